// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/store/records.hpp>
#include <chrono>

namespace icnx::store {

namespace {

template<typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template<typename T>
std::optional<T> optional_field(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

} // namespace

void to_json(nlohmann::json& j, const ProgressRecord& r) {
    j = nlohmann::json{
        {"url", r.url},
        {"filename", r.filename},
        {"progress", r.progress},
        {"downloaded", r.downloaded},
        {"total", optional_json(r.total)},
        {"speed", r.speed},
        {"eta", optional_json(r.eta)},
        {"status", r.status},
        {"updated_at", r.updated_at},
    };
}

void to_json(nlohmann::json& j, const HistoryRecord& r) {
    j = nlohmann::json{
        {"id", r.id},
        {"session_id", r.session_id},
        {"url", r.url},
        {"filename", r.filename},
        {"dir", r.dir},
        {"size", optional_json(r.size)},
        {"status", r.status},
        {"file_type", optional_json(r.file_type)},
        {"script_name", optional_json(r.script_name)},
        {"source_url", optional_json(r.source_url)},
        {"created_at", r.created_at},
    };
}

// Throws nlohmann::json::exception on missing or mistyped required fields
void from_json(const nlohmann::json& j, HistoryRecord& r) {
    r.id = j.at("id").get<std::string>();
    r.session_id = j.at("session_id").get<std::string>();
    r.url = j.at("url").get<std::string>();
    r.filename = j.at("filename").get<std::string>();
    r.dir = j.at("dir").get<std::string>();
    r.size = optional_field<std::uint64_t>(j, "size");
    r.status = j.at("status").get<std::string>();
    r.file_type = optional_field<std::string>(j, "file_type");
    r.script_name = optional_field<std::string>(j, "script_name");
    r.source_url = optional_field<std::string>(j, "source_url");
    r.created_at = j.at("created_at").get<std::int64_t>();
}

void to_json(nlohmann::json& j, const ScrapeRecord& r) {
    j = nlohmann::json{
        {"url", r.url},
        {"filename", optional_json(r.filename)},
        {"title", optional_json(r.title)},
        {"type", optional_json(r.type)},
        {"meta", r.meta},
        {"updated_at", r.updated_at},
    };
}

void to_json(nlohmann::json& j, const SessionSummary& s) {
    j = nlohmann::json{
        {"session_id", s.session_id},
        {"title", s.title},
        {"subtitle", s.subtitle},
        {"total_size", s.total_size},
        {"status", s.status},
        {"created_at", s.created_at},
    };
}

std::int64_t unix_now() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace icnx::store
