// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/core/settings.hpp>
#include <icnx/log.hpp>
#include <cstdlib>
#include <fstream>

namespace icnx::core {

void to_json(nlohmann::json& j, const EngineConfig& cfg) {
    j = nlohmann::json{
        {"max_concurrent", cfg.max_concurrent},
        {"retries", cfg.retries},
        {"backoff_ms", cfg.backoff.count()},
        {"user_agent", cfg.user_agent},
        {"connect_timeout_sec", cfg.connect_timeout_sec},
        {"max_redirects", cfg.max_redirects},
        {"retry_filesystem_errors", cfg.retry_filesystem_errors},
        {"log_level", cfg.log_level},
    };
    if (cfg.app_data_dir) {
        j["app_data_dir"] = cfg.app_data_dir->string();
    }
}

// Absent keys keep their defaults
void from_json(const nlohmann::json& j, EngineConfig& cfg) {
    if (j.contains("max_concurrent")) {
        cfg.max_concurrent = j["max_concurrent"].get<std::uint32_t>();
    }
    if (j.contains("retries")) {
        cfg.retries = j["retries"].get<std::uint32_t>();
    }
    if (j.contains("backoff_ms")) {
        cfg.backoff = std::chrono::milliseconds(j["backoff_ms"].get<std::int64_t>());
    }
    if (j.contains("user_agent")) {
        cfg.user_agent = j["user_agent"].get<std::string>();
    }
    if (j.contains("connect_timeout_sec")) {
        cfg.connect_timeout_sec = j["connect_timeout_sec"].get<std::uint32_t>();
    }
    if (j.contains("max_redirects")) {
        cfg.max_redirects = j["max_redirects"].get<std::uint32_t>();
    }
    if (j.contains("retry_filesystem_errors")) {
        cfg.retry_filesystem_errors = j["retry_filesystem_errors"].get<bool>();
    }
    if (j.contains("app_data_dir") && j["app_data_dir"].is_string()) {
        cfg.app_data_dir = std::filesystem::path(j["app_data_dir"].get<std::string>());
    }
    if (j.contains("log_level")) {
        cfg.log_level = j["log_level"].get<std::string>();
    }
}

EngineConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        logger()->info("no settings at {}, using defaults", path.string());
        return {};
    }

    try {
        auto j = nlohmann::json::parse(file);
        return j.get<EngineConfig>();
    } catch (const nlohmann::json::exception& e) {
        logger()->warn("malformed settings {}: {}; using defaults", path.string(), e.what());
        return {};
    }
}

std::error_code save_config(const EngineConfig& cfg, const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return ec;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return std::make_error_code(std::errc::permission_denied);
    }

    file << nlohmann::json(cfg).dump(2) << '\n';
    if (!file.good()) {
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

std::optional<std::filesystem::path> resolve_app_data_dir(const EngineConfig& cfg) {
    if (cfg.app_data_dir && !cfg.app_data_dir->empty()) {
        return cfg.app_data_dir;
    }
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "icnx";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "icnx";
    }
    return std::nullopt;
}

} // namespace icnx::core
