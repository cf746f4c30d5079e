// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/core/download_item.hpp>
#include <icnx/core/events.hpp>
#include <icnx/core/http_session.hpp>
#include <icnx/core/retry.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace icnx::test {

// Canned response for one GET
struct ScriptedResponse {
    int status{200};
    std::optional<std::uint64_t> content_length;
    std::string content_type{"application/octet-stream"};
    std::vector<std::string> chunks;
    std::chrono::milliseconds chunk_delay{0};
    std::error_code error;      // returned after the body was streamed
};

// Body of `size` bytes split into `count` chunks, with a matching Content-Length
inline ScriptedResponse body_response(std::size_t size, std::size_t count = 1) {
    ScriptedResponse r;
    r.content_length = size;
    count = std::max<std::size_t>(count, 1);
    std::size_t per_chunk = size / count;
    std::size_t remaining = size;
    for (std::size_t i = 0; i < count && remaining > 0; ++i) {
        std::size_t n = (i + 1 == count) ? remaining : per_chunk;
        r.chunks.emplace_back(n, 'x');
        remaining -= n;
    }
    return r;
}

// In-memory HttpTransport. Responses are queued per url; the last one repeats.
class ScriptedTransport final : public core::HttpTransport {
public:
    void add(const std::string& url, ScriptedResponse response) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[url].push_back(std::move(response));
    }

    std::error_code get(const core::HttpRequest& request,
                        core::ResponseHandler& handler,
                        std::stop_token stoken) override {
        ScriptedResponse r;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_[request.url];
            last_request_ = request;
            auto it = scripts_.find(request.url);
            if (it == scripts_.end() || it->second.empty()) {
                return make_error_code(core::DownloadErrc::dns_error);
            }
            r = it->second.front();
            if (it->second.size() > 1) {
                it->second.pop_front();
            }
        }

        auto now = ++in_flight_;
        auto prev = peak_.load();
        while (now > prev && !peak_.compare_exchange_weak(prev, now)) {}
        struct Leave {
            std::atomic<int>& n;
            ~Leave() { --n; }
        } leave{in_flight_};

        core::HttpResponse response;
        response.status_code = r.status;
        response.content_length = r.content_length;
        response.content_type = r.content_type;
        if (!handler.on_response(response)) {
            return make_error_code(core::DownloadErrc::cancelled);
        }

        for (const auto& chunk : r.chunks) {
            if (stoken.stop_requested()) {
                return make_error_code(core::DownloadErrc::cancelled);
            }
            if (r.chunk_delay.count() > 0) {
                std::this_thread::sleep_for(r.chunk_delay);
            }
            auto bytes = std::as_bytes(std::span<const char>(chunk.data(), chunk.size()));
            if (!handler.on_chunk(bytes)) {
                return make_error_code(core::DownloadErrc::cancelled);
            }
        }
        return r.error;
    }

    [[nodiscard]] int calls(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

    [[nodiscard]] int peak() const noexcept { return peak_.load(); }

    [[nodiscard]] core::HttpRequest last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_request_;
    }

private:
    std::map<std::string, std::deque<ScriptedResponse>> scripts_;
    std::map<std::string, int> calls_;
    core::HttpRequest last_request_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_{0};
    mutable std::mutex mutex_;
};

// Keeps every emitted event
class RecordingEventSink final : public core::EventSink {
public:
    void emit(std::string_view name, const nlohmann::json& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.emplace_back(std::string(name), payload);
    }

    [[nodiscard]] std::size_t count(std::string_view name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(),
            [&](const auto& e) { return e.first == name; }));
    }

    [[nodiscard]] std::vector<nlohmann::json> named(std::string_view name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> out;
        for (const auto& [n, payload] : events_) {
            if (n == name) out.push_back(payload);
        }
        return out;
    }

    [[nodiscard]] std::vector<std::string> names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& e : events_) out.push_back(e.first);
        return out;
    }

    // Progress statuses reported for one url, in order
    [[nodiscard]] std::vector<std::string> statuses(const std::string& url) const {
        std::vector<std::string> out;
        for (const auto& p : named(core::events::PROGRESS)) {
            if (p["url"] == url) out.push_back(p["status"].get<std::string>());
        }
        return out;
    }

private:
    std::vector<std::pair<std::string, nlohmann::json>> events_;
    mutable std::mutex mutex_;
};

// Real time for now(); sleeps are recorded and shortened to 1 ms
class FakeClock final : public core::Clock {
public:
    [[nodiscard]] time_point now() const override { return std::chrono::steady_clock::now(); }

    bool sleep_for(std::chrono::milliseconds duration, std::stop_token stoken) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sleeps_.push_back(duration);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return !stoken.stop_requested();
    }

    [[nodiscard]] std::vector<std::chrono::milliseconds> sleeps() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sleeps_;
    }

private:
    std::vector<std::chrono::milliseconds> sleeps_;
    mutable std::mutex mutex_;
};

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / ("icnx-test-" + core::make_uuid())) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline core::QueueItem queue_item(const std::string& url,
                                  const std::filesystem::path& dir,
                                  std::optional<std::string> filename = std::nullopt) {
    core::QueueItem qi;
    qi.id = core::make_uuid();
    qi.item.url = url;
    qi.item.filename = std::move(filename);
    qi.dir = dir;
    return qi;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline void write_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

// Poll `pred` for up to `timeout`
template<typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

} // namespace icnx::test
