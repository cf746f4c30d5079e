// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/core/events.hpp>
#include <icnx/core/http_session.hpp>
#include <icnx/core/limiter.hpp>
#include <icnx/core/registry.hpp>
#include <icnx/core/retry.hpp>
#include <icnx/core/settings.hpp>
#include <icnx/core/transfer.hpp>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace icnx::store {
class Persistence;
} // namespace icnx::store

namespace icnx::core {

// Outcome of one session after every transfer finished
struct SessionReport {
    std::string session_id;
    std::filesystem::path destination;
    std::size_t submitted{0};   // entries in the input array
    std::size_t skipped{0};     // entries rejected by parse_download_item
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t cancelled{0};
    bool was_cancelled{false};
    std::vector<std::pair<std::string, TransferResult>> results;  // url -> result

    // "completed", "failed", "mixed", "cancelled" or "empty"
    [[nodiscard]] std::string status() const;
};

// Runs a JSON batch of items on a per-session worker pool no wider than the
// shared limiter, and cleans up registry entries when the batch finishes.
class SessionOrchestrator {
public:
    SessionOrchestrator(OrchestrationContext& context,
                        HttpTransport& transport,
                        EventSink& events,
                        Clock& clock,
                        const EngineConfig& config,
                        store::Persistence* persistence = nullptr);

    // Cancels unfinished sessions and joins their threads
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    // Returns the new session id once every item is queued; transfers run
    // in the background
    [[nodiscard]] std::expected<std::string, std::error_code>
    start_session(const nlohmann::json& items, const std::filesystem::path& destination);

    // false when the session is unknown or already finished
    bool cancel_session(const std::string& session_id);
    bool pause_session(const std::string& session_id);
    bool resume_session(const std::string& session_id);

    [[nodiscard]] bool is_paused(const std::string& session_id) const;
    [[nodiscard]] bool is_running(const std::string& session_id) const;

    // Block until the session finished and hand over its report. The session
    // is forgotten afterwards; nullopt for unknown or already collected ids.
    [[nodiscard]] std::optional<SessionReport> wait(const std::string& session_id);

    void wait_all();

    // Running sessions plus finished ones not yet collected by wait()
    [[nodiscard]] std::size_t tracked_sessions() const;

    [[nodiscard]] ConcurrencyLimiter& limiter() noexcept { return limiter_; }

private:
    struct Session {
        std::string id;
        std::filesystem::path destination;
        std::stop_source source;
        PauseFlag pause;
        std::vector<QueueItem> items;
        SessionReport report;
        bool closing{false};   // cleanup started; pause state is frozen
        bool finished{false};
        std::jthread supervisor;
    };

    void supervise(const std::shared_ptr<Session>& session);
    void finish(const std::shared_ptr<Session>& session, std::vector<TransferResult> results);
    void prune_finished();
    static void join_supervisor(Session& session);
    bool set_paused(const std::string& session_id, bool paused);

    OrchestrationContext& context_;
    EventSink& events_;
    store::Persistence* persistence_;
    ConcurrencyLimiter limiter_;
    TransferExecutor executor_;

    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::deque<std::string> finished_order_;
    mutable std::mutex mutex_;
    std::condition_variable finished_cv_;
};

} // namespace icnx::core
