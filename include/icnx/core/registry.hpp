// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

namespace icnx::core {

// Session id -> cancellation source
class SessionRegistry {
public:
    // Insert or overwrite
    void register_session(const std::string& session_id, std::stop_source source);

    // Remove and request stop; false when the id is unknown
    bool cancel(const std::string& session_id);

    // Remove without cancelling
    void unregister(const std::string& session_id);

    [[nodiscard]] bool contains(const std::string& session_id) const;
    [[nodiscard]] std::size_t size() const;

private:
    std::map<std::string, std::stop_source> sessions_;
    mutable std::mutex mutex_;
};

using PauseFlag = std::shared_ptr<std::atomic<bool>>;

// Session id -> shared pause flag
class PauseRegistry {
public:
    // Create or update
    void set(const std::string& session_id, bool paused);

    // False when absent
    [[nodiscard]] bool get(const std::string& session_id) const;

    // Flag handle for lock-free polling; created unpaused when absent
    [[nodiscard]] PauseFlag flag(const std::string& session_id);

    void remove(const std::string& session_id);

    [[nodiscard]] bool contains(const std::string& session_id) const;

private:
    std::map<std::string, PauseFlag> flags_;
    mutable std::mutex mutex_;
};

// Registries shared by an orchestrator and everything that controls its
// sessions. Owned by the caller; must outlive the orchestrator.
struct OrchestrationContext {
    SessionRegistry sessions;
    PauseRegistry pauses;
};

} // namespace icnx::core
