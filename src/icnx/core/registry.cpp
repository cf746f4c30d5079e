// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/core/registry.hpp>
#include <icnx/log.hpp>

namespace icnx::core {

//=============================================================================
// SessionRegistry
//=============================================================================

void SessionRegistry::register_session(const std::string& session_id, std::stop_source source) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.insert_or_assign(session_id, std::move(source));
}

bool SessionRegistry::cancel(const std::string& session_id) {
    std::stop_source source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        source = std::move(it->second);
        sessions_.erase(it);
    }
    // Stop callbacks run synchronously; keep them outside the lock
    source.request_stop();
    logger()->info("session {} cancelled", session_id);
    return true;
}

void SessionRegistry::unregister(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

bool SessionRegistry::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.contains(session_id);
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

//=============================================================================
// PauseRegistry
//=============================================================================

void PauseRegistry::set(const std::string& session_id, bool paused) {
    flag(session_id)->store(paused, std::memory_order_release);
    logger()->debug("session {} pause flag = {}", session_id, paused);
}

bool PauseRegistry::get(const std::string& session_id) const {
    PauseFlag f;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = flags_.find(session_id);
        if (it == flags_.end()) {
            return false;
        }
        f = it->second;
    }
    return f->load(std::memory_order_acquire);
}

PauseFlag PauseRegistry::flag(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& f = flags_[session_id];
    if (!f) {
        f = std::make_shared<std::atomic<bool>>(false);
    }
    return f;
}

void PauseRegistry::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    flags_.erase(session_id);
}

bool PauseRegistry::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flags_.contains(session_id);
}

} // namespace icnx::core
