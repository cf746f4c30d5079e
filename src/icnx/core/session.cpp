// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/core/session.hpp>
#include <icnx/core/config.hpp>
#include <icnx/log.hpp>
#include <icnx/store/persistence.hpp>
#include <algorithm>
#include <atomic>
#include <system_error>

namespace icnx::core {

//=============================================================================
// SessionReport
//=============================================================================

std::string SessionReport::status() const {
    if (was_cancelled) {
        return "cancelled";
    }
    if (completed == 0 && failed == 0 && cancelled == 0) {
        return "empty";
    }
    if (failed == 0 && cancelled == 0) {
        return "completed";
    }
    if (completed == 0) {
        return failed > 0 ? "failed" : "cancelled";
    }
    return "mixed";
}

//=============================================================================
// SessionOrchestrator
//=============================================================================

SessionOrchestrator::SessionOrchestrator(OrchestrationContext& context,
                                         HttpTransport& transport,
                                         EventSink& events,
                                         Clock& clock,
                                         const EngineConfig& config,
                                         store::Persistence* persistence)
    : context_(context)
    , events_(events)
    , persistence_(persistence)
    , limiter_(config.max_concurrent)
    , executor_(transport, limiter_, events, clock, make_transfer_options(config)) {
    executor_.persistence(persistence_);
}

SessionOrchestrator::~SessionOrchestrator() {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            sessions.push_back(session);
        }
    }

    for (const auto& session : sessions) {
        if (context_.sessions.cancel(session->id)) {
            logger()->info("shutting down: cancelled session {}", session->id);
        }
    }
    for (const auto& session : sessions) {
        join_supervisor(*session);
    }
}

std::expected<std::string, std::error_code>
SessionOrchestrator::start_session(const nlohmann::json& items, const std::filesystem::path& destination) {
    if (!items.is_array()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_item));
    }

    prune_finished();

    std::error_code ec;
    std::filesystem::create_directories(destination / STORE_DIR_NAME, ec);
    if (ec) {
        logger()->warn("cannot create {}: {}", (destination / STORE_DIR_NAME).string(), ec.message());
    }
    if (persistence_) {
        std::filesystem::create_directories(persistence_->paths().root(destination), ec);
        if (ec) {
            logger()->warn("cannot create progress store directory: {}", ec.message());
        }
    }

    auto session = std::make_shared<Session>();
    session->id = make_uuid();
    session->destination = destination;
    session->pause = context_.pauses.flag(session->id);
    session->report.session_id = session->id;
    session->report.destination = destination;
    session->report.submitted = items.size();

    context_.sessions.register_session(session->id, session->source);

    events_.emit(events::SESSION_STARTED, {
        {"session_id", session->id},
        {"count", items.size()},
        {"destination", destination.string()},
    });
    logger()->info("session {}: {} item(s) -> {}", session->id, items.size(), destination.string());

    for (const auto& entry : items) {
        auto parsed = parse_download_item(entry);
        if (!parsed) {
            ++session->report.skipped;
            events_.emit(events::ITEM_PARSE_ERROR, {
                {"session", session->id},
                {"error", parsed.error().message},
            });
            logger()->warn("session {}: skipping item: {}", session->id, parsed.error().message);
            continue;
        }

        QueueItem qi{make_uuid(), std::move(*parsed), destination};
        events_.emit(events::ITEM_QUEUED, {
            {"session_id", session->id},
            {"url", qi.item.url},
            {"filename", qi.item.filename ? nlohmann::json(*qi.item.filename) : nlohmann::json(nullptr)},
        });
        session->items.push_back(std::move(qi));
    }

    std::error_code spawn_error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[session->id] = session;
        try {
            session->supervisor = std::jthread([this, session] { supervise(session); });
        } catch (const std::system_error& e) {
            spawn_error = e.code();
        }
    }

    if (spawn_error) {
        logger()->error("session {}: cannot start supervisor thread: {}", session->id, spawn_error.message());
        std::vector<TransferResult> results(session->items.size());
        for (auto& result : results) {
            result.message = "Cannot start transfer thread: " + spawn_error.message();
            result.error = spawn_error;
        }
        finish(session, std::move(results));
    }

    return session->id;
}

void SessionOrchestrator::supervise(const std::shared_ptr<Session>& session) {
    const std::size_t count = session->items.size();
    std::vector<TransferResult> results(count);
    std::atomic<std::size_t> next{0};
    auto stoken = session->source.get_token();

    // Each worker claims the next unstarted item until the batch is drained
    auto drain = [this, &session, &results, &next, stoken, count] {
        for (auto i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
            const auto& qi = session->items[i];
            events_.emit(events::ITEM_STARTED, {{"session_id", session->id}, {"url", qi.item.url}});
            results[i] = executor_.run(qi, stoken, session->pause, session->id);
        }
    };

    {
        const std::size_t wanted = std::min(count, std::max<std::size_t>(limiter_.capacity(), 1));
        std::vector<std::jthread> workers;
        workers.reserve(wanted);
        for (std::size_t n = 0; n < wanted; ++n) {
            try {
                workers.emplace_back(drain);
            } catch (const std::system_error& e) {
                logger()->warn("session {}: started {} of {} workers: {}",
                               session->id, workers.size(), wanted, e.what());
                break;
            }
        }
        if (workers.empty() && count > 0) {
            drain();
        }
    } // workers join here

    finish(session, std::move(results));
}

void SessionOrchestrator::finish(const std::shared_ptr<Session>& session, std::vector<TransferResult> results) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->closing = true;
    }

    auto& report = session->report;
    report.was_cancelled = session->source.stop_requested();

    for (std::size_t i = 0; i < results.size(); ++i) {
        switch (results[i].status) {
            case TransferStatus::completed: ++report.completed; break;
            case TransferStatus::failed:    ++report.failed; break;
            case TransferStatus::cancelled: ++report.cancelled; break;
        }
        report.results.emplace_back(session->items[i].item.url, std::move(results[i]));
    }

    // Idempotent cleanup; a session cancelled earlier is already unregistered
    session->source.request_stop();
    context_.sessions.unregister(session->id);
    context_.pauses.remove(session->id);
    if (persistence_) {
        persistence_->progress().release(session->id, session->destination);
    }

    auto status = report.status();
    events_.emit(events::SESSION_FINISHED, {
        {"session_id", session->id},
        {"completed", report.completed},
        {"failed", report.failed},
        {"cancelled", report.cancelled},
        {"status", status},
    });
    events_.emit(events::SESSION_CLEANUP, {{"session_id", session->id}});
    logger()->info("session {} finished: {} completed, {} failed, {} cancelled ({})",
                   session->id, report.completed, report.failed, report.cancelled, status);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->finished = true;
        finished_order_.push_back(session->id);
    }
    finished_cv_.notify_all();
}

// Drop the oldest finished sessions nobody collected with wait()
void SessionOrchestrator::prune_finished() {
    std::vector<std::shared_ptr<Session>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (finished_order_.size() > FINISHED_SESSION_RETENTION) {
            auto it = sessions_.find(finished_order_.front());
            finished_order_.pop_front();
            if (it != sessions_.end() && it->second->finished) {
                dropped.push_back(std::move(it->second));
                sessions_.erase(it);
            }
        }
    }
    for (const auto& session : dropped) {
        join_supervisor(*session);
    }
}

void SessionOrchestrator::join_supervisor(Session& session) {
    if (!session.supervisor.joinable()) {
        return;
    }
    if (session.supervisor.get_id() == std::this_thread::get_id()) {
        session.supervisor.detach();
    } else {
        session.supervisor.join();
    }
}

bool SessionOrchestrator::cancel_session(const std::string& session_id) {
    bool found = context_.sessions.cancel(session_id);
    if (found) {
        events_.emit(events::SESSION_CANCELLED, {{"session_id", session_id}});
    }
    return found;
}

bool SessionOrchestrator::set_paused(const std::string& session_id, bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second->closing) {
        return false;
    }
    context_.pauses.set(session_id, paused);
    return true;
}

bool SessionOrchestrator::pause_session(const std::string& session_id) {
    if (!set_paused(session_id, true)) {
        return false;
    }
    events_.emit(events::SESSION_PAUSED, {{"session_id", session_id}});
    logger()->info("session {} paused", session_id);
    return true;
}

bool SessionOrchestrator::resume_session(const std::string& session_id) {
    if (!set_paused(session_id, false)) {
        return false;
    }
    events_.emit(events::SESSION_RESUMED, {{"session_id", session_id}});
    logger()->info("session {} resumed", session_id);
    return true;
}

bool SessionOrchestrator::is_paused(const std::string& session_id) const {
    return context_.pauses.get(session_id);
}

bool SessionOrchestrator::is_running(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() && !it->second->finished;
}

std::optional<SessionReport> SessionOrchestrator::wait(const std::string& session_id) {
    std::shared_ptr<Session> session;
    bool collected = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        session = it->second;
        finished_cv_.wait(lock, [&] { return session->finished; });

        // Only the caller that removes the entry joins the supervisor
        it = sessions_.find(session_id);
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
            std::erase(finished_order_, session_id);
            collected = true;
        }
    }
    if (collected) {
        join_supervisor(*session);
    }
    return session->report;
}

std::size_t SessionOrchestrator::tracked_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionOrchestrator::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    finished_cv_.wait(lock, [this] {
        for (const auto& [id, session] : sessions_) {
            if (!session->finished) return false;
        }
        return true;
    });
}

} // namespace icnx::core
