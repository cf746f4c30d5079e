// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/core/transfer.hpp>
#include <icnx/core/config.hpp>
#include <icnx/core/filename.hpp>
#include <icnx/disk/file_writer.hpp>
#include <icnx/log.hpp>
#include <icnx/store/persistence.hpp>

namespace icnx::core {

namespace {

constexpr const char* CANCELLED_MESSAGE = "cancelled by user";

template<typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// Name used in progress rows before the response picks the real one
std::string provisional_filename(const QueueItem& item) {
    if (item.item.filename) {
        return *item.item.filename;
    }
    auto name = url_filename(item.item.url);
    return name.empty() ? std::string("download") : name;
}

} // namespace

std::string_view to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::completed: return "completed";
        case TransferStatus::failed:    return "failed";
        case TransferStatus::cancelled: return "cancelled";
        default:                        return "unknown";
    }
}

void to_json(nlohmann::json& j, const ProgressSnapshot& p) {
    j = nlohmann::json{
        {"progress", p.progress},
        {"downloaded", p.downloaded},
        {"total", optional_json(p.total)},
        {"speed", p.speed},
        {"eta", optional_json(p.eta)},
        {"status", p.status},
        {"url", p.url},
        {"filename", p.filename},
        {"error", optional_json(p.error)},
    };
}

ProgressSnapshot make_snapshot(std::uint64_t downloaded,
                               std::optional<std::uint64_t> total,
                               double elapsed_sec) {
    ProgressSnapshot s;
    s.downloaded = downloaded;
    s.total = total;
    if (total && *total > 0) {
        s.progress = static_cast<double>(downloaded) / static_cast<double>(*total);
    }
    s.speed = elapsed_sec > 0.0 ? static_cast<double>(downloaded) / elapsed_sec : 0.0;
    if (total && s.speed > 0.0 && downloaded < *total) {
        s.eta = static_cast<std::uint64_t>(static_cast<double>(*total - downloaded) / s.speed);
    }
    return s;
}

TransferOptions make_transfer_options(const EngineConfig& cfg) {
    TransferOptions opts;
    opts.retry.retries = cfg.retries;
    opts.retry.base_delay = cfg.backoff;
    opts.retry.retry_filesystem_errors = cfg.retry_filesystem_errors;
    opts.user_agent = cfg.user_agent;
    opts.connect_timeout_sec = cfg.connect_timeout_sec;
    opts.max_redirects = cfg.max_redirects;
    return opts;
}

//=============================================================================
// TransferExecutor::Attempt
//=============================================================================

// State of one GET; receives the response stream from the transport
class TransferExecutor::Attempt final : public ResponseHandler {
public:
    Attempt(TransferExecutor& exec,
            const QueueItem& item,
            std::stop_token stoken,
            const PauseFlag& pause,
            const std::string& session_id)
        : exec_(exec)
        , item_(item)
        , stoken_(std::move(stoken))
        , pause_(pause)
        , session_id_(session_id)
        , filename_(provisional_filename(item))
        , start_(exec.clock_.now())
        , last_persist_(start_) {}

    bool on_response(const HttpResponse& response) override {
        responded_ = true;
        total_ = response.content_length;

        nlohmann::json payload{
            {"url", item_.item.url},
            {"status", response.status_code},
            {"content_length", optional_json(response.content_length)},
        };
        if (!session_id_.empty()) {
            payload["session_id"] = session_id_;
        }
        exec_.events_.emit(events::ITEM_RESPONSE, payload);

        if (!response.is_success()) {
            failure_ = TransferError{make_error_code(DownloadErrc::http_status),
                                     "HTTP " + std::to_string(response.status_code)};
            return false;
        }

        filename_ = resolve_filename(item_.item.filename, item_.item.url,
                                     response.content_type, item_.item.type);
        path_ = item_.dir / filename_;

        if (auto ec = writer_.open(path_)) {
            failure_ = TransferError{make_error_code(DownloadErrc::filesystem_error),
                                     "cannot create " + path_.string() + ": " + ec.message()};
            return false;
        }
        return true;
    }

    bool on_chunk(std::span<const std::byte> data) override {
        if (stoken_.stop_requested()) {
            cancelled_ = true;
            return false;
        }

        if (!wait_while_paused()) {
            cancelled_ = true;
            return false;
        }

        if (auto ec = writer_.write(data)) {
            failure_ = TransferError{make_error_code(DownloadErrc::filesystem_error),
                                     "write to " + path_.string() + " failed: " + ec.message()};
            return false;
        }
        downloaded_ += data.size();

        auto now = exec_.clock_.now();
        bool persist = now - last_persist_ >= PROGRESS_PERSIST_INTERVAL;
        if (persist) {
            last_persist_ = now;
        }
        report("downloading", std::nullopt, persist);
        return true;
    }

    std::expected<CompletedTransfer, TransferError> finish(std::error_code transport_ec) {
        auto close_ec = writer_.close();

        if (cancelled_ || (transport_ec == DownloadErrc::cancelled && stoken_.stop_requested())) {
            discard();
            report("cancelled", CANCELLED_MESSAGE, true);
            return std::unexpected(TransferError{make_error_code(DownloadErrc::cancelled), CANCELLED_MESSAGE});
        }

        if (failure_) {
            discard();
            return std::unexpected(*failure_);
        }

        if (responded_ && total_ && downloaded_ != *total_) {
            discard();
            return std::unexpected(TransferError{
                make_error_code(DownloadErrc::incomplete),
                "Incomplete download: expected " + std::to_string(*total_)
                    + " bytes, got " + std::to_string(downloaded_) + " bytes"});
        }

        if (transport_ec) {
            discard();
            return std::unexpected(TransferError{transport_ec, transport_ec.message()});
        }

        if (!responded_) {
            return std::unexpected(TransferError{make_error_code(DownloadErrc::network_error),
                                                 "no response received"});
        }

        if (close_ec) {
            discard();
            return std::unexpected(TransferError{make_error_code(DownloadErrc::filesystem_error),
                                                 "closing " + path_.string() + " failed: " + close_ec.message()});
        }

        report("completed", std::nullopt, true);

        nlohmann::json payload{
            {"url", item_.item.url},
            {"size", downloaded_},
            {"path", path_.string()},
        };
        if (!session_id_.empty()) {
            payload["session_id"] = session_id_;
        }
        exec_.events_.emit(events::ITEM_COMPLETED, payload);

        return CompletedTransfer{downloaded_, path_};
    }

private:
    // Sleep in PAUSE_POLL_INTERVAL steps while the session is paused.
    // false when cancelled during the pause.
    bool wait_while_paused() {
        if (!pause_) {
            return true;
        }

        while (pause_->load(std::memory_order_acquire)) {
            if (!paused_) {
                paused_ = true;
                report("paused", std::nullopt, true);
                exec_.events_.emit(events::ITEM_PAUSED, {{"url", item_.item.url}, {"session_id", session_id_}});
                logger()->debug("paused {}", item_.item.url);
            }
            if (!exec_.clock_.sleep_for(PAUSE_POLL_INTERVAL, stoken_)) {
                return false;
            }
        }

        if (paused_) {
            paused_ = false;
            exec_.events_.emit(events::ITEM_RESUMED, {{"url", item_.item.url}, {"session_id", session_id_}});
            logger()->debug("resumed {}", item_.item.url);
        }
        return !stoken_.stop_requested();
    }

    void report(const char* status, std::optional<std::string> error, bool persist) {
        auto elapsed = std::chrono::duration<double>(exec_.clock_.now() - start_).count();
        auto snapshot = make_snapshot(downloaded_, total_, elapsed);
        if (std::string_view(status) == "completed") {
            snapshot.progress = 1.0;
            snapshot.eta.reset();
        }
        snapshot.status = status;
        snapshot.url = item_.item.url;
        snapshot.filename = filename_;
        snapshot.error = std::move(error);
        exec_.report(item_, session_id_, snapshot, persist);
    }

    void discard() {
        if (path_.empty()) {
            return;
        }
        if (auto ec = writer_.discard()) {
            logger()->warn("cannot remove partial file {}: {}", path_.string(), ec.message());
        }
    }

    TransferExecutor& exec_;
    const QueueItem& item_;
    std::stop_token stoken_;
    const PauseFlag& pause_;
    const std::string& session_id_;

    disk::FileWriter writer_;
    std::string filename_;
    std::filesystem::path path_;
    std::optional<std::uint64_t> total_;
    std::uint64_t downloaded_{0};
    Clock::time_point start_;
    Clock::time_point last_persist_;
    std::optional<TransferError> failure_;
    bool responded_{false};
    bool cancelled_{false};
    bool paused_{false};
};

//=============================================================================
// TransferExecutor
//=============================================================================

TransferExecutor::TransferExecutor(HttpTransport& transport,
                                   ConcurrencyLimiter& limiter,
                                   EventSink& events,
                                   Clock& clock,
                                   TransferOptions options)
    : transport_(transport)
    , limiter_(limiter)
    , events_(events)
    , clock_(clock)
    , options_(std::move(options)) {}

std::expected<CompletedTransfer, TransferError>
TransferExecutor::run_once(const QueueItem& item,
                           std::stop_token stoken,
                           const PauseFlag& pause,
                           const std::string& session_id) {
    std::error_code ec;
    std::filesystem::create_directories(item.dir, ec);
    if (ec) {
        return std::unexpected(TransferError{make_error_code(DownloadErrc::filesystem_error),
                                             "cannot create " + item.dir.string() + ": " + ec.message()});
    }

    HttpRequest request;
    request.url = item.item.url;
    request.headers = item.item.headers;
    request.user_agent = options_.user_agent;
    request.connect_timeout_sec = options_.connect_timeout_sec;
    request.max_redirects = options_.max_redirects;

    Attempt attempt(*this, item, stoken, pause, session_id);
    auto transport_ec = transport_.get(request, attempt, stoken);
    return attempt.finish(transport_ec);
}

TransferResult TransferExecutor::run(const QueueItem& item,
                                     std::stop_token stoken,
                                     const PauseFlag& pause,
                                     const std::string& session_id) {
    RetryState state(options_.retry);
    TransferResult result;

    auto cancelled_before_attempt = [&] {
        ProgressSnapshot snapshot;
        snapshot.status = "cancelled";
        snapshot.url = item.item.url;
        snapshot.filename = provisional_filename(item);
        snapshot.error = CANCELLED_MESSAGE;
        report(item, session_id, snapshot, true);
        result.status = TransferStatus::cancelled;
        result.error = make_error_code(DownloadErrc::cancelled);
        result.message = CANCELLED_MESSAGE;
        return result;
    };

    while (true) {
        if (stoken.stop_requested()) {
            return cancelled_before_attempt();
        }

        auto permit = limiter_.acquire(stoken);
        if (!permit || stoken.stop_requested()) {
            return cancelled_before_attempt();
        }

        result.attempts = state.attempt();
        logger()->debug("attempt {} for {}", state.attempt(), item.item.url);
        auto outcome = run_once(item, stoken, pause, session_id);
        permit.reset();

        if (outcome) {
            state.succeed();
            result.status = TransferStatus::completed;
            result.size = outcome->size;
            result.path = outcome->path;
            logger()->info("completed {} ({} bytes)", item.item.url, outcome->size);
            return result;
        }

        const auto& err = outcome.error();
        if (err.code == DownloadErrc::cancelled) {
            result.status = TransferStatus::cancelled;
            result.error = err.code;
            result.message = err.message;
            logger()->info("cancelled {}", item.item.url);
            return result;
        }

        auto delay = state.fail(err.code);
        if (!delay) {
            ProgressSnapshot snapshot;
            snapshot.status = "failed";
            snapshot.url = item.item.url;
            snapshot.filename = provisional_filename(item);
            snapshot.error = err.message;
            report(item, session_id, snapshot, true);

            result.status = TransferStatus::failed;
            result.error = err.code;
            result.message = err.message;
            logger()->error("failed {} after {} attempt(s): {}", item.item.url, result.attempts, err.message);
            return result;
        }

        logger()->warn("attempt {} for {} failed: {}; retrying in {} ms",
                       result.attempts, item.item.url, err.message, delay->count());
        // An interrupted backoff is caught by the stop check at the loop head
        (void)clock_.sleep_for(*delay, stoken);
    }
}

void TransferExecutor::report(const QueueItem& item,
                              const std::string& session_id,
                              const ProgressSnapshot& snapshot,
                              bool persist) {
    nlohmann::json payload = snapshot;
    if (!session_id.empty()) {
        payload["session_id"] = session_id;
    }
    events_.emit(events::PROGRESS, payload);

    if (!persist || !persistence_ || session_id.empty()) {
        return;
    }

    store::ProgressRecord row;
    row.url = snapshot.url;
    row.filename = snapshot.filename;
    row.progress = snapshot.progress;
    row.downloaded = snapshot.downloaded;
    row.total = snapshot.total;
    row.speed = snapshot.speed;
    row.eta = snapshot.eta;
    row.status = snapshot.status;
    persistence_->progress().upsert(session_id, item.dir, std::move(row));

    if (snapshot.status == "completed" || snapshot.status == "failed" || snapshot.status == "cancelled") {
        store::HistoryRecord rec;
        rec.session_id = session_id;
        rec.url = item.item.url;
        rec.filename = snapshot.filename;
        rec.dir = item.dir.string();
        if (snapshot.status == "completed") {
            rec.size = snapshot.downloaded;
        }
        rec.status = snapshot.status;
        rec.file_type = item.item.type;
        persistence_->history().append(std::move(rec));
    }
}

} // namespace icnx::core
