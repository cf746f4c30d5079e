// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/store/progress_store.hpp>
#include <icnx/log.hpp>

namespace icnx::store {

namespace {

constexpr const char* SCHEMA =
    "CREATE TABLE IF NOT EXISTS progress ("
    " url TEXT PRIMARY KEY,"
    " filename TEXT,"
    " progress REAL,"
    " downloaded INTEGER,"
    " total INTEGER,"
    " speed REAL,"
    " eta INTEGER,"
    " status TEXT,"
    " updated_at INTEGER"
    ");";

constexpr const char* UPSERT_SQL =
    "INSERT INTO progress (url, filename, progress, downloaded, total, speed, eta, status, updated_at)"
    " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)"
    " ON CONFLICT(url) DO UPDATE SET"
    " filename=excluded.filename, progress=excluded.progress, downloaded=excluded.downloaded,"
    " total=excluded.total, speed=excluded.speed, eta=excluded.eta, status=excluded.status,"
    " updated_at=excluded.updated_at;";

constexpr const char* SELECT_SQL =
    "SELECT url, filename, progress, downloaded, total, speed, eta, status, updated_at"
    " FROM progress ORDER BY updated_at DESC, rowid DESC;";

std::optional<std::int64_t> to_int64(const std::optional<std::uint64_t>& v) {
    if (!v) return std::nullopt;
    return static_cast<std::int64_t>(*v);
}

std::optional<std::uint64_t> to_uint64(const std::optional<std::int64_t>& v) {
    if (!v) return std::nullopt;
    return static_cast<std::uint64_t>(*v);
}

std::error_code write_progress(Database& db, const ProgressRecord& r) {
    auto stmt = db.prepare(UPSERT_SQL);
    if (!stmt) {
        return stmt.error();
    }
    std::error_code ec;
    if ((ec = stmt->bind(1, r.url))) return ec;
    if ((ec = stmt->bind(2, r.filename))) return ec;
    if ((ec = stmt->bind(3, r.progress))) return ec;
    if ((ec = stmt->bind(4, static_cast<std::int64_t>(r.downloaded)))) return ec;
    if ((ec = stmt->bind(5, to_int64(r.total)))) return ec;
    if ((ec = stmt->bind(6, r.speed))) return ec;
    if ((ec = stmt->bind(7, to_int64(r.eta)))) return ec;
    if ((ec = stmt->bind(8, r.status))) return ec;
    if ((ec = stmt->bind(9, r.updated_at))) return ec;
    return stmt->run();
}

} // namespace

ProgressStore::ProgressStore(StorePaths paths)
    : paths_(std::move(paths))
    , queue_("progress", SCHEMA) {}

void ProgressStore::upsert(const std::string& session_id,
                           const std::filesystem::path& destination,
                           ProgressRecord record) {
    if (record.updated_at == 0) {
        record.updated_at = unix_now();
    }
    queue_.enqueue(paths_.session_db(session_id, destination),
                   [record = std::move(record)](Database& db) { return write_progress(db, record); });
}

std::expected<std::vector<ProgressRecord>, std::error_code>
ProgressStore::read(const std::string& session_id, const std::filesystem::path& destination) const {
    std::vector<ProgressRecord> rows;

    auto path = paths_.find_session_db(session_id, destination);
    if (!path) {
        return rows;
    }

    auto db = Database::open_existing(*path, SCHEMA);
    if (!db) {
        if (db.error() == StoreErrc::not_found) {
            return rows;
        }
        return std::unexpected(db.error());
    }

    auto stmt = db->prepare(SELECT_SQL);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    while (true) {
        auto row = stmt->step();
        if (!row) {
            logger()->warn("reading {} failed: {}", path->string(), db->last_error());
            return std::unexpected(row.error());
        }
        if (!*row) {
            break;
        }
        ProgressRecord r;
        r.url = stmt->text(0);
        r.filename = stmt->text(1);
        r.progress = stmt->real(2);
        r.downloaded = static_cast<std::uint64_t>(stmt->int64(3));
        r.total = to_uint64(stmt->optional_int64(4));
        r.speed = stmt->real(5);
        r.eta = to_uint64(stmt->optional_int64(6));
        r.status = stmt->text(7);
        r.updated_at = stmt->int64(8);
        rows.push_back(std::move(r));
    }
    return rows;
}

void ProgressStore::release(const std::string& session_id, const std::filesystem::path& destination) {
    queue_.release(paths_.session_db(session_id, destination));
}

} // namespace icnx::store
