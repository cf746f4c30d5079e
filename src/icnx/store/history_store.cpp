// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/store/history_store.hpp>
#include <icnx/core/download_item.hpp>
#include <icnx/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <map>

namespace icnx::store {

namespace {

constexpr const char* SCHEMA =
    "CREATE TABLE IF NOT EXISTS history ("
    " id TEXT PRIMARY KEY,"
    " session_id TEXT,"
    " url TEXT,"
    " filename TEXT,"
    " dir TEXT,"
    " size INTEGER,"
    " status TEXT,"
    " file_type TEXT,"
    " script_name TEXT,"
    " source_url TEXT,"
    " created_at INTEGER"
    ");";

constexpr const char* INSERT_SQL =
    "INSERT OR REPLACE INTO history"
    " (id, session_id, url, filename, dir, size, status, file_type, script_name, source_url, created_at)"
    " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11);";

constexpr const char* SELECT_COLUMNS =
    "SELECT id, session_id, url, filename, dir, size, status, file_type, script_name, source_url, created_at"
    " FROM history";

constexpr const char* NO_SCRIPT = "No scraper used";

std::error_code write_history(Database& db, const HistoryRecord& r) {
    auto stmt = db.prepare(INSERT_SQL);
    if (!stmt) {
        return stmt.error();
    }
    std::optional<std::int64_t> size;
    if (r.size) size = static_cast<std::int64_t>(*r.size);

    std::error_code ec;
    if ((ec = stmt->bind(1, r.id))) return ec;
    if ((ec = stmt->bind(2, r.session_id))) return ec;
    if ((ec = stmt->bind(3, r.url))) return ec;
    if ((ec = stmt->bind(4, r.filename))) return ec;
    if ((ec = stmt->bind(5, r.dir))) return ec;
    if ((ec = stmt->bind(6, size))) return ec;
    if ((ec = stmt->bind(7, r.status))) return ec;
    if ((ec = stmt->bind(8, r.file_type))) return ec;
    if ((ec = stmt->bind(9, r.script_name))) return ec;
    if ((ec = stmt->bind(10, r.source_url))) return ec;
    if ((ec = stmt->bind(11, r.created_at))) return ec;
    return stmt->run();
}

bool status_is(std::string_view status, std::string_view expected) {
    return std::equal(status.begin(), status.end(), expected.begin(), expected.end(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a))
                              == std::tolower(static_cast<unsigned char>(b));
                      });
}

} // namespace

//=============================================================================
// HistoryStore
//=============================================================================

HistoryStore::HistoryStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path))
    , queue_("history", SCHEMA) {}

void HistoryStore::append(HistoryRecord record) {
    if (record.id.empty()) {
        record.id = core::make_uuid();
    }
    if (record.created_at == 0) {
        record.created_at = unix_now();
    }
    queue_.enqueue(db_path_, [record = std::move(record)](Database& db) {
        return write_history(db, record);
    });
}

void HistoryStore::record_failed(const std::string& session_id,
                                 const std::string& url,
                                 const std::string& filename,
                                 const std::string& dir,
                                 std::optional<std::string> file_type,
                                 std::optional<std::string> script_name,
                                 std::optional<std::string> source_url) {
    HistoryRecord record;
    record.session_id = session_id.empty() ? core::make_uuid() : session_id;
    record.url = url;
    record.filename = filename;
    record.dir = dir;
    record.status = "failed";
    record.file_type = std::move(file_type);
    record.script_name = std::move(script_name);
    record.source_url = std::move(source_url);
    append(std::move(record));
}

void HistoryStore::purge(std::optional<std::int64_t> older_than) {
    queue_.enqueue(db_path_, [older_than](Database& db) -> std::error_code {
        if (!older_than) {
            return db.exec("DELETE FROM history;");
        }
        auto stmt = db.prepare("DELETE FROM history WHERE created_at < ?1;");
        if (!stmt) {
            return stmt.error();
        }
        if (auto ec = stmt->bind(1, *older_than)) {
            return ec;
        }
        return stmt->run();
    });
}

void HistoryStore::delete_session(const std::string& session_id, bool delete_files) {
    if (delete_files) {
        // Pending appends must land before the rows are read back
        queue_.flush();
        auto records = read_session(session_id);
        if (!records) {
            logger()->warn("cannot list files of session {}: {}", session_id, records.error().message());
        } else {
            for (const auto& rec : *records) {
                std::error_code ec;
                auto path = std::filesystem::path(rec.dir) / rec.filename;
                if (std::filesystem::remove(path, ec)) {
                    logger()->info("deleted {}", path.string());
                } else if (ec) {
                    logger()->warn("cannot delete {}: {}", path.string(), ec.message());
                }
            }
        }
    }

    queue_.enqueue(db_path_, [session_id](Database& db) -> std::error_code {
        auto stmt = db.prepare("DELETE FROM history WHERE session_id = ?1;");
        if (!stmt) {
            return stmt.error();
        }
        if (auto ec = stmt->bind(1, session_id)) {
            return ec;
        }
        return stmt->run();
    });
}

std::expected<std::vector<HistoryRecord>, std::error_code> HistoryStore::read_all() const {
    return query(std::nullopt);
}

std::expected<std::vector<HistoryRecord>, std::error_code>
HistoryStore::read_session(const std::string& session_id) const {
    return query(session_id);
}

std::expected<std::vector<HistoryRecord>, std::error_code>
HistoryStore::query(const std::optional<std::string>& session_id) const {
    std::vector<HistoryRecord> rows;

    auto db = Database::open_existing(db_path_, SCHEMA);
    if (!db) {
        if (db.error() == StoreErrc::not_found) {
            return rows;
        }
        return std::unexpected(db.error());
    }

    std::string sql = SELECT_COLUMNS;
    if (session_id) {
        sql += " WHERE session_id = ?1";
    }
    sql += " ORDER BY created_at DESC, rowid DESC;";

    auto stmt = db->prepare(sql);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (session_id) {
        if (auto ec = stmt->bind(1, *session_id)) {
            return std::unexpected(ec);
        }
    }

    while (true) {
        auto row = stmt->step();
        if (!row) {
            logger()->warn("reading {} failed: {}", db_path_.string(), db->last_error());
            return std::unexpected(row.error());
        }
        if (!*row) {
            break;
        }
        HistoryRecord r;
        r.id = stmt->text(0);
        r.session_id = stmt->text(1);
        r.url = stmt->text(2);
        r.filename = stmt->text(3);
        r.dir = stmt->text(4);
        if (auto size = stmt->optional_int64(5)) {
            r.size = static_cast<std::uint64_t>(*size);
        }
        r.status = stmt->text(6);
        r.file_type = stmt->optional_text(7);
        r.script_name = stmt->optional_text(8);
        r.source_url = stmt->optional_text(9);
        r.created_at = stmt->int64(10);
        rows.push_back(std::move(r));
    }
    return rows;
}

//=============================================================================
// Summaries
//=============================================================================

std::string format_size(std::uint64_t bytes) {
    if (bytes == 0) {
        return "0 B";
    }
    constexpr std::array<const char*, 5> UNITS = {"B", "KB", "MB", "GB", "TB"};
    auto size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < UNITS.size()) {
        size /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", size, UNITS[unit]);
}

std::vector<SessionSummary> summarize_history(const std::vector<HistoryRecord>& records) {
    std::map<std::string, std::vector<const HistoryRecord*>> by_session;
    for (const auto& rec : records) {
        by_session[rec.session_id].push_back(&rec);
    }

    std::vector<SessionSummary> out;
    out.reserve(by_session.size());
    for (auto& [session_id, recs] : by_session) {
        std::stable_sort(recs.begin(), recs.end(), [](const HistoryRecord* a, const HistoryRecord* b) {
            return a->created_at < b->created_at;
        });
        const auto* first = recs.front();

        SessionSummary summary;
        summary.session_id = session_id;
        summary.title = first->source_url ? *first->source_url : first->url;
        summary.subtitle = first->script_name ? *first->script_name : NO_SCRIPT;
        summary.created_at = first->created_at;

        std::uint64_t total = 0;
        bool has_failed = false;
        bool has_completed = false;
        bool has_other = false;
        for (const auto* r : recs) {
            if (r->size) total += *r->size;
            if (status_is(r->status, "completed")) {
                has_completed = true;
            } else if (status_is(r->status, "failed")) {
                has_failed = true;
            } else {
                has_other = true;
            }
        }
        summary.total_size = format_size(total);

        if (has_failed && !has_completed) {
            summary.status = "Failed";
        } else if (has_completed && !has_failed && !has_other) {
            summary.status = "Completed";
        } else if (has_failed && has_completed) {
            summary.status = "Mixed";
        } else {
            summary.status = "Incomplete";
        }
        out.push_back(std::move(summary));
    }

    std::stable_sort(out.begin(), out.end(), [](const SessionSummary& a, const SessionSummary& b) {
        return a.created_at > b.created_at;
    });
    return out;
}

} // namespace icnx::store
