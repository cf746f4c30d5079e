// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/store/scrape_store.hpp>
#include <icnx/log.hpp>

namespace icnx::store {

namespace {

constexpr const char* SCHEMA =
    "CREATE TABLE IF NOT EXISTS scrape ("
    " session_key TEXT,"
    " url TEXT,"
    " filename TEXT,"
    " title TEXT,"
    " type TEXT,"
    " meta TEXT,"
    " updated_at INTEGER,"
    " PRIMARY KEY(session_key, url)"
    ");";

constexpr const char* UPSERT_SQL =
    "INSERT INTO scrape (session_key, url, filename, title, type, meta, updated_at)"
    " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)"
    " ON CONFLICT(session_key, url) DO UPDATE SET"
    " filename=excluded.filename, title=excluded.title, type=excluded.type,"
    " meta=excluded.meta, updated_at=excluded.updated_at;";

constexpr const char* SELECT_SQL =
    "SELECT url, filename, title, type, meta, updated_at FROM scrape"
    " WHERE session_key = ?1 ORDER BY updated_at DESC, rowid DESC;";

struct ScrapeRow {
    std::string session_key;
    ScrapeRecord record;
    std::optional<std::string> meta_text;
};

std::error_code write_scrape(Database& db, const ScrapeRow& row) {
    auto stmt = db.prepare(UPSERT_SQL);
    if (!stmt) {
        return stmt.error();
    }
    const auto& r = row.record;
    std::error_code ec;
    if ((ec = stmt->bind(1, row.session_key))) return ec;
    if ((ec = stmt->bind(2, r.url))) return ec;
    if ((ec = stmt->bind(3, r.filename))) return ec;
    if ((ec = stmt->bind(4, r.title))) return ec;
    if ((ec = stmt->bind(5, r.type))) return ec;
    if ((ec = stmt->bind(6, row.meta_text))) return ec;
    if ((ec = stmt->bind(7, r.updated_at))) return ec;
    return stmt->run();
}

} // namespace

std::string make_scrape_key(std::string_view producer, std::string_view input_url) {
    std::string key(producer);
    key += "::";
    key += input_url;
    return key;
}

ScrapeStore::ScrapeStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path))
    , queue_("scrape", SCHEMA) {}

void ScrapeStore::upsert(const std::string& session_key, ScrapeRecord record) {
    if (record.updated_at == 0) {
        record.updated_at = unix_now();
    }

    ScrapeRow row{session_key, std::move(record), std::nullopt};
    if (!row.record.meta.is_null()) {
        row.meta_text = row.record.meta.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    queue_.enqueue(db_path_, [row = std::move(row)](Database& db) { return write_scrape(db, row); });
}

std::expected<std::vector<ScrapeRecord>, std::error_code>
ScrapeStore::read(const std::string& session_key) const {
    std::vector<ScrapeRecord> rows;

    auto db = Database::open_existing(db_path_, SCHEMA);
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
    if (auto ec = stmt->bind(1, session_key)) {
        return std::unexpected(ec);
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
        ScrapeRecord r;
        r.url = stmt->text(0);
        r.filename = stmt->optional_text(1);
        r.title = stmt->optional_text(2);
        r.type = stmt->optional_text(3);
        if (auto meta = stmt->optional_text(4)) {
            r.meta = nlohmann::json::parse(*meta, nullptr, false);
            if (r.meta.is_discarded()) {
                logger()->warn("malformed scrape meta for {}", r.url);
                r.meta = nullptr;
            }
        }
        r.updated_at = stmt->int64(5);
        rows.push_back(std::move(r));
    }
    return rows;
}

} // namespace icnx::store
