// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/store/sqlite.hpp>
#include <icnx/log.hpp>
#include <sqlite3.h>

namespace icnx::store {

//=============================================================================
// Statement
//=============================================================================

Statement::Statement(Statement&& other) noexcept
    : stmt_(other.stmt_), db_(other.db_) {
    other.stmt_ = nullptr;
    other.db_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        stmt_ = other.stmt_;
        db_ = other.db_;
        other.stmt_ = nullptr;
        other.db_ = nullptr;
    }
    return *this;
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

std::error_code Statement::bind(int index, std::string_view value) noexcept {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    return rc == SQLITE_OK ? std::error_code{} : make_error_code(StoreErrc::bind_failed);
}

std::error_code Statement::bind(int index, std::int64_t value) noexcept {
    int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    return rc == SQLITE_OK ? std::error_code{} : make_error_code(StoreErrc::bind_failed);
}

std::error_code Statement::bind(int index, double value) noexcept {
    int rc = sqlite3_bind_double(stmt_, index, value);
    return rc == SQLITE_OK ? std::error_code{} : make_error_code(StoreErrc::bind_failed);
}

std::error_code Statement::bind_null(int index) noexcept {
    int rc = sqlite3_bind_null(stmt_, index);
    return rc == SQLITE_OK ? std::error_code{} : make_error_code(StoreErrc::bind_failed);
}

std::expected<bool, std::error_code> Statement::step() noexcept {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return std::unexpected(make_error_code(StoreErrc::step_failed));
}

std::error_code Statement::run() noexcept {
    while (true) {
        auto row = step();
        if (!row) {
            return row.error();
        }
        if (!*row) {
            return {};
        }
    }
}

bool Statement::is_null(int column) const noexcept {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::string Statement::text(int column) const {
    const auto* data = sqlite3_column_text(stmt_, column);
    if (!data) {
        return {};
    }
    auto size = sqlite3_column_bytes(stmt_, column);
    return std::string(reinterpret_cast<const char*>(data), static_cast<std::size_t>(size));
}

std::int64_t Statement::int64(int column) const noexcept {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

double Statement::real(int column) const noexcept {
    return sqlite3_column_double(stmt_, column);
}

std::optional<std::string> Statement::optional_text(int column) const {
    if (is_null(column)) return std::nullopt;
    return text(column);
}

std::optional<std::int64_t> Statement::optional_int64(int column) const noexcept {
    if (is_null(column)) return std::nullopt;
    return int64(column);
}

//=============================================================================
// Database
//=============================================================================

std::expected<Database, std::error_code> Database::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            logger()->warn("cannot create store directory {}: {}", path.parent_path().string(), ec.message());
            return std::unexpected(make_error_code(StoreErrc::io_error));
        }
    }

    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        logger()->warn("cannot open {}: {}", path.string(), handle ? sqlite3_errmsg(handle) : "out of memory");
        if (handle) sqlite3_close(handle);
        return std::unexpected(make_error_code(StoreErrc::open_failed));
    }

    sqlite3_busy_timeout(handle, 5000);

    Database db(handle, path);
    if (auto pragma_ec = db.exec("PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;")) {
        return std::unexpected(pragma_ec);
    }
    return db;
}

std::expected<Database, std::error_code>
Database::open_existing(const std::filesystem::path& path, std::string_view schema) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(make_error_code(StoreErrc::not_found));
    }

    auto db = open(path);
    if (!db) {
        return db;
    }
    if (auto schema_ec = db->exec(schema)) {
        return std::unexpected(schema_ec);
    }
    return db;
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        if (db_) sqlite3_close(db_);
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

std::error_code Database::exec(std::string_view sql) {
    std::string statement(sql);
    char* err = nullptr;
    int rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        logger()->warn("sqlite exec on {} failed: {}", path_.string(), err ? err : "unknown");
        sqlite3_free(err);
        return make_error_code(StoreErrc::exec_failed);
    }
    return {};
}

std::expected<Statement, std::error_code> Database::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        logger()->warn("sqlite prepare on {} failed: {}", path_.string(), sqlite3_errmsg(db_));
        if (stmt) sqlite3_finalize(stmt);
        return std::unexpected(make_error_code(StoreErrc::prepare_failed));
    }
    return Statement(stmt, db_);
}

std::int64_t Database::changes() const noexcept {
    return static_cast<std::int64_t>(sqlite3_changes(db_));
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "closed";
}

} // namespace icnx::store
