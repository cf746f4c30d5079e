// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/store/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace icnx::store {

// Prepared statement; finalized on destruction
class Statement {
public:
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameters are 1-based
    [[nodiscard]] std::error_code bind(int index, std::string_view value) noexcept;
    [[nodiscard]] std::error_code bind(int index, std::int64_t value) noexcept;
    [[nodiscard]] std::error_code bind(int index, double value) noexcept;
    [[nodiscard]] std::error_code bind_null(int index) noexcept;

    template<typename T>
    [[nodiscard]] std::error_code bind(int index, const std::optional<T>& value) noexcept {
        return value ? bind(index, *value) : bind_null(index);
    }

    // true while a row is available, false once done
    [[nodiscard]] std::expected<bool, std::error_code> step() noexcept;

    // Step until done
    [[nodiscard]] std::error_code run() noexcept;

    // Columns are 0-based
    [[nodiscard]] bool is_null(int column) const noexcept;
    [[nodiscard]] std::string text(int column) const;
    [[nodiscard]] std::int64_t int64(int column) const noexcept;
    [[nodiscard]] double real(int column) const noexcept;
    [[nodiscard]] std::optional<std::string> optional_text(int column) const;
    [[nodiscard]] std::optional<std::int64_t> optional_int64(int column) const noexcept;

private:
    friend class Database;
    Statement(sqlite3_stmt* stmt, sqlite3* db) noexcept : stmt_(stmt), db_(db) {}

    sqlite3_stmt* stmt_{nullptr};
    sqlite3* db_{nullptr};
};

// SQLite connection in WAL mode; closed on destruction
class Database {
public:
    // Creates parent directories and the file when missing
    [[nodiscard]] static std::expected<Database, std::error_code>
    open(const std::filesystem::path& path);

    // Opens without creating; StoreErrc::not_found when the file is absent.
    // `schema` is applied so older files gain missing tables.
    [[nodiscard]] static std::expected<Database, std::error_code>
    open_existing(const std::filesystem::path& path, std::string_view schema);

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] std::error_code exec(std::string_view sql);

    [[nodiscard]] std::expected<Statement, std::error_code> prepare(std::string_view sql);

    // Rows touched by the last write
    [[nodiscard]] std::int64_t changes() const noexcept;

    [[nodiscard]] std::string last_error() const;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    Database(sqlite3* db, std::filesystem::path path) noexcept : db_(db), path_(std::move(path)) {}

    sqlite3* db_{nullptr};
    std::filesystem::path path_;
};

} // namespace icnx::store
