#pragma once

/**
 * @file database.hpp
 * @brief Thin RAII layer over a raw sqlite3 connection
 *
 * WHAT IT PROVIDES:
 * - Database: owns the connection (opened in serialized/full-mutex mode)
 * - Statement: owns one prepared statement, move-only
 * - Transaction: BEGIN IMMEDIATE ... COMMIT, rolled back on destruction
 *   unless committed
 *
 * Every failure is reported as an Error of kind Store carrying
 * sqlite3_errmsg() text.
 *
 * EXAMPLE:
 * auto db = Database::open(":memory:");
 * auto tx = Transaction::begin(*db.value());
 * auto stmt = db.value()->prepare("INSERT INTO cases VALUES (?, ?, ?)");
 * stmt.value().bind(1, id).bind(2, name).bind(3, now);
 * stmt.value().run();
 * tx.value().commit();
 */

#include "fcat/core/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace fcat::catalog {

class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt) noexcept : db_(db), stmt_(stmt) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    // Parameter indices are 1-based, as in sqlite3_bind_*
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const char* value);
    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, const std::optional<std::string>& value);
    Statement& bind(int index, const std::optional<std::int64_t>& value);
    Statement& bind_null(int index);

    /**
     * @brief Advance one row
     *
     * RETURNS: true when a row is available, false when done
     */
    Result<bool> step();

    /// Execute to completion, ignoring any rows.
    Result<void> run();

    void reset();

    std::string column_text(int column) const;
    std::optional<std::string> column_optional_text(int column) const;
    std::int64_t column_int64(int column) const;
    std::optional<std::int64_t> column_optional_int64(int column) const;

private:
    Error last_error(const char* context) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
    int bind_status_ = 0;   ///< First non-OK sqlite3_bind_* result, reported by step()
};

class Database {
public:
    /**
     * @brief Open (or create) a catalog database
     *
     * Enables foreign keys and WAL journaling and sets a busy timeout.
     * Pass ":memory:" for a private in-memory catalog.
     */
    static Result<std::unique_ptr<Database>> open(const std::string& path);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Result<void> execute(const std::string& sql);
    Result<Statement> prepare(const std::string& sql);

    /// Rows modified by the most recent INSERT/UPDATE/DELETE.
    std::int64_t changes() const;

    const std::string& path() const noexcept { return path_; }

private:
    Database(sqlite3* handle, std::string path) : handle_(handle), path_(std::move(path)) {}

    sqlite3* handle_ = nullptr;
    std::string path_;
};

class Transaction {
public:
    static Result<Transaction> begin(Database& db);

    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&&) = delete;

    Result<void> commit();
    void rollback();

private:
    explicit Transaction(Database& db) : db_(&db) {}

    Database* db_ = nullptr;
    bool active_ = true;
};

/// "?,?,?" with count placeholders, for IN (...) lists.
std::string placeholders(std::size_t count);

} // namespace fcat::catalog
