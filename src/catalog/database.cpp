#include "fcat/catalog/database.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <utility>

namespace fcat::catalog {
namespace {

constexpr int kBusyTimeoutMs = 5000;

} // namespace

// ════════════════════════════════════════════════════════
// Statement
// ════════════════════════════════════════════════════════

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)),
      stmt_(std::exchange(other.stmt_, nullptr)),
      bind_status_(other.bind_status_) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
        db_ = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
        bind_status_ = other.bind_status_;
    }
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    const int rc = sqlite3_bind_text(stmt_, index, value.c_str(),
                                     static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (bind_status_ == SQLITE_OK) {
        bind_status_ = rc;
    }
    return *this;
}

Statement& Statement::bind(int index, const char* value) {
    return bind(index, std::string(value));
}

Statement& Statement::bind(int index, std::int64_t value) {
    const int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    if (bind_status_ == SQLITE_OK) {
        bind_status_ = rc;
    }
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, *value) : bind_null(index);
}

Statement& Statement::bind(int index, const std::optional<std::int64_t>& value) {
    return value ? bind(index, *value) : bind_null(index);
}

Statement& Statement::bind_null(int index) {
    const int rc = sqlite3_bind_null(stmt_, index);
    if (bind_status_ == SQLITE_OK) {
        bind_status_ = rc;
    }
    return *this;
}

Result<bool> Statement::step() {
    if (bind_status_ != SQLITE_OK) {
        return Err<bool>(Error::store(std::string("bind failed: ") + sqlite3_errstr(bind_status_)));
    }

    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return Ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Ok(false);
    }
    return Err<bool>(last_error("step"));
}

Result<void> Statement::run() {
    while (true) {
        auto row = step();
        if (row.is_error()) {
            return Err<void>(row.error());
        }
        if (!row.value()) {
            return Ok();
        }
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
    bind_status_ = SQLITE_OK;
}

std::string Statement::column_text(int column) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (text == nullptr) {
        return {};
    }
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<std::string> Statement::column_optional_text(int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_text(column);
}

std::int64_t Statement::column_int64(int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

std::optional<std::int64_t> Statement::column_optional_int64(int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_int64(column);
}

Error Statement::last_error(const char* context) const {
    return Error::store(std::string(context) + " failed: " + sqlite3_errmsg(db_));
}

// ════════════════════════════════════════════════════════
// Database
// ════════════════════════════════════════════════════════

Result<std::unique_ptr<Database>> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = handle != nullptr ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return Err<std::unique_ptr<Database>>(Error::store("Cannot open catalog " + path + ": " + message));
    }

    std::unique_ptr<Database> db(new Database(handle, path));
    sqlite3_busy_timeout(handle, kBusyTimeoutMs);

    auto fk = db->execute("PRAGMA foreign_keys = ON;");
    if (fk.is_error()) {
        return Err<std::unique_ptr<Database>>(fk.error());
    }

    // WAL is not available for in-memory databases; failure there is harmless
    auto wal = db->execute("PRAGMA journal_mode = WAL;");
    if (wal.is_error()) {
        spdlog::debug("[Catalog] WAL journaling unavailable for {}: {}", path, wal.error().message);
    }

    spdlog::debug("[Catalog] opened {}", path);
    return Ok(std::move(db));
}

Database::~Database() {
    if (handle_ != nullptr) {
        sqlite3_close_v2(handle_);
    }
}

Result<void> Database::execute(const std::string& sql) {
    char* error_message = nullptr;
    const int rc = sqlite3_exec(handle_, sql.c_str(), nullptr, nullptr, &error_message);
    if (rc != SQLITE_OK) {
        std::string message = error_message != nullptr ? error_message : sqlite3_errstr(rc);
        sqlite3_free(error_message);
        return Err<void>(Error::store(message));
    }
    return Ok();
}

Result<Statement> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(handle_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return Err<Statement>(Error::store(std::string("prepare failed: ") + sqlite3_errmsg(handle_)));
    }
    return Ok(Statement(handle_, stmt));
}

std::int64_t Database::changes() const {
    return static_cast<std::int64_t>(sqlite3_changes(handle_));
}

// ════════════════════════════════════════════════════════
// Transaction
// ════════════════════════════════════════════════════════

Result<Transaction> Transaction::begin(Database& db) {
    auto result = db.execute("BEGIN IMMEDIATE;");
    if (result.is_error()) {
        return Err<Transaction>(result.error());
    }
    return Ok(Transaction(db));
}

Transaction::Transaction(Transaction&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)),
      active_(std::exchange(other.active_, false)) {}

Transaction::~Transaction() {
    if (active_) {
        rollback();
    }
}

Result<void> Transaction::commit() {
    if (!active_ || db_ == nullptr) {
        return Err<void>(Error::store("commit on inactive transaction"));
    }
    auto result = db_->execute("COMMIT;");
    if (result.is_error()) {
        rollback();
        return result;
    }
    active_ = false;
    return Ok();
}

void Transaction::rollback() {
    if (!active_ || db_ == nullptr) {
        return;
    }
    active_ = false;
    auto result = db_->execute("ROLLBACK;");
    if (result.is_error()) {
        spdlog::error("[Catalog] rollback failed: {}", result.error().message);
    }
}

std::string placeholders(std::size_t count) {
    std::string out;
    out.reserve(count * 2);
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0) {
            out += ',';
        }
        out += '?';
    }
    return out;
}

} // namespace fcat::catalog
