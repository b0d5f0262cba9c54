#include "cbu/store/sqlite_database.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace cbu::store {
namespace {

std::string sqlite_message(sqlite3* db) {
    const char* msg = db ? sqlite3_errmsg(db) : nullptr;
    return msg ? msg : "Unknown error";
}

} // namespace

SqliteDatabase::Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

SqliteDatabase::Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), bind_rc_(other.bind_rc_), bind_index_(other.bind_index_) {
    other.stmt_ = nullptr;
}

SqliteDatabase::Statement& SqliteDatabase::Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        bind_rc_ = other.bind_rc_;
        bind_index_ = other.bind_index_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void SqliteDatabase::Statement::check_bind(int rc, int index) {
    // Keep the first failure; later binds are reported through it
    if (rc != SQLITE_OK && bind_rc_ == SQLITE_OK) {
        bind_rc_ = rc;
        bind_index_ = index;
    }
}

SqliteDatabase::Statement& SqliteDatabase::Statement::bind(int index, const std::string& value) {
    check_bind(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
               index);
    return *this;
}

SqliteDatabase::Statement& SqliteDatabase::Statement::bind(int index, std::int64_t value) {
    check_bind(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), index);
    return *this;
}

SqliteDatabase::Statement& SqliteDatabase::Statement::bind(int index, const std::optional<std::string>& value) {
    if (value) {
        return bind(index, *value);
    }
    check_bind(sqlite3_bind_null(stmt_, index), index);
    return *this;
}

Result<bool> SqliteDatabase::Statement::step() {
    if (bind_rc_ != SQLITE_OK) {
        return Err<bool>(ErrorKind::Storage, "Local database operation failed",
                         "bind parameter " + std::to_string(bind_index_) + ": " + sqlite3_errstr(bind_rc_));
    }
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return Ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Ok(false);
    }
    return Err<bool>(ErrorKind::Storage, "Local database operation failed", sqlite_message(db_));
}

std::string SqliteDatabase::Statement::column_text(int index) const {
    const auto* text = sqlite3_column_text(stmt_, index);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> SqliteDatabase::Statement::column_optional_text(int index) const {
    if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_text(index);
}

std::int64_t SqliteDatabase::Statement::column_int64(int index) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index));
}

Result<std::shared_ptr<SqliteDatabase>> SqliteDatabase::open(const std::string& path) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open(path.c_str(), &raw);
    if (rc != SQLITE_OK) {
        std::string detail = path + ": " + sqlite_message(raw);
        sqlite3_close(raw);
        return Err<std::shared_ptr<SqliteDatabase>>(ErrorKind::Storage, "Cannot open local database", detail);
    }

    std::shared_ptr<SqliteDatabase> db(new SqliteDatabase(raw));

    // WAL keeps readers off the writer; FULL fsyncs on every commit
    auto wal = db->exec("PRAGMA journal_mode=WAL;");
    if (wal.is_error()) {
        return Err<std::shared_ptr<SqliteDatabase>, Error>(wal.error());
    }
    auto sync = db->exec("PRAGMA synchronous=FULL;");
    if (sync.is_error()) {
        return Err<std::shared_ptr<SqliteDatabase>, Error>(sync.error());
    }
    auto busy = db->exec("PRAGMA busy_timeout=5000;");
    if (busy.is_error()) {
        spdlog::warn("Could not set busy timeout on {}: {}", path, busy.error().detail);
    }

    spdlog::debug("Opened state database {}", path);
    return Ok(std::move(db));
}

SqliteDatabase::~SqliteDatabase() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Result<void> SqliteDatabase::exec(const std::string& sql) {
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "Unknown error";
        sqlite3_free(err_msg);
        return Err<void>(ErrorKind::Storage, "Local database operation failed", error);
    }
    return Ok();
}

Result<SqliteDatabase::Statement> SqliteDatabase::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Err<Statement>(ErrorKind::Storage, "Local database query failed", sqlite_message(db_));
    }
    return Ok(Statement(db_, stmt));
}

} // namespace cbu::store
