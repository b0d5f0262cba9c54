#pragma once

#include "cbu/core/result.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace cbu::store {

/**
 * @brief Owned SQLite connection shared by the session store and history recorder
 *
 * Opened in WAL mode with synchronous=FULL so every committed statement is
 * durable before the call returns. Callers serialize access through mutex().
 */
class SqliteDatabase {
public:
    /// Prepared statement, finalized on destruction. Move-only.
    class Statement {
    public:
        Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
        ~Statement();

        Statement(Statement&& other) noexcept;
        Statement& operator=(Statement&& other) noexcept;
        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        Statement& bind(int index, const std::string& value);
        Statement& bind(int index, std::int64_t value);
        Statement& bind(int index, const std::optional<std::string>& value);

        /// true when a row is available, false when the statement is done.
        /// A failed bind() is reported here, before anything executes.
        Result<bool> step();

        [[nodiscard]] std::string column_text(int index) const;
        [[nodiscard]] std::optional<std::string> column_optional_text(int index) const;
        [[nodiscard]] std::int64_t column_int64(int index) const;

    private:
        void check_bind(int rc, int index);

        sqlite3* db_;
        sqlite3_stmt* stmt_;
        int bind_rc_ = 0;
        int bind_index_ = 0;
    };

    static Result<std::shared_ptr<SqliteDatabase>> open(const std::string& path);

    ~SqliteDatabase();
    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    Result<void> exec(const std::string& sql);
    Result<Statement> prepare(const std::string& sql);

    std::mutex& mutex() { return mutex_; }

private:
    explicit SqliteDatabase(sqlite3* db) : db_(db) {}

    sqlite3* db_;
    std::mutex mutex_;
};

} // namespace cbu::store
