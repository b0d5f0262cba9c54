#pragma once

#include "cbu/store/session_store.hpp"
#include "cbu/store/sqlite_database.hpp"

#include <functional>
#include <memory>

namespace cbu::store {

/**
 * @brief SessionStore backed by a one-row SQLite table
 *
 * The table enforces the single slot with a CHECK on its primary key, so a
 * second session can only ever replace the first.
 */
class SqliteSessionStore : public SessionStore {
public:
    /// Creates the table if needed. Use create() to get schema errors as a Result.
    static Result<std::unique_ptr<SqliteSessionStore>> create(std::shared_ptr<SqliteDatabase> db);

    Result<std::optional<ResumableUploadSession>> load() override;
    Result<void> save(const ResumableUploadSession& session) override;
    Result<void> update_bytes_uploaded(std::uint64_t bytes) override;
    Result<void> update_remote_file_id(const std::string& remote_file_id) override;
    Result<void> clear() override;

private:
    explicit SqliteSessionStore(std::shared_ptr<SqliteDatabase> db) : db_(std::move(db)) {}

    Result<void> run_update(const char* sql, const std::function<void(SqliteDatabase::Statement&)>& binder);

    std::shared_ptr<SqliteDatabase> db_;
};

} // namespace cbu::store
