#include "cbu/store/sqlite_session_store.hpp"

#include <spdlog/spdlog.h>

namespace cbu::store {
namespace {

constexpr const char* kCreateTable = R"(
    CREATE TABLE IF NOT EXISTS upload_session (
        slot INTEGER PRIMARY KEY CHECK(slot = 1),
        session_uri TEXT NOT NULL,
        local_file_ref TEXT NOT NULL,
        file_name TEXT NOT NULL,
        total_bytes INTEGER NOT NULL CHECK(total_bytes >= 0),
        bytes_uploaded INTEGER NOT NULL CHECK(bytes_uploaded >= 0 AND bytes_uploaded <= total_bytes),
        destination_folder_id TEXT NOT NULL,
        created_at_ms INTEGER NOT NULL,
        remote_file_id TEXT
    );
)";

std::int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_millis(std::int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace

Result<std::unique_ptr<SqliteSessionStore>> SqliteSessionStore::create(std::shared_ptr<SqliteDatabase> db) {
    std::lock_guard<std::mutex> lock(db->mutex());
    auto created = db->exec(kCreateTable);
    if (created.is_error()) {
        return Err<std::unique_ptr<SqliteSessionStore>, Error>(created.error());
    }
    return Ok(std::unique_ptr<SqliteSessionStore>(new SqliteSessionStore(std::move(db))));
}

Result<std::optional<ResumableUploadSession>> SqliteSessionStore::load() {
    using Loaded = std::optional<ResumableUploadSession>;
    std::lock_guard<std::mutex> lock(db_->mutex());

    auto stmt = db_->prepare(R"(
        SELECT session_uri, local_file_ref, file_name, total_bytes, bytes_uploaded,
               destination_folder_id, created_at_ms, remote_file_id
        FROM upload_session WHERE slot = 1
    )");
    if (stmt.is_error()) {
        return Err<Loaded, Error>(stmt.error());
    }

    auto row = stmt.value().step();
    if (row.is_error()) {
        return Err<Loaded, Error>(row.error());
    }
    if (!row.value()) {
        return Ok(Loaded{});
    }

    const auto& s = stmt.value();
    ResumableUploadSession session;
    session.session_uri = s.column_text(0);
    session.local_file_ref = s.column_text(1);
    session.file_name = s.column_text(2);
    session.total_bytes = static_cast<std::uint64_t>(s.column_int64(3));
    session.bytes_uploaded = static_cast<std::uint64_t>(s.column_int64(4));
    session.destination_folder_id = s.column_text(5);
    session.created_at = from_millis(s.column_int64(6));
    session.remote_file_id = s.column_optional_text(7);
    return Ok(Loaded{std::move(session)});
}

Result<void> SqliteSessionStore::save(const ResumableUploadSession& session) {
    if (session.bytes_uploaded > session.total_bytes) {
        return Err<void>(ErrorKind::Storage, "Refusing to save inconsistent session",
                         std::to_string(session.bytes_uploaded) + " > " + std::to_string(session.total_bytes));
    }

    auto result = run_update(R"(
        INSERT OR REPLACE INTO upload_session
        (slot, session_uri, local_file_ref, file_name, total_bytes, bytes_uploaded,
         destination_folder_id, created_at_ms, remote_file_id)
        VALUES (1, ?, ?, ?, ?, ?, ?, ?, ?)
    )", [&](SqliteDatabase::Statement& stmt) {
        stmt.bind(1, session.session_uri)
            .bind(2, session.local_file_ref)
            .bind(3, session.file_name)
            .bind(4, static_cast<std::int64_t>(session.total_bytes))
            .bind(5, static_cast<std::int64_t>(session.bytes_uploaded))
            .bind(6, session.destination_folder_id)
            .bind(7, to_millis(session.created_at))
            .bind(8, session.remote_file_id);
    });
    if (result.is_ok()) {
        spdlog::debug("Saved upload session for {} ({} bytes)", session.file_name, session.total_bytes);
    }
    return result;
}

Result<void> SqliteSessionStore::update_bytes_uploaded(std::uint64_t bytes) {
    return run_update(R"(
        UPDATE upload_session
        SET bytes_uploaded = MAX(bytes_uploaded, MIN(?, total_bytes))
        WHERE slot = 1
    )", [&](SqliteDatabase::Statement& stmt) {
        stmt.bind(1, static_cast<std::int64_t>(bytes));
    });
}

Result<void> SqliteSessionStore::update_remote_file_id(const std::string& remote_file_id) {
    return run_update("UPDATE upload_session SET remote_file_id = ? WHERE slot = 1",
                      [&](SqliteDatabase::Statement& stmt) { stmt.bind(1, remote_file_id); });
}

Result<void> SqliteSessionStore::clear() {
    return run_update("DELETE FROM upload_session", [](SqliteDatabase::Statement&) {});
}

Result<void> SqliteSessionStore::run_update(const char* sql,
                                            const std::function<void(SqliteDatabase::Statement&)>& binder) {
    std::lock_guard<std::mutex> lock(db_->mutex());

    auto stmt = db_->prepare(sql);
    if (stmt.is_error()) {
        return Err<void, Error>(stmt.error());
    }
    binder(stmt.value());

    auto done = stmt.value().step();
    if (done.is_error()) {
        return Err<void, Error>(done.error());
    }
    return Ok();
}

} // namespace cbu::store
