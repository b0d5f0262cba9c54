#include "cbu/store/sqlite_history_recorder.hpp"

#include <spdlog/spdlog.h>

namespace cbu::store {
namespace {

constexpr const char* kCreateTable = R"(
    CREATE TABLE IF NOT EXISTS upload_history (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        timestamp_ms INTEGER NOT NULL,
        file_name TEXT NOT NULL,
        file_size INTEGER NOT NULL,
        status TEXT NOT NULL CHECK(status IN ('SUCCESS', 'FAILED')),
        error_message TEXT,
        error_detail TEXT,
        destination_folder_id TEXT NOT NULL,
        remote_file_id TEXT
    );
    CREATE INDEX IF NOT EXISTS idx_history_timestamp ON upload_history(timestamp_ms);
)";

constexpr const char* kSelectColumns = R"(
    SELECT id, timestamp_ms, file_name, file_size, status, error_message, error_detail,
           destination_folder_id, remote_file_id
    FROM upload_history
)";

} // namespace

const char* to_string(UploadOutcome outcome) noexcept {
    switch (outcome) {
        case UploadOutcome::Success: return "SUCCESS";
        case UploadOutcome::Failed: return "FAILED";
    }
    return "FAILED";
}

std::optional<UploadOutcome> outcome_from_string(const std::string& text) {
    if (text == "SUCCESS") return UploadOutcome::Success;
    if (text == "FAILED") return UploadOutcome::Failed;
    return std::nullopt;
}

Result<std::unique_ptr<SqliteHistoryRecorder>> SqliteHistoryRecorder::create(std::shared_ptr<SqliteDatabase> db) {
    std::lock_guard<std::mutex> lock(db->mutex());
    auto created = db->exec(kCreateTable);
    if (created.is_error()) {
        return Err<std::unique_ptr<SqliteHistoryRecorder>, Error>(created.error());
    }
    return Ok(std::unique_ptr<SqliteHistoryRecorder>(new SqliteHistoryRecorder(std::move(db))));
}

Result<std::int64_t> SqliteHistoryRecorder::insert(const UploadRecord& record) {
    std::lock_guard<std::mutex> lock(db_->mutex());

    auto stmt = db_->prepare(R"(
        INSERT INTO upload_history
        (timestamp_ms, file_name, file_size, status, error_message, error_detail,
         destination_folder_id, remote_file_id)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (stmt.is_error()) {
        return Err<std::int64_t, Error>(stmt.error());
    }

    const auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count();
    stmt.value()
        .bind(1, static_cast<std::int64_t>(ts))
        .bind(2, record.file_name)
        .bind(3, static_cast<std::int64_t>(record.size))
        .bind(4, std::string(to_string(record.outcome)))
        .bind(5, record.error_message)
        .bind(6, record.error_detail)
        .bind(7, record.destination_folder_id)
        .bind(8, record.remote_file_id);

    auto done = stmt.value().step();
    if (done.is_error()) {
        return Err<std::int64_t, Error>(done.error());
    }

    auto row = db_->prepare("SELECT last_insert_rowid()");
    if (row.is_error()) {
        return Err<std::int64_t, Error>(row.error());
    }
    auto has_row = row.value().step();
    if (has_row.is_error()) {
        return Err<std::int64_t, Error>(has_row.error());
    }
    const std::int64_t id = has_row.value() ? row.value().column_int64(0) : 0;

    spdlog::debug("History row {} recorded: {} {}", id, to_string(record.outcome), record.file_name);
    return Ok(id);
}

Result<std::vector<UploadRecord>> SqliteHistoryRecorder::all() {
    return query(std::string(kSelectColumns) + " ORDER BY timestamp_ms DESC, id DESC");
}

Result<std::optional<UploadRecord>> SqliteHistoryRecorder::latest() {
    auto rows = query(std::string(kSelectColumns) + " ORDER BY timestamp_ms DESC, id DESC LIMIT 1");
    if (rows.is_error()) {
        return Err<std::optional<UploadRecord>, Error>(rows.error());
    }
    if (rows.value().empty()) {
        return Ok(std::optional<UploadRecord>{});
    }
    return Ok(std::optional<UploadRecord>{std::move(rows.value().front())});
}

Result<std::vector<UploadRecord>> SqliteHistoryRecorder::query(const std::string& sql) {
    std::lock_guard<std::mutex> lock(db_->mutex());

    auto stmt = db_->prepare(sql);
    if (stmt.is_error()) {
        return Err<std::vector<UploadRecord>, Error>(stmt.error());
    }

    std::vector<UploadRecord> records;
    auto& s = stmt.value();
    while (true) {
        auto row = s.step();
        if (row.is_error()) {
            return Err<std::vector<UploadRecord>, Error>(row.error());
        }
        if (!row.value()) {
            break;
        }

        UploadRecord record;
        record.id = s.column_int64(0);
        record.timestamp = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::milliseconds(s.column_int64(1))));
        record.file_name = s.column_text(2);
        record.size = static_cast<std::uint64_t>(s.column_int64(3));
        const auto status = s.column_text(4);
        record.outcome = outcome_from_string(status).value_or(UploadOutcome::Failed);
        record.error_message = s.column_optional_text(5);
        record.error_detail = s.column_optional_text(6);
        record.destination_folder_id = s.column_text(7);
        record.remote_file_id = s.column_optional_text(8);
        records.push_back(std::move(record));
    }
    return Ok(std::move(records));
}

} // namespace cbu::store
