#pragma once

#include "cbu/store/history.hpp"
#include "cbu/store/sqlite_database.hpp"

#include <memory>

namespace cbu::store {

class SqliteHistoryRecorder : public HistoryRecorder {
public:
    static Result<std::unique_ptr<SqliteHistoryRecorder>> create(std::shared_ptr<SqliteDatabase> db);

    Result<std::int64_t> insert(const UploadRecord& record) override;
    Result<std::vector<UploadRecord>> all() override;
    Result<std::optional<UploadRecord>> latest() override;

private:
    explicit SqliteHistoryRecorder(std::shared_ptr<SqliteDatabase> db) : db_(std::move(db)) {}

    Result<std::vector<UploadRecord>> query(const std::string& sql);

    std::shared_ptr<SqliteDatabase> db_;
};

} // namespace cbu::store
