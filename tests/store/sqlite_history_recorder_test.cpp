#include "cbu/store/sqlite_history_recorder.hpp"
#include "store_test_support.hpp"

#include <gtest/gtest.h>

using cbu::store::SqliteHistoryRecorder;
using cbu::store::UploadOutcome;
using cbu::store::UploadRecord;

namespace {

class SqliteHistoryRecorderTest : public cbu::test::TempDatabaseTest {
protected:
    void SetUp() override {
        TempDatabaseTest::SetUp();
        auto created = SqliteHistoryRecorder::create(db_);
        ASSERT_TRUE(created.is_ok()) << created.error().detail;
        history_ = std::move(created.value());
    }

    void TearDown() override {
        history_.reset();
        TempDatabaseTest::TearDown();
    }

    static UploadRecord record_at(std::int64_t seconds, const std::string& name, UploadOutcome outcome) {
        UploadRecord record;
        record.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
        record.file_name = name;
        record.size = 1024;
        record.outcome = outcome;
        record.destination_folder_id = "folder-1";
        return record;
    }

    std::unique_ptr<SqliteHistoryRecorder> history_;
};

} // namespace

TEST_F(SqliteHistoryRecorderTest, EmptyHistory) {
    auto all = history_->all();
    ASSERT_TRUE(all.is_ok());
    EXPECT_TRUE(all.value().empty());

    auto latest = history_->latest();
    ASSERT_TRUE(latest.is_ok());
    EXPECT_FALSE(latest.value().has_value());
}

TEST_F(SqliteHistoryRecorderTest, InsertAssignsIncreasingIds) {
    auto first = history_->insert(record_at(100, "a.backup", UploadOutcome::Success));
    auto second = history_->insert(record_at(200, "b.backup", UploadOutcome::Success));

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_GT(second.value(), first.value());
}

TEST_F(SqliteHistoryRecorderTest, AllIsNewestFirst) {
    ASSERT_TRUE(history_->insert(record_at(200, "middle.backup", UploadOutcome::Success)).is_ok());
    ASSERT_TRUE(history_->insert(record_at(300, "newest.backup", UploadOutcome::Failed)).is_ok());
    ASSERT_TRUE(history_->insert(record_at(100, "oldest.backup", UploadOutcome::Success)).is_ok());

    auto all = history_->all();
    ASSERT_TRUE(all.is_ok());
    ASSERT_EQ(all.value().size(), 3u);
    EXPECT_EQ(all.value()[0].file_name, "newest.backup");
    EXPECT_EQ(all.value()[1].file_name, "middle.backup");
    EXPECT_EQ(all.value()[2].file_name, "oldest.backup");

    auto latest = history_->latest();
    ASSERT_TRUE(latest.is_ok());
    ASSERT_TRUE(latest.value().has_value());
    EXPECT_EQ(latest.value()->file_name, "newest.backup");
    EXPECT_EQ(latest.value()->outcome, UploadOutcome::Failed);
}

TEST_F(SqliteHistoryRecorderTest, PreservesOptionalFields) {
    auto success = record_at(100, "a.backup", UploadOutcome::Success);
    success.remote_file_id = "file-1";
    auto failure = record_at(200, "a.backup", UploadOutcome::Failed);
    failure.error_message = "TransientNetworkOrServer: Server returned HTTP 503";
    failure.error_detail = "upload chunk returned HTTP 503: backend";

    ASSERT_TRUE(history_->insert(success).is_ok());
    ASSERT_TRUE(history_->insert(failure).is_ok());

    auto all = history_->all().value();
    ASSERT_EQ(all.size(), 2u);

    EXPECT_EQ(all[0].outcome, UploadOutcome::Failed);
    EXPECT_EQ(all[0].error_message, failure.error_message);
    EXPECT_EQ(all[0].error_detail, failure.error_detail);
    EXPECT_FALSE(all[0].remote_file_id.has_value());

    EXPECT_EQ(all[1].outcome, UploadOutcome::Success);
    EXPECT_EQ(all[1].remote_file_id, std::optional<std::string>("file-1"));
    EXPECT_FALSE(all[1].error_message.has_value());
    EXPECT_EQ(all[1].size, 1024u);
    EXPECT_EQ(all[1].destination_folder_id, "folder-1");
    EXPECT_EQ(all[1].timestamp, success.timestamp);
}

TEST(UploadOutcomeTest, StringForm) {
    EXPECT_STREQ(cbu::store::to_string(UploadOutcome::Success), "SUCCESS");
    EXPECT_EQ(cbu::store::outcome_from_string("FAILED"), UploadOutcome::Failed);
    EXPECT_FALSE(cbu::store::outcome_from_string("PENDING").has_value());
}
