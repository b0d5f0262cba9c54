#include "cbu/upload/progress_tracker.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using cbu::upload::ProgressTracker;
using cbu::upload::UploadProgress;

namespace {
constexpr std::uint64_t MiB = 1024 * 1024;
}

TEST(ProgressTrackerTest, StartReportsOffsetWithoutEstimate) {
    ProgressTracker tracker;
    const auto t0 = ProgressTracker::Clock::time_point{} + 1h;

    auto progress = tracker.start(5 * MiB, 12 * MiB, t0);

    EXPECT_EQ(progress.bytes_uploaded, 5 * MiB);
    EXPECT_EQ(progress.total_bytes, 12 * MiB);
    EXPECT_DOUBLE_EQ(progress.speed_bytes_per_sec, 0.0);
    EXPECT_EQ(progress.estimated_seconds_remaining, -1);
}

TEST(ProgressTrackerTest, SpeedAndEtaFromSamples) {
    ProgressTracker tracker;
    const auto t0 = ProgressTracker::Clock::time_point{} + 1h;

    tracker.start(0, 12 * MiB, t0);
    auto progress = tracker.record(5 * MiB, t0 + 5s);

    EXPECT_DOUBLE_EQ(progress.speed_bytes_per_sec, static_cast<double>(MiB));
    EXPECT_EQ(progress.estimated_seconds_remaining, 7);
}

TEST(ProgressTrackerTest, EtaRoundsUp) {
    ProgressTracker tracker;
    const auto t0 = ProgressTracker::Clock::time_point{} + 1h;

    tracker.start(0, 11, t0);
    auto progress = tracker.record(2, t0 + 1s);

    EXPECT_EQ(progress.estimated_seconds_remaining, 5);
}

TEST(ProgressTrackerTest, OldSamplesLeaveTheWindow) {
    ProgressTracker tracker(2);
    const auto t0 = ProgressTracker::Clock::time_point{} + 1h;

    tracker.start(0, 100 * MiB, t0);
    tracker.record(10 * MiB, t0 + 100s);
    auto progress = tracker.record(20 * MiB, t0 + 101s);

    // Only the last two samples count: 10 MiB in one second
    EXPECT_DOUBLE_EQ(progress.speed_bytes_per_sec, static_cast<double>(10 * MiB));
    EXPECT_EQ(progress.estimated_seconds_remaining, 8);
}

TEST(ProgressTrackerTest, CompleteUploadHasZeroRemaining) {
    ProgressTracker tracker;
    const auto t0 = ProgressTracker::Clock::time_point{} + 1h;

    tracker.start(0, 4 * MiB, t0);
    auto progress = tracker.record(4 * MiB, t0 + 2s);

    EXPECT_EQ(progress.estimated_seconds_remaining, 0);
    EXPECT_EQ(progress.percent_complete(), 100);
}

TEST(ProgressTrackerTest, SameInstantGivesNoSpeed) {
    ProgressTracker tracker;
    const auto t0 = ProgressTracker::Clock::time_point{} + 1h;

    tracker.start(0, 10, t0);
    auto progress = tracker.record(5, t0);

    EXPECT_DOUBLE_EQ(progress.speed_bytes_per_sec, 0.0);
    EXPECT_EQ(progress.estimated_seconds_remaining, -1);
}

TEST(UploadProgressTest, FractionIsClamped) {
    UploadProgress progress;
    EXPECT_DOUBLE_EQ(progress.fraction(), 0.0);

    progress.total_bytes = 4;
    progress.bytes_uploaded = 1;
    EXPECT_DOUBLE_EQ(progress.fraction(), 0.25);
    EXPECT_EQ(progress.percent_complete(), 25);

    progress.bytes_uploaded = 8;
    EXPECT_DOUBLE_EQ(progress.fraction(), 1.0);
}
