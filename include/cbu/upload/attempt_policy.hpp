#pragma once

/**
 * @file attempt_policy.hpp
 * @brief Whole-attempt retry contract for whatever schedules the orchestrator
 *
 * The orchestrator only retries a chunk that made no progress, and only inside
 * one run. Everything else (network down, server errors, checksum mismatch)
 * ends the run with the session left intact; this policy tells the caller
 * whether and when to run again.
 *
 * DECISIONS:
 * - UploadSucceeded            -> Done
 * - UploadFailed, attempts < max -> RetryLater(retry_delay)
 * - UploadFailed, attempts >= max -> GiveUp
 * - UploadFailed with ConfigurationIncomplete or Cancelled -> GiveUp
 * - NeedsConsent               -> GiveUp, attempt not counted
 */

#include "cbu/upload/types.hpp"

#include <chrono>
#include <ctime>
#include <optional>

namespace cbu::upload {

struct AttemptDecision {
    enum class Action { Done, RetryLater, GiveUp };

    Action action = Action::Done;
    std::chrono::minutes delay{0};
    bool consumes_attempt = true;
};

/// Daily time of the regular scheduled run, local time.
struct DailySchedule {
    int hour = 2;
    int minute = 0;
};

class AttemptPolicy {
public:
    static constexpr int kDefaultMaxAttempts = 3;
    static constexpr std::chrono::minutes kDefaultRetryDelay{30};
    /// No extra retry when the regular run is at most this far away.
    static constexpr std::chrono::minutes kRegularRunGuard{60};

    AttemptPolicy(int max_attempts = kDefaultMaxAttempts,
                  std::chrono::minutes retry_delay = kDefaultRetryDelay,
                  DailySchedule schedule = {});

    /// `attempts_made` counts the attempt that produced `status`.
    [[nodiscard]] AttemptDecision decide(const UploadStatus& status, int attempts_made) const;

    /**
     * @brief Delay for an extra retry after the automatic attempts gave up
     *
     * nullopt when the next regular run starts within kRegularRunGuard of
     * `now_local`, since that run retries anyway.
     */
    [[nodiscard]] std::optional<std::chrono::minutes> manual_retry_delay(const std::tm& now_local) const;

    /// Time from `now_local` to the next daily run strictly after it.
    [[nodiscard]] static std::chrono::minutes until_next_run(const std::tm& now_local, DailySchedule schedule);

    int max_attempts() const { return max_attempts_; }
    std::chrono::minutes retry_delay() const { return retry_delay_; }
    const DailySchedule& schedule() const { return schedule_; }

private:
    int max_attempts_;
    std::chrono::minutes retry_delay_;
    DailySchedule schedule_;
};

} // namespace cbu::upload
