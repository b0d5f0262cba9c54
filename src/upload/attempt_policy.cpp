#include "cbu/upload/attempt_policy.hpp"

#include <type_traits>

namespace cbu::upload {

AttemptPolicy::AttemptPolicy(int max_attempts, std::chrono::minutes retry_delay, DailySchedule schedule)
    : max_attempts_(max_attempts < 1 ? 1 : max_attempts), retry_delay_(retry_delay), schedule_(schedule) {}

AttemptDecision AttemptPolicy::decide(const UploadStatus& status, int attempts_made) const {
    using Action = AttemptDecision::Action;

    return std::visit([&](const auto& s) -> AttemptDecision {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, UploadFailed>) {
            if (s.error.kind == ErrorKind::ConfigurationIncomplete || s.error.kind == ErrorKind::Cancelled) {
                return {Action::GiveUp, std::chrono::minutes{0}, true};
            }
            if (attempts_made < max_attempts_) {
                return {Action::RetryLater, retry_delay_, true};
            }
            return {Action::GiveUp, std::chrono::minutes{0}, true};
        } else if constexpr (std::is_same_v<T, NeedsConsent>) {
            return {Action::GiveUp, std::chrono::minutes{0}, false};
        } else {
            return {Action::Done, std::chrono::minutes{0}, true};
        }
    }, status);
}

std::optional<std::chrono::minutes> AttemptPolicy::manual_retry_delay(const std::tm& now_local) const {
    if (until_next_run(now_local, schedule_) <= kRegularRunGuard) {
        return std::nullopt;
    }
    return retry_delay_;
}

std::chrono::minutes AttemptPolicy::until_next_run(const std::tm& now_local, DailySchedule schedule) {
    constexpr int minutes_per_day = 24 * 60;
    const int now_minute = now_local.tm_hour * 60 + now_local.tm_min;
    const int run_minute = schedule.hour * 60 + schedule.minute;

    int diff = run_minute - now_minute;
    // A run at the current minute counts as already started
    if (diff <= 0) {
        diff += minutes_per_day;
    }
    return std::chrono::minutes{diff};
}

} // namespace cbu::upload
