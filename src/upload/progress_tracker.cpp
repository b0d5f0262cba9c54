#include "cbu/upload/progress_tracker.hpp"

#include <cmath>

namespace cbu::upload {

ProgressTracker::ProgressTracker(std::size_t window) : window_(window < 2 ? 2 : window) {}

UploadProgress ProgressTracker::start(std::uint64_t bytes_uploaded, std::uint64_t total_bytes, Clock::time_point now) {
    total_bytes_ = total_bytes;
    samples_.clear();
    samples_.push_back({bytes_uploaded, now});
    return snapshot();
}

UploadProgress ProgressTracker::record(std::uint64_t bytes_uploaded, Clock::time_point now) {
    samples_.push_back({bytes_uploaded, now});
    while (samples_.size() > window_) {
        samples_.pop_front();
    }
    return snapshot();
}

UploadProgress ProgressTracker::snapshot() const {
    UploadProgress progress;
    progress.total_bytes = total_bytes_;
    if (samples_.empty()) {
        return progress;
    }

    const auto& first = samples_.front();
    const auto& last = samples_.back();
    progress.bytes_uploaded = last.bytes;

    const double seconds = std::chrono::duration<double>(last.at - first.at).count();
    if (seconds > 0.0 && last.bytes > first.bytes) {
        progress.speed_bytes_per_sec = static_cast<double>(last.bytes - first.bytes) / seconds;
    }

    if (progress.speed_bytes_per_sec > 0.0) {
        const auto remaining = total_bytes_ > last.bytes ? total_bytes_ - last.bytes : 0;
        progress.estimated_seconds_remaining =
            static_cast<std::int64_t>(std::ceil(static_cast<double>(remaining) / progress.speed_bytes_per_sec));
    }
    return progress;
}

} // namespace cbu::upload
