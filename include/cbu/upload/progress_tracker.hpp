#pragma once

#include "cbu/upload/types.hpp"

#include <chrono>
#include <cstddef>
#include <deque>

namespace cbu::upload {

/**
 * @brief Derives speed and ETA from confirmed-byte samples
 *
 * Speed is averaged over the last `window` samples so one slow chunk does not
 * swing the estimate.
 */
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(std::size_t window = 5);

    /// Starts a new measurement at `bytes_uploaded` (the resume offset).
    UploadProgress start(std::uint64_t bytes_uploaded, std::uint64_t total_bytes, Clock::time_point now);

    UploadProgress record(std::uint64_t bytes_uploaded, Clock::time_point now);

private:
    struct Sample {
        std::uint64_t bytes;
        Clock::time_point at;
    };

    UploadProgress snapshot() const;

    std::size_t window_;
    std::uint64_t total_bytes_ = 0;
    std::deque<Sample> samples_;
};

} // namespace cbu::upload
