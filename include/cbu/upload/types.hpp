#pragma once

#include "cbu/core/error.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace cbu::upload {

/**
 * @brief Snapshot of transfer progress within one invocation
 */
struct UploadProgress {
    std::uint64_t bytes_uploaded = 0;
    std::uint64_t total_bytes = 0;
    double speed_bytes_per_sec = 0.0;
    std::int64_t estimated_seconds_remaining = -1; ///< -1 while speed is unknown

    /// Completed share in [0, 1]; 0 for an empty transfer.
    [[nodiscard]] double fraction() const {
        if (total_bytes == 0) {
            return 0.0;
        }
        const double f = static_cast<double>(bytes_uploaded) / static_cast<double>(total_bytes);
        return f < 0.0 ? 0.0 : (f > 1.0 ? 1.0 : f);
    }

    [[nodiscard]] int percent_complete() const { return static_cast<int>(fraction() * 100.0); }
};

struct Idle {};

struct Uploading {
    UploadProgress progress;
};

struct UploadSucceeded {
    std::string file_name;
    std::uint64_t size = 0;
    std::string remote_file_id;
    bool deduplicated = false; ///< an identical remote object already existed
};

struct UploadFailed {
    Error error;
};

/// The remote side wants the user to (re)authorize; not a failed attempt.
struct NeedsConsent {
    std::string auth_challenge;
};

using UploadStatus = std::variant<Idle, Uploading, UploadSucceeded, UploadFailed, NeedsConsent>;

/// One-line human readable rendering, e.g. "Failed: TransientNetworkOrServer: Network error".
std::string describe(const UploadStatus& status);

} // namespace cbu::upload
