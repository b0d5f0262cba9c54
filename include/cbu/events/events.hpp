#pragma once

/**
 * @file events.hpp
 * @brief Upload lifecycle events emitted by the orchestrator
 *
 * Plain structs, copied into handlers. Every event carries the file name so
 * subscribers can correlate without holding orchestrator state.
 */

#include "cbu/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace cbu::events {

/// A fresh resumable session was initiated and persisted.
struct UploadStartedEvent {
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// A stored session was validated against the remote side and will continue.
struct UploadResumedEvent {
    std::string file_name;
    std::uint64_t confirmed_bytes = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// A stored session was dropped (expired, folder changed, file changed, remote 404).
struct SessionDiscardedEvent {
    std::string file_name;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ChunkAcceptedEvent {
    std::string file_name;
    std::uint64_t chunk_bytes = 0;
    std::uint64_t confirmed_bytes = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// The remote side did not advance its confirmed offset after a chunk.
struct ChunkRetriedEvent {
    std::string file_name;
    std::uint64_t offset = 0;
    int consecutive_stalls = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// An identical remote object already existed; nothing was transferred.
struct DuplicateSkippedEvent {
    std::string file_name;
    std::uint64_t size = 0;
    std::string remote_file_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadCompletedEvent {
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::string remote_file_id;
    bool checksum_verified = false;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadFailedEvent {
    std::string file_name;
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ConsentRequiredEvent {
    std::string auth_challenge;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace cbu::events
