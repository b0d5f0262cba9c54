#pragma once

/**
 * @file session_store.hpp
 * @brief Durable single-slot storage of the in-flight resumable upload
 *
 * WHAT IT HOLDS:
 * At most one ResumableUploadSession. The slot is either empty or holds a
 * complete record; save() replaces the whole record in one statement, so a
 * crash never exposes a half-written session.
 *
 * HOW THE ORCHESTRATOR USES IT:
 * - save() right after the remote side issues a session URI, before any chunk
 * - update_bytes_uploaded() after every accepted chunk
 * - update_remote_file_id() once the remote side reports completion
 * - clear() after completion is recorded, or when the session is invalid
 *
 * A session with remote_file_id set is a finished upload whose cleanup was
 * interrupted; the next run records it without transferring anything.
 */

#include "cbu/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace cbu::store {

/// Resume tokens are assumed to die about a week after issue.
constexpr std::chrono::hours kMaxSessionAge{24 * 6};

struct ResumableUploadSession {
    std::string session_uri;
    std::string local_file_ref;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_uploaded = 0;
    std::string destination_folder_id;
    std::chrono::system_clock::time_point created_at{};
    std::optional<std::string> remote_file_id;

    [[nodiscard]] bool is_expired(std::chrono::system_clock::time_point now,
                                  std::chrono::system_clock::duration max_age = kMaxSessionAge) const {
        return now - created_at > max_age;
    }

    bool operator==(const ResumableUploadSession& other) const {
        return session_uri == other.session_uri && local_file_ref == other.local_file_ref &&
               file_name == other.file_name && total_bytes == other.total_bytes &&
               bytes_uploaded == other.bytes_uploaded &&
               destination_folder_id == other.destination_folder_id && created_at == other.created_at &&
               remote_file_id == other.remote_file_id;
    }
};

class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual Result<std::optional<ResumableUploadSession>> load() = 0;

    /// Replaces any stored session.
    virtual Result<void> save(const ResumableUploadSession& session) = 0;

    /// Never lowers the stored value and never exceeds total_bytes.
    virtual Result<void> update_bytes_uploaded(std::uint64_t bytes) = 0;

    virtual Result<void> update_remote_file_id(const std::string& remote_file_id) = 0;

    virtual Result<void> clear() = 0;
};

} // namespace cbu::store
