#pragma once

#include "cbu/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cbu::remote {

/// Chunk stored; the server holds `confirmed_bytes` bytes of the object so far.
struct ChunkAccepted {
    std::uint64_t confirmed_bytes = 0;
};

/// Final chunk stored and the remote object created.
struct UploadFinished {
    std::string remote_file_id;
    std::optional<std::string> checksum; ///< MD5 hex reported by the server, if any
};

using ChunkResult = std::variant<ChunkAccepted, UploadFinished>;

struct SessionInProgress {
    std::uint64_t confirmed_bytes = 0;
};

struct SessionAlreadyComplete {
    std::string remote_file_id;
    std::optional<std::string> checksum; ///< MD5 hex reported by the server, if any
};

struct SessionExpired {};

using ProgressResult = std::variant<SessionInProgress, SessionAlreadyComplete, SessionExpired>;

/**
 * @brief Existing remote object found by name in the destination folder
 */
struct RemoteFileInfo {
    std::string id;
    std::optional<std::uint64_t> size; ///< Absent for objects without binary content
};

/**
 * @brief Client side of the resumable upload protocol
 *
 * Implementations perform no retries. Every call is one round trip and its
 * outcome is reported as-is; the caller owns retry decisions.
 */
class RemoteUploadEndpoint {
public:
    virtual ~RemoteUploadEndpoint() = default;

    /// Opens a resumable session and returns its URI (the resume token).
    virtual Result<std::string> initiate(const std::string& folder_id,
                                         const std::string& file_name,
                                         const std::string& mime_type,
                                         std::uint64_t total_bytes) = 0;

    /// Sends bytes [offset, offset + bytes.size()) of a `total_bytes` object.
    virtual Result<ChunkResult> upload_chunk(const std::string& session_uri,
                                             const std::vector<std::uint8_t>& bytes,
                                             std::uint64_t offset,
                                             std::uint64_t total_bytes) = 0;

    /// Zero-payload probe of how far a session got.
    virtual Result<ProgressResult> query_progress(const std::string& session_uri,
                                                  std::uint64_t total_bytes) = 0;

    /// Newest non-trashed object named exactly `file_name` in `folder_id`.
    virtual Result<std::optional<RemoteFileInfo>> find_by_name(const std::string& folder_id,
                                                               const std::string& file_name) = 0;
};

} // namespace cbu::remote
