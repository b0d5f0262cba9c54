#pragma once

#include "cbu/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cbu::store {

enum class UploadOutcome { Success, Failed };

const char* to_string(UploadOutcome outcome) noexcept;
std::optional<UploadOutcome> outcome_from_string(const std::string& text);

/// One finished attempt. Immutable once inserted.
struct UploadRecord {
    std::int64_t id = 0; ///< assigned by the recorder
    std::chrono::system_clock::time_point timestamp{};
    std::string file_name;
    std::uint64_t size = 0;
    UploadOutcome outcome = UploadOutcome::Success;
    std::optional<std::string> error_message;
    std::optional<std::string> error_detail;
    std::string destination_folder_id;
    std::optional<std::string> remote_file_id;
};

/**
 * @brief Append-only log of upload attempts
 */
class HistoryRecorder {
public:
    virtual ~HistoryRecorder() = default;

    /// Returns the id of the new row.
    virtual Result<std::int64_t> insert(const UploadRecord& record) = 0;

    /// Newest first.
    virtual Result<std::vector<UploadRecord>> all() = 0;

    virtual Result<std::optional<UploadRecord>> latest() = 0;
};

} // namespace cbu::store
