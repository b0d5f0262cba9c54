#pragma once

#include "cbu/core/result.hpp"

#include <spdlog/common.h>

#include <cstdint>
#include <string>

namespace cbu::config {

/**
 * @brief Runtime settings, read from a JSON file
 *
 * Every key is optional in the file; missing keys keep the defaults below.
 * source_dir and destination_folder_id have no usable default and are checked
 * by validate().
 */
struct UploaderConfig {
    std::string source_dir;
    std::string file_pattern = "*.backup";
    std::string destination_folder_id;
    bool wifi_only = true; ///< scheduler constraint only

    std::string state_db_path = "cloud-backup-uploader.db";
    std::string access_token_file = "access_token";

    std::string upload_endpoint = "https://www.googleapis.com/upload/drive/v3/files";
    std::string api_endpoint = "https://www.googleapis.com/drive/v3/files";
    std::string mime_type = "application/octet-stream";

    int http_timeout_seconds = 120;
    std::uint64_t chunk_size_bytes = 5 * 1024 * 1024;

    int max_attempts = 3;
    int retry_delay_minutes = 30;
    int schedule_hour = 2;
    int schedule_minute = 0;

    std::string log_level = "info";

    /// Protocol requirement on every chunk but the last.
    static constexpr std::uint64_t kChunkGranularity = 256 * 1024;

    static Result<UploaderConfig> parse(const std::string& json_text);
    static Result<UploaderConfig> load_file(const std::string& path);

    /// ConfigurationIncomplete naming the first missing or out-of-range setting.
    Result<void> validate() const;
};

/// trace|debug|info|warn|error|off (case-insensitive; "warning" accepted).
Result<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace cbu::config
