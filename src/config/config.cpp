#include "cbu/config/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace cbu::config {

using json = nlohmann::json;

namespace {

template<typename T>
void read_key(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j.at(key).is_null()) {
        target = j.at(key).get<T>();
    }
}

} // namespace

Result<UploaderConfig> UploaderConfig::parse(const std::string& json_text) {
    auto j = json::parse(json_text, nullptr, false);
    if (j.is_discarded()) {
        return Err<UploaderConfig>(ErrorKind::ConfigurationIncomplete, "Configuration is not valid JSON");
    }
    if (!j.is_object()) {
        return Err<UploaderConfig>(ErrorKind::ConfigurationIncomplete, "Configuration must be a JSON object");
    }

    UploaderConfig config;
    try {
        read_key(j, "source_dir", config.source_dir);
        read_key(j, "file_pattern", config.file_pattern);
        read_key(j, "destination_folder_id", config.destination_folder_id);
        read_key(j, "wifi_only", config.wifi_only);
        read_key(j, "state_db_path", config.state_db_path);
        read_key(j, "access_token_file", config.access_token_file);
        read_key(j, "upload_endpoint", config.upload_endpoint);
        read_key(j, "api_endpoint", config.api_endpoint);
        read_key(j, "mime_type", config.mime_type);
        read_key(j, "http_timeout_seconds", config.http_timeout_seconds);
        read_key(j, "chunk_size_bytes", config.chunk_size_bytes);
        read_key(j, "max_attempts", config.max_attempts);
        read_key(j, "retry_delay_minutes", config.retry_delay_minutes);
        read_key(j, "schedule_hour", config.schedule_hour);
        read_key(j, "schedule_minute", config.schedule_minute);
        read_key(j, "log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<UploaderConfig>(ErrorKind::ConfigurationIncomplete, "Configuration has a wrongly typed value",
                                   e.what());
    }
    return Ok(std::move(config));
}

Result<UploaderConfig> UploaderConfig::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<UploaderConfig>(ErrorKind::ConfigurationIncomplete, "Cannot read configuration file", path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto parsed = parse(buffer.str());
    if (parsed.is_error()) {
        auto error = parsed.error();
        error.detail = error.detail.empty() ? path : path + ": " + error.detail;
        return Err<UploaderConfig, Error>(std::move(error));
    }
    spdlog::debug("Loaded configuration from {}", path);
    return parsed;
}

Result<void> UploaderConfig::validate() const {
    auto incomplete = [](std::string message, std::string detail = {}) {
        return Err<void>(ErrorKind::ConfigurationIncomplete, std::move(message), std::move(detail));
    };

    if (source_dir.empty()) {
        return incomplete("No source folder configured", "source_dir");
    }
    if (destination_folder_id.empty()) {
        return incomplete("No destination folder configured", "destination_folder_id");
    }
    if (file_pattern.empty()) {
        return incomplete("No file pattern configured", "file_pattern");
    }
    if (state_db_path.empty()) {
        return incomplete("No state database path configured", "state_db_path");
    }
    if (chunk_size_bytes == 0 || chunk_size_bytes % kChunkGranularity != 0) {
        return incomplete("Chunk size must be a positive multiple of 256 KiB",
                          "chunk_size_bytes=" + std::to_string(chunk_size_bytes));
    }
    if (http_timeout_seconds <= 0) {
        return incomplete("HTTP timeout must be positive", "http_timeout_seconds");
    }
    if (max_attempts < 1) {
        return incomplete("At least one attempt is required", "max_attempts");
    }
    if (retry_delay_minutes < 0) {
        return incomplete("Retry delay cannot be negative", "retry_delay_minutes");
    }
    if (schedule_hour < 0 || schedule_hour > 23 || schedule_minute < 0 || schedule_minute > 59) {
        return incomplete("Schedule time is out of range",
                          std::to_string(schedule_hour) + ":" + std::to_string(schedule_minute));
    }
    if (auto level = parse_log_level(log_level); level.is_error()) {
        return Err<void, Error>(level.error());
    }
    return Ok();
}

Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Ok(spdlog::level::trace);
    if (lower == "debug") return Ok(spdlog::level::debug);
    if (lower == "info") return Ok(spdlog::level::info);
    if (lower == "warn" || lower == "warning") return Ok(spdlog::level::warn);
    if (lower == "error") return Ok(spdlog::level::err);
    if (lower == "off") return Ok(spdlog::level::off);
    return Err<spdlog::level::level_enum>(ErrorKind::ConfigurationIncomplete, "Unknown log level", name);
}

} // namespace cbu::config
