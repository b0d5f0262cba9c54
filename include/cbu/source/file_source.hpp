#pragma once

#include "cbu/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cbu::source {

/**
 * @brief Identity of the local file chosen for upload
 *
 * `ref` is the stable reference persisted with a session (an absolute path for
 * LocalFileSource); it never encodes file content.
 */
struct LocalFile {
    std::string ref;
    std::string name;
    std::uint64_t size = 0;
    std::filesystem::file_time_type modified{};
};

/**
 * @brief Sequential reader positioned at a byte offset
 */
class ChunkReader {
public:
    virtual ~ChunkReader() = default;

    /// Reads up to `max_bytes` into `buffer` (resized to the count read).
    /// A short count before end of file means the stream went bad.
    virtual std::size_t read(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) = 0;
};

class FileSource {
public:
    virtual ~FileSource() = default;

    /// Most recently modified candidate file.
    virtual Result<LocalFile> find_latest() = 0;

    /// Current size of the referenced file, nullopt when it no longer exists.
    virtual std::optional<std::uint64_t> size_of(const std::string& ref) = 0;

    virtual Result<std::unique_ptr<ChunkReader>> open(const std::string& ref, std::uint64_t offset) = 0;

    /// Lower-case hex MD5 of the whole referenced file.
    virtual Result<std::string> md5_hex(const std::string& ref) = 0;
};

/**
 * @brief FileSource over one local directory
 *
 * Candidates are regular files directly inside `directory` whose name matches
 * `pattern` ('*' and '?' wildcards). Subdirectories are not searched.
 */
class LocalFileSource : public FileSource {
public:
    LocalFileSource(std::filesystem::path directory, std::string pattern);

    Result<LocalFile> find_latest() override;
    std::optional<std::uint64_t> size_of(const std::string& ref) override;
    Result<std::unique_ptr<ChunkReader>> open(const std::string& ref, std::uint64_t offset) override;
    Result<std::string> md5_hex(const std::string& ref) override;

    [[nodiscard]] static bool matches_pattern(const std::string& name, const std::string& pattern);

private:
    std::filesystem::path directory_;
    std::string pattern_;
};

/// Lower-case hex MD5 of a file, computed with 64 KiB reads.
Result<std::string> md5_file(const std::filesystem::path& path);

} // namespace cbu::source
