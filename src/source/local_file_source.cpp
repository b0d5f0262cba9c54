#include "cbu/source/file_source.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace cbu::source {
namespace {

class StreamChunkReader : public ChunkReader {
public:
    explicit StreamChunkReader(std::ifstream stream) : stream_(std::move(stream)) {}

    std::size_t read(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) override {
        buffer.resize(max_bytes);
        if (!stream_) {
            buffer.clear();
            return 0;
        }
        stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(max_bytes));
        const auto count = static_cast<std::size_t>(stream_.gcount());
        buffer.resize(count);
        return count;
    }

private:
    std::ifstream stream_;
};

} // namespace

LocalFileSource::LocalFileSource(fs::path directory, std::string pattern)
    : directory_(std::move(directory)), pattern_(std::move(pattern)) {}

Result<LocalFile> LocalFileSource::find_latest() {
    if (directory_.empty()) {
        return Err<LocalFile>(ErrorKind::ConfigurationIncomplete, "No source folder configured", "source_dir");
    }
    if (pattern_.empty()) {
        return Err<LocalFile>(ErrorKind::ConfigurationIncomplete, "No file pattern configured", "file_pattern");
    }

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return Err<LocalFile>(ErrorKind::FileNotFound, "Cannot access local folder", directory_.string());
    }

    std::optional<LocalFile> latest;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (!matches_pattern(name, pattern_)) {
            continue;
        }

        const auto modified = entry.last_write_time(entry_ec);
        if (entry_ec) {
            continue;
        }
        const auto size = entry.file_size(entry_ec);
        if (entry_ec) {
            continue;
        }

        if (!latest || modified > latest->modified) {
            latest = LocalFile{fs::absolute(entry.path()).string(), name, static_cast<std::uint64_t>(size), modified};
        }
    }

    if (ec) {
        return Err<LocalFile>(ErrorKind::FileNotFound, "Cannot access local folder",
                              directory_.string() + ": " + ec.message());
    }
    if (!latest) {
        return Err<LocalFile>(ErrorKind::FileNotFound, "No backup file found",
                              "No file matching '" + pattern_ + "' in " + directory_.string());
    }

    spdlog::debug("Latest backup candidate: {} ({} bytes)", latest->ref, latest->size);
    return Ok(std::move(*latest));
}

std::optional<std::uint64_t> LocalFileSource::size_of(const std::string& ref) {
    std::error_code ec;
    const fs::path path(ref);
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

Result<std::unique_ptr<ChunkReader>> LocalFileSource::open(const std::string& ref, std::uint64_t offset) {
    std::ifstream input(ref, std::ios::binary);
    if (!input) {
        return Err<std::unique_ptr<ChunkReader>>(ErrorKind::FileNotFound, "Cannot open backup file", ref);
    }
    input.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!input) {
        return Err<std::unique_ptr<ChunkReader>>(ErrorKind::FileNotFound, "Cannot seek in backup file",
                                                 ref + " @ " + std::to_string(offset));
    }
    return Ok(std::unique_ptr<ChunkReader>(std::make_unique<StreamChunkReader>(std::move(input))));
}

Result<std::string> LocalFileSource::md5_hex(const std::string& ref) {
    return md5_file(ref);
}

bool LocalFileSource::matches_pattern(const std::string& name, const std::string& pattern) {
    // Iterative wildcard match with single-star backtracking
    std::size_t n = 0;
    std::size_t p = 0;
    std::size_t star = std::string::npos;
    std::size_t star_match = 0;

    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++n;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            star_match = n;
        } else if (star != std::string::npos) {
            p = star + 1;
            n = ++star_match;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

} // namespace cbu::source
