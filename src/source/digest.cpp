#include "cbu/source/file_source.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace cbu::source {

Result<std::string> md5_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::string>(ErrorKind::FileNotFound, "Cannot open backup file for verification",
                                path.string());
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return Err<std::string>(ErrorKind::IntegrityMismatch, "Cannot compute local checksum",
                                "EVP_DigestInit_ex failed");
    }

    constexpr std::size_t buffer_size = 64 * 1024;
    std::vector<char> buffer(buffer_size);
    while (file.read(buffer.data(), buffer_size) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(file.gcount())) != 1) {
            return Err<std::string>(ErrorKind::IntegrityMismatch, "Cannot compute local checksum",
                                    "EVP_DigestUpdate failed");
        }
    }
    if (file.bad()) {
        return Err<std::string>(ErrorKind::FileNotFound, "Backup file became unreadable", path.string());
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return Err<std::string>(ErrorKind::IntegrityMismatch, "Cannot compute local checksum",
                                "EVP_DigestFinal_ex failed");
    }

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return Ok(ss.str());
}

} // namespace cbu::source
