#include "cbu/remote/token_provider.hpp"

#include <fstream>
#include <sstream>

namespace cbu::remote {

FileTokenProvider::FileTokenProvider(std::filesystem::path token_file)
    : token_file_(std::move(token_file)) {}

Result<std::string> FileTokenProvider::access_token() {
    std::ifstream input(token_file_);
    if (!input) {
        return Err<std::string>(ErrorKind::AuthConsentRequired,
                                "Not signed in", "Token file not readable: " + token_file_.string());
    }

    std::ostringstream oss;
    oss << input.rdbuf();
    std::string token = oss.str();

    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return Err<std::string>(ErrorKind::AuthConsentRequired,
                                "Not signed in", "Token file is empty: " + token_file_.string());
    }
    const auto last = token.find_last_not_of(" \t\r\n");
    return Ok(token.substr(first, last - first + 1));
}

} // namespace cbu::remote
