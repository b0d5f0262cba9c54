#pragma once

#include "cbu/core/result.hpp"

#include <filesystem>
#include <string>

namespace cbu::remote {

/**
 * @brief Source of OAuth bearer tokens
 *
 * Asked before every request so that a token refreshed out of band is picked up
 * without restarting. A missing token means the user has to (re)grant access,
 * reported as AuthConsentRequired.
 */
class AccessTokenProvider {
public:
    virtual ~AccessTokenProvider() = default;

    virtual Result<std::string> access_token() = 0;
};

/**
 * @brief Reads the token from a file kept current by an external sign-in helper
 */
class FileTokenProvider : public AccessTokenProvider {
public:
    explicit FileTokenProvider(std::filesystem::path token_file);

    Result<std::string> access_token() override;

private:
    std::filesystem::path token_file_;
};

} // namespace cbu::remote
