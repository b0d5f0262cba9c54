#pragma once

#include "cbu/core/result.hpp"

#include <string>
#include <utility>
#include <vector>

namespace cbu::network {

/**
 * @brief Absolute URL split into the parts a client connection needs
 */
struct Url {
    std::string scheme; ///< "http" or "https", lower case
    std::string host;
    std::string port;   ///< Defaults to 443 / 80 when absent
    std::string target; ///< Path plus query, never empty ("/" at least)

    [[nodiscard]] bool use_tls() const noexcept { return scheme == "https"; }
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

Result<Url> parse_url(const std::string& url);

/// Percent-encodes everything except RFC 3986 unreserved characters.
std::string url_encode(const std::string& value);

/// Appends encoded parameters to `base`, using '&' when it already has a query.
std::string append_query(const std::string& base, const QueryParams& params);

} // namespace cbu::network
