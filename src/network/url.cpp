#include "cbu/network/url.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>

namespace cbu::network {

Result<Url> parse_url(const std::string& url) {
    static const std::regex url_regex(R"(^(https?)://([^/:?#]+)(?::(\d+))?([^#]*)$)", std::regex::icase);
    std::smatch match;
    if (!std::regex_match(url, match, url_regex)) {
        return Err<Url>(ErrorKind::ProtocolViolation, "Invalid URL", url);
    }

    Url parsed;
    parsed.scheme = match[1].str();
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    parsed.host = match[2].str();
    parsed.port = match[3].str();
    parsed.target = match[4].str();

    if (parsed.port.empty()) {
        parsed.port = parsed.use_tls() ? "443" : "80";
    }
    if (parsed.target.empty()) {
        parsed.target = "/";
    } else if (parsed.target.front() == '?') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    return Ok(std::move(parsed));
}

std::string url_encode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string append_query(const std::string& base, const QueryParams& params) {
    std::string result = base;
    char separator = base.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params) {
        result += separator;
        result += url_encode(key);
        result += '=';
        result += url_encode(value);
        separator = '&';
    }
    return result;
}

} // namespace cbu::network
