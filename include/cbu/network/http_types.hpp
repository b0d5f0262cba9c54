#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <unordered_map>
#include <vector>

// For strcasecmp on Unix/Linux
#ifndef _WIN32
#include <strings.h>
#endif

namespace cbu {
namespace network {

/**
 * @brief HTTP request methods used by the upload protocol
 *
 * DELETE is spelled DELETE_METHOD to avoid the Windows macro of the same name.
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,
    HEAD,
    UNKNOWN
};

namespace detail {

inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

inline const std::string* find_header(const std::unordered_map<std::string, std::string>& headers,
                                      const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return &value;
        }
    }
    return nullptr;
}

} // namespace detail

/**
 * @brief Outgoing HTTP request
 *
 * `url` is absolute (scheme://host[:port]/path?query); the transport splits it.
 * Body is a byte vector because chunk payloads are binary.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    std::unordered_map<std::string, std::string> headers;
    std::vector<std::uint8_t> body;

    /**
     * @brief Get a header value (case-insensitive lookup)
     *
     * @return Header value if found, empty string otherwise
     */
    std::string get_header(const std::string& name) const {
        const auto* value = detail::find_header(headers, name);
        return value ? *value : std::string{};
    }

    bool has_header(const std::string& name) const {
        return detail::find_header(headers, name) != nullptr;
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Response received from the remote side
 *
 * status_code is kept as a plain int: the resumable protocol relies on
 * 308 (Resume Incomplete), which has no entry in most status enums.
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<std::uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(int status) : status_code(status) {}

    std::string get_header(const std::string& name) const {
        const auto* value = detail::find_header(headers, name);
        return value ? *value : std::string{};
    }

    bool has_header(const std::string& name) const {
        return detail::find_header(headers, name) != nullptr;
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
    }

    /**
     * @brief Get the body as a string (for text content)
     *
     * Warning: Only use this if you know the body contains text!
     */
    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            default: return "UNKNOWN";
        }
    }
};

} // namespace network
} // namespace cbu
