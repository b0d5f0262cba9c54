#pragma once

#include "cbu/core/result.hpp"
#include "cbu/network/http_types.hpp"

#include <chrono>
#include <string>

namespace cbu::network {

/**
 * @brief Blocking request/response seam used by the remote endpoint client
 *
 * Implementations return a response for every status code the server sends;
 * only connection-level failures (DNS, TLS, timeouts, resets) are errors.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * @brief HttpTransport over Boost.Beast, one connection per request
 *
 * https URLs use TLS 1.2+ with the system CA store and SNI; http URLs use a plain
 * TCP stream. Each call blocks the calling thread for at most `timeout` per
 * network operation.
 */
class BeastHttpTransport : public HttpTransport {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{120};

    explicit BeastHttpTransport(std::chrono::seconds timeout = kDefaultTimeout,
                                std::string user_agent = "cloud-backup-uploader/1.0");

    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    std::chrono::seconds timeout_;
    std::string user_agent_;
};

} // namespace cbu::network
