#include "cbu/network/http_transport.hpp"
#include "cbu/network/url.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

#include <openssl/err.h>

#include <string>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace cbu::network {
namespace {

using OutgoingRequest = http::request<http::vector_body<std::uint8_t>>;
using IncomingResponse = http::response<http::vector_body<std::uint8_t>>;

http::verb to_verb(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return http::verb::get;
        case HttpMethod::POST: return http::verb::post;
        case HttpMethod::PUT: return http::verb::put;
        case HttpMethod::DELETE_METHOD: return http::verb::delete_;
        case HttpMethod::HEAD: return http::verb::head;
        default: return http::verb::unknown;
    }
}

HttpResponse to_response(IncomingResponse& res) {
    HttpResponse response(static_cast<int>(res.result_int()));
    response.reason_phrase = std::string(res.reason());
    for (const auto& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.body = std::move(res.body());
    return response;
}

template<typename Stream>
IncomingResponse exchange(Stream& stream, OutgoingRequest& req) {
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::vector_body<std::uint8_t>> parser;
    parser.body_limit(16 * 1024 * 1024);
    if (req.method() == http::verb::head) {
        parser.skip(true);
    }
    http::read(stream, buffer, parser);
    return parser.release();
}

} // namespace

BeastHttpTransport::BeastHttpTransport(std::chrono::seconds timeout, std::string user_agent)
    : timeout_(timeout), user_agent_(std::move(user_agent)) {}

Result<HttpResponse> BeastHttpTransport::send(const HttpRequest& request) {
    auto url_result = parse_url(request.url);
    if (url_result.is_error()) {
        return Err<HttpResponse>(url_result.error());
    }
    const Url& url = url_result.value();

    const auto verb = to_verb(request.method);
    if (verb == http::verb::unknown) {
        return Err<HttpResponse>(ErrorKind::ProtocolViolation, "Unsupported HTTP method",
                                 HttpMethodUtils::to_string(request.method));
    }

    OutgoingRequest req{verb, url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, user_agent_);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();

    spdlog::debug("{} {}{} ({} bytes)", HttpMethodUtils::to_string(request.method),
                  url.host, url.target, request.body.size());

    try {
        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        IncomingResponse res;

        if (url.use_tls()) {
            ssl::context ctx(ssl::context::tlsv12_client);
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);

            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

            // SNI is mandatory for Google front ends
            if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
                return Err<HttpResponse>(ErrorKind::TransientNetworkOrServer,
                                         "TLS setup failed", ec.message());
            }

            beast::get_lowest_layer(stream).expires_after(timeout_);
            auto const endpoints = resolver.resolve(url.host, url.port);
            beast::get_lowest_layer(stream).connect(endpoints);
            stream.handshake(ssl::stream_base::client);

            res = exchange(stream, req);

            beast::error_code ec;
            stream.shutdown(ec);
            // Servers routinely close without close_notify
            if (ec && ec != asio::ssl::error::stream_truncated && ec != beast::errc::not_connected) {
                spdlog::debug("TLS shutdown: {}", ec.message());
            }
        } else {
            beast::tcp_stream stream(ioc);
            stream.expires_after(timeout_);
            auto const endpoints = resolver.resolve(url.host, url.port);
            stream.connect(endpoints);

            res = exchange(stream, req);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != beast::errc::not_connected) {
                spdlog::debug("Socket shutdown: {}", ec.message());
            }
        }

        return Ok(to_response(res));
    } catch (const beast::system_error& e) {
        return Err<HttpResponse>(ErrorKind::TransientNetworkOrServer, "Network error",
                                 url.host + ": " + e.code().message());
    } catch (const std::exception& e) {
        return Err<HttpResponse>(ErrorKind::TransientNetworkOrServer, "Network error",
                                 url.host + ": " + e.what());
    }
}

} // namespace cbu::network
