#include "cbu/remote/drive_client.hpp"
#include "cbu/network/url.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace cbu::remote {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;

namespace {

constexpr std::size_t kMaxBodyExcerpt = 512;

std::string body_excerpt(const HttpResponse& response) {
    std::string body = response.body_as_string();
    if (body.size() > kMaxBodyExcerpt) {
        body.resize(kMaxBodyExcerpt);
        body += "...";
    }
    return body;
}

struct CompletionBody {
    std::string id;
    std::optional<std::string> md5;
};

Result<CompletionBody> parse_completion(const HttpResponse& response) {
    auto payload = json::parse(response.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return Err<CompletionBody>(ErrorKind::ProtocolViolation,
                                   "Malformed completion response", body_excerpt(response));
    }

    CompletionBody parsed;
    if (auto it = payload.find("id"); it != payload.end() && it->is_string()) {
        parsed.id = it->get<std::string>();
    }
    if (parsed.id.empty()) {
        return Err<CompletionBody>(ErrorKind::ProtocolViolation,
                                   "No file ID in upload completion response", body_excerpt(response));
    }
    if (auto it = payload.find("md5Checksum"); it != payload.end() && it->is_string()) {
        parsed.md5 = it->get<std::string>();
    }
    return Ok(std::move(parsed));
}

std::optional<std::uint64_t> parse_size(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_string()) {
        try {
            return static_cast<std::uint64_t>(std::stoull(value.get<std::string>()));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool is_consent_reason(const std::string& reason) {
    return reason == "insufficientPermissions" || reason == "authError" ||
           reason == "ACCESS_TOKEN_SCOPE_INSUFFICIENT";
}

std::string first_error_reason(const HttpResponse& response) {
    auto payload = json::parse(response.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return {};
    }
    const auto error = payload.find("error");
    if (error == payload.end() || !error->is_object()) {
        return {};
    }
    if (auto errors = error->find("errors"); errors != error->end() && errors->is_array() && !errors->empty()) {
        const auto& first = errors->front();
        if (first.is_object()) {
            return first.value("reason", "");
        }
    }
    if (auto details = error->find("details"); details != error->end() && details->is_array()) {
        for (const auto& detail : *details) {
            if (detail.is_object() && detail.contains("reason") && detail["reason"].is_string()) {
                return detail["reason"].get<std::string>();
            }
        }
    }
    return {};
}

} // namespace

DriveUploadClient::DriveUploadClient(network::HttpTransport& transport,
                                     AccessTokenProvider& tokens,
                                     DriveEndpoints endpoints)
    : transport_(transport), tokens_(tokens), endpoints_(std::move(endpoints)) {}

Result<std::string> DriveUploadClient::initiate(const std::string& folder_id,
                                                const std::string& file_name,
                                                const std::string& mime_type,
                                                std::uint64_t total_bytes) {
    // fields=id,md5Checksum so the completion response carries the checksum
    const auto url = network::append_query(endpoints_.upload_url, {
        {"uploadType", "resumable"},
        {"fields", "id,md5Checksum"},
    });

    auto request = authorized_request(HttpMethod::POST, url);
    if (request.is_error()) {
        return Err<std::string>(request.error());
    }
    auto& req = request.value();

    const json metadata{
        {"name", file_name},
        {"parents", json::array({folder_id})},
    };
    req.set_body(metadata.dump());
    req.set_header("Content-Type", "application/json; charset=UTF-8");
    req.set_header("X-Upload-Content-Type", mime_type);
    req.set_header("X-Upload-Content-Length", std::to_string(total_bytes));

    auto response = execute(req);
    if (response.is_error()) {
        return Err<std::string>(response.error());
    }
    const auto& res = response.value();

    if (res.status_code != 200) {
        return Err<std::string>(classify_failure(res, "initiate"));
    }
    std::string session_uri = res.get_header("Location");
    if (session_uri.empty()) {
        return Err<std::string>(ErrorKind::ProtocolViolation,
                                "No Location header in resumable upload initiation response",
                                body_excerpt(res));
    }

    spdlog::debug("Resumable upload session initiated for {} ({} bytes)", file_name, total_bytes);
    return Ok(std::move(session_uri));
}

Result<ChunkResult> DriveUploadClient::upload_chunk(const std::string& session_uri,
                                                    const std::vector<std::uint8_t>& bytes,
                                                    std::uint64_t offset,
                                                    std::uint64_t total_bytes) {
    if (bytes.empty()) {
        return Err<ChunkResult>(ErrorKind::ProtocolViolation, "Refusing to send an empty chunk");
    }

    auto request = authorized_request(HttpMethod::PUT, session_uri);
    if (request.is_error()) {
        return Err<ChunkResult>(request.error());
    }
    auto& req = request.value();

    const std::uint64_t chunk_end = offset + bytes.size() - 1;
    const std::string content_range = "bytes " + std::to_string(offset) + "-" +
                                      std::to_string(chunk_end) + "/" + std::to_string(total_bytes);
    req.set_header("Content-Range", content_range);
    req.set_header("Content-Type", "application/octet-stream");
    req.body = bytes;

    spdlog::debug("Uploading chunk: {}", content_range);
    auto response = execute(req);
    if (response.is_error()) {
        return Err<ChunkResult>(response.error());
    }
    const auto& res = response.value();

    switch (res.status_code) {
        case 200:
        case 201: {
            auto completion = parse_completion(res);
            if (completion.is_error()) {
                return Err<ChunkResult>(completion.error());
            }
            auto& body = completion.value();
            spdlog::debug("Upload complete, file id: {}, md5: {}", body.id, body.md5.value_or("<none>"));
            return Ok(ChunkResult{UploadFinished{std::move(body.id), std::move(body.md5)}});
        }
        case kResumeIncomplete: {
            const auto confirmed = parse_confirmed_bytes(res.get_header("Range"));
            spdlog::debug("Chunk accepted, confirmed bytes: {}", confirmed);
            return Ok(ChunkResult{ChunkAccepted{confirmed}});
        }
        default:
            return Err<ChunkResult>(classify_failure(res, "upload chunk"));
    }
}

Result<ProgressResult> DriveUploadClient::query_progress(const std::string& session_uri,
                                                         std::uint64_t total_bytes) {
    auto request = authorized_request(HttpMethod::PUT, session_uri);
    if (request.is_error()) {
        return Err<ProgressResult>(request.error());
    }
    auto& req = request.value();
    req.set_header("Content-Range", "bytes */" + std::to_string(total_bytes));

    auto response = execute(req);
    if (response.is_error()) {
        return Err<ProgressResult>(response.error());
    }
    const auto& res = response.value();

    switch (res.status_code) {
        case 200:
        case 201: {
            auto completion = parse_completion(res);
            if (completion.is_error()) {
                return Err<ProgressResult>(completion.error());
            }
            auto& body = completion.value();
            spdlog::debug("Session query: upload already complete, file id: {}, md5: {}", body.id,
                          body.md5.value_or("<none>"));
            return Ok(ProgressResult{SessionAlreadyComplete{std::move(body.id), std::move(body.md5)}});
        }
        case kResumeIncomplete: {
            const auto confirmed = parse_confirmed_bytes(res.get_header("Range"));
            spdlog::debug("Session query: {} bytes confirmed", confirmed);
            return Ok(ProgressResult{SessionInProgress{confirmed}});
        }
        case 404:
            spdlog::warn("Resumable session expired or not found");
            return Ok(ProgressResult{SessionExpired{}});
        default:
            // 5xx must not look like expiry: that would throw away a valid session
            return Err<ProgressResult>(classify_failure(res, "query progress"));
    }
}

Result<std::optional<RemoteFileInfo>> DriveUploadClient::find_by_name(const std::string& folder_id,
                                                                      const std::string& file_name) {
    const std::string query = "name = '" + escape_query_literal(file_name) + "' and '" +
                              escape_query_literal(folder_id) + "' in parents and trashed = false";
    const auto url = network::append_query(endpoints_.files_url, {
        {"q", query},
        {"spaces", "drive"},
        {"fields", "files(id, size)"},
        {"orderBy", "createdTime desc"},
        {"pageSize", "1"},
    });

    auto request = authorized_request(HttpMethod::GET, url);
    if (request.is_error()) {
        return Err<std::optional<RemoteFileInfo>>(request.error());
    }

    auto response = execute(request.value());
    if (response.is_error()) {
        return Err<std::optional<RemoteFileInfo>>(response.error());
    }
    const auto& res = response.value();
    if (res.status_code != 200) {
        return Err<std::optional<RemoteFileInfo>>(classify_failure(res, "find by name"));
    }

    auto payload = json::parse(res.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return Err<std::optional<RemoteFileInfo>>(ErrorKind::ProtocolViolation,
                                                  "Malformed file list response", body_excerpt(res));
    }

    const auto files = payload.find("files");
    if (files == payload.end() || !files->is_array() || files->empty()) {
        return Ok(std::optional<RemoteFileInfo>{});
    }
    const auto& first = files->front();
    if (!first.is_object() || !first.contains("id") || !first["id"].is_string()) {
        return Err<std::optional<RemoteFileInfo>>(ErrorKind::ProtocolViolation,
                                                  "File list entry without id", body_excerpt(res));
    }

    RemoteFileInfo info;
    info.id = first["id"].get<std::string>();
    if (first.contains("size")) {
        info.size = parse_size(first["size"]);
    }
    return Ok(std::optional<RemoteFileInfo>{std::move(info)});
}

std::uint64_t DriveUploadClient::parse_confirmed_bytes(const std::string& range_header) {
    if (range_header.empty()) {
        return 0;
    }
    const auto dash = range_header.find_last_of('-');
    if (dash == std::string::npos || dash + 1 >= range_header.size()) {
        spdlog::warn("Unparseable Range header: '{}'", range_header);
        return 0;
    }
    try {
        std::size_t consumed = 0;
        const std::string last_byte = range_header.substr(dash + 1);
        const auto value = std::stoull(last_byte, &consumed);
        if (consumed != last_byte.size()) {
            spdlog::warn("Unparseable Range header: '{}'", range_header);
            return 0;
        }
        return static_cast<std::uint64_t>(value) + 1;
    } catch (const std::exception&) {
        spdlog::warn("Unparseable Range header: '{}'", range_header);
        return 0;
    }
}

std::string DriveUploadClient::escape_query_literal(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '\'') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

Result<HttpRequest> DriveUploadClient::authorized_request(HttpMethod method, std::string url) {
    auto token = tokens_.access_token();
    if (token.is_error()) {
        return Err<HttpRequest>(token.error());
    }

    HttpRequest request;
    request.method = method;
    request.url = std::move(url);
    request.set_header("Authorization", "Bearer " + token.value());
    return Ok(std::move(request));
}

Result<HttpResponse> DriveUploadClient::execute(const HttpRequest& request) {
    auto response = transport_.send(request);
    if (response.is_error()) {
        spdlog::debug("{} failed: {}", network::HttpMethodUtils::to_string(request.method),
                      response.error().detail);
    }
    return response;
}

Error DriveUploadClient::classify_failure(const HttpResponse& response, const std::string& operation) {
    const std::string detail = operation + " returned HTTP " + std::to_string(response.status_code) +
                               ": " + body_excerpt(response);

    if (response.status_code == 401) {
        const auto challenge = response.get_header("WWW-Authenticate");
        return make_error(ErrorKind::AuthConsentRequired, "Drive access needs to be re-authorized",
                          challenge.empty() ? detail : challenge);
    }
    if (response.status_code == 403 && is_consent_reason(first_error_reason(response))) {
        return make_error(ErrorKind::AuthConsentRequired, "Drive access needs additional consent", detail);
    }
    return make_error(ErrorKind::TransientNetworkOrServer,
                      "Server returned HTTP " + std::to_string(response.status_code), detail);
}

} // namespace cbu::remote
