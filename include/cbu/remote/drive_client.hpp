#pragma once

#include "cbu/network/http_transport.hpp"
#include "cbu/remote/endpoint.hpp"
#include "cbu/remote/token_provider.hpp"

#include <cstdint>
#include <string>

namespace cbu::remote {

struct DriveEndpoints {
    std::string upload_url = "https://www.googleapis.com/upload/drive/v3/files";
    std::string files_url = "https://www.googleapis.com/drive/v3/files";
};

/**
 * @brief Drive v3 resumable upload protocol over an HttpTransport
 *
 * Status mapping:
 * - initiate: 200 + Location header, anything else is an error
 * - upload_chunk: 200/201 complete, 308 + Range in progress
 * - query_progress: 200/201 complete, 308 in progress, 404 expired
 * - 401, or 403 with an auth reason, becomes AuthConsentRequired
 * - any other status becomes TransientNetworkOrServer
 */
class DriveUploadClient : public RemoteUploadEndpoint {
public:
    static constexpr int kResumeIncomplete = 308;

    DriveUploadClient(network::HttpTransport& transport,
                      AccessTokenProvider& tokens,
                      DriveEndpoints endpoints = {});

    Result<std::string> initiate(const std::string& folder_id,
                                 const std::string& file_name,
                                 const std::string& mime_type,
                                 std::uint64_t total_bytes) override;

    Result<ChunkResult> upload_chunk(const std::string& session_uri,
                                     const std::vector<std::uint8_t>& bytes,
                                     std::uint64_t offset,
                                     std::uint64_t total_bytes) override;

    Result<ProgressResult> query_progress(const std::string& session_uri,
                                          std::uint64_t total_bytes) override;

    Result<std::optional<RemoteFileInfo>> find_by_name(const std::string& folder_id,
                                                       const std::string& file_name) override;

    /// "bytes=0-N" -> N + 1. Missing or malformed values count as nothing confirmed.
    static std::uint64_t parse_confirmed_bytes(const std::string& range_header);

    /// Escapes backslashes and single quotes for a Drive query string literal.
    static std::string escape_query_literal(const std::string& value);

private:
    Result<network::HttpRequest> authorized_request(network::HttpMethod method, std::string url);

    Result<network::HttpResponse> execute(const network::HttpRequest& request);

    static Error classify_failure(const network::HttpResponse& response, const std::string& operation);

    network::HttpTransport& transport_;
    AccessTokenProvider& tokens_;
    DriveEndpoints endpoints_;
};

} // namespace cbu::remote
