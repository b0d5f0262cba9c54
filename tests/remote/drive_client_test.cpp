#include "cbu/network/url.hpp"
#include "cbu/remote/drive_client.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <deque>
#include <string>
#include <vector>

using cbu::ErrorKind;
using cbu::network::HttpMethod;
using cbu::network::HttpRequest;
using cbu::network::HttpResponse;
using cbu::remote::ChunkAccepted;
using cbu::remote::DriveEndpoints;
using cbu::remote::DriveUploadClient;
using cbu::remote::SessionAlreadyComplete;
using cbu::remote::SessionExpired;
using cbu::remote::SessionInProgress;
using cbu::remote::UploadFinished;
using json = nlohmann::json;

namespace {

class FakeTransport : public cbu::network::HttpTransport {
public:
    cbu::Result<HttpResponse> send(const HttpRequest& request) override {
        requests.push_back(request);
        if (responses.empty()) {
            return cbu::Err<HttpResponse>(ErrorKind::TransientNetworkOrServer, "Network error", "no response queued");
        }
        auto next = responses.front();
        responses.pop_front();
        return next;
    }

    void respond(int status, const std::string& body = {},
                 std::vector<std::pair<std::string, std::string>> headers = {}) {
        HttpResponse response(status);
        response.set_body(body);
        for (const auto& [name, value] : headers) {
            response.set_header(name, value);
        }
        responses.push_back(cbu::Ok(response));
    }

    void fail_network() {
        responses.push_back(cbu::Err<HttpResponse>(ErrorKind::TransientNetworkOrServer, "Network error", "reset"));
    }

    std::vector<HttpRequest> requests;
    std::deque<cbu::Result<HttpResponse>> responses;
};

class StaticTokens : public cbu::remote::AccessTokenProvider {
public:
    cbu::Result<std::string> access_token() override {
        if (token.empty()) {
            return cbu::Err<std::string>(ErrorKind::AuthConsentRequired, "Not signed in");
        }
        return cbu::Ok(token);
    }

    std::string token = "ya29.token";
};

class DriveUploadClientTest : public ::testing::Test {
protected:
    FakeTransport transport;
    StaticTokens tokens;
    DriveUploadClient client{transport, tokens, DriveEndpoints{"https://upload.test/files", "https://api.test/files"}};

    static std::vector<std::uint8_t> bytes(std::size_t n) { return std::vector<std::uint8_t>(n, 0xAB); }
};

} // namespace

TEST_F(DriveUploadClientTest, InitiateSendsMetadataAndReturnsLocation) {
    transport.respond(200, "", {{"Location", "https://upload.test/files?upload_id=xyz"}});

    auto uri = client.initiate("folder-1", "signal-2024.backup", "application/octet-stream", 12345);

    ASSERT_TRUE(uri.is_ok());
    EXPECT_EQ(uri.value(), "https://upload.test/files?upload_id=xyz");

    ASSERT_EQ(transport.requests.size(), 1u);
    const auto& req = transport.requests[0];
    EXPECT_EQ(req.method, HttpMethod::POST);
    EXPECT_EQ(req.url, "https://upload.test/files?uploadType=resumable&fields=id%2Cmd5Checksum");
    EXPECT_EQ(req.get_header("Authorization"), "Bearer ya29.token");
    EXPECT_EQ(req.get_header("Content-Type"), "application/json; charset=UTF-8");
    EXPECT_EQ(req.get_header("X-Upload-Content-Type"), "application/octet-stream");
    EXPECT_EQ(req.get_header("X-Upload-Content-Length"), "12345");

    const auto body = json::parse(req.body_as_string());
    EXPECT_EQ(body["name"], "signal-2024.backup");
    EXPECT_EQ(body["parents"], json::array({"folder-1"}));
}

TEST_F(DriveUploadClientTest, InitiateWithoutLocationIsProtocolViolation) {
    transport.respond(200, "{}");

    auto uri = client.initiate("folder-1", "a.backup", "application/octet-stream", 1);

    ASSERT_TRUE(uri.is_error());
    EXPECT_EQ(uri.error().kind, ErrorKind::ProtocolViolation);
}

TEST_F(DriveUploadClientTest, InitiateServerErrorIsTransient) {
    transport.respond(503, "backend unavailable");

    auto uri = client.initiate("folder-1", "a.backup", "application/octet-stream", 1);

    ASSERT_TRUE(uri.is_error());
    EXPECT_EQ(uri.error().kind, ErrorKind::TransientNetworkOrServer);
    EXPECT_NE(uri.error().detail.find("503"), std::string::npos);
}

TEST_F(DriveUploadClientTest, UploadChunkSendsExactContentRange) {
    transport.respond(308, "", {{"Range", "bytes=0-5242879"}});

    auto result = client.upload_chunk("https://upload.test/s", bytes(5242880), 0, 12582912);

    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(std::holds_alternative<ChunkAccepted>(result.value()));
    EXPECT_EQ(std::get<ChunkAccepted>(result.value()).confirmed_bytes, 5242880u);

    const auto& req = transport.requests.at(0);
    EXPECT_EQ(req.method, HttpMethod::PUT);
    EXPECT_EQ(req.url, "https://upload.test/s");
    EXPECT_EQ(req.get_header("Content-Range"), "bytes 0-5242879/12582912");
    EXPECT_EQ(req.body.size(), 5242880u);
}

TEST_F(DriveUploadClientTest, ResumeIncompleteWithoutRangeConfirmsNothing) {
    transport.respond(308);

    auto result = client.upload_chunk("https://upload.test/s", bytes(10), 0, 20);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(std::get<ChunkAccepted>(result.value()).confirmed_bytes, 0u);
}

TEST_F(DriveUploadClientTest, FinalChunkReturnsIdAndChecksum) {
    transport.respond(200, R"({"id":"file-123","md5Checksum":"5d41402abc4b2a76b9719d911017c592"})");

    auto result = client.upload_chunk("https://upload.test/s", bytes(5), 10, 15);

    ASSERT_TRUE(result.is_ok());
    const auto& finished = std::get<UploadFinished>(result.value());
    EXPECT_EQ(finished.remote_file_id, "file-123");
    ASSERT_TRUE(finished.checksum.has_value());
    EXPECT_EQ(*finished.checksum, "5d41402abc4b2a76b9719d911017c592");
    EXPECT_EQ(transport.requests.at(0).get_header("Content-Range"), "bytes 10-14/15");
}

TEST_F(DriveUploadClientTest, FinalChunkWithoutChecksum) {
    transport.respond(201, R"({"id":"file-123"})");

    auto result = client.upload_chunk("https://upload.test/s", bytes(5), 0, 5);

    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(std::get<UploadFinished>(result.value()).checksum.has_value());
}

TEST_F(DriveUploadClientTest, CompletionWithoutIdIsProtocolViolation) {
    transport.respond(200, R"({"md5Checksum":"abc"})");

    auto result = client.upload_chunk("https://upload.test/s", bytes(5), 0, 5);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::ProtocolViolation);
}

TEST_F(DriveUploadClientTest, UnexpectedChunkStatusIsTransient) {
    transport.respond(500, "oops");

    auto result = client.upload_chunk("https://upload.test/s", bytes(5), 0, 5);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::TransientNetworkOrServer);
}

TEST_F(DriveUploadClientTest, EmptyChunkIsRejectedWithoutSending) {
    auto result = client.upload_chunk("https://upload.test/s", {}, 0, 5);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::ProtocolViolation);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(DriveUploadClientTest, UnauthorizedMapsToConsentWithChallenge) {
    transport.respond(401, "{}", {{"WWW-Authenticate", "Bearer realm=\"https://accounts.google.com/\""}});

    auto result = client.upload_chunk("https://upload.test/s", bytes(5), 0, 5);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::AuthConsentRequired);
    EXPECT_EQ(result.error().detail, "Bearer realm=\"https://accounts.google.com/\"");
}

TEST_F(DriveUploadClientTest, ForbiddenMapsByReason) {
    transport.respond(403, R"({"error":{"errors":[{"reason":"insufficientPermissions"}],"code":403}})");
    transport.respond(403, R"({"error":{"errors":[{"reason":"userRateLimitExceeded"}],"code":403}})");

    auto consent = client.query_progress("https://upload.test/s", 5);
    auto limited = client.query_progress("https://upload.test/s", 5);

    ASSERT_TRUE(consent.is_error());
    EXPECT_EQ(consent.error().kind, ErrorKind::AuthConsentRequired);
    ASSERT_TRUE(limited.is_error());
    EXPECT_EQ(limited.error().kind, ErrorKind::TransientNetworkOrServer);
}

TEST_F(DriveUploadClientTest, MissingTokenSendsNothing) {
    tokens.token.clear();

    auto result = client.initiate("folder-1", "a.backup", "application/octet-stream", 1);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::AuthConsentRequired);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(DriveUploadClientTest, QueryProgressSendsEmptyProbe) {
    transport.respond(308, "", {{"Range", "bytes=0-99"}});

    auto result = client.query_progress("https://upload.test/s", 1000);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(std::get<SessionInProgress>(result.value()).confirmed_bytes, 100u);

    const auto& req = transport.requests.at(0);
    EXPECT_EQ(req.method, HttpMethod::PUT);
    EXPECT_EQ(req.get_header("Content-Range"), "bytes */1000");
    EXPECT_TRUE(req.body.empty());
}

TEST_F(DriveUploadClientTest, QueryProgressOutcomes) {
    transport.respond(200, R"({"id":"file-9"})");
    transport.respond(404, "Not Found");
    transport.respond(502, "Bad Gateway");

    auto complete = client.query_progress("https://upload.test/s", 10);
    auto expired = client.query_progress("https://upload.test/s", 10);
    auto transient = client.query_progress("https://upload.test/s", 10);

    ASSERT_TRUE(complete.is_ok());
    EXPECT_EQ(std::get<SessionAlreadyComplete>(complete.value()).remote_file_id, "file-9");
    EXPECT_FALSE(std::get<SessionAlreadyComplete>(complete.value()).checksum.has_value());
    ASSERT_TRUE(expired.is_ok());
    EXPECT_TRUE(std::holds_alternative<SessionExpired>(expired.value()));
    ASSERT_TRUE(transient.is_error());
    EXPECT_EQ(transient.error().kind, ErrorKind::TransientNetworkOrServer);
}

TEST_F(DriveUploadClientTest, QueryProgressCarriesChecksumOfFinishedUpload) {
    transport.respond(200, R"({"id":"file-9","md5Checksum":"5d41402abc4b2a76b9719d911017c592"})");

    auto result = client.query_progress("https://upload.test/s", 5);

    ASSERT_TRUE(result.is_ok());
    const auto& done = std::get<SessionAlreadyComplete>(result.value());
    EXPECT_EQ(done.remote_file_id, "file-9");
    EXPECT_EQ(done.checksum, std::optional<std::string>("5d41402abc4b2a76b9719d911017c592"));
}

TEST_F(DriveUploadClientTest, NetworkErrorPassesThrough) {
    transport.fail_network();

    auto result = client.query_progress("https://upload.test/s", 10);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::TransientNetworkOrServer);
}

TEST_F(DriveUploadClientTest, FindByNameBuildsEscapedQuery) {
    transport.respond(200, R"({"files":[{"id":"file-1","size":"2048"}]})");

    auto found = client.find_by_name("folder-1", "it's.backup");

    ASSERT_TRUE(found.is_ok());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->id, "file-1");
    ASSERT_TRUE(found.value()->size.has_value());
    EXPECT_EQ(*found.value()->size, 2048u);

    const auto& req = transport.requests.at(0);
    EXPECT_EQ(req.method, HttpMethod::GET);
    const std::string expected_q =
        cbu::network::url_encode("name = 'it\\'s.backup' and 'folder-1' in parents and trashed = false");
    EXPECT_EQ(req.url.rfind("https://api.test/files?q=" + expected_q + "&", 0), 0u);
    EXPECT_NE(req.url.find("fields=files%28id%2C%20size%29"), std::string::npos);
    EXPECT_NE(req.url.find("orderBy=createdTime%20desc"), std::string::npos);
    EXPECT_NE(req.url.find("pageSize=1"), std::string::npos);
}

TEST_F(DriveUploadClientTest, FindByNameWithoutMatch) {
    transport.respond(200, R"({"files":[]})");
    transport.respond(200, R"({"files":[{"id":"folder-like"}]})");

    auto none = client.find_by_name("folder-1", "a.backup");
    auto sizeless = client.find_by_name("folder-1", "a.backup");

    ASSERT_TRUE(none.is_ok());
    EXPECT_FALSE(none.value().has_value());
    ASSERT_TRUE(sizeless.is_ok());
    ASSERT_TRUE(sizeless.value().has_value());
    EXPECT_FALSE(sizeless.value()->size.has_value());
}

TEST(DriveUploadClientParsing, ConfirmedBytesFromRangeHeader) {
    EXPECT_EQ(DriveUploadClient::parse_confirmed_bytes("bytes=0-5242879"), 5242880u);
    EXPECT_EQ(DriveUploadClient::parse_confirmed_bytes("bytes=0-0"), 1u);
    EXPECT_EQ(DriveUploadClient::parse_confirmed_bytes(""), 0u);
    EXPECT_EQ(DriveUploadClient::parse_confirmed_bytes("bytes=0-"), 0u);
    EXPECT_EQ(DriveUploadClient::parse_confirmed_bytes("bytes=0-abc"), 0u);
}

TEST(DriveUploadClientParsing, EscapesQueryLiterals) {
    EXPECT_EQ(DriveUploadClient::escape_query_literal("plain.backup"), "plain.backup");
    EXPECT_EQ(DriveUploadClient::escape_query_literal("it's"), "it\\'s");
    EXPECT_EQ(DriveUploadClient::escape_query_literal("a\\b"), "a\\\\b");
}
