#include "cbu/network/http_types.hpp"

#include <gtest/gtest.h>

using cbu::network::HttpMethod;
using cbu::network::HttpMethodUtils;
using cbu::network::HttpRequest;
using cbu::network::HttpResponse;

TEST(HttpTypesTest, HeaderLookupIsCaseInsensitive) {
    HttpResponse response(308);
    response.set_header("Range", "bytes=0-1023");

    EXPECT_TRUE(response.has_header("range"));
    EXPECT_EQ(response.get_header("RANGE"), "bytes=0-1023");
    EXPECT_EQ(response.get_header("Location"), "");
    EXPECT_FALSE(response.is_success());
}

TEST(HttpTypesTest, RequestBodyRoundTripsAsString) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.set_body(R"({"name":"a.backup"})");
    request.set_header("Content-Type", "application/json; charset=UTF-8");

    EXPECT_EQ(request.body.size(), 19u);
    EXPECT_EQ(request.body_as_string(), R"({"name":"a.backup"})");
    EXPECT_TRUE(request.has_header("content-type"));
}

TEST(HttpTypesTest, MethodNames) {
    EXPECT_EQ(HttpMethodUtils::to_string(HttpMethod::PUT), "PUT");
    EXPECT_EQ(HttpMethodUtils::from_string("GET"), HttpMethod::GET);
    EXPECT_EQ(HttpMethodUtils::from_string("PATCH"), HttpMethod::UNKNOWN);
}

TEST(HttpTypesTest, SuccessRange) {
    EXPECT_TRUE(HttpResponse(200).is_success());
    EXPECT_TRUE(HttpResponse(201).is_success());
    EXPECT_FALSE(HttpResponse(404).is_success());
}
