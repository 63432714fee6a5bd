#include "utilities/http.hpp"
#include <gtest/gtest.h>

using namespace ledgerproof;

TEST(HttpUtils, RoundTripRequest) {
  HTTP::HTTPREQUEST req;
  req.method = HTTP::HttpMethod::POST;
  req.uri = "/tools/get_batch";
  req.protocol = "HTTP/1.1";
  req.headers["Content-Type"] = "application/json";
  req.body = R"({"batch_id":"BATCH-2025-06-01-a"})";

  std::string raw = HTTP::GenerateHttpRequestString(req);
  auto parsed = HTTP::ParseHttpRequest(raw);
  EXPECT_EQ(parsed.method, req.method);
  EXPECT_EQ(parsed.uri, req.uri);
  EXPECT_EQ(parsed.protocol, req.protocol);
  ASSERT_EQ(parsed.headers.at("Content-Type"), "application/json");
  EXPECT_EQ(parsed.body, req.body);
  EXPECT_EQ(HTTP::ContentLength(parsed), req.body.size());
}

TEST(HttpUtils, HeaderLookupIgnoresCase) {
  auto req = HTTP::ParseHttpRequest("GET /healthz HTTP/1.1\r\n"
                                    "authorization:   Bearer abc \r\n"
                                    "content-length: 0\r\n\r\n");
  EXPECT_EQ(HTTP::FindHeader(req, "Authorization"), "Bearer abc");
  EXPECT_FALSE(HTTP::FindHeader(req, "X-Missing").has_value());
  EXPECT_EQ(HTTP::ContentLength(req), 0u);
}

TEST(HttpUtils, ContentLengthValidation) {
  HTTP::HTTPREQUEST req;
  EXPECT_EQ(HTTP::ContentLength(req), 0u);
  req.headers["Content-Length"] = "12";
  EXPECT_EQ(HTTP::ContentLength(req), 12u);
  req.headers["Content-Length"] = "-1";
  EXPECT_FALSE(HTTP::ContentLength(req).has_value());
  req.headers["Content-Length"] = "12abc";
  EXPECT_FALSE(HTTP::ContentLength(req).has_value());
  req.headers["Content-Length"] = "99999999999999999999999999";
  EXPECT_FALSE(HTTP::ContentLength(req).has_value());
}

TEST(HttpUtils, MethodsAndPaths) {
  EXPECT_EQ(HTTP::StringToHttpMethod("PATCH"), HTTP::HttpMethod::PATCH);
  EXPECT_EQ(HTTP::StringToHttpMethod("get"), HTTP::HttpMethod::INVALID);
  EXPECT_EQ(HTTP::HttpMethodToString(HTTP::HttpMethod::DELETE), "DELETE");
  EXPECT_EQ(HTTP::RequestPath("/tools/list_batches?limit=5"), "/tools/list_batches");
  EXPECT_EQ(HTTP::RequestPath("/metrics"), "/metrics");
}

TEST(HttpUtils, ResponseRoundTrip) {
  auto res = HTTP::MakeResponse(503, R"({"error":"busy"})");
  EXPECT_EQ(res.reasonPhrase, "Service Unavailable");
  res.headers["Retry-After"] = "1";
  std::string raw = HTTP::GenerateHttpResponseString(res);
  EXPECT_NE(raw.find("Content-Length: 16\r\n"), std::string::npos);
  EXPECT_NE(raw.find("Connection: close\r\n"), std::string::npos);

  auto parsed = HTTP::ParseHttpResponse(raw);
  EXPECT_EQ(parsed.statusCodeNumber, 503);
  EXPECT_EQ(parsed.reasonPhrase, "Service Unavailable");
  EXPECT_EQ(parsed.contentType, "application/json");
  EXPECT_EQ(parsed.headers.at("Retry-After"), "1");
  EXPECT_EQ(parsed.body, R"({"error":"busy"})");
}

TEST(HttpUtils, Trim) {
  EXPECT_EQ(trim("  a b \r\n"), "a b");
  EXPECT_EQ(trim(" \t "), "");
}
