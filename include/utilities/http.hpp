#ifndef LEDGERPROOF_HTTP_HPP
#define LEDGERPROOF_HTTP_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace ledgerproof {

std::string trim(const std::string &str);

namespace HTTP {

// Status codes mapping
const std::unordered_map<int, std::string> statusCode = {
    {200, "OK"},
    {400, "Bad Request"},
    {401, "Unauthorized"},
    {404, "Not Found"},
    {405, "Method Not Allowed"},
    {413, "Payload Too Large"},
    {500, "Internal Server Error"},
    {503, "Service Unavailable"}};

enum class HttpMethod { GET, POST, PUT, DELETE, OPTIONS, HEAD, PATCH, INVALID };

HttpMethod StringToHttpMethod(const std::string &methodStr);
std::string HttpMethodToString(HttpMethod method);

struct HTTPREQUEST {
  HttpMethod method = HttpMethod::INVALID;
  std::string uri;
  std::string protocol;
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

struct HTTPRESPONSE {
  std::string protocol = "HTTP/1.1";
  int statusCodeNumber = 200;
  std::string reasonPhrase = "OK";
  std::string contentType = "application/json";
  std::unordered_map<std::string, std::string> headers;
  std::string body;
};

/// Parse a request head plus whatever body follows the blank line.
HTTPREQUEST ParseHttpRequest(const std::string &requestStr);
std::string GenerateHttpRequestString(const HTTPREQUEST &request);

/// Case-insensitive header lookup.
std::optional<std::string> FindHeader(const HTTPREQUEST &request,
                                      const std::string &name);

/// Content-Length of @p request, 0 when absent; nullopt when malformed.
std::optional<std::size_t> ContentLength(const HTTPREQUEST &request);

/// URI without its query string.
std::string RequestPath(const std::string &uri);

HTTPRESPONSE MakeResponse(int status, std::string body,
                          std::string contentType = "application/json");
std::string GenerateHttpResponseString(const HTTPRESPONSE &response);
HTTPRESPONSE ParseHttpResponse(const std::string &responseStr);

} // namespace HTTP
} // namespace ledgerproof

#endif // LEDGERPROOF_HTTP_HPP
