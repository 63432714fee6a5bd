#include "utilities/http.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace ledgerproof {

std::string trim(const std::string &str) {
  const std::string whitespace = " \t\n\r";
  size_t start = str.find_first_not_of(whitespace);
  size_t end = str.find_last_not_of(whitespace);

  if (start == std::string::npos) // No non-whitespace characters found
    return "";

  return str.substr(start, end - start + 1);
}

namespace HTTP {

namespace {

bool iequals(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

std::string reasonFor(int status) {
  auto it = statusCode.find(status);
  return it == statusCode.end() ? "Unknown" : it->second;
}

} // namespace

HttpMethod StringToHttpMethod(const std::string &methodStr) {
  if (methodStr == "GET")
    return HttpMethod::GET;
  else if (methodStr == "POST")
    return HttpMethod::POST;
  else if (methodStr == "PUT")
    return HttpMethod::PUT;
  else if (methodStr == "DELETE")
    return HttpMethod::DELETE;
  else if (methodStr == "OPTIONS")
    return HttpMethod::OPTIONS;
  else if (methodStr == "HEAD")
    return HttpMethod::HEAD;
  else if (methodStr == "PATCH")
    return HttpMethod::PATCH;
  else
    return HttpMethod::INVALID;
}

std::string HttpMethodToString(HttpMethod method) {
  switch (method) {
  case HttpMethod::GET:
    return "GET";
  case HttpMethod::POST:
    return "POST";
  case HttpMethod::PUT:
    return "PUT";
  case HttpMethod::DELETE:
    return "DELETE";
  case HttpMethod::OPTIONS:
    return "OPTIONS";
  case HttpMethod::HEAD:
    return "HEAD";
  case HttpMethod::PATCH:
    return "PATCH";
  default:
    return "INVALID";
  }
}

HTTPREQUEST ParseHttpRequest(const std::string &requestStr) {
  HTTPREQUEST request;
  std::istringstream requestStream(requestStr);
  std::string requestLine;
  std::getline(requestStream, requestLine);

  if (!requestLine.empty() && requestLine.back() == '\r')
    requestLine.pop_back();

  std::istringstream requestLineStream(requestLine);
  std::string methodStr;
  requestLineStream >> methodStr >> request.uri >> request.protocol;
  request.method = StringToHttpMethod(methodStr);

  std::string line;
  while (std::getline(requestStream, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      break;

    size_t delimiterPos = line.find(':');
    if (delimiterPos != std::string::npos) {
      std::string headerName = trim(line.substr(0, delimiterPos));
      std::string headerValue = trim(line.substr(delimiterPos + 1));
      request.headers[headerName] = headerValue;
    }
  }

  std::ostringstream bodyStream;
  bodyStream << requestStream.rdbuf();
  request.body = bodyStream.str();
  return request;
}

std::string GenerateHttpRequestString(const HTTPREQUEST &request) {
  std::ostringstream out;
  out << HttpMethodToString(request.method) << ' ' << request.uri << ' '
      << (request.protocol.empty() ? "HTTP/1.1" : request.protocol) << "\r\n";
  for (const auto &[name, value] : request.headers)
    out << name << ": " << value << "\r\n";
  if (!request.body.empty() && !FindHeader(request, "Content-Length"))
    out << "Content-Length: " << request.body.size() << "\r\n";
  out << "\r\n" << request.body;
  return out.str();
}

std::optional<std::string> FindHeader(const HTTPREQUEST &request,
                                      const std::string &name) {
  for (const auto &[key, value] : request.headers) {
    if (iequals(key, name))
      return value;
  }
  return std::nullopt;
}

std::optional<std::size_t> ContentLength(const HTTPREQUEST &request) {
  auto value = FindHeader(request, "Content-Length");
  if (!value)
    return std::size_t{0};
  if (value->empty() || !std::all_of(value->begin(), value->end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
      }))
    return std::nullopt;
  try {
    return static_cast<std::size_t>(std::stoull(*value));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::string RequestPath(const std::string &uri) {
  return uri.substr(0, uri.find('?'));
}

HTTPRESPONSE MakeResponse(int status, std::string body,
                          std::string contentType) {
  HTTPRESPONSE res;
  res.statusCodeNumber = status;
  res.reasonPhrase = reasonFor(status);
  res.contentType = std::move(contentType);
  res.body = std::move(body);
  return res;
}

std::string GenerateHttpResponseString(const HTTPRESPONSE &response) {
  std::ostringstream out;
  out << response.protocol << ' ' << response.statusCodeNumber << ' '
      << response.reasonPhrase << "\r\n";
  out << "Content-Type: " << response.contentType << "\r\n";
  for (const auto &[name, value] : response.headers)
    out << name << ": " << value << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n\r\n";
  out << response.body;
  return out.str();
}

HTTPRESPONSE ParseHttpResponse(const std::string &responseStr) {
  HTTPRESPONSE response;
  std::istringstream stream(responseStr);
  std::string statusLine;
  std::getline(stream, statusLine);
  if (!statusLine.empty() && statusLine.back() == '\r')
    statusLine.pop_back();

  std::istringstream statusStream(statusLine);
  statusStream >> response.protocol >> response.statusCodeNumber;
  std::getline(statusStream, response.reasonPhrase);
  response.reasonPhrase = trim(response.reasonPhrase);

  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      break;
    size_t delimiterPos = line.find(':');
    if (delimiterPos == std::string::npos)
      continue;
    std::string name = trim(line.substr(0, delimiterPos));
    std::string value = trim(line.substr(delimiterPos + 1));
    if (iequals(name, "Content-Type"))
      response.contentType = value;
    else
      response.headers[name] = value;
  }

  std::ostringstream bodyStream;
  bodyStream << stream.rdbuf();
  response.body = bodyStream.str();
  return response;
}

} // namespace HTTP
} // namespace ledgerproof
