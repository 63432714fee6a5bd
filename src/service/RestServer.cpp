#include "service/RestServer.h"
#include "utilities/digest.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <array>
#include <chrono>
#include <cppcodec/base64_url_unpadded.hpp>
#include <sodium.h>
#include <stdexcept>

namespace ledgerproof {

using tcp = boost::asio::ip::tcp;
using base64 = cppcodec::base64_url_unpadded;
using nlohmann::json;

namespace {

using Mac = std::array<unsigned char, crypto_auth_hmacsha256_BYTES>;

Mac hmacSha256(const std::string &secret, const std::string &input) {
  Mac mac{};
  crypto_auth_hmacsha256_state state;
  crypto_auth_hmacsha256_init(
      &state, reinterpret_cast<const unsigned char *>(secret.data()),
      secret.size());
  crypto_auth_hmacsha256_update(
      &state, reinterpret_cast<const unsigned char *>(input.data()),
      input.size());
  crypto_auth_hmacsha256_final(&state, mac.data());
  return mac;
}

HTTP::HTTPRESPONSE jsonResponse(int status, const json &body) {
  return HTTP::MakeResponse(
      status, body.dump(-1, ' ', false, json::error_handler_t::replace));
}

HTTP::HTTPRESPONSE errorResponse(int status, const std::string &message) {
  return jsonResponse(status, {{"error", message}});
}

/// Map a tool result onto an HTTP status.
int statusFor(const json &result) {
  if (!result.is_object() || !result.contains("error"))
    return 200;
  if (result.contains("invalid_fields"))
    return 400;
  auto retryable = result.find("retryable");
  if (retryable != result.end() && retryable->is_boolean() &&
      retryable->get<bool>())
    return 503;
  return 500;
}

} // namespace

RestServer::RestServer(boost::asio::io_context &ioc, unsigned short port,
                       ToolService &tools, std::string secret)
    : acceptor_(ioc, tcp::endpoint(tcp::v4(), port)), tools_(tools),
      secret_(std::move(secret)) {
  if (sodium_init() < 0)
    throw std::runtime_error("libsodium initialisation failed");
}

void RestServer::run() {
  Logger::getInstance().log(LogLevel::INFO, "REST server listening",
                            {{"port", port()}, {"auth", !secret_.empty()}});
  do_accept();
}

void RestServer::stop() {
  boost::system::error_code ec;
  acceptor_.close(ec);
}

unsigned short RestServer::port() const {
  boost::system::error_code ec;
  auto endpoint = acceptor_.local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

void RestServer::do_accept() {
  acceptor_.async_accept(
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        on_accept(ec, std::move(socket));
      });
}

void RestServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
  if (ec == boost::asio::error::operation_aborted)
    return;
  if (!ec) {
    boost::asio::post(acceptor_.get_executor(),
                      [this, s = std::move(socket)]() mutable {
                        serve(std::move(s));
                      });
  } else {
    Logger::getInstance().log(LogLevel::WARN, "Accept failed",
                              {{"error", ec.message()}});
  }
  if (acceptor_.is_open())
    do_accept();
}

void RestServer::serve(tcp::socket socket) {
  boost::system::error_code ec;
  std::string header;
  std::size_t headEnd = boost::asio::read_until(
      socket, boost::asio::dynamic_buffer(header, MAX_HEADER_BYTES),
      "\r\n\r\n", ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::DEBUG, "Dropped connection",
                              {{"error", ec.message()}});
    return;
  }
  std::string body = header.substr(headEnd);
  header.erase(headEnd);

  HTTP::HTTPREQUEST req = HTTP::ParseHttpRequest(header);
  HTTP::HTTPRESPONSE res;
  auto length = HTTP::ContentLength(req);
  if (!length) {
    res = errorResponse(400, "malformed Content-Length");
  } else if (*length > MAX_BODY_BYTES) {
    res = errorResponse(413, "request body too large");
  } else {
    if (body.size() < *length) {
      std::string rest(*length - body.size(), '\0');
      boost::asio::read(socket, boost::asio::buffer(rest), ec);
      if (ec) {
        Logger::getInstance().log(LogLevel::DEBUG, "Short request body",
                                  {{"error", ec.message()}});
        return;
      }
      body += rest;
    }
    body.resize(*length);
    req.body = std::move(body);
    res = handle(req);
  }

  boost::asio::write(
      socket, boost::asio::buffer(HTTP::GenerateHttpResponseString(res)), ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::DEBUG, "Response write failed",
                              {{"error", ec.message()}});
    return;
  }
  socket.shutdown(tcp::socket::shutdown_send, ec);
}

bool RestServer::check_auth(const HTTP::HTTPREQUEST &req) const {
  if (secret_.empty())
    return true;
  auto auth = HTTP::FindHeader(req, "Authorization");
  if (!auth || auth->empty())
    return false;
  const std::string prefix = "Bearer ";
  if (auth->compare(0, prefix.size(), prefix) != 0)
    return false;
  return verifyJwt(auth->substr(prefix.size()));
}

bool RestServer::verifyJwt(const std::string &jwt) const {
  auto firstDot = jwt.find('.');
  if (firstDot == std::string::npos)
    return false;
  auto secondDot = jwt.find('.', firstDot + 1);
  if (secondDot == std::string::npos ||
      jwt.find('.', secondDot + 1) != std::string::npos)
    return false;
  std::string header = jwt.substr(0, firstDot);
  std::string payload = jwt.substr(firstDot + 1, secondDot - firstDot - 1);
  std::string sig = jwt.substr(secondDot + 1);

  try {
    json head = json::parse(base64::decode<std::string>(header));
    if (!head.is_object() || head.value("alg", "") != "HS256")
      return false;

    Mac mac = hmacSha256(secret_, header + "." + payload);
    std::vector<uint8_t> decoded = base64::decode(sig);
    if (!constantTimeEquals(mac.data(), mac.size(), decoded.data(),
                            decoded.size()))
      return false;

    json claims = json::parse(base64::decode<std::string>(payload));
    if (!claims.is_object())
      return false;
    auto exp = claims.find("exp");
    if (exp != claims.end()) {
      if (!exp->is_number())
        return false;
      const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
      if (exp->get<double>() <= static_cast<double>(now))
        return false;
    }
    return true;
  } catch (const cppcodec::parse_error &) {
    return false;
  } catch (const json::exception &) {
    return false;
  }
}

std::string RestServer::signJwt(const json &claims, const std::string &secret) {
  const std::string header =
      base64::encode(std::string(R"({"alg":"HS256","typ":"JWT"})"));
  const std::string payload = base64::encode(claims.dump());
  const std::string signingInput = header + "." + payload;
  Mac mac = hmacSha256(secret, signingInput);
  return signingInput + "." + base64::encode(mac.data(), mac.size());
}

HTTP::HTTPRESPONSE RestServer::callTool(const std::string &name,
                                        const std::string &body) {
  if (!tools_.hasTool(name))
    return errorResponse(404, "unknown tool '" + name + "'");

  json args = json::object();
  if (!trim(body).empty()) {
    try {
      args = json::parse(body);
    } catch (const json::parse_error &e) {
      return errorResponse(400, std::string("malformed JSON: ") + e.what());
    }
  }
  json result = tools_.call(name, args);
  return jsonResponse(statusFor(result), result);
}

HTTP::HTTPRESPONSE RestServer::handle(const HTTP::HTTPREQUEST &req) {
  const auto started = std::chrono::steady_clock::now();
  const std::string path = HTTP::RequestPath(req.uri);
  const std::string toolsPrefix = "/tools/";
  HTTP::HTTPRESPONSE res;

  if (path == "/healthz") {
    res = req.method == HTTP::HttpMethod::GET
              ? HTTP::MakeResponse(200, "ok", "text/plain")
              : errorResponse(405, "method not allowed");
  } else if (path == "/metrics") {
    res = req.method == HTTP::HttpMethod::GET
              ? HTTP::MakeResponse(200,
                                   MetricsRegistry::instance().toPrometheus(),
                                   "text/plain; version=0.0.4")
              : errorResponse(405, "method not allowed");
  } else if (path == "/tools" || path.rfind(toolsPrefix, 0) == 0) {
    if (!check_auth(req)) {
      res = errorResponse(401, "unauthorized");
    } else if (path == "/tools") {
      res = req.method == HTTP::HttpMethod::GET
                ? jsonResponse(200, {{"tools", tools_.toolNames()}})
                : errorResponse(405, "method not allowed");
    } else if (req.method != HTTP::HttpMethod::POST) {
      res = errorResponse(405, "method not allowed");
    } else {
      res = callTool(path.substr(toolsPrefix.size()), req.body);
    }
  } else {
    res = errorResponse(404, "not found");
  }

  Logger::getInstance().log(
      LogLevel::DEBUG, "HTTP request",
      {{"method", HTTP::HttpMethodToString(req.method)},
       {"path", path},
       {"status", res.statusCodeNumber},
       {"elapsed_ms",
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)
            .count()}});
  return res;
}

} // namespace ledgerproof
