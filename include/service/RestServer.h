#pragma once
#include "service/ToolService.h"
#include "utilities/http.hpp"
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace ledgerproof {

/**
 * @brief HTTP front end for ToolService.
 *
 * Routes:
 *   POST /tools/<name>  JSON arguments in, JSON result out
 *   GET  /tools         tool names
 *   GET  /healthz       "ok"
 *   GET  /metrics       Prometheus text
 *
 * When a secret is configured, /tools requests need an HS256 bearer token.
 */
class RestServer {
public:
  static constexpr std::size_t MAX_HEADER_BYTES = 64 * 1024;
  static constexpr std::size_t MAX_BODY_BYTES = 8 * 1024 * 1024;

  /**
   * @param ioc    I/O context driving the acceptor.
   * @param port   Port to bind; 0 picks an ephemeral port.
   * @param tools  Operations to expose.
   * @param secret HMAC secret for JWT verification; empty disables auth.
   */
  RestServer(boost::asio::io_context &ioc, unsigned short port,
             ToolService &tools, std::string secret = {});

  /// Begin accepting connections.
  void run();
  void stop();

  unsigned short port() const;

  /// Route one parsed request.
  HTTP::HTTPRESPONSE handle(const HTTP::HTTPREQUEST &req);

  bool verifyJwt(const std::string &jwt) const;

  /// HS256 token over @p claims, as accepted by verifyJwt().
  static std::string signJwt(const nlohmann::json &claims,
                             const std::string &secret);

private:
  void do_accept();
  void on_accept(boost::system::error_code ec,
                 boost::asio::ip::tcp::socket socket);
  void serve(boost::asio::ip::tcp::socket socket);
  bool check_auth(const HTTP::HTTPREQUEST &req) const;
  HTTP::HTTPRESPONSE callTool(const std::string &name,
                              const std::string &body);

  boost::asio::ip::tcp::acceptor acceptor_;
  ToolService &tools_;
  std::string secret_;
};

} // namespace ledgerproof
