#ifndef LEDGERPROOF_CONFIG_HPP
#define LEDGERPROOF_CONFIG_HPP

#include "utilities/logger.h"
#include "utilities/retry_policy.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace ledgerproof {

/**
 * @brief Runtime options for the verification service.
 *
 * Loaded from YAML, then overridden by LEDGERPROOF_* environment variables.
 */
struct Config {
  std::string organization;
  std::string network = "testnet";
  std::string rpcEndpoint;
  std::chrono::seconds timeout{30};
  std::chrono::seconds cacheTtl{300};
  std::size_t cacheCapacity = 1024;
  unsigned maxRetries = 3;
  std::chrono::milliseconds retryBaseDelay{100};
  std::chrono::milliseconds retryMaxDelay{2000};
  double retryJitter = 0.2;
  unsigned workers = 4;
  std::chrono::seconds batchTimeout{120};
  std::size_t maxCandidates = 50;
  double tieMargin = 0.0;
  std::string archiveDir = "archive";
  uint16_t listenPort = 8000;
  std::string jwtSecret;
  std::string logFile = Logger::CONSOLE_ONLY_OUTPUT;
  LogLevel logLevel = LogLevel::INFO;
  std::string awsRegion = "us-west-2";

  /// "<org>.near" on mainnet, "<org>.<network>" elsewhere.
  std::string contractId() const;

  RetryPolicy::Options retryOptions() const;
};

/// Read the file named by LEDGERPROOF_CONFIG (default "ledgerproof.yaml").
/// A missing file yields defaults; a malformed one throws ConfigError.
Config loadConfig();

/// Parse @p path without consulting the environment.
Config loadConfigFile(const std::string &path);

/// Apply LEDGERPROOF_* environment overrides to @p cfg.
void applyEnvironment(Config &cfg);

/// Throws ConfigError when a field is out of range or missing.
void validate(const Config &cfg);

LogLevel parseLogLevel(const std::string &name);

} // namespace ledgerproof

#endif // LEDGERPROOF_CONFIG_HPP
