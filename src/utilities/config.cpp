#include "utilities/config.hpp"
#include "ledger/errors.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace ledgerproof {

namespace {

template <typename T>
T readAs(const YAML::Node &node, const char *key, T fallback) {
  if (!node[key])
    return fallback;
  try {
    return node[key].as<T>();
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("config key '") + key + "': " + e.what());
  }
}

long long envInt(const char *name, const char *value) {
  try {
    std::size_t used = 0;
    long long v = std::stoll(value, &used);
    if (used != std::string(value).size())
      throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::exception &) {
    throw ConfigError(std::string(name) + " is not an integer: " + value);
  }
}

} // namespace

std::string Config::contractId() const {
  if (network == "mainnet")
    return organization + ".near";
  return organization + "." + network;
}

RetryPolicy::Options Config::retryOptions() const {
  RetryPolicy::Options opts;
  opts.maxAttempts = maxRetries + 1;
  opts.baseDelay = retryBaseDelay;
  opts.maxDelay = retryMaxDelay;
  opts.jitter = retryJitter;
  return opts;
}

LogLevel parseLogLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return LogLevel::TRACE;
  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "INFO")
    return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  if (upper == "FATAL")
    return LogLevel::FATAL;
  throw ConfigError("unknown log level: " + name);
}

Config loadConfigFile(const std::string &path) {
  Config cfg;
  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::BadFile &) {
    return cfg;
  } catch (const YAML::Exception &e) {
    throw ConfigError("cannot parse " + path + ": " + e.what());
  }
  if (!node || node.IsNull())
    return cfg;
  if (!node.IsMap())
    throw ConfigError(path + ": top level must be a mapping");

  cfg.organization = readAs<std::string>(node, "organization", cfg.organization);
  cfg.network = readAs<std::string>(node, "network", cfg.network);
  cfg.rpcEndpoint = readAs<std::string>(node, "rpc_endpoint", cfg.rpcEndpoint);
  cfg.timeout = std::chrono::seconds(
      readAs<long long>(node, "timeout_seconds", cfg.timeout.count()));
  cfg.cacheTtl = std::chrono::seconds(
      readAs<long long>(node, "cache_ttl_seconds", cfg.cacheTtl.count()));
  cfg.cacheCapacity =
      readAs<std::size_t>(node, "cache_capacity", cfg.cacheCapacity);
  cfg.maxRetries = readAs<unsigned>(node, "max_retries", cfg.maxRetries);
  cfg.retryBaseDelay = std::chrono::milliseconds(readAs<long long>(
      node, "retry_base_delay_ms", cfg.retryBaseDelay.count()));
  cfg.retryMaxDelay = std::chrono::milliseconds(
      readAs<long long>(node, "retry_max_delay_ms", cfg.retryMaxDelay.count()));
  cfg.retryJitter = readAs<double>(node, "retry_jitter", cfg.retryJitter);
  cfg.workers = readAs<unsigned>(node, "workers", cfg.workers);
  cfg.batchTimeout = std::chrono::seconds(readAs<long long>(
      node, "batch_timeout_seconds", cfg.batchTimeout.count()));
  cfg.maxCandidates =
      readAs<std::size_t>(node, "max_candidates", cfg.maxCandidates);
  cfg.tieMargin = readAs<double>(node, "tie_margin", cfg.tieMargin);
  cfg.archiveDir = readAs<std::string>(node, "archive_dir", cfg.archiveDir);
  cfg.listenPort = readAs<uint16_t>(node, "listen_port", cfg.listenPort);
  cfg.jwtSecret = readAs<std::string>(node, "jwt_secret", cfg.jwtSecret);
  cfg.logFile = readAs<std::string>(node, "log_file", cfg.logFile);
  if (node["log_level"])
    cfg.logLevel = parseLogLevel(readAs<std::string>(node, "log_level", ""));
  cfg.awsRegion = readAs<std::string>(node, "aws_region", cfg.awsRegion);
  return cfg;
}

void applyEnvironment(Config &cfg) {
  if (const char *env = std::getenv("LEDGERPROOF_ORGANIZATION"))
    cfg.organization = env;
  if (const char *env = std::getenv("LEDGERPROOF_NETWORK"))
    cfg.network = env;
  if (const char *env = std::getenv("LEDGERPROOF_RPC_ENDPOINT"))
    cfg.rpcEndpoint = env;
  if (const char *env = std::getenv("LEDGERPROOF_TIMEOUT"))
    cfg.timeout = std::chrono::seconds(envInt("LEDGERPROOF_TIMEOUT", env));
  if (const char *env = std::getenv("LEDGERPROOF_CACHE_TTL"))
    cfg.cacheTtl = std::chrono::seconds(envInt("LEDGERPROOF_CACHE_TTL", env));
  if (const char *env = std::getenv("LEDGERPROOF_MAX_RETRIES")) {
    long long v = envInt("LEDGERPROOF_MAX_RETRIES", env);
    if (v < 0)
      throw ConfigError("LEDGERPROOF_MAX_RETRIES must not be negative");
    cfg.maxRetries = static_cast<unsigned>(v);
  }
  if (const char *env = std::getenv("LEDGERPROOF_WORKERS")) {
    long long v = envInt("LEDGERPROOF_WORKERS", env);
    if (v < 1)
      throw ConfigError("LEDGERPROOF_WORKERS must be at least 1");
    cfg.workers = static_cast<unsigned>(v);
  }
  if (const char *env = std::getenv("LEDGERPROOF_ARCHIVE_DIR"))
    cfg.archiveDir = env;
  if (const char *env = std::getenv("LEDGERPROOF_LOG_LEVEL"))
    cfg.logLevel = parseLogLevel(env);
}

void validate(const Config &cfg) {
  if (cfg.organization.empty())
    throw ConfigError("organization is required");
  if (cfg.network.empty())
    throw ConfigError("network must not be empty");
  if (cfg.timeout.count() <= 0)
    throw ConfigError("timeout_seconds must be positive");
  if (cfg.cacheTtl.count() <= 0)
    throw ConfigError("cache_ttl_seconds must be positive");
  if (cfg.cacheCapacity == 0)
    throw ConfigError("cache_capacity must be positive");
  if (cfg.workers == 0)
    throw ConfigError("workers must be at least 1");
  if (cfg.batchTimeout.count() <= 0)
    throw ConfigError("batch_timeout_seconds must be positive");
  if (cfg.maxCandidates == 0)
    throw ConfigError("max_candidates must be positive");
  if (cfg.tieMargin < 0.0)
    throw ConfigError("tie_margin must not be negative");
  if (cfg.retryJitter < 0.0 || cfg.retryJitter >= 1.0)
    throw ConfigError("retry_jitter must be in [0, 1)");
  if (cfg.retryBaseDelay.count() < 0 ||
      cfg.retryMaxDelay < cfg.retryBaseDelay)
    throw ConfigError("retry delays must satisfy 0 <= base <= max");
}

Config loadConfig() {
  const char *path = std::getenv("LEDGERPROOF_CONFIG");
  if (!path)
    path = "ledgerproof.yaml";
  Config cfg = loadConfigFile(path);
  applyEnvironment(cfg);
  validate(cfg);
  return cfg;
}

} // namespace ledgerproof
