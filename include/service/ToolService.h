#pragma once
#include "archive/LocalArchive.h"
#include "cache/BatchMetadataCache.h"
#include "ledger/LedgerClient.h"
#include "ledger/StorageClient.h"
#include "search/CandidateSearch.h"
#include "utilities/cancellation.hpp"
#include "utilities/config.hpp"
#include "utilities/retry_policy.hpp"
#include "verify/BatchOrchestrator.h"
#include "verify/TransactionVerifier.h"
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ledgerproof {

/**
 * @brief Owns the verification components built from one Config.
 *
 * The cache is created once here and shared by reference with everything
 * that reads batch metadata.
 */
class Engine {
public:
  /// Engine over a LocalArchive rooted at cfg.archiveDir.
  explicit Engine(const Config &cfg);
  Engine(const Config &cfg, LedgerClient &ledger, StorageClient &storage);
  ~Engine();

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  const Config &config() const { return config_; }
  LedgerClient &ledger() { return ledger_; }
  /// Null unless the engine owns its archive.
  LocalArchive *archive() { return archive_.get(); }
  RetryPolicy &retry() { return retry_; }
  BatchMetadataCache &cache() { return cache_; }
  const CandidateSearch &search() const { return search_; }
  const TransactionVerifier &verifier() const { return verifier_; }
  BatchOrchestrator &orchestrator() { return orchestrator_; }

  /// Start background maintenance (cache sweeping).
  void start();
  void stop();

private:
  Engine(const Config &cfg, std::unique_ptr<LocalArchive> archive);

  Config config_;
  std::unique_ptr<LocalArchive> archive_;
  LedgerClient &ledger_;
  StorageClient &storage_;
  RetryPolicy retry_;
  BatchMetadataCache cache_;
  CandidateSearch search_;
  TransactionVerifier verifier_;
  BatchOrchestrator orchestrator_;
};

/**
 * @brief Named JSON operations over an Engine.
 *
 * call() never throws for request problems: malformed arguments come back as
 * {"error": ..., "invalid_fields": [...]} and collaborator failures as
 * {"error": ..., "retryable": ...}.
 */
class ToolService {
public:
  using Handler = std::function<nlohmann::json(const nlohmann::json &,
                                               const CancellationToken &)>;

  explicit ToolService(Engine &engine);

  nlohmann::json call(const std::string &name, const nlohmann::json &args,
                      const CancellationToken &token = {});

  bool hasTool(const std::string &name) const;
  std::vector<std::string> toolNames() const;

private:
  nlohmann::json verifyTransaction(const nlohmann::json &args,
                                   const CancellationToken &token);
  nlohmann::json verifyBatch(const nlohmann::json &args,
                             const CancellationToken &token);
  nlohmann::json getBatch(const nlohmann::json &args,
                          const CancellationToken &token);
  nlohmann::json listBatches(const nlohmann::json &args,
                             const CancellationToken &token);
  nlohmann::json searchBatches(const nlohmann::json &args,
                               const CancellationToken &token);
  nlohmann::json getConfig() const;
  nlohmann::json getContractInfo(const CancellationToken &token);

  Engine &engine_;
  std::map<std::string, Handler> tools_;
};

} // namespace ledgerproof
