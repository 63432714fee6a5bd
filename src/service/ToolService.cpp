#include "service/ToolService.h"
#include "ledger/errors.h"
#include "ledger/json_codec.h"
#include "search/HintResolver.h"
#include "utilities/logger.h"
#include "utilities/time_utils.hpp"
#include <algorithm>
#include <chrono>

namespace ledgerproof {

using nlohmann::json;

namespace {

BatchMetadataCache::Options cacheOptions(const Config &cfg) {
  BatchMetadataCache::Options o;
  o.ttl = cfg.cacheTtl;
  o.capacity = cfg.cacheCapacity;
  return o;
}

TransactionVerifier::Options verifierOptions(const Config &cfg) {
  TransactionVerifier::Options o;
  o.tieMargin = cfg.tieMargin;
  o.timeout =
      std::chrono::duration_cast<std::chrono::milliseconds>(cfg.timeout);
  return o;
}

const json &objectArg(const json &args, const char *key) {
  static const json null;
  auto it = args.find(key);
  if (it == args.end() || it->is_null())
    return null;
  if (!it->is_object())
    throw InvalidHint({InvalidHint::Field{key, "must be an object"}});
  return *it;
}

std::optional<std::string> stringArg(const json &obj, const char *key,
                                     std::vector<InvalidHint::Field> &errors) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
    return std::nullopt;
  if (!it->is_string()) {
    errors.push_back({key, "must be a string"});
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::optional<uint64_t> countArg(const json &obj, const char *key,
                                 std::vector<InvalidHint::Field> &errors) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
    return std::nullopt;
  if (it->is_number_unsigned() ||
      (it->is_number_integer() && it->get<int64_t>() >= 0))
    return it->get<uint64_t>();
  errors.push_back({key, "must be a non-negative integer"});
  return std::nullopt;
}

/// A positive count of @p unit no longer than @p ceiling.
std::optional<std::chrono::milliseconds>
timeoutArg(const json &obj, const char *key, std::chrono::milliseconds unit,
           std::chrono::milliseconds ceiling,
           std::vector<InvalidHint::Field> &errors) {
  auto value = countArg(obj, key, errors);
  if (!value)
    return std::nullopt;
  const auto limit = static_cast<uint64_t>(ceiling / unit);
  if (*value == 0 || *value > limit) {
    errors.push_back(
        {key, "must be between 1 and " + std::to_string(limit)});
    return std::nullopt;
  }
  return unit * static_cast<std::chrono::milliseconds::rep>(*value);
}

bool flagArg(const json &obj, const char *key,
             std::vector<InvalidHint::Field> &errors) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
    return false;
  if (!it->is_boolean()) {
    errors.push_back({key, "must be a boolean"});
    return false;
  }
  return it->get<bool>();
}

std::chrono::milliseconds timeoutCeiling(const Config &cfg) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::max(cfg.timeout, cfg.batchTimeout));
}

std::optional<Timestamp> timeArg(const json &obj, const char *key,
                                 std::vector<InvalidHint::Field> &errors) {
  auto text = stringArg(obj, key, errors);
  if (!text)
    return std::nullopt;
  auto parsed = parseIsoUtc(*text);
  if (parsed)
    return parsed.value;
  errors.push_back({key, parsed.error == TimeParseError::Naive
                             ? "must carry a UTC designator (Z or +HH:MM)"
                             : "is not an ISO-8601 timestamp"});
  return std::nullopt;
}

/// Either bound may be open; an open bound extends to the end of time.
std::optional<TimeRange> rangeArg(const json &obj,
                                  std::vector<InvalidHint::Field> &errors) {
  auto start = timeArg(obj, "time_start", errors);
  auto end = timeArg(obj, "time_end", errors);
  if (!start && !end)
    return std::nullopt;
  TimeRange range{start.value_or(Timestamp::min()),
                  end.value_or(Timestamp::max())};
  if (range.start >= range.end) {
    errors.push_back({"time_end", "must be after time_start"});
    return std::nullopt;
  }
  return range;
}

json summaryJson(const BatchDescriptor &b) {
  json out = {{"batch_id", b.batchId},
              {"timestamp", formatIsoUtc(b.createdAt)},
              {"database_name", b.databaseName},
              {"table_names", b.tableNames},
              {"transaction_count", b.transactionCount},
              {"merkle_root", toHex(b.merkleRoot)}};
  out["size_bytes"] = b.sizeBytes ? json(*b.sizeBytes) : json();
  return out;
}

json optionalTime(const std::optional<Timestamp> &ts) {
  return ts ? json(formatIsoUtc(*ts)) : json();
}

/// A batch item is {"transaction": {...}, "hints": {...}} with nothing else;
/// any other object is a bare record.
bool isWrappedItem(const json &item) {
  auto tx = item.find("transaction");
  if (tx == item.end() || !tx->is_object())
    return false;
  for (auto it = item.begin(); it != item.end(); ++it) {
    if (it.key() != "transaction" && it.key() != "hints")
      return false;
  }
  return true;
}

VerificationVerdict itemError(const std::string &reason) {
  VerificationVerdict v;
  v.kind = VerdictKind::Error;
  v.reason = reason;
  return v;
}

json errorJson(const std::string &message, std::vector<std::string> fields) {
  return {{"error", message}, {"invalid_fields", fields}};
}

} // namespace

Engine::Engine(const Config &cfg)
    : Engine(cfg, std::make_unique<LocalArchive>(cfg.archiveDir)) {}

Engine::Engine(const Config &cfg, std::unique_ptr<LocalArchive> archive)
    : config_(cfg), archive_(std::move(archive)), ledger_(*archive_),
      storage_(*archive_), retry_(cfg.retryOptions()),
      cache_(BatchMetadataCache::ledgerLoader(ledger_, retry_),
             cacheOptions(cfg)),
      search_(ledger_, cache_, retry_,
              CandidateSearch::Options{cfg.maxCandidates}, &storage_),
      verifier_(search_, storage_, retry_, verifierOptions(cfg)),
      orchestrator_(verifier_, cfg.workers,
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        cfg.batchTimeout)) {}

Engine::Engine(const Config &cfg, LedgerClient &ledger, StorageClient &storage)
    : config_(cfg), ledger_(ledger), storage_(storage),
      retry_(cfg.retryOptions()),
      cache_(BatchMetadataCache::ledgerLoader(ledger_, retry_),
             cacheOptions(cfg)),
      search_(ledger_, cache_, retry_,
              CandidateSearch::Options{cfg.maxCandidates}, &storage_),
      verifier_(search_, storage_, retry_, verifierOptions(cfg)),
      orchestrator_(verifier_, cfg.workers,
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        cfg.batchTimeout)) {}

Engine::~Engine() { stop(); }

void Engine::start() { cache_.start(); }

void Engine::stop() { cache_.stop(); }

ToolService::ToolService(Engine &engine) : engine_(engine) {
  tools_["verify_transaction"] = [this](const json &a,
                                        const CancellationToken &t) {
    return verifyTransaction(a, t);
  };
  tools_["verify_batch"] = [this](const json &a, const CancellationToken &t) {
    return verifyBatch(a, t);
  };
  tools_["get_batch"] = [this](const json &a, const CancellationToken &t) {
    return getBatch(a, t);
  };
  tools_["list_batches"] = [this](const json &a, const CancellationToken &t) {
    return listBatches(a, t);
  };
  tools_["search_batches"] = [this](const json &a,
                                    const CancellationToken &t) {
    return searchBatches(a, t);
  };
  tools_["get_config"] = [this](const json &, const CancellationToken &) {
    return getConfig();
  };
  tools_["get_contract_info"] = [this](const json &,
                                       const CancellationToken &t) {
    return getContractInfo(t);
  };
}

bool ToolService::hasTool(const std::string &name) const {
  return tools_.count(name) != 0;
}

std::vector<std::string> ToolService::toolNames() const {
  std::vector<std::string> names;
  for (const auto &[name, handler] : tools_)
    names.push_back(name);
  return names;
}

json ToolService::call(const std::string &name, const json &args,
                       const CancellationToken &token) {
  auto it = tools_.find(name);
  if (it == tools_.end())
    return errorJson("unknown tool '" + name + "'", {});
  if (!args.is_null() && !args.is_object())
    return errorJson("arguments must be a JSON object", {});

  const json &in = args.is_null() ? json::object() : args;
  try {
    return it->second(in, token);
  } catch (const InvalidHint &e) {
    return errorJson(e.what(), e.fieldNames());
  } catch (const EncodingError &e) {
    return errorJson(e.what(), {e.column()});
  } catch (const InvalidRequest &e) {
    return errorJson(e.what(), {});
  } catch (const Cancelled &e) {
    return {{"error", e.what()}, {"cancelled", true}, {"retryable", true}};
  } catch (const CollaboratorError &e) {
    const bool retryable =
        dynamic_cast<const TransientCollaboratorError *>(&e) != nullptr;
    Logger::getInstance().log(LogLevel::ERROR, "Tool call failed",
                              {{"tool", name},
                               {"call", e.call()},
                               {"error", e.what()},
                               {"retryable", retryable}});
    return {{"error", e.what()}, {"retryable", retryable}};
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "Tool call failed",
                              {{"tool", name}, {"error", e.what()}});
    return {{"error", std::string("internal error: ") + e.what()},
            {"retryable", false}};
  }
}

json ToolService::verifyTransaction(const json &args,
                                    const CancellationToken &token) {
  auto tx = args.find("transaction_data");
  if (tx == args.end() || tx->is_null())
    throw InvalidHint({InvalidHint::Field{"transaction_data", "is required"}});
  if (!tx->is_object())
    throw InvalidHint({InvalidHint::Field{"transaction_data", "must be an object"}});

  std::vector<InvalidHint::Field> errors;
  auto timeout = timeoutArg(args, "timeout", std::chrono::seconds(1),
                            timeoutCeiling(engine_.config()), errors);
  if (!errors.empty())
    throw InvalidHint(std::move(errors));

  TransactionRecord record = recordFromJson(*tx);
  VerificationHint hint = hintFromJson(objectArg(args, "hints"));
  const TransactionVerifier &verifier = engine_.verifier();
  return verdictToJson(
      timeout ? verifier.verify(record, hint, token, *timeout)
              : verifier.verify(record, hint, token));
}

json ToolService::verifyBatch(const json &args,
                              const CancellationToken &token) {
  auto txs = args.find("transactions");
  if (txs == args.end() || !txs->is_array())
    throw InvalidHint({InvalidHint::Field{"transactions", "must be an array"}});

  BatchRunOptions options;
  options.defaultHint = hintFromJson(objectArg(args, "hints"));
  // Reject a bad shared hint up front rather than once per item.
  HintResolver::resolve(options.defaultHint);
  std::vector<InvalidHint::Field> errors;
  if (auto p = args.find("parallel"); p != args.end() && !p->is_null()) {
    if (!p->is_boolean())
      errors.push_back({"parallel", "must be a boolean"});
    else
      options.parallel = p->get<bool>();
  }
  options.failFast = flagArg(args, "fail_fast", errors);
  if (auto t = timeoutArg(args, "timeout_ms", std::chrono::milliseconds(1),
                          timeoutCeiling(engine_.config()), errors))
    options.timeout = *t;
  if (!errors.empty())
    throw InvalidHint(std::move(errors));

  // Items that fail to decode get their verdict here; the rest are verified
  // and spliced back into their original positions.
  std::vector<std::optional<VerificationVerdict>> verdicts(txs->size());
  std::vector<VerificationItem> items;
  std::vector<std::size_t> positions;
  for (std::size_t i = 0; i < txs->size(); ++i) {
    const json &item = (*txs)[i];
    try {
      if (!item.is_object())
        throw InvalidRequest("transaction must be a JSON object");
      if (isWrappedItem(item)) {
        VerificationItem vi{recordFromJson(item["transaction"]), std::nullopt};
        if (auto h = item.find("hints"); h != item.end() && !h->is_null())
          vi.hint = hintFromJson(*h);
        items.push_back(std::move(vi));
      } else {
        items.push_back({recordFromJson(item), std::nullopt});
      }
      positions.push_back(i);
    } catch (const LedgerProofError &e) {
      verdicts[i] = itemError(e.what());
    }
  }

  const auto started = std::chrono::steady_clock::now();
  auto results = engine_.orchestrator().verifyMany(items, options, token);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  for (std::size_t k = 0; k < results.size(); ++k)
    verdicts[positions[k]] = std::move(results[k]);

  std::vector<VerificationVerdict> ordered;
  ordered.reserve(verdicts.size());
  json individual = json::array();
  for (auto &v : verdicts) {
    individual.push_back(verdictToJson(*v));
    ordered.push_back(std::move(*v));
  }
  BatchSummary summary = BatchOrchestrator::summarize(ordered);

  return {{"total_transactions", summary.total},
          {"verified_count", summary.verified},
          {"failed_count", summary.failed},
          {"processing_time_ms", elapsed.count()},
          {"verification_timestamp",
           formatIsoUtc(std::chrono::time_point_cast<std::chrono::microseconds>(
               std::chrono::system_clock::now()))},
          {"individual_results", individual},
          {"summary",
           {{"success_rate", summary.successRate},
            {"average_verification_time_ms", summary.averageMs},
            {"parallel_processing", options.parallel},
            {"fail_fast_mode", options.failFast},
            {"hints_used", !options.defaultHint.empty()}}}};
}

json ToolService::getBatch(const json &args, const CancellationToken &token) {
  std::vector<InvalidHint::Field> errors;
  auto id = stringArg(args, "batch_id", errors);
  if (!errors.empty())
    throw InvalidHint(std::move(errors));
  if (!id)
    throw InvalidHint({InvalidHint::Field{"batch_id", "is required"}});
  if (!HintResolver::isValidBatchId(*id))
    throw InvalidHint({InvalidHint::Field{"batch_id", "must match BATCH-YYYY-MM-DD-<suffix>"}});

  auto batch = engine_.cache().get(*id, token);
  if (!batch)
    return nullptr;
  return descriptorToJson(*batch);
}

json ToolService::listBatches(const json &args,
                              const CancellationToken &token) {
  const json &f = objectArg(args, "filter");
  std::vector<InvalidHint::Field> errors;
  BatchFilter filter;
  if (!f.is_null()) {
    filter.databaseName = stringArg(f, "database_name", errors);
    filter.tableName = stringArg(f, "table_name", errors);
    filter.timeRange = rangeArg(f, errors);
    filter.minCount = countArg(f, "min_transaction_count", errors);
    filter.maxCount = countArg(f, "max_transaction_count", errors);
  }
  std::vector<InvalidHint::Field> argErrors;
  auto limit = countArg(args, "limit", argErrors);
  auto offset = countArg(args, "offset", argErrors);
  auto orderText = stringArg(args, "order_by", argErrors);
  errors.insert(errors.end(), argErrors.begin(), argErrors.end());

  BatchOrder order = BatchOrder::TimestampDesc;
  if (orderText) {
    if (auto parsed = parseBatchOrder(*orderText))
      order = *parsed;
    else
      errors.push_back({"order_by", "must be timestamp_desc, timestamp_asc, "
                                    "count_desc or count_asc"});
  }
  if (!errors.empty())
    throw InvalidHint(std::move(errors));

  BatchPage page = engine_.search().listBatches(
      filter, limit ? static_cast<std::size_t>(*limit) : 100,
      offset ? static_cast<std::size_t>(*offset) : 0, order, token);

  json batches = json::array();
  for (const auto &b : page.batches)
    batches.push_back(summaryJson(b));
  json out = {{"batches", batches},
              {"total_count", page.totalCount},
              {"offset", page.offset},
              {"limit", page.limit},
              {"has_more", page.hasMore}};
  out["filter_applied"] = f.is_null() ? json() : f;
  return out;
}

json ToolService::searchBatches(const json &args,
                                const CancellationToken &token) {
  const json &c = objectArg(args, "criteria");
  std::vector<InvalidHint::Field> errors;
  SearchCriteria criteria;
  if (!c.is_null()) {
    criteria.databaseName = stringArg(c, "database_name", errors);
    criteria.tableName = stringArg(c, "table_name", errors);
    criteria.timeRange = rangeArg(c, errors);
    criteria.minCount = countArg(c, "min_transaction_count", errors);
    criteria.batchIdPattern = stringArg(c, "batch_id_pattern", errors);
    if (auto root = stringArg(c, "merkle_root", errors)) {
      if (auto d = digestFromHex(*root))
        criteria.merkleRoot = *d;
      else
        errors.push_back({"merkle_root", "must be a 32-byte hex digest"});
    }
    if (auto hash = stringArg(c, "transaction_hash", errors)) {
      if (auto d = digestFromHex(*hash))
        criteria.transactionHash = *d;
      else
        errors.push_back(
            {"transaction_hash", "must be a 32-byte hex digest"});
    }
  }
  auto maxResults = countArg(args, "max_results", errors);
  if (!errors.empty())
    throw InvalidHint(std::move(errors));

  const auto started = std::chrono::steady_clock::now();
  SearchResult result = engine_.search().searchBatches(
      criteria, maxResults ? static_cast<std::size_t>(*maxResults) : 50,
      token);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  json matches = json::array();
  for (const auto &candidate : result.candidates) {
    json m = summaryJson(candidate.descriptor);
    m["match_reason"] = candidate.matchReason;
    m["relevance_score"] = candidate.score;
    matches.push_back(std::move(m));
  }
  json out = {{"matches", matches},
              {"total_matches", result.candidates.size()},
              {"search_time_ms", elapsed.count()},
              {"search_incomplete", result.possiblyIncomplete}};
  out["search_criteria"] = c.is_null() ? json::object() : c;
  if (result.candidates.empty()) {
    out["suggestions"] = {"Widen the time range",
                          "Check the database and table names",
                          "Use list_batches to see recent batches"};
  }
  return out;
}

json ToolService::getConfig() const {
  const Config &cfg = engine_.config();
  json out = {{"organization_id", cfg.organization},
              {"network", cfg.network},
              {"contract_id", cfg.contractId()},
              {"timeout", cfg.timeout.count()},
              {"cache_ttl", cfg.cacheTtl.count()},
              {"max_retries", cfg.maxRetries},
              {"aws_region", cfg.awsRegion}};
  out["rpc_endpoint"] =
      cfg.rpcEndpoint.empty() ? json() : json(cfg.rpcEndpoint);
  return out;
}

json ToolService::getContractInfo(const CancellationToken &token) {
  const Config &cfg = engine_.config();
  ContractStats stats = engine_.retry().run(
      "contract_stats", token,
      [&] { return engine_.ledger().contractStats(token); });
  return {{"contract_address", cfg.contractId()},
          {"organization_id", cfg.organization},
          {"network", cfg.network},
          {"total_batches", stats.totalBatches},
          {"total_transactions", stats.totalTransactions},
          {"oldest_batch_timestamp", optionalTime(stats.earliest)},
          {"newest_batch_timestamp", optionalTime(stats.latest)},
          {"databases", stats.databases}};
}

} // namespace ledgerproof
