#pragma once
#include "cache/BatchMetadataCache.h"
#include "ledger/LedgerClient.h"
#include "ledger/StorageClient.h"
#include "ledger/types.h"
#include "utilities/cancellation.hpp"
#include "utilities/retry_policy.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledgerproof {

struct ScoredCandidate {
  BatchDescriptor descriptor;
  double score = 0.0;
  std::string matchReason;
};

struct SearchResult {
  std::vector<ScoredCandidate> candidates; ///< best first, unique ids
  bool possiblyIncomplete = false;

  std::vector<std::string> ids() const;
};

enum class BatchOrder { TimestampDesc, TimestampAsc, CountDesc, CountAsc };

std::optional<BatchOrder> parseBatchOrder(const std::string &text);

struct BatchFilter {
  std::optional<std::string> databaseName;
  std::optional<std::string> tableName;
  std::optional<TimeRange> timeRange;
  std::optional<uint64_t> minCount;
  std::optional<uint64_t> maxCount;
};

struct BatchPage {
  std::vector<BatchDescriptor> batches;
  std::size_t totalCount = 0;
  std::size_t offset = 0;
  std::size_t limit = 0;
  bool hasMore = false;
};

struct SearchCriteria {
  std::optional<std::string> databaseName;
  std::optional<std::string> tableName;
  std::optional<TimeRange> timeRange;
  std::optional<Digest> merkleRoot;
  std::optional<uint64_t> minCount;
  std::optional<std::string> batchIdPattern; ///< substring match
  /// Canonical digest of a transaction; only batches holding it match.
  std::optional<Digest> transactionHash;
};

/**
 * @brief Finds the batches that may contain a transaction and ranks them.
 */
class CandidateSearch {
public:
  static constexpr double FAST_PATH_SCORE = 100.0;
  static constexpr std::size_t MAX_LIST_LIMIT = 1000;
  static constexpr std::size_t MAX_SEARCH_RESULTS = 200;

  struct Options {
    /// Most recent batches considered per index query.
    std::size_t maxCandidates = 50;
  };

  /// @p storage is needed only for transaction hash searches.
  CandidateSearch(LedgerClient &ledger, BatchMetadataCache &cache,
                  RetryPolicy &retry, Options opts,
                  StorageClient *storage = nullptr);

  /**
   * @brief Candidate batches for @p constraint, best first.
   *
   * A batch id goes straight to the cache. Otherwise the batch index is
   * queried and each batch scored: +4 database, +4 table, +2 inside the time
   * range, +1 when a time range is given and the batch can hold the expected
   * operation. Ties go to the newer batch, then the lower id. At most
   * maxCandidates of the newest matching batches are considered; the result
   * is flagged possiblyIncomplete when more exist.
   */
  SearchResult search(const ResolvedConstraint &constraint,
                      const CancellationToken &token) const;

  BatchPage listBatches(const BatchFilter &filter, std::size_t limit,
                        std::size_t offset, BatchOrder order,
                        const CancellationToken &token) const;

  /**
   * @brief Batches matching every given criterion, most relevant first.
   *
   * A transaction hash criterion fetches the contents of each batch that
   * passes the other criteria.
   * @throw InvalidRequest for a transaction hash search without storage.
   */
  SearchResult searchBatches(const SearchCriteria &criteria,
                             std::size_t maxResults,
                             const CancellationToken &token) const;

  static double score(const BatchDescriptor &batch,
                      const ResolvedConstraint &constraint,
                      std::string *reason = nullptr);

private:
  BatchIndexPage query(const BatchQuery &q,
                       const CancellationToken &token) const;
  bool holdsLeaf(const BatchDescriptor &batch, const Digest &leaf,
                 const CancellationToken &token) const;

  LedgerClient &ledger_;
  BatchMetadataCache &cache_;
  RetryPolicy &retry_;
  Options opts_;
  StorageClient *storage_;
};

} // namespace ledgerproof
