#pragma once
#include "ledger/types.h"
#include "utilities/cancellation.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledgerproof {

/// Filter for the ledger's batch index. Unset fields do not filter.
struct BatchQuery {
  std::optional<std::string> databaseName;
  std::optional<std::string> tableName;
  std::optional<Timestamp> from; ///< inclusive
  std::optional<Timestamp> to;   ///< exclusive
  std::optional<uint64_t> minCount;
  std::optional<uint64_t> maxCount;
  std::size_t limit = 0; ///< 0 returns every match
  std::size_t offset = 0;
};

/// One page of the batch index, newest first.
struct BatchIndexPage {
  std::vector<BatchDescriptor> batches;
  std::size_t total = 0; ///< matches before limit/offset
};

struct ContractStats {
  uint64_t totalBatches = 0;
  uint64_t totalTransactions = 0;
  std::optional<Timestamp> earliest;
  std::optional<Timestamp> latest;
  std::vector<std::string> databases;
};

/**
 * @brief Read-only view of the blockchain contract holding batch anchors.
 *
 * Implementations throw TransientCollaboratorError for retryable failures and
 * PermanentCollaboratorError otherwise.
 */
class LedgerClient {
public:
  virtual ~LedgerClient() = default;

  virtual BatchIndexPage queryBatchIndex(const BatchQuery &query,
                                         const CancellationToken &token) = 0;
  virtual std::optional<BatchDescriptor>
  getBatch(const std::string &batchId, const CancellationToken &token) = 0;
  /// Root as anchored on chain, independent of any descriptor copy.
  virtual std::optional<Digest>
  getBatchRoot(const std::string &batchId, const CancellationToken &token) = 0;
  virtual ContractStats contractStats(const CancellationToken &token) = 0;
};

/// True when @p batch satisfies every filter in @p query.
bool matchesQuery(const BatchDescriptor &batch, const BatchQuery &query);

/// Order by creation time descending, then batch id ascending.
void sortNewestFirst(std::vector<BatchDescriptor> &batches);

} // namespace ledgerproof
