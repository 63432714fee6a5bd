#include "ledger/LedgerClient.h"
#include <algorithm>

namespace ledgerproof {

bool matchesQuery(const BatchDescriptor &batch, const BatchQuery &query) {
  if (query.databaseName && batch.databaseName != *query.databaseName)
    return false;
  if (query.tableName && !batch.hasTable(*query.tableName))
    return false;
  if (query.from && batch.createdAt < *query.from)
    return false;
  if (query.to && batch.createdAt >= *query.to)
    return false;
  if (query.minCount && batch.transactionCount < *query.minCount)
    return false;
  if (query.maxCount && batch.transactionCount > *query.maxCount)
    return false;
  return true;
}

void sortNewestFirst(std::vector<BatchDescriptor> &batches) {
  std::sort(batches.begin(), batches.end(),
            [](const BatchDescriptor &a, const BatchDescriptor &b) {
              if (a.createdAt != b.createdAt)
                return a.createdAt > b.createdAt;
              return a.batchId < b.batchId;
            });
}

} // namespace ledgerproof
