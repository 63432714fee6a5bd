#include "search/CandidateSearch.h"
#include "ledger/errors.h"
#include "utilities/logger.h"
#include <algorithm>
#include <set>

namespace ledgerproof {

namespace {

void rank(std::vector<ScoredCandidate> &candidates) {
  std::sort(candidates.begin(), candidates.end(),
            [](const ScoredCandidate &a, const ScoredCandidate &b) {
              if (a.score != b.score)
                return a.score > b.score;
              if (a.descriptor.createdAt != b.descriptor.createdAt)
                return a.descriptor.createdAt > b.descriptor.createdAt;
              return a.descriptor.batchId < b.descriptor.batchId;
            });
}

void dedupe(std::vector<ScoredCandidate> &candidates) {
  std::set<std::string> seen;
  candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                  [&](const ScoredCandidate &c) {
                                    return !seen.insert(c.descriptor.batchId)
                                                .second;
                                  }),
                   candidates.end());
}

void appendReason(std::string *reason, const char *part) {
  if (!reason)
    return;
  if (!reason->empty())
    *reason += ", ";
  *reason += part;
}

} // namespace

std::vector<std::string> SearchResult::ids() const {
  std::vector<std::string> out;
  out.reserve(candidates.size());
  for (const auto &c : candidates)
    out.push_back(c.descriptor.batchId);
  return out;
}

std::optional<BatchOrder> parseBatchOrder(const std::string &text) {
  if (text == "timestamp_desc")
    return BatchOrder::TimestampDesc;
  if (text == "timestamp_asc")
    return BatchOrder::TimestampAsc;
  if (text == "count_desc")
    return BatchOrder::CountDesc;
  if (text == "count_asc")
    return BatchOrder::CountAsc;
  return std::nullopt;
}

CandidateSearch::CandidateSearch(LedgerClient &ledger, BatchMetadataCache &cache,
                                 RetryPolicy &retry, Options opts,
                                 StorageClient *storage)
    : ledger_(ledger), cache_(cache), retry_(retry), opts_(opts),
      storage_(storage) {
  if (opts_.maxCandidates == 0)
    opts_.maxCandidates = 1;
}

BatchIndexPage CandidateSearch::query(const BatchQuery &q,
                                      const CancellationToken &token) const {
  return retry_.run("query_batch_index", token,
                    [&] { return ledger_.queryBatchIndex(q, token); });
}

bool CandidateSearch::holdsLeaf(const BatchDescriptor &batch, const Digest &leaf,
                                const CancellationToken &token) const {
  BatchContents contents =
      retry_.run("fetch_batch_contents", token, [&] {
        return storage_->fetchBatchContents(batch.storageRef, token);
      });
  return std::any_of(contents.leaves.begin(), contents.leaves.end(),
                     [&](const BatchLeaf &l) { return l.digest == leaf; });
}

double CandidateSearch::score(const BatchDescriptor &batch,
                              const ResolvedConstraint &constraint,
                              std::string *reason) {
  double s = 0.0;
  if (constraint.databaseName && batch.databaseName == *constraint.databaseName) {
    s += 4.0;
    appendReason(reason, "database");
  }
  if (constraint.tableName && batch.hasTable(*constraint.tableName)) {
    s += 4.0;
    appendReason(reason, "table");
  }
  if (constraint.timeRange) {
    if (constraint.timeRange->contains(batch.createdAt)) {
      s += 2.0;
      appendReason(reason, "time range");
    }
    bool plausible = false;
    if (constraint.operation) {
      auto it = batch.operationCounts.find(*constraint.operation);
      plausible = it != batch.operationCounts.end() && it->second > 0;
    } else {
      plausible = batch.transactionCount > 0;
    }
    if (plausible) {
      s += 1.0;
      appendReason(reason, "operation");
    }
  }
  return s;
}

SearchResult CandidateSearch::search(const ResolvedConstraint &constraint,
                                     const CancellationToken &token) const {
  SearchResult result;
  if (constraint.fastPath()) {
    if (auto batch = cache_.get(*constraint.batchId, token))
      result.candidates.push_back({*batch, FAST_PATH_SCORE, "batch id"});
    return result;
  }

  BatchQuery q;
  q.databaseName = constraint.databaseName;
  q.tableName = constraint.tableName;
  if (constraint.timeRange) {
    q.from = constraint.timeRange->start;
    q.to = constraint.timeRange->end;
  }
  // The index returns newest first, so a narrower query keeps every batch a
  // wider one kept and never yields more candidates.
  q.limit = opts_.maxCandidates + 1;

  BatchIndexPage page = query(q, token);
  if (page.batches.size() > opts_.maxCandidates) {
    page.batches.resize(opts_.maxCandidates);
    result.possiblyIncomplete = true;
  }
  if (page.total > opts_.maxCandidates)
    result.possiblyIncomplete = true;

  for (auto &batch : page.batches) {
    // The index is an external collaborator; do not trust its filtering.
    if (!matchesQuery(batch, q))
      continue;
    std::string reason;
    double s = score(batch, constraint, &reason);
    result.candidates.push_back({std::move(batch), s, std::move(reason)});
  }
  rank(result.candidates);
  dedupe(result.candidates);

  if (result.possiblyIncomplete) {
    Logger::getInstance().log(
        LogLevel::INFO, "Candidate search truncated",
        {{"limit", opts_.maxCandidates},
         {"unconstrained", constraint.unconstrained()}});
  }
  return result;
}

BatchPage CandidateSearch::listBatches(const BatchFilter &filter,
                                       std::size_t limit, std::size_t offset,
                                       BatchOrder order,
                                       const CancellationToken &token) const {
  limit = std::clamp<std::size_t>(limit, 1, MAX_LIST_LIMIT);

  BatchQuery q;
  q.databaseName = filter.databaseName;
  q.tableName = filter.tableName;
  if (filter.timeRange) {
    q.from = filter.timeRange->start;
    q.to = filter.timeRange->end;
  }
  q.minCount = filter.minCount;
  q.maxCount = filter.maxCount;

  std::vector<BatchDescriptor> all = query(q, token).batches;
  all.erase(std::remove_if(all.begin(), all.end(),
                           [&](const BatchDescriptor &b) {
                             return !matchesQuery(b, q);
                           }),
            all.end());

  switch (order) {
  case BatchOrder::TimestampDesc:
    sortNewestFirst(all);
    break;
  case BatchOrder::TimestampAsc:
    std::sort(all.begin(), all.end(), [](const auto &a, const auto &b) {
      if (a.createdAt != b.createdAt)
        return a.createdAt < b.createdAt;
      return a.batchId < b.batchId;
    });
    break;
  case BatchOrder::CountDesc:
    std::sort(all.begin(), all.end(), [](const auto &a, const auto &b) {
      if (a.transactionCount != b.transactionCount)
        return a.transactionCount > b.transactionCount;
      return a.batchId < b.batchId;
    });
    break;
  case BatchOrder::CountAsc:
    std::sort(all.begin(), all.end(), [](const auto &a, const auto &b) {
      if (a.transactionCount != b.transactionCount)
        return a.transactionCount < b.transactionCount;
      return a.batchId < b.batchId;
    });
    break;
  }

  BatchPage page;
  page.totalCount = all.size();
  page.offset = offset;
  page.limit = limit;
  if (offset < all.size()) {
    auto first = all.begin() + static_cast<std::ptrdiff_t>(offset);
    auto last = all.begin() +
                static_cast<std::ptrdiff_t>(std::min(all.size(), offset + limit));
    page.batches.assign(std::make_move_iterator(first),
                        std::make_move_iterator(last));
  }
  page.hasMore = offset + page.batches.size() < page.totalCount;
  return page;
}

SearchResult CandidateSearch::searchBatches(const SearchCriteria &criteria,
                                            std::size_t maxResults,
                                            const CancellationToken &token) const {
  maxResults = std::clamp<std::size_t>(maxResults, 1, MAX_SEARCH_RESULTS);
  if (criteria.transactionHash && !storage_)
    throw InvalidRequest("transaction hash search needs batch storage");

  BatchQuery q;
  q.databaseName = criteria.databaseName;
  q.tableName = criteria.tableName;
  if (criteria.timeRange) {
    q.from = criteria.timeRange->start;
    q.to = criteria.timeRange->end;
  }
  q.minCount = criteria.minCount;

  ResolvedConstraint asConstraint;
  asConstraint.databaseName = criteria.databaseName;
  asConstraint.tableName = criteria.tableName;
  asConstraint.timeRange = criteria.timeRange;

  SearchResult result;
  for (auto &batch : query(q, token).batches) {
    if (!matchesQuery(batch, q))
      continue;
    std::string reason;
    double s = score(batch, asConstraint, &reason);
    if (criteria.merkleRoot) {
      if (batch.merkleRoot != *criteria.merkleRoot)
        continue;
      s += 8.0;
      appendReason(&reason, "merkle root");
    }
    if (criteria.batchIdPattern) {
      if (batch.batchId.find(*criteria.batchIdPattern) == std::string::npos)
        continue;
      s += 1.0;
      appendReason(&reason, "batch id pattern");
    }
    // Last: the only criterion that touches storage.
    if (criteria.transactionHash) {
      token.throwIfCancelled("search_batches");
      if (!holdsLeaf(batch, *criteria.transactionHash, token))
        continue;
      s += 10.0;
      appendReason(&reason, "transaction hash");
    }
    result.candidates.push_back({std::move(batch), s, std::move(reason)});
  }
  rank(result.candidates);
  dedupe(result.candidates);
  if (result.candidates.size() > maxResults) {
    result.candidates.resize(maxResults);
    result.possiblyIncomplete = true;
  }
  return result;
}

} // namespace ledgerproof
