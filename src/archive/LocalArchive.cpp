#include "archive/LocalArchive.h"
#include "ledger/errors.h"
#include "ledger/json_codec.h"
#include "merkle/merkle_proof.h"
#include "search/HintResolver.h"
#include "utilities/logger.h"
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace ledgerproof {

namespace fs = std::filesystem;
using nlohmann::json;

LocalArchive::LocalArchive(fs::path root) : root_(std::move(root)) {}

std::string LocalArchive::storageRefFor(const std::string &batchId) {
  return "batches/" + batchId + ".json";
}

std::string LocalArchive::readFile(const fs::path &path,
                                   const char *call) const {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw TransientCollaboratorError(call, "cannot open " + path.string());
  std::ostringstream buf;
  buf << in.rdbuf();
  if (in.bad())
    throw TransientCollaboratorError(call, "read failed for " + path.string());
  return buf.str();
}

void LocalArchive::ensureLoadedLocked() {
  if (loaded_)
    return;
  std::map<std::string, BatchDescriptor> index;
  const fs::path dir = root_ / "batches";
  std::error_code ec;
  if (fs::exists(dir, ec)) {
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
      if (!it->is_regular_file() || it->path().extension() != ".json")
        continue;
      const std::string text = readFile(it->path(), "query_batch_index");
      BatchDescriptor batch;
      try {
        batch = descriptorFromJson(json::parse(text));
      } catch (const json::exception &e) {
        throw PermanentCollaboratorError(
            "query_batch_index", it->path().string() + ": " + e.what());
      } catch (const InvalidRequest &e) {
        throw PermanentCollaboratorError(
            "query_batch_index", it->path().string() + ": " + e.what());
      }
      if (batch.storageRef.empty())
        batch.storageRef = "batches/" + it->path().filename().string();
      index[batch.batchId] = std::move(batch);
    }
  }
  if (ec) {
    throw TransientCollaboratorError("query_batch_index",
                                     "cannot list " + dir.string() + ": " +
                                         ec.message());
  }
  index_ = std::move(index);
  loaded_ = true;
  Logger::getInstance().log(LogLevel::DEBUG, "Loaded batch archive index",
                            {{"root", root_.string()},
                             {"batches", index_.size()}});
}

void LocalArchive::refresh() {
  std::lock_guard<std::mutex> lg(mtx_);
  loaded_ = false;
  index_.clear();
}

BatchIndexPage LocalArchive::queryBatchIndex(const BatchQuery &query,
                                             const CancellationToken &token) {
  token.throwIfCancelled("query_batch_index");
  std::vector<BatchDescriptor> matched;
  {
    std::lock_guard<std::mutex> lg(mtx_);
    ensureLoadedLocked();
    for (const auto &[id, batch] : index_) {
      if (matchesQuery(batch, query))
        matched.push_back(batch);
    }
  }
  sortNewestFirst(matched);

  BatchIndexPage page;
  page.total = matched.size();
  std::size_t first = std::min(query.offset, matched.size());
  std::size_t last = query.limit == 0
                         ? matched.size()
                         : std::min(matched.size(), first + query.limit);
  page.batches.assign(matched.begin() + static_cast<std::ptrdiff_t>(first),
                      matched.begin() + static_cast<std::ptrdiff_t>(last));
  return page;
}

std::optional<BatchDescriptor>
LocalArchive::getBatch(const std::string &batchId,
                       const CancellationToken &token) {
  token.throwIfCancelled("get_batch");
  std::lock_guard<std::mutex> lg(mtx_);
  ensureLoadedLocked();
  auto it = index_.find(batchId);
  if (it == index_.end())
    return std::nullopt;
  return it->second;
}

std::optional<Digest>
LocalArchive::getBatchRoot(const std::string &batchId,
                           const CancellationToken &token) {
  auto batch = getBatch(batchId, token);
  if (!batch)
    return std::nullopt;
  return batch->merkleRoot;
}

ContractStats LocalArchive::contractStats(const CancellationToken &token) {
  token.throwIfCancelled("contract_stats");
  std::lock_guard<std::mutex> lg(mtx_);
  ensureLoadedLocked();
  ContractStats stats;
  std::set<std::string> databases;
  for (const auto &[id, batch] : index_) {
    ++stats.totalBatches;
    stats.totalTransactions += batch.transactionCount;
    if (!stats.earliest || batch.createdAt < *stats.earliest)
      stats.earliest = batch.createdAt;
    if (!stats.latest || batch.createdAt > *stats.latest)
      stats.latest = batch.createdAt;
    if (!batch.databaseName.empty())
      databases.insert(batch.databaseName);
  }
  stats.databases.assign(databases.begin(), databases.end());
  return stats;
}

BatchContents LocalArchive::fetchBatchContents(const std::string &storageRef,
                                               const CancellationToken &token) {
  token.throwIfCancelled("fetch_batch_contents");
  const fs::path rel(storageRef);
  if (storageRef.empty() || rel.is_absolute() ||
      std::any_of(rel.begin(), rel.end(),
                  [](const fs::path &part) { return part == ".."; })) {
    throw PermanentCollaboratorError("fetch_batch_contents",
                                     "invalid storage reference '" +
                                         storageRef + "'");
  }
  const fs::path path = root_ / rel;
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec)
      throw TransientCollaboratorError("fetch_batch_contents", ec.message());
    throw PermanentCollaboratorError("fetch_batch_contents",
                                     "no object at " + storageRef);
  }
  const std::string text = readFile(path, "fetch_batch_contents");
  try {
    return contentsFromJson(json::parse(text));
  } catch (const json::exception &e) {
    throw PermanentCollaboratorError("fetch_batch_contents",
                                     storageRef + ": " + e.what());
  } catch (const InvalidRequest &e) {
    throw PermanentCollaboratorError("fetch_batch_contents",
                                     storageRef + ": " + e.what());
  }
}

BatchDescriptor LocalArchive::write(BatchDescriptor batch,
                                    const BatchContents &contents) {
  if (!HintResolver::isValidBatchId(batch.batchId))
    throw InvalidRequest("invalid batch id '" + batch.batchId + "'");

  batch.storageRef = storageRefFor(batch.batchId);
  const fs::path dir = root_ / "batches";
  const fs::path target = root_ / batch.storageRef;
  const fs::path tmp = target.string() + ".tmp";

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec)
    throw TransientCollaboratorError("write_batch", "cannot create " +
                                                        dir.string() + ": " +
                                                        ec.message());

  json doc = descriptorToJson(batch);
  json body = contentsToJson(contents);
  doc["leaves"] = body["leaves"];
  if (body.contains("proofs"))
    doc["proofs"] = body["proofs"];
  const std::string text = doc.dump(2);
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    os.write(text.data(), static_cast<std::streamsize>(text.size()));
    os.flush();
    if (!os)
      throw TransientCollaboratorError("write_batch",
                                       "cannot write " + tmp.string());
  }
  fs::rename(tmp, target, ec);
  if (ec)
    throw TransientCollaboratorError("write_batch", "cannot rename into " +
                                                        target.string() + ": " +
                                                        ec.message());
  batch.sizeBytes = static_cast<uint64_t>(text.size());

  std::lock_guard<std::mutex> lg(mtx_);
  if (loaded_)
    index_[batch.batchId] = batch;
  Logger::getInstance().log(LogLevel::INFO, "Wrote batch to archive",
                            {{"batch_id", batch.batchId},
                             {"leaves", contents.leaves.size()},
                             {"root", toHex(batch.merkleRoot)}});
  return batch;
}

BatchDescriptor LocalArchive::seal(const std::string &batchId,
                                   const std::string &database,
                                   const std::vector<std::string> &tables,
                                   const std::vector<BatchLeaf> &leaves,
                                   Timestamp createdAt) {
  if (leaves.empty())
    throw InvalidRequest("cannot seal an empty batch");

  BatchDescriptor batch;
  batch.batchId = batchId;
  batch.databaseName = database;
  batch.tableNames = tables;
  batch.createdAt = createdAt;
  batch.transactionCount = leaves.size();

  std::vector<Digest> digests;
  digests.reserve(leaves.size());
  for (const auto &leaf : leaves) {
    digests.push_back(leaf.digest);
    if (leaf.operation)
      ++batch.operationCounts[*leaf.operation];
  }
  batch.merkleRoot = MerkleTree::computeRoot(digests);

  BatchContents contents;
  contents.leaves = leaves;
  return write(std::move(batch), contents);
}

} // namespace ledgerproof
