#pragma once
#include "ledger/LedgerClient.h"
#include "ledger/StorageClient.h"
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ledgerproof {

/**
 * @brief File-backed ledger and object store.
 *
 * Each batch lives in <root>/batches/<batch_id>.json holding the descriptor
 * fields plus "leaves" and optional "proofs". The index is read on first use
 * and reloaded by refresh().
 */
class LocalArchive : public LedgerClient, public StorageClient {
public:
  explicit LocalArchive(std::filesystem::path root);

  BatchIndexPage queryBatchIndex(const BatchQuery &query,
                                 const CancellationToken &token) override;
  std::optional<BatchDescriptor>
  getBatch(const std::string &batchId, const CancellationToken &token) override;
  std::optional<Digest> getBatchRoot(const std::string &batchId,
                                     const CancellationToken &token) override;
  ContractStats contractStats(const CancellationToken &token) override;

  BatchContents fetchBatchContents(const std::string &storageRef,
                                   const CancellationToken &token) override;

  /** Drop the in-memory index so the next call rereads the directory. */
  void refresh();

  /**
   * @brief Store @p batch and @p contents as given, root included.
   * @return The descriptor with storageRef and sizeBytes filled in.
   */
  BatchDescriptor write(BatchDescriptor batch, const BatchContents &contents);

  /**
   * @brief Build a batch from @p leaves: compute the root and operation
   * counts, then write it.
   */
  BatchDescriptor seal(const std::string &batchId, const std::string &database,
                       const std::vector<std::string> &tables,
                       const std::vector<BatchLeaf> &leaves,
                       Timestamp createdAt);

  const std::filesystem::path &root() const { return root_; }

  static std::string storageRefFor(const std::string &batchId);

private:
  void ensureLoadedLocked();
  std::string readFile(const std::filesystem::path &path,
                       const char *call) const;

  std::filesystem::path root_;
  mutable std::mutex mtx_;
  bool loaded_ = false;
  std::map<std::string, BatchDescriptor> index_;
};

} // namespace ledgerproof
