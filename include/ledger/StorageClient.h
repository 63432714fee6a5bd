#pragma once
#include "ledger/types.h"
#include "utilities/cancellation.hpp"
#include <string>

namespace ledgerproof {

/**
 * @brief Object storage holding the full leaf list of each batch.
 */
class StorageClient {
public:
  virtual ~StorageClient() = default;

  /// Fetch the leaves (and stored proofs, if any) behind @p storageRef.
  virtual BatchContents fetchBatchContents(const std::string &storageRef,
                                           const CancellationToken &token) = 0;
};

} // namespace ledgerproof
