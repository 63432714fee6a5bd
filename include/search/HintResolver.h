#pragma once
#include "ledger/types.h"

namespace ledgerproof {

/**
 * @brief Validates caller hints and turns them into a search constraint.
 */
class HintResolver {
public:
  /**
   * @brief Validate every field of @p hint.
   * @throw InvalidHint listing each offending field.
   */
  static ResolvedConstraint resolve(const VerificationHint &hint);

  /**
   * @brief Fill database, table and operation from @p record where the
   * constraint leaves them open.
   * @throw InvalidHint when a hinted value contradicts the record.
   */
  static ResolvedConstraint merge(ResolvedConstraint constraint,
                                  const TransactionRecord &record);

  /// True for ids of the form BATCH-YYYY-MM-DD-<suffix> with a real date.
  static bool isValidBatchId(const std::string &batchId);
};

} // namespace ledgerproof
