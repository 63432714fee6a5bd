#pragma once
#include "ledger/types.h"
#include "utilities/cancellation.hpp"
#include "utilities/worker_pool.hpp"
#include "verify/TransactionVerifier.h"
#include <chrono>
#include <optional>
#include <vector>

namespace ledgerproof {

struct VerificationItem {
  TransactionRecord record;
  std::optional<VerificationHint> hint;
};

struct BatchRunOptions {
  bool parallel = true;
  /// Zero uses the orchestrator's default.
  std::chrono::milliseconds timeout{0};
  /// Applied to items that carry no hint of their own.
  VerificationHint defaultHint;
  /// Cancel the items still pending once any item is not Verified.
  bool failFast = false;
};

struct BatchSummary {
  std::size_t total = 0;
  std::size_t verified = 0;
  std::size_t failed = 0;
  double successRate = 0.0; ///< percent
  double averageMs = 0.0;
};

/**
 * @brief Runs many verifications on a bounded worker pool.
 *
 * Verdicts come back in input order. A failing item only affects its own
 * verdict. When the overall timeout expires, or a fail-fast run sees its
 * first failure, the remaining items are reported as cancelled errors and
 * finished ones are kept.
 */
class BatchOrchestrator {
public:
  BatchOrchestrator(const TransactionVerifier &verifier, std::size_t workers,
                    std::chrono::milliseconds defaultTimeout);
  ~BatchOrchestrator();

  std::vector<VerificationVerdict>
  verifyMany(const std::vector<VerificationItem> &items,
             const BatchRunOptions &options = {},
             const CancellationToken &cancel = {});

  static BatchSummary summarize(const std::vector<VerificationVerdict> &verdicts);

  std::size_t workers() const { return pool_.size(); }

private:
  struct Run;

  static VerificationVerdict verifyOne(const TransactionVerifier &verifier,
                                       const VerificationItem &item,
                                       const VerificationHint &fallback,
                                       const CancellationToken &token);

  const TransactionVerifier &verifier_;
  std::chrono::milliseconds defaultTimeout_;
  WorkerPool pool_;
};

} // namespace ledgerproof
