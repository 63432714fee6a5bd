#pragma once
#include "ledger/StorageClient.h"
#include "ledger/types.h"
#include "search/CandidateSearch.h"
#include "utilities/cancellation.hpp"
#include "utilities/retry_policy.hpp"
#include <chrono>
#include <functional>

namespace ledgerproof {

/**
 * @brief Verifies one transaction against the anchored batches.
 *
 * Each call walks Start -> HintsResolved -> CandidatesFound -> BatchFetched ->
 * ProofChecked -> Done, never backwards, and always ends in a verdict unless
 * the hint itself is invalid.
 */
class TransactionVerifier {
public:
  enum class State {
    Start,
    HintsResolved,
    CandidatesFound,
    BatchFetched,
    ProofChecked,
    Done
  };

  struct Options {
    /// Candidates scoring within this distance of the best match tie.
    double tieMargin = 0.0;
    std::chrono::milliseconds timeout{30000};
    /// Called on every state change; must be thread-safe if verify() is
    /// called concurrently.
    std::function<void(State)> onTransition;
  };

  TransactionVerifier(const CandidateSearch &search, StorageClient &storage,
                      RetryPolicy &retry, Options opts);

  /**
   * @brief Verify @p record.
   * @throw InvalidHint before any lookup when @p hint is malformed or
   *        contradicts the record.
   */
  VerificationVerdict verify(const TransactionRecord &record,
                             const VerificationHint &hint,
                             const CancellationToken &cancel = {}) const;

  /// verify() bounded by @p timeout instead of Options::timeout.
  VerificationVerdict verify(const TransactionRecord &record,
                             const VerificationHint &hint,
                             const CancellationToken &cancel,
                             std::chrono::milliseconds timeout) const;

  const Options &options() const { return opts_; }

  static const char *stateName(State s);

private:
  struct Progress;

  VerificationVerdict run(const TransactionRecord &record,
                          const ResolvedConstraint &constraint,
                          const CancellationToken &token, Progress &p) const;
  VerificationVerdict errorVerdict(const Progress &p, std::string reason,
                                   bool retryable, bool cancelled) const;
  void advance(Progress &p, State next) const;

  const CandidateSearch &search_;
  StorageClient &storage_;
  RetryPolicy &retry_;
  Options opts_;
};

} // namespace ledgerproof
