#ifndef LEDGERPROOF_RETRY_POLICY_HPP
#define LEDGERPROOF_RETRY_POLICY_HPP

#include "ledger/errors.h"
#include "utilities/cancellation.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <chrono>
#include <mutex>
#include <random>
#include <string>

namespace ledgerproof {

/**
 * @brief Bounded retry with exponential backoff and jitter.
 *
 * Only TransientCollaboratorError is retried. Sleeps between attempts are
 * interrupted by cancellation, in which case Cancelled is thrown.
 */
class RetryPolicy {
public:
  struct Options {
    unsigned maxAttempts = 3;
    std::chrono::milliseconds baseDelay{100};
    std::chrono::milliseconds maxDelay{2000};
    double jitter = 0.2; ///< Fraction of the delay randomised either way.
  };

  RetryPolicy() : RetryPolicy(Options{}) {}
  explicit RetryPolicy(Options opts, unsigned seed = std::random_device{}())
      : opts_(opts), rng_(seed) {
    if (opts_.maxAttempts == 0)
      opts_.maxAttempts = 1;
  }

  const Options &options() const { return opts_; }

  /// Delay before retry number @p attempt (1-based), jitter applied.
  std::chrono::milliseconds backoffFor(unsigned attempt);

  template <typename Fn>
  auto run(const std::string &call, const CancellationToken &token, Fn &&fn)
      -> decltype(fn()) {
    for (unsigned attempt = 1;; ++attempt) {
      token.throwIfCancelled(call);
      try {
        return fn();
      } catch (const TransientCollaboratorError &e) {
        if (attempt >= opts_.maxAttempts) {
          throw TransientCollaboratorError(
              call, "gave up after " + std::to_string(attempt) +
                        " attempts: " + e.what());
        }
        auto delay = backoffFor(attempt);
        MetricsRegistry::instance().incrementCounter(
            "ledgerproof_collaborator_retries_total", 1.0, {{"call", call}});
        Logger::getInstance().log(
            LogLevel::WARN, "Transient collaborator failure, retrying",
            {{"call", call},
             {"attempt", attempt},
             {"delay_ms", delay.count()},
             {"error", e.what()}});
        if (!token.waitFor(delay))
          throw Cancelled(call);
      }
    }
  }

private:
  Options opts_;
  std::mutex rngMutex_;
  std::mt19937 rng_;
};

} // namespace ledgerproof

#endif // LEDGERPROOF_RETRY_POLICY_HPP
