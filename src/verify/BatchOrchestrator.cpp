#include "verify/BatchOrchestrator.h"
#include "hashing/canonical_hasher.h"
#include "ledger/errors.h"
#include "utilities/logger.h"
#include <condition_variable>
#include <memory>
#include <mutex>

namespace ledgerproof {

struct BatchOrchestrator::Run {
  explicit Run(const CancellationToken &parent) : source(parent) {}

  std::vector<VerificationItem> items;
  VerificationHint defaultHint;
  std::vector<std::optional<VerificationVerdict>> results;
  std::size_t remaining = 0;
  bool closed = false;
  std::mutex mtx;
  std::condition_variable cv;
  CancellationSource source;

  void complete(std::size_t index, std::optional<VerificationVerdict> verdict) {
    {
      std::lock_guard<std::mutex> lg(mtx);
      if (!closed && verdict)
        results[index] = std::move(verdict);
      --remaining;
    }
    cv.notify_all();
  }
};

namespace {

VerificationVerdict cancelledVerdict(const TransactionRecord &record) {
  VerificationVerdict v;
  v.kind = VerdictKind::Error;
  v.reason = "cancelled";
  v.cancelled = true;
  v.retryable = true;
  try {
    v.leafDigest = CanonicalHasher::digest(record);
  } catch (const EncodingError &) {
    // Leave the digest unset; the record could never be verified anyway.
  }
  return v;
}

} // namespace

BatchOrchestrator::BatchOrchestrator(const TransactionVerifier &verifier,
                                     std::size_t workers,
                                     std::chrono::milliseconds defaultTimeout)
    : verifier_(verifier), defaultTimeout_(defaultTimeout), pool_(workers) {}

BatchOrchestrator::~BatchOrchestrator() { pool_.stop(); }

VerificationVerdict
BatchOrchestrator::verifyOne(const TransactionVerifier &verifier,
                             const VerificationItem &item,
                             const VerificationHint &fallback,
                             const CancellationToken &token) {
  const VerificationHint &hint = item.hint ? *item.hint : fallback;
  try {
    return verifier.verify(item.record, hint, token);
  } catch (const InvalidHint &e) {
    VerificationVerdict v;
    v.kind = VerdictKind::Error;
    v.reason = e.what();
    return v;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "Batch item failed",
                              {{"error", e.what()}});
    VerificationVerdict v;
    v.kind = VerdictKind::Error;
    v.reason = e.what();
    return v;
  }
}

std::vector<VerificationVerdict>
BatchOrchestrator::verifyMany(const std::vector<VerificationItem> &items,
                              const BatchRunOptions &options,
                              const CancellationToken &cancel) {
  if (items.empty())
    return {};

  auto run = std::make_shared<Run>(cancel);
  run->items = items;
  run->defaultHint = options.defaultHint;
  run->results.resize(items.size());
  auto timeout =
      options.timeout.count() > 0 ? options.timeout : defaultTimeout_;
  if (timeout.count() > 0)
    run->source.setTimeout(timeout);
  const CancellationToken token = run->source.token();
  const TransactionVerifier &verifier = verifier_;
  const bool failFast = options.failFast;

  bool submitted = true;
  if (options.parallel) {
    run->remaining = items.size();
    for (std::size_t i = 0; i < items.size() && submitted; ++i) {
      submitted = pool_.submit([run, i, token, failFast, &verifier] {
        if (token.cancelled()) {
          run->complete(i, std::nullopt);
          return;
        }
        auto verdict =
            verifyOne(verifier, run->items[i], run->defaultHint, token);
        const bool failed = !verdict.verified();
        // Record the failure before cancelling so it is not reported as
        // cancelled itself.
        run->complete(i, std::move(verdict));
        if (failFast && failed)
          run->source.cancel();
      });
    }
  } else {
    run->remaining = 1;
    submitted = pool_.submit([run, token, failFast, &verifier] {
      for (std::size_t i = 0; i < run->items.size(); ++i) {
        if (token.cancelled())
          break;
        auto verdict =
            verifyOne(verifier, run->items[i], run->defaultHint, token);
        const bool failed = !verdict.verified();
        {
          std::lock_guard<std::mutex> lg(run->mtx);
          if (!run->closed)
            run->results[i] = std::move(verdict);
        }
        if (failFast && failed)
          break;
      }
      run->complete(0, std::nullopt);
    });
  }
  if (!submitted) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Worker pool stopped; batch run abandoned");
    run->source.cancel();
  }

  std::vector<VerificationVerdict> out;
  out.reserve(items.size());
  {
    std::unique_lock<std::mutex> lk(run->mtx);
    while (submitted && run->remaining > 0 && !token.cancelled())
      run->cv.wait_for(lk, std::chrono::milliseconds(20));
    run->closed = true;
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (run->results[i])
        out.push_back(std::move(*run->results[i]));
      else
        out.push_back(cancelledVerdict(items[i].record));
    }
  }
  // Stop whatever is still running; its results are discarded.
  run->source.cancel();

  std::size_t pending = 0;
  for (const auto &v : out)
    pending += v.cancelled ? 1 : 0;
  Logger::getInstance().log(LogLevel::INFO, "Batch verification finished",
                            {{"items", items.size()},
                             {"parallel", options.parallel},
                             {"fail_fast", options.failFast},
                             {"cancelled", pending}});
  return out;
}

BatchSummary
BatchOrchestrator::summarize(const std::vector<VerificationVerdict> &verdicts) {
  BatchSummary s;
  s.total = verdicts.size();
  double totalMs = 0.0;
  for (const auto &v : verdicts) {
    if (v.verified())
      ++s.verified;
    else
      ++s.failed;
    totalMs += static_cast<double>(v.elapsed.count());
  }
  if (s.total > 0) {
    s.successRate = 100.0 * static_cast<double>(s.verified) /
                    static_cast<double>(s.total);
    s.averageMs = totalMs / static_cast<double>(s.total);
  }
  return s;
}

} // namespace ledgerproof
