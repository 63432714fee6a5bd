#pragma once
#include "ledger/LedgerClient.h"
#include "ledger/types.h"
#include "utilities/cancellation.hpp"
#include "utilities/retry_policy.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

/**
 * @file BatchMetadataCache.h
 * @brief TTL cache of batch descriptors with single-flight loading.
 */

namespace ledgerproof {

using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Thread-safe, read-through cache of BatchDescriptor keyed by batch id.
 *
 * Concurrent misses for the same id share one loader call. Not-found results
 * and failed loads are never stored.
 */
class BatchMetadataCache {
public:
  /// Loader returns std::nullopt when the batch does not exist.
  using Loader = std::function<std::optional<BatchDescriptor>(
      const std::string &, const CancellationToken &)>;
  using Clock = std::function<SteadyClock::time_point()>;

  struct Options {
    std::chrono::seconds ttl{300};
    std::size_t capacity = 1024;
    std::chrono::seconds sweepInterval{60};
  };

  struct Stats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t fetches = 0;
    uint64_t coalesced = 0;
  };

  BatchMetadataCache(Loader loader, Options opts,
                     Clock clock = [] { return SteadyClock::now(); });
  ~BatchMetadataCache();

  BatchMetadataCache(const BatchMetadataCache &) = delete;
  BatchMetadataCache &operator=(const BatchMetadataCache &) = delete;

  /**
   * @brief Return the descriptor for @p batchId, loading it on a miss.
   *
   * Loader exceptions propagate to the caller and to every caller waiting on
   * the same load. A waiter whose own @p token fires gets Cancelled.
   */
  std::optional<BatchDescriptor> get(const std::string &batchId,
                                     const CancellationToken &token = {});

  void invalidate(const std::string &batchId);

  /** Drop expired entries. Returns how many were removed. */
  std::size_t sweep();

  std::size_t size() const;
  Stats stats() const;

  /** Start the background sweep thread. */
  void start();
  /** Stop the background sweep thread. */
  void stop();

  /**
   * @brief Loader that reads the descriptor and the anchored root from the
   * ledger under @p retry.
   *
   * The root from getBatchRoot() replaces the descriptor's copy; a missing
   * root is a PermanentCollaboratorError.
   */
  static Loader ledgerLoader(LedgerClient &ledger, RetryPolicy &retry);

private:
  using Result = std::optional<BatchDescriptor>;

  struct Entry {
    BatchDescriptor descriptor;
    SteadyClock::time_point expiresAt;
  };

  /// One in-progress load shared by every caller that missed on the same id.
  struct Flight : std::enable_shared_from_this<Flight> {
    std::mutex mtx;
    std::condition_variable cv;
    bool done = false;
    Result value;
    std::exception_ptr error;

    void finish(Result loaded, std::exception_ptr failure);
    /// Block until finished or @p token fires; throws Cancelled on the latter.
    void await(const std::string &batchId, const CancellationToken &token);
  };

  std::optional<BatchDescriptor> lookupLocked(const std::string &batchId,
                                              SteadyClock::time_point now);
  void storeLocked(const std::string &batchId, const BatchDescriptor &d,
                   SteadyClock::time_point now);
  void publishSize() const;
  void threadFunc();

  Loader loader_;
  Options opts_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::unordered_map<std::string, std::shared_ptr<Flight>> inflight_;
  Stats stats_;

  std::atomic<bool> running_{false};
  std::mutex sweepMutex_;
  std::condition_variable sweepCv_;
  std::thread sweeper_;
};

} // namespace ledgerproof
