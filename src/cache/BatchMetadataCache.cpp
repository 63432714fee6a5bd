#include "cache/BatchMetadataCache.h"
#include "ledger/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <algorithm>

namespace ledgerproof {

namespace {

void countRequest(const char *result) {
  MetricsRegistry::instance().incrementCounter(
      "ledgerproof_cache_requests_total", 1.0, {{"result", result}});
}

} // namespace

BatchMetadataCache::BatchMetadataCache(Loader loader, Options opts,
                                       Clock clock)
    : loader_(std::move(loader)), opts_(opts), clock_(std::move(clock)) {
  if (opts_.capacity == 0)
    opts_.capacity = 1;
}

BatchMetadataCache::~BatchMetadataCache() { stop(); }

std::optional<BatchDescriptor>
BatchMetadataCache::lookupLocked(const std::string &batchId,
                                 SteadyClock::time_point now) {
  auto it = entries_.find(batchId);
  if (it == entries_.end())
    return std::nullopt;
  if (now >= it->second.expiresAt) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.descriptor;
}

void BatchMetadataCache::storeLocked(const std::string &batchId,
                                     const BatchDescriptor &d,
                                     SteadyClock::time_point now) {
  if (entries_.find(batchId) == entries_.end() &&
      entries_.size() >= opts_.capacity) {
    auto victim = std::min_element(
        entries_.begin(), entries_.end(), [](const auto &a, const auto &b) {
          return a.second.expiresAt < b.second.expiresAt;
        });
    if (victim != entries_.end())
      entries_.erase(victim);
  }
  entries_[batchId] = Entry{d, now + opts_.ttl};
}

void BatchMetadataCache::Flight::finish(Result loaded,
                                       std::exception_ptr failure) {
  {
    std::lock_guard<std::mutex> lg(mtx);
    value = std::move(loaded);
    error = std::move(failure);
    done = true;
  }
  cv.notify_all();
}

void BatchMetadataCache::Flight::await(const std::string &batchId,
                                       const CancellationToken &token) {
  // Explicit cancels arrive through the callback; deadlines bound the wait.
  auto wake = token.onCancel([self = shared_from_this()] {
    std::lock_guard<std::mutex> lg(self->mtx);
    self->cv.notify_all();
  });
  std::unique_lock<std::mutex> lk(mtx);
  auto ready = [&] { return done || token.cancelled(); };
  auto deadline = token.deadline();
  if (deadline && *deadline != CancellationToken::Clock::time_point::max())
    cv.wait_until(lk, *deadline, ready);
  else
    cv.wait(lk, ready);
  if (!done)
    throw Cancelled("waiting for batch " + batchId);
}

std::optional<BatchDescriptor>
BatchMetadataCache::get(const std::string &batchId,
                        const CancellationToken &token) {
  for (;;) {
    token.throwIfCancelled("batch metadata lookup");

    std::shared_ptr<Flight> flight;
    bool leader = false;
    {
      std::lock_guard<std::mutex> lg(mutex_);
      if (auto hit = lookupLocked(batchId, clock_())) {
        ++stats_.hits;
        countRequest("hit");
        return hit;
      }
      auto it = inflight_.find(batchId);
      if (it != inflight_.end()) {
        flight = it->second;
        ++stats_.coalesced;
        countRequest("coalesced");
      } else {
        flight = std::make_shared<Flight>();
        inflight_.emplace(batchId, flight);
        leader = true;
        ++stats_.misses;
        ++stats_.fetches;
        countRequest("miss");
      }
    }

    if (leader) {
      Result loaded;
      try {
        loaded = loader_(batchId, token);
      } catch (...) {
        {
          std::lock_guard<std::mutex> lg(mutex_);
          inflight_.erase(batchId);
        }
        flight->finish(std::nullopt, std::current_exception());
        throw;
      }
      {
        std::lock_guard<std::mutex> lg(mutex_);
        inflight_.erase(batchId);
        if (loaded)
          storeLocked(batchId, *loaded, clock_());
      }
      flight->finish(loaded, nullptr);
      publishSize();
      return loaded;
    }

    flight->await(batchId, token);
    if (!flight->error)
      return flight->value;
    try {
      std::rethrow_exception(flight->error);
    } catch (const Cancelled &) {
      // The leader was cancelled under its own token; load again under ours.
      Logger::getInstance().log(LogLevel::DEBUG,
                                "Shared batch load cancelled, retrying",
                                {{"batch_id", batchId}});
    }
  }
}

void BatchMetadataCache::invalidate(const std::string &batchId) {
  {
    std::lock_guard<std::mutex> lg(mutex_);
    entries_.erase(batchId);
  }
  publishSize();
}

std::size_t BatchMetadataCache::sweep() {
  std::size_t removed = 0;
  {
    std::lock_guard<std::mutex> lg(mutex_);
    auto now = clock_();
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (now >= it->second.expiresAt) {
        it = entries_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  if (removed > 0) {
    Logger::getInstance().log(LogLevel::DEBUG, "Swept expired batch metadata",
                              {{"removed", removed}});
  }
  publishSize();
  return removed;
}

std::size_t BatchMetadataCache::size() const {
  std::lock_guard<std::mutex> lg(mutex_);
  return entries_.size();
}

BatchMetadataCache::Stats BatchMetadataCache::stats() const {
  std::lock_guard<std::mutex> lg(mutex_);
  return stats_;
}

void BatchMetadataCache::publishSize() const {
  MetricsRegistry::instance().setGauge("ledgerproof_cache_entries",
                                       static_cast<double>(size()));
}

void BatchMetadataCache::start() {
  if (running_)
    return;
  running_ = true;
  sweeper_ = std::thread(&BatchMetadataCache::threadFunc, this);
}

void BatchMetadataCache::stop() {
  if (!running_)
    return;
  {
    std::lock_guard<std::mutex> lg(sweepMutex_);
    running_ = false;
  }
  sweepCv_.notify_all();
  if (sweeper_.joinable())
    sweeper_.join();
}

void BatchMetadataCache::threadFunc() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lk(sweepMutex_);
      sweepCv_.wait_for(lk, opts_.sweepInterval, [this] { return !running_; });
    }
    if (!running_)
      break;
    sweep();
  }
}

BatchMetadataCache::Loader
BatchMetadataCache::ledgerLoader(LedgerClient &ledger, RetryPolicy &retry) {
  return [&ledger, &retry](const std::string &batchId,
                           const CancellationToken &token) -> Result {
    auto descriptor = retry.run("get_batch", token, [&] {
      return ledger.getBatch(batchId, token);
    });
    if (!descriptor)
      return std::nullopt;

    auto root = retry.run("get_batch_root", token, [&] {
      return ledger.getBatchRoot(batchId, token);
    });
    if (!root) {
      throw PermanentCollaboratorError(
          "get_batch_root", "ledger has a descriptor but no root for " + batchId);
    }
    if (*root != descriptor->merkleRoot) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Descriptor root differs from anchored root",
                                {{"batch_id", batchId},
                                 {"descriptor_root", toHex(descriptor->merkleRoot)},
                                 {"anchored_root", toHex(*root)}});
      descriptor->merkleRoot = *root;
    }
    return descriptor;
  };
}

} // namespace ledgerproof
