#include "utilities/retry_policy.hpp"
#include <algorithm>
#include <cmath>

namespace ledgerproof {

std::chrono::milliseconds RetryPolicy::backoffFor(unsigned attempt) {
  if (attempt == 0)
    attempt = 1;
  double base = static_cast<double>(opts_.baseDelay.count()) *
                std::pow(2.0, static_cast<double>(attempt - 1));
  base = std::min(base, static_cast<double>(opts_.maxDelay.count()));

  double factor = 1.0;
  if (opts_.jitter > 0.0) {
    std::uniform_real_distribution<double> dist(-opts_.jitter, opts_.jitter);
    std::lock_guard<std::mutex> lg(rngMutex_);
    factor += dist(rng_);
  }
  double delay = std::clamp(base * factor, 0.0,
                            static_cast<double>(opts_.maxDelay.count()));
  return std::chrono::milliseconds(static_cast<long long>(delay));
}

} // namespace ledgerproof
