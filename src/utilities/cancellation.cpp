#include "utilities/cancellation.hpp"
#include "ledger/errors.h"
#include <algorithm>
#include <thread>

namespace ledgerproof {

namespace detail {

struct CancelState {
  std::mutex mtx;
  std::condition_variable cv;
  bool flag = false;
  std::optional<CancellationToken::Clock::time_point> deadline;
  std::shared_ptr<CancelState> parent;
  std::vector<std::weak_ptr<CancelState>> children;
  uint64_t nextCallbackId = 1;
  std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;

  void cancel() {
    std::vector<std::weak_ptr<CancelState>> kids;
    std::vector<std::pair<uint64_t, std::function<void()>>> pending;
    {
      std::lock_guard<std::mutex> lg(mtx);
      if (flag)
        return;
      flag = true;
      kids.swap(children);
      pending.swap(callbacks);
    }
    cv.notify_all();
    for (auto &cb : pending)
      cb.second();
    for (auto &weak : kids) {
      if (auto child = weak.lock())
        child->cancel();
    }
  }

  bool fired(CancellationToken::Clock::time_point now) {
    for (CancelState *s = this; s; s = s->parent.get()) {
      std::lock_guard<std::mutex> lg(s->mtx);
      if (s->flag || (s->deadline && now >= *s->deadline))
        return true;
    }
    return false;
  }

  std::optional<CancellationToken::Clock::time_point> effectiveDeadline() {
    std::optional<CancellationToken::Clock::time_point> best;
    for (CancelState *s = this; s; s = s->parent.get()) {
      std::lock_guard<std::mutex> lg(s->mtx);
      if (s->deadline && (!best || *s->deadline < *best))
        best = s->deadline;
    }
    return best;
  }
};

} // namespace detail

bool CancellationToken::cancelled() const {
  return state_ && state_->fired(Clock::now());
}

CancellationToken::Callback::~Callback() {
  if (id_ == 0)
    return;
  if (auto state = state_.lock()) {
    std::lock_guard<std::mutex> lg(state->mtx);
    auto &cbs = state->callbacks;
    cbs.erase(std::remove_if(cbs.begin(), cbs.end(),
                             [this](const auto &cb) { return cb.first == id_; }),
              cbs.end());
  }
}

CancellationToken::Callback
CancellationToken::onCancel(std::function<void()> fn) const {
  if (!state_)
    return Callback();
  {
    std::lock_guard<std::mutex> lg(state_->mtx);
    if (!state_->flag) {
      const uint64_t id = state_->nextCallbackId++;
      state_->callbacks.emplace_back(id, std::move(fn));
      return Callback(state_, id);
    }
  }
  fn();
  return Callback();
}

void CancellationToken::throwIfCancelled(const std::string &where) const {
  if (cancelled())
    throw Cancelled(where);
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
  auto until = Clock::now() + duration;
  if (!state_) {
    std::this_thread::sleep_until(until);
    return true;
  }
  auto limit = until;
  if (auto d = state_->effectiveDeadline())
    limit = std::min(limit, *d);

  {
    std::unique_lock<std::mutex> lk(state_->mtx);
    state_->cv.wait_until(lk, limit, [this] { return state_->flag; });
  }
  return !cancelled();
}

std::optional<CancellationToken::Clock::time_point>
CancellationToken::deadline() const {
  if (!state_)
    return std::nullopt;
  return state_->effectiveDeadline();
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancelState>()) {}

CancellationSource::CancellationSource(const CancellationToken &parent)
    : state_(std::make_shared<detail::CancelState>()) {
  if (!parent.state_)
    return;
  state_->parent = parent.state_;
  bool parentFired = false;
  {
    std::lock_guard<std::mutex> lg(parent.state_->mtx);
    if (parent.state_->flag)
      parentFired = true;
    else {
      auto &kids = parent.state_->children;
      kids.erase(std::remove_if(kids.begin(), kids.end(),
                                [](const auto &w) { return w.expired(); }),
                 kids.end());
      kids.push_back(state_);
    }
  }
  if (parentFired)
    state_->cancel();
}

void CancellationSource::cancel() { state_->cancel(); }

void CancellationSource::setTimeout(std::chrono::milliseconds timeout) {
  using Clock = CancellationToken::Clock;
  const auto now = Clock::now();
  const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::time_point::max() - now);
  if (timeout.count() <= 0)
    setDeadline(now);
  else
    setDeadline(timeout >= headroom ? Clock::time_point::max()
                                    : now + timeout);
}

void CancellationSource::setDeadline(
    CancellationToken::Clock::time_point deadline) {
  {
    std::lock_guard<std::mutex> lg(state_->mtx);
    state_->deadline = deadline;
  }
  state_->cv.notify_all();
}

} // namespace ledgerproof
