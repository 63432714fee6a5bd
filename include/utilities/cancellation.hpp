#ifndef LEDGERPROOF_CANCELLATION_HPP
#define LEDGERPROOF_CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ledgerproof {

namespace detail {
struct CancelState;
}

/**
 * @brief Read-only view of a cancellation flag.
 *
 * A default-constructed token is never cancelled. A token is cancelled when
 * its source is cancelled, its deadline passes, or any ancestor source is
 * cancelled.
 */
class CancellationToken {
public:
  using Clock = std::chrono::steady_clock;

  /**
   * @brief Registration of a function run once when the token is cancelled.
   *
   * Runs at once when the token is already cancelled. Deadline expiry does not
   * run it. Destroying the registration removes the function, though a
   * concurrent cancel may still be running it.
   */
  class Callback {
  public:
    Callback() = default;
    Callback(Callback &&other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {
      other.id_ = 0;
    }
    Callback(const Callback &) = delete;
    Callback &operator=(const Callback &) = delete;
    ~Callback();

  private:
    friend class CancellationToken;
    Callback(std::weak_ptr<detail::CancelState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::weak_ptr<detail::CancelState> state_;
    uint64_t id_ = 0;
  };

  CancellationToken() = default;

  bool cancelled() const;

  /// Register @p fn to run when cancel() reaches this token.
  Callback onCancel(std::function<void()> fn) const;

  /// Throws Cancelled naming @p where when the token has fired.
  void throwIfCancelled(const std::string &where) const;

  /**
   * @brief Sleep for @p duration unless cancelled first.
   * @return false when the wait ended because of cancellation.
   */
  bool waitFor(std::chrono::milliseconds duration) const;

  std::optional<Clock::time_point> deadline() const;

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancelState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancelState> state_;
};

/**
 * @brief Owner side of a cancellation flag.
 *
 * Sources may be linked to a parent token; cancelling the parent cancels
 * every linked child.
 */
class CancellationSource {
public:
  CancellationSource();
  explicit CancellationSource(const CancellationToken &parent);

  void cancel();
  void setDeadline(CancellationToken::Clock::time_point deadline);
  /// Deadline @p timeout from now, saturating at the clock's maximum. A
  /// non-positive timeout fires immediately.
  void setTimeout(std::chrono::milliseconds timeout);

  CancellationToken token() const { return CancellationToken(state_); }

private:
  std::shared_ptr<detail::CancelState> state_;
};

} // namespace ledgerproof

#endif // LEDGERPROOF_CANCELLATION_HPP
