/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation of a run
 *
 * @details A CancellationToken is shared by the orchestrator, the worker
 *          pool, the process runner and the copiers. SIGINT/SIGTERM set the
 *          token from the signal handler; everything else polls it.
 */

#ifndef TRANSYNC_CANCELLATION_HPP
#define TRANSYNC_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace transync {

/**
 * @class CancellationToken
 * @brief Lock-free "stop requested" flag.
 * @note request() is async-signal-safe.
 */
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void request() noexcept { requested_.store(true); }
  bool requested() const noexcept { return requested_.load(); }
  void reset() noexcept { requested_.store(false); }

private:
  std::atomic<bool> requested_{false};
  static_assert(std::atomic<bool>::is_always_lock_free,
                "signal handler needs a lock-free flag");
};

/**
 * @class SignalGuard
 * @brief Routes SIGINT and SIGTERM to a token while in scope.
 *
 * @note The previous handlers are restored on destruction. Only one guard
 *       may be active at a time.
 */
class SignalGuard {
public:
  explicit SignalGuard(CancellationToken &token);
  ~SignalGuard();

  SignalGuard(const SignalGuard &) = delete;
  SignalGuard &operator=(const SignalGuard &) = delete;

private:
  struct Saved;
  std::unique_ptr<Saved> saved_;
};

} // namespace transync

#endif // TRANSYNC_CANCELLATION_HPP
