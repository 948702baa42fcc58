// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Scope - cancellable execution scope

 Purpose
 - Carry cancellation (and an optional deadline) into a long-running
   operation such as a liveness probe
 - Derive child scopes that end when their parent ends, never the reverse

 Cancellation is signalled through a std::stop_token so that waiters can
 attach a std::stop_callback (the prober uses it to interrupt its reactor).

 Deadlines are passive: IsCancelled() reports true once the effective
 deadline has passed, but the stop token only fires after someone calls
 CancelIfExpired(). Whoever waits on a scope with a deadline is expected to
 arm a timer for Deadline() and call CancelIfExpired() when it expires.
*/

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>

namespace liveprobe {
namespace probe {

enum class CancelReason {
  None,
  Cancelled,        // Cancel() on this scope or an ancestor
  DeadlineExceeded  // effective deadline passed
};

const char *CancelReasonName(CancelReason reason);

class Scope {
public:
  using Ptr = std::shared_ptr<Scope>;
  using Clock = std::chrono::steady_clock;

  // Root scope; never cancelled, no deadline
  static Ptr Background();

  static Ptr WithCancel(const Ptr &parent);
  static Ptr WithDeadline(const Ptr &parent, Clock::time_point deadline);
  static Ptr WithTimeout(const Ptr &parent, Clock::duration timeout);

  ~Scope() = default;

  Scope(const Scope &) = delete;
  Scope &operator=(const Scope &) = delete;

  /**
   * End this scope and every scope derived from it.
   * Idempotent and thread-safe; no-op on Background().
   */
  void Cancel();

  /**
   * Cancel with DeadlineExceeded if the effective deadline has passed.
   * @return true if the scope is cancelled after the call
   */
  bool CancelIfExpired();

  bool IsCancelled() const;
  CancelReason Reason() const;

  // Earliest deadline along the parent chain
  std::optional<Clock::time_point> Deadline() const;

  // Fires when the scope is cancelled (not when a deadline merely passes)
  std::stop_token Token() const { return source_.get_token(); }

  /**
   * Block until the scope is cancelled, its deadline passes, or timeout
   * elapses, whichever comes first.
   * @return IsCancelled() at wake-up
   */
  bool WaitFor(Clock::duration timeout) const;

private:
  Scope(Ptr parent, std::optional<Clock::time_point> deadline, bool cancellable);

  void CancelWithReason(CancelReason reason);

  Ptr parent_;
  std::stop_source source_;
  std::optional<Clock::time_point> deadline_;  // effective (already min'd with parent)
  std::atomic<CancelReason> reason_{CancelReason::None};

  mutable std::mutex wait_mutex_;
  mutable std::condition_variable_any wait_cv_;

  // Must stay the last member: destroyed first, so a parent cancellation can
  // never run against a partially destroyed scope
  std::optional<std::stop_callback<std::function<void()>>> parent_link_;
};

} // namespace probe
} // namespace liveprobe
