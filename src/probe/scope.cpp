// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "probe/scope.hpp"
#include <algorithm>

namespace liveprobe {
namespace probe {

const char *CancelReasonName(CancelReason reason) {
  switch (reason) {
  case CancelReason::None:
    return "none";
  case CancelReason::Cancelled:
    return "canceled";
  case CancelReason::DeadlineExceeded:
    return "deadline exceeded";
  }
  return "unknown";
}

Scope::Ptr Scope::Background() {
  static const Ptr background(new Scope(nullptr, std::nullopt, false));
  return background;
}

Scope::Ptr Scope::WithCancel(const Ptr &parent) {
  const Ptr &base = parent ? parent : Background();
  return Ptr(new Scope(base, base->Deadline(), true));
}

Scope::Ptr Scope::WithDeadline(const Ptr &parent, Clock::time_point deadline) {
  const Ptr &base = parent ? parent : Background();
  auto inherited = base->Deadline();
  if (inherited) {
    deadline = std::min(deadline, *inherited);
  }
  return Ptr(new Scope(base, deadline, true));
}

Scope::Ptr Scope::WithTimeout(const Ptr &parent, Clock::duration timeout) {
  return WithDeadline(parent, Clock::now() + timeout);
}

Scope::Scope(Ptr parent, std::optional<Clock::time_point> deadline,
             bool cancellable)
    : parent_(std::move(parent)),
      source_(cancellable ? std::stop_source() : std::stop_source(std::nostopstate)),
      deadline_(deadline) {
  if (parent_) {
    // Runs immediately (in this thread) if the parent is already cancelled
    parent_link_.emplace(parent_->Token(), std::function<void()>([this] {
                           CancelWithReason(parent_->Reason());
                         }));
  }
}

void Scope::Cancel() { CancelWithReason(CancelReason::Cancelled); }

bool Scope::CancelIfExpired() {
  if (deadline_ && Clock::now() >= *deadline_) {
    CancelWithReason(CancelReason::DeadlineExceeded);
  }
  return source_.stop_requested();
}

void Scope::CancelWithReason(CancelReason reason) {
  if (!source_.stop_possible()) {
    return;
  }
  if (reason == CancelReason::None) {
    reason = CancelReason::Cancelled;
  }

  // First reason wins
  CancelReason expected = CancelReason::None;
  reason_.compare_exchange_strong(expected, reason, std::memory_order_acq_rel);

  // Synchronously runs stop callbacks: child scopes, waiting probes
  source_.request_stop();
}

bool Scope::IsCancelled() const {
  if (source_.stop_requested()) {
    return true;
  }
  return deadline_ && Clock::now() >= *deadline_;
}

CancelReason Scope::Reason() const {
  CancelReason reason = reason_.load(std::memory_order_acquire);
  if (reason != CancelReason::None) {
    return reason;
  }
  if (deadline_ && Clock::now() >= *deadline_) {
    return CancelReason::DeadlineExceeded;
  }
  return CancelReason::None;
}

std::optional<Scope::Clock::time_point> Scope::Deadline() const {
  return deadline_;
}

bool Scope::WaitFor(Clock::duration timeout) const {
  auto until = Clock::now() + timeout;
  if (deadline_) {
    until = std::min(until, *deadline_);
  }

  std::unique_lock<std::mutex> lock(wait_mutex_);
  // Nothing but the stop token or the timeout ends the wait
  wait_cv_.wait_until(lock, source_.get_token(), until, [] { return false; });
  return IsCancelled();
}

} // namespace probe
} // namespace liveprobe
