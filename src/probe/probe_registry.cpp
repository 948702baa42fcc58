// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "probe/probe_registry.hpp"
#include "util/logging.hpp"
#include <string>

namespace liveprobe {
namespace probe {

DuplicateRequestError::DuplicateRequestError(uint64_t id)
    : std::logic_error("duplicate request id " + std::to_string(id)),
      id_(id) {}

// ============================================================================
// Operation
// ============================================================================

ProbeRegistry::Operation::Operation(ProbeRegistry *registry, uint64_t id,
                                    Scope::Ptr scope)
    : registry_(registry), id_(id), scope_(std::move(scope)) {}

ProbeRegistry::Operation::Operation(Operation &&other) noexcept
    : registry_(other.registry_), id_(other.id_),
      scope_(std::move(other.scope_)),
      done_(other.done_.exchange(true, std::memory_order_acq_rel)) {
  other.registry_ = nullptr;
}

ProbeRegistry::Operation &
ProbeRegistry::Operation::operator=(Operation &&other) noexcept {
  if (this != &other) {
    Done();
    registry_ = other.registry_;
    id_ = other.id_;
    scope_ = std::move(other.scope_);
    done_.store(other.done_.exchange(true, std::memory_order_acq_rel),
                std::memory_order_release);
    other.registry_ = nullptr;
  }
  return *this;
}

ProbeRegistry::Operation::~Operation() { Done(); }

void ProbeRegistry::Operation::Done() {
  if (done_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  if (registry_ && scope_) {
    registry_->Release(id_, scope_);
  }
}

// ============================================================================
// ProbeRegistry
// ============================================================================

ProbeRegistry::Operation ProbeRegistry::Begin(const Scope::Ptr &base,
                                              uint64_t id) {
  auto scope = Scope::WithCancel(base);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = active_.try_emplace(id, scope);
    if (!inserted) {
      // Never overwrite: the running operation would lose its cancel path
      LOG_PROBE_ERROR("request id {} is already active", id);
      throw DuplicateRequestError(id);
    }
  }

  LOG_PROBE_TRACE("registered request {}", id);
  return Operation(this, id, std::move(scope));
}

void ProbeRegistry::Cancel(uint64_t id) {
  Scope::Ptr scope;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
      return;
    }
    scope = std::move(it->second);
    active_.erase(it);
  }

  LOG_PROBE_DEBUG("cancelling request {}", id);
  scope->Cancel();
}

void ProbeRegistry::CancelAll() {
  std::unordered_map<uint64_t, Scope::Ptr> cancelled;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled.swap(active_);
  }

  for (auto &[id, scope] : cancelled) {
    LOG_PROBE_DEBUG("cancelling request {}", id);
    scope->Cancel();
  }
}

void ProbeRegistry::Release(uint64_t id, const Scope::Ptr &scope) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it != active_.end() && it->second == scope) {
      active_.erase(it);
      LOG_PROBE_TRACE("released request {}", id);
    }
  }
  scope->Cancel();
}

bool ProbeRegistry::IsActive(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.count(id) > 0;
}

size_t ProbeRegistry::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.size();
}

std::vector<uint64_t> ProbeRegistry::ActiveIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint64_t> ids;
  ids.reserve(active_.size());
  for (const auto &[id, scope] : active_) {
    ids.push_back(id);
  }
  return ids;
}

} // namespace probe
} // namespace liveprobe
