// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ProbeRegistry - request id -> cancellation handle

 Purpose
 - Allow at most one in-flight operation per caller-assigned request id
 - Let a separate control path cancel an operation by id
 - Guarantee the id is released on every exit path of the operation

 The handle stored per id is the operation's derived Scope. Entries are
 compared by handle identity, so a late Done() or Cancel() for an id that
 has since been reused by a newer operation never touches the newer entry.

 The mutex guards the map only. Scopes are always cancelled after the lock
 is released, so cancellation callbacks may re-enter the registry.
*/

#include "probe/scope.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace liveprobe {
namespace probe {

/**
 * Thrown by ProbeRegistry::Begin() when the id already has a live entry.
 *
 * This is a caller contract violation (an id was reused before its previous
 * operation finished), not a runtime condition to retry.
 */
class DuplicateRequestError : public std::logic_error {
public:
  explicit DuplicateRequestError(uint64_t id);
  uint64_t id() const { return id_; }

private:
  uint64_t id_;
};

class ProbeRegistry {
public:
  /**
   * One registered operation. Move-only; Done() runs on destruction.
   */
  class Operation {
  public:
    Operation(Operation &&other) noexcept;
    Operation &operator=(Operation &&other) noexcept;
    ~Operation();

    Operation(const Operation &) = delete;
    Operation &operator=(const Operation &) = delete;

    uint64_t id() const { return id_; }
    const Scope::Ptr &scope() const { return scope_; }

    /**
     * Release the id (if it still belongs to this operation) and cancel
     * the scope. Idempotent; safe to race with ProbeRegistry::Cancel().
     */
    void Done();

  private:
    friend class ProbeRegistry;
    Operation(ProbeRegistry *registry, uint64_t id, Scope::Ptr scope);

    ProbeRegistry *registry_;
    uint64_t id_;
    Scope::Ptr scope_;
    std::atomic<bool> done_{false};
  };

  ProbeRegistry() = default;
  ~ProbeRegistry() = default;

  ProbeRegistry(const ProbeRegistry &) = delete;
  ProbeRegistry &operator=(const ProbeRegistry &) = delete;

  /**
   * Derive a cancellable scope from base and register it under id.
   * @throws DuplicateRequestError if id already has a live entry
   */
  Operation Begin(const Scope::Ptr &base, uint64_t id);

  /**
   * Cancel the operation registered under id and release the id.
   * Unknown or already finished ids are ignored.
   */
  void Cancel(uint64_t id);

  // Cancel every registered operation (shutdown path)
  void CancelAll();

  bool IsActive(uint64_t id) const;
  size_t ActiveCount() const;
  std::vector<uint64_t> ActiveIds() const;

private:
  // Remove id only if it still maps to scope
  void Release(uint64_t id, const Scope::Ptr &scope);

  mutable std::mutex mutex_;
  std::unordered_map<uint64_t, Scope::Ptr> active_;
};

} // namespace probe
} // namespace liveprobe
