// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "probe/liveness_prober.hpp"
#include "probe/probe_registry.hpp"
#include "probe/scope.hpp"
#include <cstdint>
#include <string>

namespace liveprobe {
namespace probe {

/**
 * ProbeDispatcher - cancellable liveness probes addressed by request id
 *
 * The surface a control plane exposes to its callers:
 *   StartProbe(id, "10.0.0.2:8545")   // blocks until live / cancelled / malformed
 *   Cancel(id)                        // from any other thread, any time
 *
 * StartProbe() runs in the calling thread; callers wanting concurrency run it
 * on their own threads. The id is released on every return path, so once
 * StartProbe() has returned the same id may be reused.
 */
class ProbeDispatcher {
public:
  ProbeDispatcher();
  explicit ProbeDispatcher(const LivenessProber::Options &options);

  ProbeDispatcher(const ProbeDispatcher &) = delete;
  ProbeDispatcher &operator=(const ProbeDispatcher &) = delete;

  /**
   * Probe address under request id until it accepts a TCP connection.
   * @throws DuplicateRequestError if id is already being probed
   */
  ProbeResult StartProbe(uint64_t id, const std::string &address);

  /**
   * As above, with base as the parent scope; cancelling base or reaching its
   * deadline ends the probe with ProbeStatus::Cancelled.
   */
  ProbeResult StartProbe(const Scope::Ptr &base, uint64_t id,
                         const std::string &address);

  // Idempotent; ids that are unknown or already finished are ignored
  void Cancel(uint64_t id);

  void CancelAll();

  bool IsActive(uint64_t id) const { return registry_.IsActive(id); }
  size_t ActiveCount() const { return registry_.ActiveCount(); }

private:
  ProbeRegistry registry_;
  LivenessProber prober_;
};

} // namespace probe
} // namespace liveprobe
