// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "probe/probe_dispatcher.hpp"
#include "util/logging.hpp"

namespace liveprobe {
namespace probe {

ProbeDispatcher::ProbeDispatcher() : prober_() {}

ProbeDispatcher::ProbeDispatcher(const LivenessProber::Options &options)
    : prober_(options) {}

ProbeResult ProbeDispatcher::StartProbe(uint64_t id,
                                        const std::string &address) {
  return StartProbe(Scope::Background(), id, address);
}

ProbeResult ProbeDispatcher::StartProbe(const Scope::Ptr &base, uint64_t id,
                                        const std::string &address) {
  // Throws on a duplicate id before anything is started
  ProbeRegistry::Operation operation = registry_.Begin(base, id);

  LOG_PROBE_DEBUG("request {}: probing {}", id, address);
  ProbeResult result = prober_.Probe(operation.scope(), address);

  operation.Done();
  return result;
}

void ProbeDispatcher::Cancel(uint64_t id) { registry_.Cancel(id); }

void ProbeDispatcher::CancelAll() { registry_.CancelAll(); }

} // namespace probe
} // namespace liveprobe
