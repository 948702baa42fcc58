// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "probe/scope.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace liveprobe {
namespace probe {

enum class ProbeStatus {
  Live,             // a TCP connection was established
  Cancelled,        // scope ended first (cancel or deadline)
  MalformedAddress  // rejected before any dial
};

const char *ProbeStatusName(ProbeStatus status);

struct ProbeResult {
  ProbeStatus status{ProbeStatus::Cancelled};
  std::string error;  // empty when live
  uint32_t attempts{0};
  std::chrono::milliseconds elapsed{0};

  bool ok() const { return status == ProbeStatus::Live; }
};

/**
 * LivenessProber - waits until a TCP endpoint accepts connections
 *
 * Dials the target once per poll interval until a connection succeeds or the
 * scope ends. The address must be "ip:port" (or "[ipv6]:port"); hostnames are
 * rejected up front and never retried.
 *
 * Each Probe() call runs its own boost::asio::io_context in the calling
 * thread. Cancelling the scope (or reaching its deadline) aborts the pending
 * timer and any in-flight connect, and Probe() returns Cancelled.
 */
class LivenessProber {
public:
  struct Options {
    std::chrono::milliseconds poll_interval{100};
    // "checking address" is logged at most once per log_interval
    std::chrono::milliseconds log_interval{1000};
  };

  LivenessProber();
  explicit LivenessProber(const Options &options);

  ProbeResult Probe(const Scope::Ptr &scope, const std::string &address) const;

  const Options &options() const { return options_; }

private:
  Options options_;
};

} // namespace probe
} // namespace liveprobe
