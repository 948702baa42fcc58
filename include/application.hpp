#pragma once

#include "probe/liveness_prober.hpp"
#include "probe/probe_dispatcher.hpp"
#include "probe/scope.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace liveprobe {
namespace app {

// One endpoint to wait for
struct ProbeTarget {
  uint64_t id{0};
  std::string address;
};

/**
 * Parse "[<id>=]<ip:port>" target specs
 *
 * Targets without an explicit id get the lowest unused id starting at 1.
 * The address itself is not validated here; malformed addresses are
 * reported per target by the prober.
 *
 * @param specs Target specs in command-line order
 * @param out Parsed targets (same order)
 * @param error Reason on failure (bad id, empty address, duplicate id)
 * @return true on success
 */
bool ParseTargets(const std::vector<std::string> &specs,
                  std::vector<ProbeTarget> &out, std::string &error);

// Application configuration
struct AppConfig {
  std::vector<ProbeTarget> targets;

  // Overall deadline for all probes (0 = wait until live or interrupted)
  std::chrono::milliseconds timeout{0};

  probe::LivenessProber::Options probe_options;

  // Report one JSON object per target instead of text lines
  bool json_output = false;
};

struct TargetReport {
  ProbeTarget target;
  probe::ProbeResult result;
};

// Application - waits for every configured target concurrently
// Owns the dispatcher, maps SIGINT/SIGTERM onto per-id cancellation and
// prints one report line per target
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Validate configuration and create the dispatcher
  bool initialize();

  /**
   * Probe all targets, block until each has finished, print reports.
   * @return 0 if every target is live, 1 otherwise
   */
  int run(std::ostream &out = std::cout);

  // Cancel every outstanding probe (async-signal-safe)
  void request_shutdown() { shutdown_requested_ = true; }

  bool is_running() const { return running_; }

  probe::ProbeDispatcher &dispatcher() { return *dispatcher_; }
  const std::vector<TargetReport> &reports() const { return reports_; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  std::unique_ptr<probe::ProbeDispatcher> dispatcher_;
  probe::Scope::Ptr base_scope_;

  std::vector<TargetReport> reports_;
  std::vector<std::exception_ptr> failures_;

  void wait_for_probes(const std::atomic<size_t> &remaining);
  void cancel_all();
  void print_reports(std::ostream &out) const;

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace liveprobe
