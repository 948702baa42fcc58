#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <thread>
#include <unistd.h>  // For write(), STDERR_FILENO (async-signal-safe)

namespace liveprobe {
namespace app {

bool ParseTargets(const std::vector<std::string> &specs,
                  std::vector<ProbeTarget> &out, std::string &error) {
  std::vector<std::optional<uint64_t>> explicit_ids;
  std::vector<std::string> addresses;
  std::set<uint64_t> used;

  for (const auto &spec : specs) {
    std::optional<uint64_t> id;
    std::string address = spec;

    size_t eq = spec.find('=');
    if (eq != std::string::npos) {
      id = util::SafeParseUInt64(spec.substr(0, eq));
      if (!id) {
        error = "invalid request id in target '" + spec + "'";
        return false;
      }
      if (!used.insert(*id).second) {
        error = "duplicate request id " + std::to_string(*id);
        return false;
      }
      address = spec.substr(eq + 1);
    }

    if (address.empty()) {
      error = "empty address in target '" + spec + "'";
      return false;
    }

    explicit_ids.push_back(id);
    addresses.push_back(address);
  }

  std::vector<ProbeTarget> targets;
  targets.reserve(specs.size());
  uint64_t next_id = 1;
  for (size_t i = 0; i < addresses.size(); ++i) {
    ProbeTarget target;
    target.address = addresses[i];
    if (explicit_ids[i]) {
      target.id = *explicit_ids[i];
    } else {
      while (used.count(next_id) > 0) {
        ++next_id;
      }
      target.id = next_id;
      used.insert(next_id);
    }
    targets.push_back(std::move(target));
  }

  out = std::move(targets);
  return true;
}

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  cancel_all();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  if (config_.targets.empty()) {
    LOG_APP_ERROR("No targets to probe");
    return false;
  }

  if (config_.probe_options.poll_interval.count() <= 0) {
    LOG_APP_ERROR("Poll interval must be positive (got {} ms)",
                  config_.probe_options.poll_interval.count());
    return false;
  }

  std::set<uint64_t> ids;
  for (const auto &target : config_.targets) {
    if (!ids.insert(target.id).second) {
      LOG_APP_ERROR("Duplicate request id {} in configuration", target.id);
      return false;
    }
  }

  dispatcher_ = std::make_unique<probe::ProbeDispatcher>(config_.probe_options);

  if (config_.timeout.count() > 0) {
    base_scope_ = probe::Scope::WithTimeout(probe::Scope::Background(),
                                            config_.timeout);
    LOG_APP_INFO("Probing {} target(s), timeout {} ms", config_.targets.size(),
                 config_.timeout.count());
  } else {
    base_scope_ = probe::Scope::WithCancel(probe::Scope::Background());
    LOG_APP_INFO("Probing {} target(s), no timeout", config_.targets.size());
  }

  return true;
}

int Application::run(std::ostream &out) {
  if (!dispatcher_) {
    LOG_APP_ERROR("Application not initialized");
    return 1;
  }
  if (running_.exchange(true)) {
    LOG_APP_ERROR("Application already running");
    return 1;
  }

  setup_signal_handlers();

  const size_t count = config_.targets.size();
  reports_.assign(count, TargetReport{});
  failures_.assign(count, nullptr);

  std::atomic<size_t> remaining{count};
  std::vector<std::thread> workers;
  workers.reserve(count);

  try {
    for (size_t i = 0; i < count; ++i) {
      reports_[i].target = config_.targets[i];
      workers.emplace_back([this, i, &remaining] {
        const ProbeTarget &target = reports_[i].target;
        try {
          reports_[i].result =
              dispatcher_->StartProbe(base_scope_, target.id, target.address);
        } catch (const std::exception &e) {
          LOG_APP_ERROR("Probe {} ({}) failed: {}", target.id, target.address,
                        e.what());
          failures_[i] = std::current_exception();
        }
        remaining.fetch_sub(1, std::memory_order_acq_rel);
      });
    }
  } catch (const std::exception &e) {
    // Could not start every worker: stop the ones already running
    LOG_APP_ERROR("Failed to start probe thread: {}", e.what());
    cancel_all();
    for (auto &worker : workers) {
      worker.join();
    }
    running_ = false;
    throw;
  }

  wait_for_probes(remaining);

  for (auto &worker : workers) {
    worker.join();
  }
  running_ = false;

  // A worker failure is a contract violation; surface it to the caller
  for (const auto &failure : failures_) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }

  print_reports(out);

  size_t live = 0;
  for (const auto &report : reports_) {
    if (report.result.ok()) {
      ++live;
    }
  }
  LOG_APP_INFO("{}/{} target(s) live", live, count);

  return live == count ? 0 : 1;
}

void Application::wait_for_probes(const std::atomic<size_t> &remaining) {
  bool cancelled = false;
  while (remaining.load(std::memory_order_acquire) > 0) {
    if (shutdown_requested_ && !cancelled) {
      LOG_APP_INFO("Shutdown requested, cancelling outstanding probes");
      cancel_all();
      cancelled = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

void Application::cancel_all() {
  if (!dispatcher_) {
    return;
  }
  // Probes that have not registered yet derive from the base scope and start
  // out cancelled
  if (base_scope_) {
    base_scope_->Cancel();
  }
  for (const auto &target : config_.targets) {
    dispatcher_->Cancel(target.id);
  }
}

void Application::print_reports(std::ostream &out) const {
  for (const auto &report : reports_) {
    const auto &result = report.result;

    if (config_.json_output) {
      nlohmann::json j;
      j["id"] = report.target.id;
      j["address"] = report.target.address;
      j["status"] = probe::ProbeStatusName(result.status);
      j["attempts"] = result.attempts;
      j["elapsed_ms"] = result.elapsed.count();
      if (!result.error.empty()) {
        j["error"] = result.error;
      }
      out << j.dump() << "\n";
      continue;
    }

    out << "[" << report.target.id << "] " << report.target.address << ": "
        << probe::ProbeStatusName(result.status);
    if (!result.error.empty()) {
      out << " (" << result.error << ")";
    }
    out << ", " << result.attempts << " attempt(s), "
        << result.elapsed.count() << " ms\n";
  }
  out.flush();
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cerr is NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDERR_FILENO, msg, 17);
    (void)written;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace liveprobe
