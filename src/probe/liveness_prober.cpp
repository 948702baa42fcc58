// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "probe/liveness_prober.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio.hpp>
#include <optional>
#include <stop_token>

namespace liveprobe {
namespace probe {

const char *ProbeStatusName(ProbeStatus status) {
  switch (status) {
  case ProbeStatus::Live:
    return "live";
  case ProbeStatus::Cancelled:
    return "cancelled";
  case ProbeStatus::MalformedAddress:
    return "malformed";
  }
  return "unknown";
}

namespace {

using boost::asio::ip::tcp;
using Clock = std::chrono::steady_clock;

std::chrono::milliseconds ElapsedSince(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               start);
}

/**
 * State of one polling loop. Every handler runs on io_, which is driven by
 * the thread that called LivenessProber::Probe(), so no member needs locking.
 * The only cross-thread entry point is the stop callback, which posts.
 */
class ProbeRun {
public:
  ProbeRun(const LivenessProber::Options &options, Scope::Ptr scope,
           const std::string &address, const tcp::endpoint &endpoint)
      : options_(options), scope_(std::move(scope)), address_(address),
        endpoint_(endpoint), ticker_(io_), deadline_timer_(io_),
        socket_(io_) {}

  ProbeRun(const ProbeRun &) = delete;
  ProbeRun &operator=(const ProbeRun &) = delete;

  ProbeResult Run(Clock::time_point start);

private:
  void ScheduleTick();
  void OnTick(const boost::system::error_code &ec);
  void OnConnect(const boost::system::error_code &ec);
  void OnCancel();
  void Finish(ProbeStatus status, const std::string &error);
  void LogProgress();

  const LivenessProber::Options &options_;
  Scope::Ptr scope_;
  std::string address_;
  tcp::endpoint endpoint_;

  boost::asio::io_context io_;
  boost::asio::steady_timer ticker_;
  boost::asio::steady_timer deadline_timer_;
  tcp::socket socket_;

  Clock::time_point next_tick_;
  std::optional<Clock::time_point> last_log_;
  bool finished_{false};
  ProbeResult result_;
};

ProbeResult ProbeRun::Run(Clock::time_point start) {
  // Declared after io_ (a member), so it is destroyed while io_ is alive.
  // Invoked immediately if the scope is already cancelled.
  std::stop_callback on_stop(scope_->Token(), [this] {
    boost::asio::post(io_, [this] { OnCancel(); });
  });

  if (auto deadline = scope_->Deadline()) {
    deadline_timer_.expires_at(*deadline);
    deadline_timer_.async_wait([this](const boost::system::error_code &ec) {
      if (ec == boost::asio::error::operation_aborted) {
        return;
      }
      // Fires the stop token, which lands in OnCancel()
      scope_->CancelIfExpired();
    });
  }

  next_tick_ = Clock::now();
  ScheduleTick();

  io_.run();

  result_.elapsed = ElapsedSince(start);
  return result_;
}

void ProbeRun::ScheduleTick() {
  // Fixed rate: if a dial overran the period, tick again right away instead
  // of queueing the missed ticks
  next_tick_ += options_.poll_interval;
  auto now = Clock::now();
  if (next_tick_ < now) {
    next_tick_ = now;
  }

  ticker_.expires_at(next_tick_);
  ticker_.async_wait(
      [this](const boost::system::error_code &ec) { OnTick(ec); });
}

void ProbeRun::OnTick(const boost::system::error_code &ec) {
  if (ec || finished_) {
    return;
  }

  LogProgress();

  ++result_.attempts;
  socket_.async_connect(
      endpoint_,
      [this](const boost::system::error_code &connect_ec) { OnConnect(connect_ec); });
}

void ProbeRun::OnConnect(const boost::system::error_code &ec) {
  if (finished_) {
    return;
  }

  if (!ec) {
    Finish(ProbeStatus::Live, "");
    return;
  }

  // A failed connect leaves the automatically opened socket open
  boost::system::error_code ignored;
  socket_.close(ignored);

  LOG_PROBE_TRACE("dial {} failed (attempt {}): {}", address_,
                  result_.attempts, ec.message());
  ScheduleTick();
}

void ProbeRun::OnCancel() {
  if (finished_) {
    return;
  }
  Finish(ProbeStatus::Cancelled, CancelReasonName(scope_->Reason()));
}

void ProbeRun::Finish(ProbeStatus status, const std::string &error) {
  finished_ = true;
  result_.status = status;
  result_.error = error;

  (void)ticker_.cancel();
  (void)deadline_timer_.cancel();

  // Pure liveness check: drop the connection (or abort the in-flight dial)
  boost::system::error_code ignored;
  if (status == ProbeStatus::Live) {
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
  }
  socket_.close(ignored);
}

void ProbeRun::LogProgress() {
  auto now = Clock::now();
  if (last_log_ && now - *last_log_ < options_.log_interval) {
    return;
  }
  LOG_PROBE_INFO("checking address: {}", address_);
  last_log_ = now;
}

} // namespace

LivenessProber::LivenessProber() : options_() {}

LivenessProber::LivenessProber(const Options &options) : options_(options) {}

ProbeResult LivenessProber::Probe(const Scope::Ptr &scope,
                                  const std::string &address) const {
  const auto start = Clock::now();

  auto malformed = [&](const std::string &error) {
    LOG_PROBE_DEBUG("rejecting probe address '{}': {}", address, error);
    ProbeResult result;
    result.status = ProbeStatus::MalformedAddress;
    result.error = error;
    result.elapsed = ElapsedSince(start);
    return result;
  };

  std::string host;
  std::string port_text;
  std::string split_error;
  if (!util::SplitHostPort(address, host, port_text, &split_error)) {
    return malformed("address " + address + ": " + split_error);
  }

  auto ip = util::ValidateAndNormalizeIP(host);
  if (!ip) {
    return malformed("invalid IP");
  }

  auto port = util::SafeParsePortNumber(port_text);
  if (!port) {
    return malformed("invalid port");
  }

  tcp::endpoint endpoint(boost::asio::ip::make_address(*ip), *port);

  ProbeRun run(options_, scope ? scope : Scope::Background(), address, endpoint);
  ProbeResult result = run.Run(start);

  LOG_PROBE_DEBUG("probe of {} finished: {} after {} attempts ({} ms)", address,
                  ProbeStatusName(result.status), result.attempts,
                  result.elapsed.count());
  return result;
}

} // namespace probe
} // namespace liveprobe
