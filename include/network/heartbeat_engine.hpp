// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include "network/session_registry.hpp"
#include <utility> // before Boost.Asio: awaitable.hpp needs std::exchange
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>

namespace heartsock {
namespace network {

/**
 * HeartbeatEngine - periodic liveness sweep over all sessions
 *
 * Every tick_interval: take a registry snapshot, close sessions silent for
 * longer than liveness_timeout (LivenessTimeout), and queue one heartbeat on
 * every other Open/Active session. Connecting sessions are left to their
 * handshake timer.
 *
 * The next tick is armed only after the current one finished, so ticks never
 * overlap. Runs on the io_context thread.
 */
class HeartbeatEngine {
public:
  struct Config {
    std::chrono::milliseconds tick_interval{std::chrono::seconds(5)};
    std::chrono::milliseconds liveness_timeout{std::chrono::seconds(30)};
  };

  struct TickResult {
    size_t heartbeats_sent{0};
    size_t evicted{0};
    size_t skipped{0};  // Connecting, or already closing
  };

  HeartbeatEngine(boost::asio::io_context &io_context,
                  SessionRegistry &registry, const Config &config);

  HeartbeatEngine(const HeartbeatEngine &) = delete;
  HeartbeatEngine &operator=(const HeartbeatEngine &) = delete;

  void start();
  void stop();
  bool is_running() const { return running_; }

  // One sweep. Public so tests can drive it without waiting for the timer.
  TickResult tick();

  const Config &config() const { return config_; }

private:
  void schedule_next();

  SessionRegistry &registry_;
  Config config_;
  boost::asio::steady_timer timer_;
  bool running_{false};
};

} // namespace network
} // namespace heartsock
