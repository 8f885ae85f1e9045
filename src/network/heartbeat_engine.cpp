// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "network/heartbeat_engine.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <vector>

namespace heartsock {
namespace network {

HeartbeatEngine::HeartbeatEngine(boost::asio::io_context &io_context,
                                 SessionRegistry &registry,
                                 const Config &config)
    : registry_(registry), config_(config),
      timer_(io_context) {}

void HeartbeatEngine::start() {
  if (running_) {
    return;
  }
  running_ = true;
  LOG_NET_DEBUG("heartbeat engine started (tick={}ms, liveness={}ms)",
                config_.tick_interval.count(), config_.liveness_timeout.count());
  schedule_next();
}

void HeartbeatEngine::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  timer_.cancel();
  LOG_NET_DEBUG("heartbeat engine stopped");
}

void HeartbeatEngine::schedule_next() {
  timer_.expires_after(config_.tick_interval);
  timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted || !running_) {
      return;
    }
    tick();
    if (running_) {
      schedule_next();
    }
  });
}

HeartbeatEngine::TickResult HeartbeatEngine::tick() {
  TickResult result;
  const auto sessions = registry_.snapshot();
  const auto now = util::GetSteadyTime();

  std::vector<SessionPtr> expired;
  for (const auto &session : sessions) {
    if (!session->is_live()) {
      ++result.skipped;
      continue;
    }
    if (now - session->last_seen() > config_.liveness_timeout) {
      expired.push_back(session);
      continue;
    }
    if (session->send_heartbeat()) {
      ++result.heartbeats_sent;
    }
  }

  for (const auto &session : expired) {
    session->close(CloseReason::LivenessTimeout);
    ++result.evicted;
  }

  if (result.evicted > 0) {
    LOG_NET_DEBUG("heartbeat tick: {} sessions, {} heartbeats, {} evicted",
                  sessions.size(), result.heartbeats_sent, result.evicted);
  } else {
    LOG_NET_TRACE("heartbeat tick: {} sessions, {} heartbeats", sessions.size(),
                  result.heartbeats_sent);
  }
  return result;
}

} // namespace network
} // namespace heartsock
