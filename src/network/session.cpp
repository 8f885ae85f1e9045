// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "network/session.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace heartsock {
namespace network {

const char *SessionStateName(SessionState state) {
  switch (state) {
  case SessionState::Connecting:
    return "connecting";
  case SessionState::Open:
    return "open";
  case SessionState::Active:
    return "active";
  case SessionState::Closing:
    return "closing";
  case SessionState::Closed:
    return "closed";
  }
  return "unknown";
}

SessionPtr Session::create(boost::asio::io_context &io_context,
                           TransportConnectionPtr connection, uint64_t id,
                           const Config &config) {
  return std::make_shared<Session>(PrivateTag{}, io_context,
                                   std::move(connection), id, config);
}

Session::Session(PrivateTag, boost::asio::io_context &io_context,
                 TransportConnectionPtr connection, uint64_t id,
                 const Config &config)
    : io_context_(io_context), connection_(std::move(connection)),
      handshake_timer_(io_context), config_(config), id_(id),
      created_at_(util::GetSteadyTime()) {
  if (connection_) {
    remote_address_ = connection_->remote_address();
    remote_port_ = connection_->remote_port();
  } else {
    remote_address_ = "unknown";
  }
  touch();
}

void Session::start() {
  bool expected = false;
  if (!started_.compare_exchange_strong(expected, true,
                                        std::memory_order_acq_rel)) {
    LOG_NET_TRACE("session {} already started, ignoring", id_);
    return;
  }
  if (state_ != SessionState::Connecting) {
    LOG_NET_TRACE("session {} not connecting (state={}), ignoring start()", id_,
                  SessionStateName(state_));
    return;
  }
  if (!connection_) {
    LOG_NET_ERROR("cannot start session {} without a connection", id_);
    return;
  }

  // Callbacks hold a shared_ptr so the session outlives any callback that is
  // currently executing; do_close() clears them to break the cycle.
  SessionPtr self = shared_from_this();
  connection_->set_open_callback([self]() { self->on_transport_open(); });
  connection_->set_receive_callback(
      [self](const std::string &payload, bool is_binary) {
        self->on_transport_receive(payload, is_binary);
      });
  connection_->set_write_callback([self]() { self->on_transport_write(); });
  connection_->set_control_callback([self]() { self->on_transport_control(); });
  connection_->set_disconnect_callback(
      [self](CloseReason reason) { self->on_transport_disconnect(reason); });

  connection_->start();
  start_handshake_timeout();
  LOG_NET_TRACE("session {} started for {}:{}", id_, remote_address_,
                remote_port_);
}

void Session::close(CloseReason reason) {
  if (io_context_.get_executor().running_in_this_thread()) {
    do_close(reason);
  } else {
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self, reason]() { self->do_close(reason); });
  }
}

bool Session::send_text(const std::string &text) {
  return enqueue(OutboundFrame{FrameKind::Reply, text});
}

bool Session::send_heartbeat() {
  if (!is_live()) {
    return false;
  }
  // The number is consumed even if the frame is dropped below, so a client
  // may see gaps under saturation but never a repeat.
  const uint64_t seq = next_heartbeat_seq_++;
  if (state_ == SessionState::Open) {
    transition_to(SessionState::Active);
  }
  return enqueue(OutboundFrame{FrameKind::Heartbeat, protocol::FormatHeartbeat(seq)});
}

void Session::note_client_sequence(uint64_t seq) {
  if (seq <= last_client_seq_) {
    LOG_NET_DEBUG("session {} sent non-increasing heartbeat sequence {} "
                  "(previous {})",
                  id_, seq, last_client_seq_);
  }
  last_client_seq_ = seq;
}

std::chrono::steady_clock::time_point Session::last_seen() const {
  return std::chrono::steady_clock::time_point(
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(
          last_seen_ms_.load(std::memory_order_relaxed)));
}

void Session::on_transport_open() {
  if (state_ != SessionState::Connecting) {
    return;
  }
  handshake_timer_.cancel();
  touch();
  transition_to(SessionState::Open);
  LOG_NET_DEBUG("session {} open ({}:{})", id_, remote_address_, remote_port_);

  if (open_handler_) {
    open_handler_(shared_from_this());
  }
}

void Session::on_transport_receive(const std::string &payload, bool is_binary) {
  if (!is_live()) {
    return;
  }
  touch();
  if (state_ == SessionState::Open) {
    transition_to(SessionState::Active);
  }
  if (message_handler_) {
    message_handler_(shared_from_this(), payload, is_binary);
  }
}

// WebSocket ping/pong counts as inbound traffic
void Session::on_transport_control() {
  if (!is_live()) {
    return;
  }
  touch();
  if (state_ == SessionState::Open) {
    transition_to(SessionState::Active);
  }
  LOG_NET_TRACE("session {} control frame", id_);
}

void Session::on_transport_write() { flush(); }

void Session::on_transport_disconnect(CloseReason reason) { do_close(reason); }

void Session::do_close(CloseReason reason) {
  const SessionState current = state_;
  if (current == SessionState::Closing || current == SessionState::Closed) {
    return;
  }

  // Keep ourselves alive until the close handler has run
  SessionPtr self = shared_from_this();

  close_reason_ = reason;
  transition_to(SessionState::Closing);
  handshake_timer_.cancel();
  send_queue_.clear();

  if (connection_) {
    connection_->set_open_callback({});
    connection_->set_receive_callback({});
    connection_->set_write_callback({});
    connection_->set_control_callback({});
    connection_->set_disconnect_callback({});
    connection_->close(reason);
    connection_.reset();
  }

  if (reason == CloseReason::LivenessTimeout) {
    LOG_NET_INFO("session {} ({}:{}) evicted: no traffic", id_,
                 remote_address_, remote_port_);
  } else {
    LOG_NET_DEBUG("session {} ({}:{}) closed: {}", id_, remote_address_,
                  remote_port_, CloseReasonName(reason));
  }

  transition_to(SessionState::Closed);

  CloseHandler on_closed = std::move(close_handler_);
  open_handler_ = {};
  message_handler_ = {};
  close_handler_ = {};
  if (on_closed) {
    on_closed(self, reason);
  }
  state_observer_ = {};
}

bool Session::enqueue(OutboundFrame frame) {
  if (!is_live()) {
    return false;
  }

  if (send_queue_.size() >= config_.send_queue_limit) {
    auto oldest_heartbeat =
        std::find_if(send_queue_.begin(), send_queue_.end(),
                     [](const OutboundFrame &f) {
                       return f.kind == FrameKind::Heartbeat;
                     });
    if (oldest_heartbeat != send_queue_.end()) {
      LOG_NET_TRACE("session {} send queue full, dropping queued '{}'", id_,
                    oldest_heartbeat->text);
      send_queue_.erase(oldest_heartbeat);
    } else if (frame.kind == FrameKind::Heartbeat) {
      LOG_NET_TRACE("session {} send queue full, dropping '{}'", id_,
                    frame.text);
      return false;
    } else {
      LOG_NET_DEBUG("session {} ({}:{}) is not reading, {} replies queued", id_,
                    remote_address_, remote_port_, send_queue_.size());
      do_close(CloseReason::TransportError);
      return false;
    }
  }

  send_queue_.push_back(std::move(frame));
  flush();
  return true;
}

void Session::flush() {
  if (!connection_ || send_queue_.empty() || !connection_->is_writable()) {
    return;
  }
  if (connection_->send(send_queue_.front().text)) {
    send_queue_.pop_front();
  }
}

void Session::touch() {
  last_seen_ms_.store(std::chrono::duration_cast<std::chrono::milliseconds>(
                          util::GetSteadyTime().time_since_epoch()),
                      std::memory_order_relaxed);
}

void Session::transition_to(SessionState next) {
  const SessionState previous = state_.exchange(next);
  LOG_NET_TRACE("session {} {} -> {}", id_, SessionStateName(previous),
                SessionStateName(next));
  if (state_observer_) {
    state_observer_(id_, previous, next);
  }
}

void Session::start_handshake_timeout() {
  handshake_timer_.expires_after(config_.handshake_timeout);
  auto self = shared_from_this();
  handshake_timer_.async_wait([self](const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    if (self->state_ == SessionState::Connecting) {
      LOG_NET_DEBUG("session {} ({}:{}) handshake timed out", self->id_,
                    self->remote_address_, self->remote_port_);
      self->do_close(CloseReason::HandshakeTimeout);
    }
  });
}

} // namespace network
} // namespace heartsock
