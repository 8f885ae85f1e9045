// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility> // before Boost.Asio: awaitable.hpp needs std::exchange
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace heartsock {
namespace network {

class Session;
using SessionPtr = std::shared_ptr<Session>;

// Session lifecycle. Transitions only move forward:
// Connecting -> Open -> Active -> Closing -> Closed, with any non-terminal
// state able to jump straight to Closing.
enum class SessionState {
  Connecting,  // WebSocket handshake in progress
  Open,        // Handshake done, no traffic yet
  Active,      // Steady state (first inbound frame or first heartbeat seen)
  Closing,     // Transport close initiated
  Closed       // Terminal
};

const char *SessionStateName(SessionState state);

enum class FrameKind { Heartbeat, Reply };

struct OutboundFrame {
  FrameKind kind;
  std::string text;
};

// Session - one client connection and its heartbeat protocol
//
// Owns the transport connection. Shared ownership is held by the transport
// callbacks and timers this session installs (SessionRegistry only keeps a
// weak_ptr), so a session lives until it reaches Closed and its transport
// releases the callbacks.
//
// All state changes run on the io_context thread. close() may be called from
// any thread; it is posted to the io_context when called from elsewhere.
class Session : public std::enable_shared_from_this<Session> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  struct Config {
    std::chrono::milliseconds handshake_timeout{std::chrono::seconds(10)};
    size_t send_queue_limit{32};
  };

  using OpenHandler = std::function<void(const SessionPtr &)>;
  using MessageHandler = std::function<void(const SessionPtr &,
                                            const std::string &text,
                                            bool is_binary)>;
  using CloseHandler = std::function<void(const SessionPtr &, CloseReason)>;
  using StateObserver =
      std::function<void(uint64_t id, SessionState from, SessionState to)>;

  static SessionPtr create(boost::asio::io_context &io_context,
                           TransportConnectionPtr connection, uint64_t id,
                           const Config &config);

  // DO NOT call directly - use create()
  Session(PrivateTag, boost::asio::io_context &io_context,
          TransportConnectionPtr connection, uint64_t id, const Config &config);

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // Install transport callbacks, start the WebSocket handshake and the
  // handshake timer. Single use.
  void start();

  // Move to Closing then Closed. No-op once Closing.
  void close(CloseReason reason);

  // Queue an application reply. False if the session is not Open/Active or
  // the frame was rejected by the queue policy.
  bool send_text(const std::string &text);

  // Queue "heartbeat <seq>" with the next sequence number. Open -> Active.
  // False if the session is not Open/Active or the heartbeat was dropped
  // because the queue is full.
  bool send_heartbeat();

  // Record a client-reported heartbeat sequence number. Non-increasing
  // numbers are logged at debug level and otherwise accepted.
  void note_client_sequence(uint64_t seq);

  void set_open_handler(OpenHandler handler) { open_handler_ = std::move(handler); }
  void set_message_handler(MessageHandler handler) {
    message_handler_ = std::move(handler);
  }
  void set_close_handler(CloseHandler handler) {
    close_handler_ = std::move(handler);
  }
  void set_state_observer(StateObserver observer) {
    state_observer_ = std::move(observer);
  }

  uint64_t id() const { return id_; }
  SessionState state() const { return state_; }
  bool is_live() const {
    auto s = state_.load();
    return s == SessionState::Open || s == SessionState::Active;
  }
  std::string remote_address() const { return remote_address_; }
  uint16_t remote_port() const { return remote_port_; }
  std::chrono::steady_clock::time_point created_at() const { return created_at_; }
  std::chrono::steady_clock::time_point last_seen() const;

  // Sequence number the next heartbeat will carry
  uint64_t next_heartbeat_seq() const { return next_heartbeat_seq_; }
  uint64_t last_client_seq() const { return last_client_seq_; }
  size_t queued_frames() const { return send_queue_.size(); }
  CloseReason close_reason() const { return close_reason_; }

private:
  // Transport callbacks
  void on_transport_open();
  void on_transport_receive(const std::string &payload, bool is_binary);
  void on_transport_control();
  void on_transport_write();
  void on_transport_disconnect(CloseReason reason);

  void do_close(CloseReason reason);
  bool enqueue(OutboundFrame frame);
  void flush();
  void touch();
  void transition_to(SessionState next);
  void start_handshake_timeout();

  boost::asio::io_context &io_context_;
  TransportConnectionPtr connection_;
  boost::asio::steady_timer handshake_timer_;
  Config config_;

  const uint64_t id_;
  std::string remote_address_;
  uint16_t remote_port_{0};
  std::chrono::steady_clock::time_point created_at_;

  // Read from the heartbeat engine and status reporting
  std::atomic<SessionState> state_{SessionState::Connecting};
  std::atomic<std::chrono::milliseconds> last_seen_ms_{std::chrono::milliseconds{0}};

  std::deque<OutboundFrame> send_queue_;
  uint64_t next_heartbeat_seq_{1};
  uint64_t last_client_seq_{0};
  CloseReason close_reason_{CloseReason::ClientClose};

  std::atomic<bool> started_{false};

  OpenHandler open_handler_;
  MessageHandler message_handler_;
  CloseHandler close_handler_;
  StateObserver state_observer_;
};

} // namespace network
} // namespace heartsock
