// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include "network/heartbeat_engine.hpp"
#include "network/protocol.hpp"
#include "network/session.hpp"
#include "network/session_registry.hpp"
#include "network/tracked_values.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

namespace heartsock {
namespace network {

class MessageDispatcher;

// NetworkManager - top-level coordinator for the WebSocket side
// Owns the io_context and its thread, the transport, the session registry,
// the heartbeat engine and the tracked values; routes client commands.
//
// CRITICAL ARCHITECTURE CONSTRAINT: Single-threaded networking reactor
// - Sessions, the heartbeat engine and all command handlers assume serialized
//   execution on one io_context thread (no strands outside the transport)
// - Config::io_threads MUST be 1 in production (0 = external io_context for
//   tests, driven by the test with poll()/run_for())
class NetworkManager {
public:
  struct Config {
    std::string listen_address{protocol::DEFAULT_LISTEN_ADDRESS};
    uint16_t listen_port{protocol::DEFAULT_PORT};  // 0 = ephemeral
    size_t io_threads{1};
    std::string datadir;  // empty = no value files

    std::chrono::milliseconds handshake_timeout{
        std::chrono::seconds(protocol::DEFAULT_HANDSHAKE_TIMEOUT_SEC)};
    std::chrono::milliseconds liveness_timeout{
        std::chrono::seconds(protocol::DEFAULT_LIVENESS_TIMEOUT_SEC)};
    std::chrono::milliseconds heartbeat_interval{
        std::chrono::seconds(protocol::DEFAULT_HEARTBEAT_INTERVAL_SEC)};
    std::chrono::milliseconds shutdown_grace{
        std::chrono::seconds(protocol::DEFAULT_SHUTDOWN_GRACE_SEC)};

    size_t send_queue_limit{protocol::DEFAULT_SEND_QUEUE_LIMIT};
    size_t max_message_size{protocol::MAX_MESSAGE_SIZE};
  };

  using StatusProvider = std::function<nlohmann::json()>;
  using IdleCallback = std::function<void()>;

  /**
   * @param config              Network configuration
   * @param transport           Optional transport (nullptr = WebSocketTransport
   *                            on this manager's io_context)
   * @param external_io_context Optional external io_context (nullptr = create
   *                            owned io_context)
   */
  explicit NetworkManager(
      const Config &config,
      std::shared_ptr<Transport> transport = nullptr,
      std::shared_ptr<boost::asio::io_context> external_io_context = nullptr);
  // Default config (a Config{} default argument is ill-formed inside the class)
  NetworkManager() : NetworkManager(Config{}) {}
  ~NetworkManager();

  NetworkManager(const NetworkManager &) = delete;
  NetworkManager &operator=(const NetworkManager &) = delete;

  // Bind the listen socket and start the io thread and heartbeat engine.
  // Returns false if the socket could not be bound.
  bool start();

  /**
   * Ordered shutdown: stop accepting, close every session with
   * ServerShutdown, wait up to shutdown_grace for transports to finish their
   * close handshakes, then stop the io_context. Remaining transports are
   * dropped with it.
   *
   * Blocks for at most about shutdown_grace. Idempotent.
   */
  void stop();

  bool is_running() const { return running_; }

  uint16_t listening_port() const;
  size_t session_count() const { return registry_.size(); }

  SessionRegistry &registry() { return registry_; }
  TrackedValues &values() { return *values_; }
  HeartbeatEngine &heartbeat_engine() { return *heartbeat_; }
  boost::asio::io_context &io_context() { return *io_context_; }

  // One-line JSON answered to "status"
  nlohmann::json status() const;

  // Adds an "advertisement" object to status(); null when unset
  void set_advertisement_status_provider(StatusProvider provider);

  // Called on the io thread each time the last session is removed
  void set_idle_callback(IdleCallback callback);

#ifdef HEARTSOCK_TESTS
  MessageDispatcher &dispatcher_for_test() { return *message_dispatcher_; }
#endif

private:
  void handle_inbound_connection(TransportConnectionPtr connection);
  void on_session_open(const SessionPtr &session);
  void on_session_message(const SessionPtr &session, const std::string &text,
                          bool is_binary);
  void on_session_closed(const SessionPtr &session, CloseReason reason);
  void register_handlers();
  void broadcast_except(uint64_t exclude_id, const std::string &text);
  void close_all_sessions();

  Config config_;
  std::atomic<bool> running_{false};
  mutable std::mutex start_stop_mutex_;
  std::condition_variable stop_cv_;
  bool fully_stopped_{true};  // guarded by start_stop_mutex_

  std::shared_ptr<boost::asio::io_context> io_context_;
  bool external_io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;

  std::shared_ptr<Transport> transport_;

  SessionRegistry registry_;
  std::unique_ptr<TrackedValues> values_;
  std::unique_ptr<HeartbeatEngine> heartbeat_;
  std::unique_ptr<MessageDispatcher> message_dispatcher_;

  mutable std::mutex status_mutex_;
  StatusProvider advertisement_status_;
  IdleCallback idle_callback_;
  std::chrono::steady_clock::time_point started_at_;
  int64_t started_time_{0};  // Unix seconds, for status()
};

} // namespace network
} // namespace heartsock
