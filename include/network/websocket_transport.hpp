// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility> // before Boost.Asio: awaitable.hpp needs std::exchange
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace heartsock {
namespace network {

/**
 * WebSocketConnection - Boost.Beast implementation of TransportConnection
 *
 * All stream operations run on strand_. One read is always outstanding once
 * the handshake completes; at most one write is in flight (see send()).
 */
class WebSocketConnection
    : public TransportConnection,
      public std::enable_shared_from_this<WebSocketConnection> {
public:
  struct Options {
    // Limit for the HTTP upgrade and for the close handshake
    std::chrono::milliseconds handshake_timeout{std::chrono::seconds(20)};
    // Largest inbound message accepted; bigger ones fail the connection
    size_t max_message_size{4096};
  };

  // Takes an accepted socket. live_count is incremented now and decremented
  // when the socket is torn down.
  static std::shared_ptr<WebSocketConnection>
  create(boost::asio::ip::tcp::socket socket, const Options &options,
         std::shared_ptr<std::atomic<size_t>> live_count);

  ~WebSocketConnection() override;

  WebSocketConnection(const WebSocketConnection &) = delete;
  WebSocketConnection &operator=(const WebSocketConnection &) = delete;

  void start() override;
  bool send(const std::string &text) override;
  bool is_writable() const override;
  void close(CloseReason reason) override;
  bool is_open() const override { return open_; }
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }

  void set_open_callback(OpenCallback callback) override;
  void set_receive_callback(ReceiveCallback callback) override;
  void set_write_callback(WriteCallback callback) override;
  void set_control_callback(ControlCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

private:
  WebSocketConnection(boost::asio::ip::tcp::socket socket,
                      const Options &options,
                      std::shared_ptr<std::atomic<size_t>> live_count);

  // Strand-serialized internals
  void on_accept(const boost::system::error_code &ec);
  void start_read_impl();
  void on_read(const boost::system::error_code &ec, size_t bytes);
  void close_impl(CloseReason reason);
  void deliver_disconnect_once(CloseReason reason);
  void clear_callbacks();
  void teardown();

  using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  boost::asio::strand<boost::asio::any_io_executor> strand_;
  Stream ws_;
  boost::beast::flat_buffer read_buffer_;
  Options options_;
  std::shared_ptr<std::atomic<size_t>> live_count_;

  // Callbacks (accessed only on strand_)
  OpenCallback open_callback_;
  ReceiveCallback receive_callback_;
  WriteCallback write_callback_;
  ControlCallback control_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};
  bool closing_{false};

  // Read from send() off the strand
  std::atomic<bool> open_{true};
  std::atomic<bool> handshake_done_{false};
  std::atomic<bool> writing_{false};

  std::string remote_addr_;
  uint16_t remote_port_{0};
};

/**
 * WebSocketTransport - accepts TCP connections and wraps them in
 * WebSocketConnection
 *
 * Runs on an io_context owned by the caller (NetworkManager); it creates no
 * threads of its own.
 */
class WebSocketTransport : public Transport {
public:
  explicit WebSocketTransport(boost::asio::io_context &io_context,
                              const WebSocketConnection::Options &options =
                                  WebSocketConnection::Options{});
  ~WebSocketTransport() override;

  bool listen(const std::string &address, uint16_t port,
              AcceptCallback accept_callback) override;
  void stop_listening() override;
  uint16_t listening_port() const override { return listen_port_; }
  size_t open_connection_count() const override { return *live_count_; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  boost::asio::io_context &io_context_;
  WebSocketConnection::Options options_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  std::atomic<uint16_t> listen_port_{0};
  std::shared_ptr<std::atomic<size_t>> live_count_;
};

} // namespace network
} // namespace heartsock
