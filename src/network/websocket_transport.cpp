// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "network/websocket_transport.hpp"
#include "util/logging.hpp"
#include "version.hpp"

namespace heartsock {
namespace network {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {

websocket::close_code CloseCodeFor(CloseReason reason) {
  switch (reason) {
  case CloseReason::ClientClose:
  case CloseReason::LivenessTimeout:
  case CloseReason::HandshakeTimeout:
    return websocket::close_code::normal;
  case CloseReason::ServerShutdown:
    return websocket::close_code::going_away;
  case CloseReason::TransportError:
    return websocket::close_code::policy_error;
  }
  return websocket::close_code::normal;
}

} // namespace

// ============================================================================
// WebSocketConnection
// ============================================================================

std::shared_ptr<WebSocketConnection>
WebSocketConnection::create(tcp::socket socket, const Options &options,
                            std::shared_ptr<std::atomic<size_t>> live_count) {
  return std::shared_ptr<WebSocketConnection>(
      new WebSocketConnection(std::move(socket), options, std::move(live_count)));
}

WebSocketConnection::WebSocketConnection(
    tcp::socket socket, const Options &options,
    std::shared_ptr<std::atomic<size_t>> live_count)
    : strand_(socket.get_executor()), ws_(std::move(socket)),
      options_(options), live_count_(std::move(live_count)) {
  boost::system::error_code ec;
  auto ep = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
  if (!ec) {
    remote_addr_ = ep.address().to_string();
    remote_port_ = ep.port();
  } else {
    remote_addr_ = "unknown";
  }
  if (live_count_) {
    live_count_->fetch_add(1);
  }
}

WebSocketConnection::~WebSocketConnection() {
  // Cleanup happens in teardown() while a shared_ptr is still alive. Do not
  // log here; the logger may already be gone during process exit.
}

void WebSocketConnection::start() {
  boost::asio::dispatch(strand_, [this, self = shared_from_this()]() {
    if (!open_ || closing_) {
      return;
    }

    // Beast's own timer bounds the upgrade and the close handshake
    beast::get_lowest_layer(ws_).expires_never();
    websocket::stream_base::timeout timeouts =
        websocket::stream_base::timeout::suggested(beast::role_type::server);
    timeouts.handshake_timeout =
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            options_.handshake_timeout);
    ws_.set_option(timeouts);
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type &res) {
          res.set(beast::http::field::server, GetUserAgent());
        }));
    ws_.read_message_max(options_.max_message_size);
    // Runs inside async_read on strand_. Beast answers pings itself; the
    // session only needs to know the peer is alive.
    ws_.control_callback(
        [this](websocket::frame_type kind, beast::string_view) {
          if (kind == websocket::frame_type::close) {
            return;
          }
          ControlCallback saved_control_cb = control_callback_;
          if (saved_control_cb) {
            saved_control_cb();
          }
        });

    ws_.async_accept(boost::asio::bind_executor(
        strand_, [this, self](const boost::system::error_code &ec) {
          on_accept(ec);
        }));
  });
}

void WebSocketConnection::on_accept(const boost::system::error_code &ec) {
  if (closing_ || !open_) {
    teardown();
    return;
  }
  if (ec) {
    LOG_NET_DEBUG("websocket handshake with {}:{} failed: {}", remote_addr_,
                  remote_port_, ec.message());
    deliver_disconnect_once(CloseReason::TransportError);
    teardown();
    return;
  }

  handshake_done_ = true;
  LOG_NET_TRACE("websocket handshake complete with {}:{}", remote_addr_,
                remote_port_);

  OpenCallback saved_open_cb = open_callback_;
  if (saved_open_cb) {
    saved_open_cb();
  }
  // The open callback may have closed us
  if (!closing_ && open_) {
    start_read_impl();
  }
}

void WebSocketConnection::start_read_impl() {
  ws_.async_read(read_buffer_,
                 boost::asio::bind_executor(
                     strand_, [this, self = shared_from_this()](
                                  const boost::system::error_code &ec,
                                  size_t bytes) { on_read(ec, bytes); }));
}

void WebSocketConnection::on_read(const boost::system::error_code &ec,
                                  size_t bytes) {
  if (ec) {
    if (closing_) {
      // Expected while our own close handshake completes
      teardown();
      return;
    }
    if (ec == websocket::error::closed || ec == boost::asio::error::eof ||
        ec == boost::asio::error::connection_reset) {
      LOG_NET_TRACE("{}:{} closed the connection ({})", remote_addr_,
                    remote_port_, ec.message());
      deliver_disconnect_once(CloseReason::ClientClose);
    } else {
      LOG_NET_DEBUG("read error from {}:{}: {}", remote_addr_, remote_port_,
                    ec.message());
      deliver_disconnect_once(CloseReason::TransportError);
    }
    teardown();
    return;
  }

  std::string payload = beast::buffers_to_string(read_buffer_.data());
  read_buffer_.consume(bytes);
  const bool is_binary = ws_.got_binary();

  ReceiveCallback saved_receive_cb = receive_callback_;
  if (saved_receive_cb) {
    saved_receive_cb(payload, is_binary);
  }

  // The receive callback may have closed the connection
  if (!closing_ && open_) {
    start_read_impl();
  }
}

bool WebSocketConnection::send(const std::string &text) {
  if (!open_ || !handshake_done_) {
    return false;
  }
  if (writing_.exchange(true)) {
    return false;  // previous frame still in flight
  }

  auto payload = std::make_shared<std::string>(text);
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (closing_ || !open_) {
      writing_ = false;
      return;
    }
    ws_.text(true);
    ws_.async_write(
        boost::asio::buffer(*payload),
        boost::asio::bind_executor(
            strand_, [this, self, payload](const boost::system::error_code &ec,
                                           size_t) {
              writing_ = false;
              if (ec) {
                if (!closing_) {
                  LOG_NET_DEBUG("write error to {}:{}: {}", remote_addr_,
                                remote_port_, ec.message());
                  deliver_disconnect_once(CloseReason::TransportError);
                }
                teardown();
                return;
              }
              WriteCallback saved_write_cb = write_callback_;
              if (saved_write_cb) {
                saved_write_cb();
              }
            }));
  });
  return true;
}

bool WebSocketConnection::is_writable() const {
  return open_ && handshake_done_ && !writing_;
}

void WebSocketConnection::close(CloseReason reason) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), reason]() {
    close_impl(reason);
  });
}

void WebSocketConnection::close_impl(CloseReason reason) {
  if (closing_ || !open_) {
    return;
  }
  closing_ = true;
  clear_callbacks();

  if (!handshake_done_) {
    // No WebSocket session yet; nothing to negotiate
    teardown();
    return;
  }

  websocket::close_reason cr(CloseCodeFor(reason));
  cr.reason = CloseReasonName(reason);
  ws_.async_close(cr, boost::asio::bind_executor(
                          strand_, [this, self = shared_from_this()](
                                       const boost::system::error_code &ec) {
                            if (ec) {
                              LOG_NET_TRACE("close handshake with {}:{}: {}",
                                            remote_addr_, remote_port_,
                                            ec.message());
                            }
                            teardown();
                          }));
}

void WebSocketConnection::deliver_disconnect_once(CloseReason reason) {
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  disconnect_callback_ = {};
  if (saved_disconnect_cb) {
    // Post (not dispatch) so the callback never re-enters the strand
    boost::asio::post(strand_.get_inner_executor(),
                      [cb = std::move(saved_disconnect_cb), reason]() {
                        cb(reason);
                      });
  }
}

void WebSocketConnection::clear_callbacks() {
  open_callback_ = {};
  receive_callback_ = {};
  write_callback_ = {};
  control_callback_ = {};
  disconnect_callback_ = {};
}

void WebSocketConnection::teardown() {
  if (!open_.exchange(false)) {
    return;
  }
  closing_ = true;

  boost::system::error_code ec;
  auto &socket = beast::get_lowest_layer(ws_).socket();
  socket.shutdown(tcp::socket::shutdown_both, ec);
  socket.close(ec);

  // Pending handlers hold shared_ptrs; releasing the callbacks here breaks
  // the session <-> connection cycle.
  open_callback_ = {};
  receive_callback_ = {};
  write_callback_ = {};
  control_callback_ = {};
  if (!disconnect_delivered_) {
    disconnect_callback_ = {};
  }

  if (live_count_) {
    live_count_->fetch_sub(1);
  }
}

void WebSocketConnection::set_open_callback(OpenCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    open_callback_ = std::move(cb);
  });
}

void WebSocketConnection::set_receive_callback(ReceiveCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void WebSocketConnection::set_write_callback(WriteCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    write_callback_ = std::move(cb);
  });
}

void WebSocketConnection::set_control_callback(ControlCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    control_callback_ = std::move(cb);
  });
}

void WebSocketConnection::set_disconnect_callback(DisconnectCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    if (!disconnect_delivered_) {
      disconnect_callback_ = std::move(cb);
    }
  });
}

// ============================================================================
// WebSocketTransport
// ============================================================================

WebSocketTransport::WebSocketTransport(
    boost::asio::io_context &io_context,
    const WebSocketConnection::Options &options)
    : io_context_(io_context), options_(options),
      live_count_(std::make_shared<std::atomic<size_t>>(0)) {}

WebSocketTransport::~WebSocketTransport() { stop_listening(); }

bool WebSocketTransport::listen(const std::string &address, uint16_t port,
                                AcceptCallback accept_callback) {
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    LOG_NET_ERROR("invalid listen address '{}': {}", address, ec.message());
    return false;
  }

  accept_callback_ = std::move(accept_callback);
  acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
  const tcp::endpoint endpoint(ip, port);

  acceptor_->open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec && ip.is_v6() && ip.is_unspecified()) {
    // "::" accepts IPv4 as well where the OS allows it
    boost::system::error_code v6_ec;
    acceptor_->set_option(boost::asio::ip::v6_only(false), v6_ec);
  }
  if (!ec) {
    acceptor_->bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    LOG_NET_ERROR("failed to listen on {}:{}: {}", address, port, ec.message());
    boost::system::error_code close_ec;
    acceptor_->close(close_ec);
    acceptor_.reset();
    accept_callback_ = {};
    return false;
  }

  auto local = acceptor_->local_endpoint(ec);
  listen_port_ = ec ? port : local.port();

  LOG_NET_INFO("WebSocket server listening on {}:{}", address,
               listen_port_.load());
  start_accept();
  return true;
}

void WebSocketTransport::start_accept() {
  if (!acceptor_) {
    return;
  }
  // The transport is owned by NetworkManager, which stops listening before
  // it is destroyed; capturing this is safe.
  acceptor_->async_accept(
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        handle_accept(ec, std::move(socket));
      });
}

void WebSocketTransport::handle_accept(const boost::system::error_code &ec,
                                       tcp::socket socket) {
  if (ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    LOG_NET_TRACE("accept error: {}", ec.message());
    start_accept();
    return;
  }

  boost::system::error_code opt_ec;
  socket.set_option(tcp::no_delay(true), opt_ec);

  auto conn = WebSocketConnection::create(std::move(socket), options_,
                                          live_count_);
  LOG_NET_DEBUG("connection from {}:{} accepted", conn->remote_address(),
                conn->remote_port());

  if (accept_callback_) {
    accept_callback_(conn);
  } else {
    conn->close(CloseReason::ServerShutdown);
  }

  start_accept();
}

void WebSocketTransport::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  listen_port_ = 0;
  // Release anything the callback captured
  accept_callback_ = {};
}

} // namespace network
} // namespace heartsock
