// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace heartsock {
namespace network {

// Abstract message-oriented transport
// Allows dependency injection of different implementations:
// - WebSocketTransport: WebSocket over TCP via Boost.Beast
// - MockTransport / MockTransportConnection: in-memory, for tests (in test/)

class Transport;
class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

// Why a connection is (being) closed. Doubles as the close reason code handed
// to the transport's close primitive.
enum class CloseReason {
  ClientClose,       // peer closed (close frame or EOF)
  HandshakeTimeout,  // transport handshake not completed in time
  LivenessTimeout,   // no inbound traffic within the liveness window
  TransportError,    // I/O failure, protocol violation, or send overflow
  ServerShutdown     // local shutdown request
};

const char *CloseReasonName(CloseReason reason);

using OpenCallback = std::function<void()>;
using ReceiveCallback =
    std::function<void(const std::string &payload, bool is_binary)>;
using WriteCallback = std::function<void()>;
// Inbound ping or pong control frame (answered by the transport itself)
using ControlCallback = std::function<void()>;
// Only delivered for closes the local side did not initiate
using DisconnectCallback = std::function<void(CloseReason reason)>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

// TransportConnection - one full-duplex message connection
//
// Callbacks are invoked on the network thread. Setting a callback to an empty
// function detaches it.
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Run the server-side handshake, then start receiving. The open callback
  // fires once the handshake completes.
  virtual void start() = 0;

  // Send one text frame. Back-pressure: at most one frame is in flight; returns
  // false if a frame is still being written, the handshake has not completed,
  // or the connection is closed. The write callback fires when the frame has
  // been written and the next one may be sent.
  virtual bool send(const std::string &text) = 0;
  virtual bool is_writable() const = 0;

  // Initiate a close carrying the reason code. Idempotent. No disconnect
  // callback is delivered for a locally initiated close.
  virtual void close(CloseReason reason) = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;

  virtual void set_open_callback(OpenCallback callback) = 0;
  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_write_callback(WriteCallback callback) = 0;
  virtual void set_control_callback(ControlCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

// Transport - accepts inbound connections
class Transport {
public:
  virtual ~Transport() = default;

  // Start accepting on address:port (port 0 = ephemeral). Returns false if the
  // socket could not be bound.
  virtual bool listen(const std::string &address, uint16_t port,
                      AcceptCallback accept_callback) = 0;

  virtual void stop_listening() = 0;

  // Bound port, 0 if not listening
  virtual uint16_t listening_port() const = 0;

  // Connections whose underlying socket has not been torn down yet (includes
  // connections still finishing a close handshake)
  virtual size_t open_connection_count() const = 0;
};

} // namespace network
} // namespace heartsock
