// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "network/transport.hpp"

namespace heartsock {
namespace network {

const char *CloseReasonName(CloseReason reason) {
  switch (reason) {
  case CloseReason::ClientClose:
    return "client-close";
  case CloseReason::HandshakeTimeout:
    return "handshake-timeout";
  case CloseReason::LivenessTimeout:
    return "liveness-timeout";
  case CloseReason::TransportError:
    return "transport-error";
  case CloseReason::ServerShutdown:
    return "server-shutdown";
  }
  return "unknown";
}

} // namespace network
} // namespace heartsock
