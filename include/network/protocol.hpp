// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include "version.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace heartsock {
namespace protocol {

constexpr uint16_t DEFAULT_PORT = 9001;
constexpr const char *DEFAULT_LISTEN_ADDRESS = "0.0.0.0";

// Text commands (inbound frames are lower-cased before dispatch)
namespace commands {
constexpr const char *PING = "ping";
constexpr const char *PONG = "pong";
constexpr const char *GET = "get";
constexpr const char *SET = "set";
constexpr const char *HEARTBEAT = "heartbeat";
constexpr const char *STATUS = "status";
} // namespace commands

// Fixed replies
namespace replies {
constexpr const char *OK = "ok";
constexpr const char *PONG = "pong";
constexpr const char *UNKNOWN_INPUT = "error: unknown input";
constexpr const char *UNKNOWN_KEY = "error: unknown value key";
constexpr const char *TRACKER_CONNECTED = "error: a tracker is already connected";
} // namespace replies

// Tracked value keys
namespace keys {
constexpr const char *BPM = "bpm";
constexpr const char *BATTERY = "battery";
} // namespace keys

// Timeouts and intervals (in seconds)
constexpr int DEFAULT_HANDSHAKE_TIMEOUT_SEC = 10;
constexpr int DEFAULT_LIVENESS_TIMEOUT_SEC = 30;
constexpr int DEFAULT_HEARTBEAT_INTERVAL_SEC = 5;
constexpr int DEFAULT_SHUTDOWN_GRACE_SEC = 2;

// Session limits
constexpr size_t DEFAULT_SEND_QUEUE_LIMIT = 32;   // frames per session
constexpr size_t MAX_MESSAGE_SIZE = 4096;         // bytes per inbound frame

// "heartbeat <seq>"
std::string FormatHeartbeat(uint64_t seq);

// "<key>: <value>"
std::string FormatValue(const std::string &key, unsigned value);

// "error: unknown input for <key> value"
std::string FormatBadValue(const std::string &key);

// Sequence number of a "heartbeat <seq>" / "pong <seq>" argument
std::optional<uint64_t> ParseSequence(const std::string &arg);

} // namespace protocol
} // namespace heartsock
