// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "network/protocol.hpp"
#include "util/string_parsing.hpp"

namespace heartsock {
namespace protocol {

std::string FormatHeartbeat(uint64_t seq) {
  return std::string(commands::HEARTBEAT) + " " + std::to_string(seq);
}

std::string FormatValue(const std::string &key, unsigned value) {
  return key + ": " + std::to_string(value);
}

std::string FormatBadValue(const std::string &key) {
  return "error: unknown input for " + key + " value";
}

std::optional<uint64_t> ParseSequence(const std::string &arg) {
  return util::SafeParseUint64(arg);
}

} // namespace protocol
} // namespace heartsock
