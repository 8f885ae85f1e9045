// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 - ValidateAndNormalizeIP: numeric IP validation, IPv4-mapped IPv6 folded to IPv4
 - ParseIPPort / FormatIPPort: "1.2.3.4:9001" and "[2001:db8::1]:9001" forms
*/

#include <cstdint>
#include <optional>
#include <string>

namespace heartsock {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Hostnames are rejected; only numeric addresses are accepted.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string &address);

/**
 * Parse "IP:port" or "[IPv6]:port"
 *
 * Unbracketed IPv6 is rejected. Port 0 is rejected.
 * @return false on any parse error (outputs untouched in that case)
 */
bool ParseIPPort(const std::string &address_port, std::string &out_ip,
                 uint16_t &out_port);

// Inverse of ParseIPPort; brackets IPv6 addresses
std::string FormatIPPort(const std::string &ip, uint16_t port);

} // namespace util
} // namespace heartsock
