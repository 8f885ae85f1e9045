// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/ip/address.hpp>

namespace heartsock {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string &address) {
  if (address.empty()) {
    return std::nullopt;
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  // ::ffff:192.168.1.1 -> 192.168.1.1
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped,
                                            ip.to_v6())
        .to_string();
  }

  return ip.to_string();
}

bool ParseIPPort(const std::string &address_port, std::string &out_ip,
                 uint16_t &out_port) {
  if (address_port.empty()) {
    return false;
  }

  std::string ip_part;
  std::string port_part;

  if (address_port[0] == '[') {
    size_t bracket_end = address_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= address_port.size() ||
        address_port[bracket_end + 1] != ':') {
      return false;
    }
    ip_part = address_port.substr(1, bracket_end - 1);
    port_part = address_port.substr(bracket_end + 2);
  } else {
    size_t colon = address_port.find(':');
    if (colon == std::string::npos || colon == 0) {
      return false;
    }
    // A second colon means unbracketed IPv6
    if (address_port.find(':', colon + 1) != std::string::npos) {
      return false;
    }
    ip_part = address_port.substr(0, colon);
    port_part = address_port.substr(colon + 1);
  }

  auto port = SafeParsePort(port_part);
  if (!port) {
    return false;
  }
  auto normalized = ValidateAndNormalizeIP(ip_part);
  if (!normalized) {
    return false;
  }

  out_ip = *normalized;
  out_port = *port;
  return true;
}

std::string FormatIPPort(const std::string &ip, uint16_t port) {
  if (ip.find(':') != std::string::npos) {
    return "[" + ip + "]:" + std::to_string(port);
  }
  return ip + ":" + std::to_string(port);
}

} // namespace util
} // namespace heartsock
