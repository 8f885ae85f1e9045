// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "discovery/service_advertiser.hpp"
#include "version.hpp"
#include <algorithm>

namespace heartsock {
namespace discovery {

std::string HostNameFor(const boost::asio::ip::address &address) {
  std::string text;
  if (address.is_v6()) {
    text = boost::asio::ip::address_v6(address.to_v6().to_bytes()).to_string();
  } else {
    text = address.to_string();
  }
  std::replace(text.begin(), text.end(), '.', '-');
  std::replace(text.begin(), text.end(), ':', '-');
  return "heartsock-" + text + ".local.";
}

ServiceRecordInput MakeServiceRecord(const NetworkAddressSet &addresses,
                                     uint16_t port, uint64_t generation) {
  ServiceRecordInput input;
  input.addresses = addresses;
  input.port = port;
  input.generation = generation;
  if (!addresses.empty()) {
    input.host_name = HostNameFor(addresses.front());
  }
  input.txt.push_back("version=" + GetVersionString());
  return input;
}

} // namespace discovery
} // namespace heartsock
