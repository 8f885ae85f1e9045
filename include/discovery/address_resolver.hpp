// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

/*
 Address Resolver

 Picks the local addresses worth advertising. Interface enumeration sits
 behind InterfaceEnumerator so tests can inject fixed interface tables.

 Filtering rules:
 - interfaces that are down are ignored
 - loopback interfaces and loopback addresses are ignored
 - unspecified and multicast addresses are ignored
 - link-local addresses (169.254/16, fe80::/10) are only returned when
   nothing else is left

 Ordering: IPv4 before IPv6, then ascending by address bytes, no duplicates.
*/

#include <boost/asio/ip/address.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace heartsock {
namespace discovery {

using NetworkAddressSet = std::vector<boost::asio::ip::address>;

class NoAddressError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct InterfaceAddress {
  std::string interface_name;
  boost::asio::ip::address address;
  bool up{true};
  bool loopback{false};
};

class InterfaceEnumerator {
public:
  virtual ~InterfaceEnumerator() = default;
  virtual std::vector<InterfaceAddress> enumerate() = 0;
};

// getifaddrs(3); entries without an IPv4/IPv6 address are skipped. IPv6
// addresses keep their scope id.
class SystemInterfaceEnumerator : public InterfaceEnumerator {
public:
  std::vector<InterfaceAddress> enumerate() override;
};

class AddressResolver {
public:
  // nullptr = SystemInterfaceEnumerator
  explicit AddressResolver(std::shared_ptr<InterfaceEnumerator> enumerator = nullptr);

  // Throws NoAddressError if no usable address exists. No side effects.
  NetworkAddressSet resolve() const;

  // Names of the interfaces that own `addresses`, in address order without
  // duplicates. Addresses no interface owns are skipped.
  std::vector<std::string> interfaces_for(const NetworkAddressSet &addresses) const;

  static bool IsLinkLocal(const boost::asio::ip::address &address);

  // IPv4 first, then by bytes
  static bool AddressLess(const boost::asio::ip::address &a,
                          const boost::asio::ip::address &b);

private:
  std::shared_ptr<InterfaceEnumerator> enumerator_;
};

std::string FormatAddressSet(const NetworkAddressSet &addresses);

} // namespace discovery
} // namespace heartsock
