// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "discovery/address_resolver.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace heartsock {
namespace discovery {

namespace ip = boost::asio::ip;

std::vector<InterfaceAddress> SystemInterfaceEnumerator::enumerate() {
  std::vector<InterfaceAddress> result;

  struct ifaddrs *ifaddr = nullptr;
  if (getifaddrs(&ifaddr) != 0) {
    LOG_DISC_WARN("getifaddrs failed: {}", std::strerror(errno));
    return result;
  }

  for (struct ifaddrs *ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr) {
      continue;
    }

    InterfaceAddress entry;
    entry.interface_name = ifa->ifa_name ? ifa->ifa_name : "";
    entry.up = (ifa->ifa_flags & IFF_UP) != 0;
    entry.loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;

    if (ifa->ifa_addr->sa_family == AF_INET) {
      auto *addr_in = reinterpret_cast<struct sockaddr_in *>(ifa->ifa_addr);
      entry.address = ip::address_v4(ntohl(addr_in->sin_addr.s_addr));
    } else if (ifa->ifa_addr->sa_family == AF_INET6) {
      auto *addr_in6 = reinterpret_cast<struct sockaddr_in6 *>(ifa->ifa_addr);
      ip::address_v6::bytes_type bytes;
      std::memcpy(bytes.data(), addr_in6->sin6_addr.s6_addr, bytes.size());
      entry.address = ip::address_v6(bytes, addr_in6->sin6_scope_id);
    } else {
      continue;
    }
    result.push_back(std::move(entry));
  }

  freeifaddrs(ifaddr);
  return result;
}

AddressResolver::AddressResolver(std::shared_ptr<InterfaceEnumerator> enumerator)
    : enumerator_(enumerator ? std::move(enumerator)
                             : std::make_shared<SystemInterfaceEnumerator>()) {}

bool AddressResolver::IsLinkLocal(const ip::address &address) {
  if (address.is_v4()) {
    const auto bytes = address.to_v4().to_bytes();
    return bytes[0] == 169 && bytes[1] == 254;
  }
  return address.to_v6().is_link_local();
}

bool AddressResolver::AddressLess(const ip::address &a, const ip::address &b) {
  if (a.is_v4() != b.is_v4()) {
    return a.is_v4();
  }
  if (a.is_v4()) {
    return a.to_v4().to_bytes() < b.to_v4().to_bytes();
  }
  return a.to_v6().to_bytes() < b.to_v6().to_bytes();
}

namespace {

// Same address, ignoring the IPv6 scope
bool SameAddress(const ip::address &a, const ip::address &b) {
  if (a.is_v6() && b.is_v6()) {
    return a.to_v6().to_bytes() == b.to_v6().to_bytes();
  }
  return a == b;
}

} // namespace

std::vector<std::string>
AddressResolver::interfaces_for(const NetworkAddressSet &addresses) const {
  const auto entries = enumerator_->enumerate();
  std::vector<std::string> names;
  for (const auto &wanted : addresses) {
    for (const auto &entry : entries) {
      if (!entry.up || entry.interface_name.empty()) {
        continue;
      }
      ip::address addr = entry.address;
      if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
        addr = ip::make_address_v4(ip::v4_mapped, addr.to_v6());
      }
      if (!SameAddress(addr, wanted)) {
        continue;
      }
      if (std::find(names.begin(), names.end(), entry.interface_name) ==
          names.end()) {
        names.push_back(entry.interface_name);
      }
      break;
    }
  }
  return names;
}

NetworkAddressSet AddressResolver::resolve() const {
  NetworkAddressSet preferred;
  NetworkAddressSet link_local;

  for (const auto &entry : enumerator_->enumerate()) {
    if (!entry.up || entry.loopback) {
      continue;
    }
    ip::address addr = entry.address;
    // Fold IPv4-mapped IPv6 into plain IPv4
    if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
      addr = ip::make_address_v4(ip::v4_mapped, addr.to_v6());
    }
    if (addr.is_loopback() || addr.is_unspecified() || addr.is_multicast()) {
      continue;
    }
    if (IsLinkLocal(addr)) {
      link_local.push_back(addr);
    } else {
      preferred.push_back(addr);
    }
  }

  NetworkAddressSet result = preferred.empty() ? link_local : preferred;
  if (result.empty()) {
    throw NoAddressError("no non-loopback network address found");
  }

  std::sort(result.begin(), result.end(), AddressLess);
  result.erase(std::unique(result.begin(), result.end()), result.end());
  return result;
}

std::string FormatAddressSet(const NetworkAddressSet &addresses) {
  std::string out;
  for (const auto &addr : addresses) {
    if (!out.empty()) {
      out += ", ";
    }
    out += addr.to_string();
  }
  return out;
}

} // namespace discovery
} // namespace heartsock
