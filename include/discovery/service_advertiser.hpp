// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include "discovery/address_resolver.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace heartsock {
namespace discovery {

// DNS-SD naming for the server
constexpr const char *SERVICE_TYPE = "_heartsock._tcp.local.";
constexpr const char *INSTANCE_NAME = "\xE2\x9D\xA4\xEF\xB8\x8F\xF0\x9F\xA7\xA6";  // U+2764 U+FE0F U+1F9E6

// Raised by a backend that could not publish or withdraw
class AdvertiseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ServiceRecordInput {
  std::string service_type{SERVICE_TYPE};
  std::string instance_name{INSTANCE_NAME};
  std::string host_name;               // "heartsock-10-0-0-5.local."
  NetworkAddressSet addresses;
  // Interfaces owning `addresses`; empty = any interface
  std::vector<std::string> interfaces;
  uint16_t port{0};
  std::vector<std::string> txt;        // "key=value" entries
  uint64_t generation{0};
};

// A record as it is visible on the network
struct AdvertisedRecord {
  uint64_t handle{0};  // backend-assigned, 0 = nothing published
  std::string service_type;
  std::string instance_name;
  std::string host_name;
  NetworkAddressSet addresses;
  std::vector<std::string> interfaces;
  uint16_t port{0};
  std::vector<std::string> txt;
  uint64_t generation{0};

  // "<instance>.<service type>"
  std::string full_name() const { return instance_name + "." + service_type; }
};

// "heartsock-<address with '.' and ':' replaced by '-'>.local.", without
// the IPv6 scope
std::string HostNameFor(const boost::asio::ip::address &address);

ServiceRecordInput MakeServiceRecord(const NetworkAddressSet &addresses,
                                     uint16_t port, uint64_t generation);

/**
 * ServiceAdvertiser - publishes one DNS-SD service record
 *
 * Implementations:
 * - DnsSdAdvertiser (dnssd): DNS-SD API (mDNSResponder or avahi-compat)
 * - AvahiAdvertiser (avahi): entry group on the system Avahi daemon
 * Exactly one is compiled in, see CreateServiceAdvertiser().
 *
 * publish() throws AdvertiseError on failure. withdraw() of a record that is
 * not currently published is a no-op.
 */
class ServiceAdvertiser {
public:
  virtual ~ServiceAdvertiser() = default;

  virtual AdvertisedRecord publish(const ServiceRecordInput &input) = 0;
  virtual void withdraw(const AdvertisedRecord &record) = 0;
  virtual std::string backend_name() const = 0;
};

// Defined by the backend selected with HEARTSOCK_MDNS_BACKEND
std::unique_ptr<ServiceAdvertiser> CreateServiceAdvertiser();

} // namespace discovery
} // namespace heartsock
