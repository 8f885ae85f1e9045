// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include "discovery/service_advertiser.hpp"
#include <chrono>
#include <cstdint>
#include <dns_sd.h>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace heartsock {
namespace discovery {

namespace dnssd {

// "_heartsock._tcp.local." -> "_heartsock._tcp"
std::string RegistrationType(const std::string &service_type);

// "key=value" entries in DNS-SD TXT wire form, built with TXTRecordSetValue.
// Entries without '=' become boolean keys.
std::string BuildTxtRecord(const std::vector<std::string> &entries);

// Interface indexes to register on. Unknown names are skipped; an empty
// result becomes {kDNSServiceInterfaceIndexAny}.
std::vector<uint32_t> InterfaceIndexes(const std::vector<std::string> &names);

const char *ErrorName(DNSServiceErrorType error);

} // namespace dnssd

/**
 * DnsSdAdvertiser - registers the service through the DNS-SD API
 * (dnssd backend)
 *
 * Works against mDNSResponder's libdns_sd or Avahi's compatibility library.
 * The service is registered once per interface that owns an advertised
 * address, under the system host name, so the daemon answers with that
 * interface's addresses. A republish after an address change registers on
 * the new interfaces. withdraw() deallocates the registrations, which makes
 * the daemon send goodbye packets.
 *
 * publish() waits up to register_timeout for the daemon to confirm each
 * registration.
 */
class DnsSdAdvertiser : public ServiceAdvertiser {
public:
  struct Options {
    std::chrono::milliseconds register_timeout{std::chrono::seconds(5)};
  };

  DnsSdAdvertiser();
  explicit DnsSdAdvertiser(const Options &options);
  ~DnsSdAdvertiser() override;

  DnsSdAdvertiser(const DnsSdAdvertiser &) = delete;
  DnsSdAdvertiser &operator=(const DnsSdAdvertiser &) = delete;

  AdvertisedRecord publish(const ServiceRecordInput &input) override;
  void withdraw(const AdvertisedRecord &record) override;
  std::string backend_name() const override { return "dnssd"; }

private:
  // Caller must hold mutex_
  DNSServiceRef register_on(uint32_t interface_index,
                            const ServiceRecordInput &input,
                            const std::string &txt);  // throws AdvertiseError
  void release_locked();

  Options options_;
  std::mutex mutex_;
  std::vector<DNSServiceRef> refs_;
  std::optional<AdvertisedRecord> current_;
  uint64_t next_handle_{1};
};

} // namespace discovery
} // namespace heartsock
