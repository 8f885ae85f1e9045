// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include "discovery/service_advertiser.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

struct AvahiThreadedPoll;
struct AvahiClient;
struct AvahiEntryGroup;

namespace heartsock {
namespace discovery {

/**
 * AvahiAdvertiser - registers the service with the system Avahi daemon
 * (avahi backend)
 *
 * One entry group holds the service and explicit address records for the
 * advertised host name. withdraw() resets the group. The client is created on
 * first publish and recreated after the daemon went away, so a publish retry
 * recovers once avahi-daemon is back.
 */
class AvahiAdvertiser : public ServiceAdvertiser {
public:
  AvahiAdvertiser();
  ~AvahiAdvertiser() override;

  AvahiAdvertiser(const AvahiAdvertiser &) = delete;
  AvahiAdvertiser &operator=(const AvahiAdvertiser &) = delete;

  AdvertisedRecord publish(const ServiceRecordInput &input) override;
  void withdraw(const AdvertisedRecord &record) override;
  std::string backend_name() const override { return "avahi"; }

private:
  void ensure_client();   // throws AdvertiseError
  void release_client();

  AvahiThreadedPoll *poll_{nullptr};
  AvahiClient *client_{nullptr};
  AvahiEntryGroup *group_{nullptr};

  // Set from Avahi callbacks (poll thread)
  std::atomic<bool> client_failed_{false};

  std::mutex mutex_;
  std::optional<AdvertisedRecord> current_;
  uint64_t next_handle_{1};
};

} // namespace discovery
} // namespace heartsock
