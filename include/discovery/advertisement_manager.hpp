// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include "discovery/address_resolver.hpp"
#include "discovery/service_advertiser.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

namespace heartsock {
namespace discovery {

/**
 * AdvertisementManager - owns the published service record
 *
 * start() publishes once synchronously and then runs a monitor thread that
 * re-resolves local addresses every address_poll_interval. When the advertised
 * addresses change the old record is withdrawn before the new one (generation
 * + 1) is published. Failures are logged and retried with exponential backoff;
 * they never stop the server.
 */
class AdvertisementManager {
public:
  struct Config {
    // Fixed address; disables resolving
    std::optional<boost::asio::ip::address> advertise_ip;
    // Advertise every resolved address instead of only the first
    bool all_addresses{false};
    std::chrono::milliseconds address_poll_interval{std::chrono::seconds(10)};
    std::chrono::milliseconds retry_min{std::chrono::seconds(1)};
    std::chrono::milliseconds retry_max{std::chrono::seconds(60)};
  };

  // nullptr advertiser = CreateServiceAdvertiser(), nullptr resolver = system
  explicit AdvertisementManager(Config config,
                                std::unique_ptr<ServiceAdvertiser> advertiser = nullptr,
                                std::shared_ptr<AddressResolver> resolver = nullptr);
  ~AdvertisementManager() noexcept;

  AdvertisementManager(const AdvertisementManager &) = delete;
  AdvertisementManager &operator=(const AdvertisementManager &) = delete;

  // Returns true if the initial publish succeeded. The monitor thread is
  // started either way (it retries), false only for port 0 or a second start.
  bool start(uint16_t port);

  // Stops the monitor and withdraws the record.
  // PRECONDITION: Must NOT be called while holding mutex_ (joins the monitor)
  void stop(bool silent = false);

  // Withdraws and republishes when the addresses selected from
  // `addresses` differ from the published record. Returns true if a new
  // record was published.
  bool republish_on_change(const NetworkAddressSet &addresses);

  // One monitor iteration: resolve, then publish or republish as needed.
  // Returns true if a record is published afterwards.
  bool poll_once();

  bool is_running() const { return running_; }
  bool is_published() const;
  std::optional<AdvertisedRecord> current_record() const;
  uint64_t generation() const;
  std::chrono::milliseconds current_backoff() const;
  uint32_t consecutive_failures() const;
  std::string last_error() const;
  std::string backend_name() const { return advertiser_->backend_name(); }

  nlohmann::json status_json() const;

private:
  // Caller must hold mutex_
  NetworkAddressSet select_addresses();
  bool publish_locked(const NetworkAddressSet &addresses);
  void withdraw_locked(bool silent);
  void record_failure_locked(const std::string &what);
  std::chrono::milliseconds backoff_locked() const;

  void monitor_loop();

  Config config_;
  std::unique_ptr<ServiceAdvertiser> advertiser_;
  std::shared_ptr<AddressResolver> resolver_;

  uint16_t port_{0};
  std::optional<AdvertisedRecord> record_;
  uint64_t generation_{0};
  uint32_t failures_{0};
  std::string last_error_;

  std::atomic<bool> running_{false};
  std::thread monitor_thread_;
  std::condition_variable monitor_cv_;
  std::mutex monitor_mutex_;

  // Serializes publish/withdraw/republish and protects the record state
  mutable std::mutex mutex_;
};

} // namespace discovery
} // namespace heartsock
