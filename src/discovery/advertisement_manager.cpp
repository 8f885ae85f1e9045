// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "discovery/advertisement_manager.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace heartsock {
namespace discovery {

AdvertisementManager::AdvertisementManager(Config config,
                                           std::unique_ptr<ServiceAdvertiser> advertiser,
                                           std::shared_ptr<AddressResolver> resolver)
    : config_(std::move(config)), advertiser_(std::move(advertiser)),
      resolver_(std::move(resolver)) {
  if (!advertiser_) {
    advertiser_ = CreateServiceAdvertiser();
  }
  if (!resolver_) {
    resolver_ = std::make_shared<AddressResolver>();
  }
  if (config_.retry_min.count() <= 0) {
    config_.retry_min = std::chrono::milliseconds(1);
  }
  if (config_.retry_max < config_.retry_min) {
    config_.retry_max = config_.retry_min;
  }
}

AdvertisementManager::~AdvertisementManager() noexcept {
  stop(true);
}

bool AdvertisementManager::start(uint16_t port) {
  if (port == 0) {
    LOG_DISC_ERROR("invalid advertised port: 0");
    return false;
  }
  if (running_.exchange(true)) {
    LOG_DISC_TRACE("advertisement manager already running");
    return false;
  }

  bool published = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    port_ = port;
    LOG_DISC_DEBUG("starting {} advertisement for port {}",
                   advertiser_->backend_name(), port);
    try {
      published = publish_locked(select_addresses());
    } catch (const NoAddressError &e) {
      record_failure_locked(e.what());
    }
  }

  // Retries run on the monitor even if the first publish failed
  monitor_thread_ = std::thread(&AdvertisementManager::monitor_loop, this);
  return published;
}

void AdvertisementManager::stop(bool silent) {
  {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  monitor_cv_.notify_all();
  if (monitor_thread_.joinable()) {
    monitor_thread_.join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  withdraw_locked(silent);
}

void AdvertisementManager::monitor_loop() {
  std::unique_lock<std::mutex> lock(monitor_mutex_);
  while (running_) {
    const auto wait = is_published() ? config_.address_poll_interval
                                     : current_backoff();
    if (monitor_cv_.wait_for(lock, wait, [this]() { return !running_; })) {
      break;
    }
    lock.unlock();
    try {
      poll_once();
    } catch (const std::exception &e) {
      LOG_DISC_ERROR("advertisement monitor error: {}; will retry", e.what());
    }
    lock.lock();
  }
}

bool AdvertisementManager::poll_once() {
  std::lock_guard<std::mutex> lock(mutex_);
  NetworkAddressSet addresses;
  try {
    addresses = select_addresses();
  } catch (const NoAddressError &e) {
    // The published address is gone
    withdraw_locked(false);
    record_failure_locked(e.what());
    return false;
  }

  if (!record_) {
    return publish_locked(addresses);
  }
  if (record_->addresses == addresses &&
      record_->interfaces == resolver_->interfaces_for(addresses)) {
    return true;
  }

  LOG_DISC_INFO("Local address or interface changed ({} -> {}), republishing",
                FormatAddressSet(record_->addresses),
                FormatAddressSet(addresses));
  withdraw_locked(false);
  return publish_locked(addresses);
}

bool AdvertisementManager::republish_on_change(const NetworkAddressSet &addresses) {
  if (addresses.empty()) {
    return false;
  }
  NetworkAddressSet selected = addresses;
  if (!config_.all_addresses) {
    selected.resize(1);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (port_ == 0) {
    return false;
  }
  if (record_ && record_->addresses == selected &&
      record_->interfaces == resolver_->interfaces_for(selected)) {
    return false;
  }
  withdraw_locked(false);
  return publish_locked(selected);
}

NetworkAddressSet AdvertisementManager::select_addresses() {
  if (config_.advertise_ip) {
    return NetworkAddressSet{*config_.advertise_ip};
  }
  NetworkAddressSet addresses = resolver_->resolve();
  if (!config_.all_addresses && addresses.size() > 1) {
    addresses.resize(1);
  }
  return addresses;
}

bool AdvertisementManager::publish_locked(const NetworkAddressSet &addresses) {
  const uint64_t generation = generation_ + 1;
  ServiceRecordInput input = MakeServiceRecord(addresses, port_, generation);
  input.interfaces = resolver_->interfaces_for(addresses);
  try {
    record_ = advertiser_->publish(input);
  } catch (const AdvertiseError &e) {
    record_.reset();
    record_failure_locked(e.what());
    return false;
  }

  generation_ = generation;
  failures_ = 0;
  last_error_.clear();
  LOG_DISC_INFO("Advertising {} at {} port {} via {} (generation {})",
                record_->full_name(), FormatAddressSet(record_->addresses),
                record_->port, advertiser_->backend_name(), generation_);
  return true;
}

void AdvertisementManager::withdraw_locked(bool silent) {
  if (!record_) {
    return;
  }
  const AdvertisedRecord record = *record_;
  record_.reset();
  try {
    advertiser_->withdraw(record);
  } catch (const AdvertiseError &e) {
    if (!silent) {
      LOG_DISC_WARN("failed to withdraw {}: {}", record.full_name(), e.what());
    }
    return;
  }
  if (!silent) {
    LOG_DISC_INFO("Withdrew {} (generation {})", record.full_name(),
                  record.generation);
  }
}

void AdvertisementManager::record_failure_locked(const std::string &what) {
  ++failures_;
  last_error_ = what;
  LOG_DISC_ERROR("Unable to advertise via mDNS: {} (attempt {}, retry in {} ms)",
                 what, failures_, backoff_locked().count());
}

bool AdvertisementManager::is_published() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return record_.has_value();
}

std::optional<AdvertisedRecord> AdvertisementManager::current_record() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return record_;
}

uint64_t AdvertisementManager::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

uint32_t AdvertisementManager::consecutive_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_;
}

std::string AdvertisementManager::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

std::chrono::milliseconds AdvertisementManager::current_backoff() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return backoff_locked();
}

// retry_min doubled once per consecutive failure after the first, capped at retry_max
std::chrono::milliseconds AdvertisementManager::backoff_locked() const {
  std::chrono::milliseconds delay = config_.retry_min;
  for (uint32_t i = 1; i < failures_ && delay < config_.retry_max; ++i) {
    delay *= 2;
  }
  return std::min(delay, config_.retry_max);
}

nlohmann::json AdvertisementManager::status_json() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json j;
  j["backend"] = advertiser_->backend_name();
  j["published"] = record_.has_value();
  j["generation"] = generation_;
  if (record_) {
    j["name"] = record_->full_name();
    j["host"] = record_->host_name;
    nlohmann::json addresses = nlohmann::json::array();
    for (const auto &address : record_->addresses) {
      addresses.push_back(address.to_string());
    }
    j["addresses"] = addresses;
    j["interfaces"] = record_->interfaces;
    j["port"] = record_->port;
  }
  j["failures"] = failures_;
  j["last_error"] = last_error_.empty() ? nlohmann::json(nullptr)
                                        : nlohmann::json(last_error_);
  return j;
}

} // namespace discovery
} // namespace heartsock
