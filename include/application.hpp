// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include "discovery/advertisement_manager.hpp"
#include "network/network_manager.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace heartsock {
namespace app {

// Application configuration
struct AppConfig {
  // Directory for the plain-text value files (empty = none)
  std::filesystem::path datadir;

  network::NetworkManager::Config network_config;

  // mDNS advertisement
  bool mdns_enabled = true;
  discovery::AdvertisementManager::Config advertise_config;

  // Logging
  std::string log_level = "info";
  std::vector<std::string> debug_components;
  std::string log_file;  // empty = console only
};

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  // advertiser: optional mDNS backend override (nullptr = compiled-in backend)
  explicit Application(const AppConfig &config = AppConfig{},
                       std::unique_ptr<discovery::ServiceAdvertiser> advertiser = nullptr);
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  network::NetworkManager &network_manager() { return *network_manager_; }
  discovery::AdvertisementManager *advertisement_manager() {
    return advertisement_manager_.get();
  }

  bool is_running() const { return running_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  std::unique_ptr<discovery::ServiceAdvertiser> advertiser_override_;

  // Components (initialized in order)
  std::unique_ptr<network::NetworkManager> network_manager_;
  std::unique_ptr<discovery::AdvertisementManager> advertisement_manager_;

  // Initialization steps
  bool init_datadir();
  bool init_network();
  bool init_discovery();

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace heartsock
