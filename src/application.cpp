// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace heartsock {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config,
                         std::unique_ptr<discovery::ServiceAdvertiser> advertiser)
    : config_(config), advertiser_override_(std::move(advertiser)) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  std::cout << GetStartupBanner(util::FormatIPPort(
                   config_.network_config.listen_address,
                   config_.network_config.listen_port))
            << std::flush;

  LOG_APP_INFO("Initializing heartsock...");

  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_network()) {
    LOG_APP_ERROR("Failed to initialize network manager");
    return false;
  }

  if (!init_discovery()) {
    LOG_APP_ERROR("Failed to initialize mDNS advertisement");
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }
  if (!network_manager_) {
    LOG_APP_ERROR("Application not initialized");
    return false;
  }

  LOG_APP_INFO("Starting heartsock...");

  setup_signal_handlers();

  if (!network_manager_->start()) {
    LOG_APP_ERROR("Failed to start network manager");
    return false;
  }

  running_ = true;

  const uint16_t port = network_manager_->listening_port();
  LOG_APP_INFO("Listening on {}",
               util::FormatIPPort(config_.network_config.listen_address, port));

  if (advertisement_manager_) {
    // A failed first publish is retried by the monitor thread
    if (!advertisement_manager_->start(port)) {
      LOG_APP_WARN("mDNS advertisement not published yet, retrying in background");
    }
  } else {
    LOG_APP_INFO("mDNS advertisement disabled");
  }

  if (!config_.datadir.empty()) {
    LOG_APP_INFO("Data directory: {}", config_.datadir.string());
  }
  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_APP_INFO("Shutting down heartsock...");

  // Stops accepting, closes every session and stops the io_context
  if (network_manager_) {
    LOG_APP_INFO("Stopping network manager...");
    network_manager_->stop();
  }

  if (advertisement_manager_) {
    LOG_APP_INFO("Withdrawing mDNS advertisement...");
    advertisement_manager_->stop();
  }

  LOG_APP_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  if (config_.datadir.empty()) {
    LOG_APP_DEBUG("No data directory, value files disabled");
    return true;
  }

  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  config_.network_config.datadir = config_.datadir.string();
  return true;
}

bool Application::init_network() {
  LOG_APP_INFO("Initializing network manager...");
  network_manager_ =
      std::make_unique<network::NetworkManager>(config_.network_config);
  network_manager_->set_idle_callback(
      []() { LOG_APP_INFO("No clients connected"); });
  return true;
}

bool Application::init_discovery() {
  if (!config_.mdns_enabled) {
    return true;
  }

  LOG_APP_INFO("Initializing mDNS advertisement...");
  advertisement_manager_ = std::make_unique<discovery::AdvertisementManager>(
      config_.advertise_config, std::move(advertiser_override_));

  // status_json() only touches the manager's own mutex
  discovery::AdvertisementManager *manager = advertisement_manager_.get();
  network_manager_->set_advertisement_status_provider(
      [manager]() { return manager->status_json(); });
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout is NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);
    (void)written;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace heartsock
