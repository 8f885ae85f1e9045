// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace heartsock {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "network", "discovery", "app"),
 * all sharing the same sinks.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, also log to a rotating file
   * @param log_file_path Path to log file (if log_to_file is true)
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "heartsock.log");

  // Flush and drop all loggers. Logging afterwards falls back to a silent
  // console logger.
  static void Shutdown();

  /**
   * Get logger for specific component
   * Auto-initializes with defaults if Initialize() was never called.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @return false if the component is unknown
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  // Names accepted by SetComponentLevel (and --debug=)
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace heartsock

#define LOG_TRACE(...)                                                         \
  heartsock::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  heartsock::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  heartsock::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  heartsock::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  heartsock::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  heartsock::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  heartsock::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  heartsock::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  heartsock::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  heartsock::util::LogManager::GetLogger("network")->error(__VA_ARGS__)
#define LOG_NET_CRITICAL(...)                                                  \
  heartsock::util::LogManager::GetLogger("network")->critical(__VA_ARGS__)

#define LOG_DISC_TRACE(...)                                                    \
  heartsock::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...)                                                    \
  heartsock::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...)                                                     \
  heartsock::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...)                                                     \
  heartsock::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...)                                                    \
  heartsock::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  heartsock::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  heartsock::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  heartsock::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  heartsock::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
