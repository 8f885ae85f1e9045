// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace heartsock {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Heartsock developers";

// HTTP Server header sent with the WebSocket upgrade response
// Format: heartsock/0.3.0
inline std::string GetUserAgent() { return "heartsock/" + GetVersionString(); }

// Full version info for display
inline std::string GetFullVersionString() {
  return "heartsock version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *RED = "\033[1;31m";
} // namespace colors

// Startup banner showing the listen endpoint
inline std::string GetStartupBanner(const std::string &endpoint) {
  std::string banner;
  banner += "\n";
  banner += colors::RED;
  banner +=
      "╔═══════════════════════════════════════════════════════════════╗\n";
  banner +=
      "║                                                               ║\n";
  banner +=
      "║   ██╗  ██╗███████╗ █████╗ ██████╗ ████████╗███████╗ ██████╗   ║\n";
  banner +=
      "║   ██║  ██║██╔════╝██╔══██╗██╔══██╗╚══██╔══╝██╔════╝██╔═══██╗  ║\n";
  banner +=
      "║   ███████║█████╗  ███████║██████╔╝   ██║   ███████╗██║   ██║  ║\n";
  banner +=
      "║   ██╔══██║██╔══╝  ██╔══██║██╔══██╗   ██║   ╚════██║██║   ██║  ║\n";
  banner +=
      "║   ██║  ██║███████╗██║  ██║██║  ██║   ██║   ███████║╚██████╔╝  ║\n";
  banner +=
      "║   ╚═╝  ╚═╝╚══════╝╚═╝  ╚═╝╚═╝  ╚═╝   ╚═╝   ╚══════╝ ╚═════╝   ║\n";
  banner +=
      "║                                                               ║\n";
  banner +=
      "║                 LAN presence / heartbeat server               ║\n";
  banner +=
      "║                                                               ║\n";
  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  std::string version_str = GetVersionString();
  banner += "║  Version: " + version_str;
  // Box is 65 display chars. "║  Version: " = 12 display chars, closing "║" = 1
  size_t version_padding = 52 - version_str.length();
  banner += std::string(version_padding, ' ') + "║\n";

  std::string shown = endpoint.size() > 52 ? endpoint.substr(0, 52) : endpoint;
  banner += "║  Listen:  " + shown;
  banner += std::string(52 - shown.length(), ' ') + "║\n";

  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  banner += "║  " + GetCopyrightString();
  size_t copyright_padding = 61 - GetCopyrightString().length();
  banner += std::string(copyright_padding, ' ') + "║\n";
  banner += "╚═══════════════════════════════════════════════════════════════╝";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace heartsock
