// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <algorithm>
#include <boost/asio/ip/address.hpp>
#include <iostream> // Keep for CLI output and early errors before logger initialized

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --listen=<ip:port>        WebSocket listen endpoint (default: 0.0.0.0:9001)\n"
      << "                            IPv6 in brackets: --listen=[::]:9001\n"
      << "  --datadir=<path>          Write bpm.txt/battery.txt into this directory\n"
      << "  --handshake-timeout=<s>   WebSocket handshake timeout (default: 10)\n"
      << "  --liveness-timeout=<s>    Evict clients silent for longer (default: 30)\n"
      << "  --heartbeat-interval=<s>  Heartbeat period (default: 5)\n"
      << "\n"
      << "mDNS:\n"
      << "  --nomdns                  Disable mDNS advertisement\n"
      << "  --advertise-ip=<ip>       Advertise this address instead of resolving\n"
      << "  --mdns-all-addresses      Advertise every local address, not just the first\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>        Set global log level (trace,debug,info,warn,error,critical,off)\n"
      << "                            Default: info\n"
      << "  --debug=<component>       Enable trace logging for specific component(s)\n"
      << "                            Components: network, discovery, app, all\n"
      << "                            Can be comma-separated: --debug=network,discovery\n"
      << "  --logfile=<path>          Also log to a rotating file\n"
      << "\n"
      << "Other:\n"
      << "  --version                 Show version information\n"
      << "  --help                    Show this help message\n"
      << std::endl;
}

bool ValidLogLevel(const std::string &level) {
  static const std::vector<std::string> levels = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  return std::find(levels.begin(), levels.end(), level) != levels.end();
}

// Seconds option in 1..86400
bool ParseSeconds(const std::string &name, const std::string &value,
                  std::chrono::milliseconds &out) {
  auto seconds = heartsock::util::SafeParseInt(value, 1, 86400);
  if (!seconds) {
    std::cerr << "Error: Invalid " << name << ": " << value << std::endl;
    std::cerr << "Must be a number of seconds between 1 and 86400" << std::endl;
    return false;
  }
  out = std::chrono::seconds(*seconds);
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    heartsock::app::AppConfig config;
    auto &net = config.network_config;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << heartsock::GetFullVersionString() << std::endl;
        std::cout << heartsock::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--listen=") == 0) {
        std::string ip;
        uint16_t port = 0;
        if (!heartsock::util::ParseIPPort(arg.substr(9), ip, port)) {
          std::cerr << "Error: Invalid listen endpoint: " << arg.substr(9) << std::endl;
          std::cerr << "Expected <ip>:<port> or [<ipv6>]:<port>" << std::endl;
          return 1;
        }
        net.listen_address = ip;
        net.listen_port = port;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--handshake-timeout=") == 0) {
        if (!ParseSeconds("handshake timeout", arg.substr(20), net.handshake_timeout)) {
          return 1;
        }
      } else if (arg.find("--liveness-timeout=") == 0) {
        if (!ParseSeconds("liveness timeout", arg.substr(19), net.liveness_timeout)) {
          return 1;
        }
      } else if (arg.find("--heartbeat-interval=") == 0) {
        if (!ParseSeconds("heartbeat interval", arg.substr(21), net.heartbeat_interval)) {
          return 1;
        }
      } else if (arg == "--nomdns") {
        config.mdns_enabled = false;
      } else if (arg.find("--advertise-ip=") == 0) {
        auto ip = heartsock::util::ValidateAndNormalizeIP(arg.substr(15));
        if (!ip) {
          std::cerr << "Error: Invalid advertise address: " << arg.substr(15) << std::endl;
          return 1;
        }
        config.advertise_config.advertise_ip = boost::asio::ip::make_address(*ip);
      } else if (arg == "--mdns-all-addresses") {
        config.advertise_config.all_addresses = true;
      } else if (arg.find("--loglevel=") == 0) {
        config.log_level = arg.substr(11);
        if (!ValidLogLevel(config.log_level)) {
          std::cerr << "Error: Invalid log level: " << config.log_level << std::endl;
          return 1;
        }
      } else if (arg.find("--debug=") == 0) {
        for (const auto &component : heartsock::util::SplitList(arg.substr(8))) {
          const auto &known = heartsock::util::LogManager::Components();
          if (component != "all" &&
              std::find(known.begin(), known.end(), component) == known.end()) {
            std::cerr << "Error: Unknown debug component: " << component << std::endl;
            return 1;
          }
          config.debug_components.push_back(component);
        }
      } else if (arg.find("--logfile=") == 0) {
        config.log_file = arg.substr(10);
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (net.liveness_timeout <= net.heartbeat_interval) {
      std::cerr << "Error: --liveness-timeout must be greater than --heartbeat-interval"
                << std::endl;
      return 1;
    }

    heartsock::util::LogManager::Initialize(config.log_level,
                                            !config.log_file.empty(),
                                            config.log_file);

    for (const auto &component : config.debug_components) {
      if (component == "all") {
        heartsock::util::LogManager::SetLogLevel("trace");
      } else {
        heartsock::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    {
      heartsock::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      app.wait_for_shutdown();
    }

    heartsock::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    heartsock::util::LogManager::Shutdown();
    return 1;
  }
}
