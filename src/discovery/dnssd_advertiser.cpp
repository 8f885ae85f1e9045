// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "discovery/dnssd_advertiser.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <boost/asio/ip/host_name.hpp>
#include <cerrno>
#include <cstring>
#include <net/if.h>
#include <poll.h>

namespace heartsock {
namespace discovery {

namespace dnssd {

std::string RegistrationType(const std::string &service_type) {
  std::string type = service_type;
  for (const std::string suffix : {".local.", ".local", "."}) {
    if (type.size() > suffix.size() &&
        type.compare(type.size() - suffix.size(), suffix.size(), suffix) == 0) {
      type.erase(type.size() - suffix.size());
      break;
    }
  }
  return type;
}

std::string BuildTxtRecord(const std::vector<std::string> &entries) {
  TXTRecordRef txt;
  TXTRecordCreate(&txt, 0, nullptr);
  for (const auto &entry : entries) {
    const auto eq = entry.find('=');
    const std::string key = entry.substr(0, eq);
    DNSServiceErrorType err;
    if (eq == std::string::npos) {
      err = TXTRecordSetValue(&txt, key.c_str(), 0, nullptr);
    } else {
      const std::string value = entry.substr(eq + 1);
      err = TXTRecordSetValue(&txt, key.c_str(),
                              static_cast<uint8_t>(value.size()), value.data());
    }
    if (err != kDNSServiceErr_NoError) {
      LOG_DISC_WARN("skipping TXT entry '{}': {}", entry, ErrorName(err));
    }
  }
  std::string bytes;
  if (TXTRecordGetLength(&txt) > 0) {
    bytes.assign(static_cast<const char *>(TXTRecordGetBytesPtr(&txt)),
                 TXTRecordGetLength(&txt));
  }
  TXTRecordDeallocate(&txt);
  return bytes;
}

std::vector<uint32_t> InterfaceIndexes(const std::vector<std::string> &names) {
  std::vector<uint32_t> indexes;
  for (const auto &name : names) {
    const unsigned index = if_nametoindex(name.c_str());
    if (index == 0) {
      LOG_DISC_DEBUG("interface {} has no index, skipping", name);
      continue;
    }
    if (std::find(indexes.begin(), indexes.end(), index) == indexes.end()) {
      indexes.push_back(index);
    }
  }
  if (indexes.empty()) {
    indexes.push_back(kDNSServiceInterfaceIndexAny);
  }
  return indexes;
}

const char *ErrorName(DNSServiceErrorType error) {
  switch (error) {
  case kDNSServiceErr_NoError:
    return "no error";
  case kDNSServiceErr_ServiceNotRunning:
    return "mDNS daemon not running";
  case kDNSServiceErr_NameConflict:
    return "name conflict";
  case kDNSServiceErr_BadParam:
    return "bad parameter";
  case kDNSServiceErr_NoMemory:
    return "out of memory";
  case kDNSServiceErr_Unsupported:
    return "unsupported";
  case kDNSServiceErr_Refused:
    return "refused";
  case kDNSServiceErr_Timeout:
    return "timeout";
  default:
    return "DNS-SD error";
  }
}

} // namespace dnssd

namespace {

struct RegisterResult {
  bool done{false};
  DNSServiceErrorType error{kDNSServiceErr_NoError};
  std::string name;
};

void DNSSD_API RegisterReply(DNSServiceRef, DNSServiceFlags,
                             DNSServiceErrorType error, const char *name,
                             const char *, const char *, void *context) {
  auto *result = static_cast<RegisterResult *>(context);
  result->done = true;
  result->error = error;
  if (name) {
    result->name = name;
  }
}

} // namespace

DnsSdAdvertiser::DnsSdAdvertiser() : DnsSdAdvertiser(Options{}) {}

DnsSdAdvertiser::DnsSdAdvertiser(const Options &options) : options_(options) {}

DnsSdAdvertiser::~DnsSdAdvertiser() {
  std::lock_guard<std::mutex> lock(mutex_);
  release_locked();
  current_.reset();
}

DNSServiceRef DnsSdAdvertiser::register_on(uint32_t interface_index,
                                           const ServiceRecordInput &input,
                                           const std::string &txt) {
  const std::string type = dnssd::RegistrationType(input.service_type);
  RegisterResult result;
  DNSServiceRef ref = nullptr;

  DNSServiceErrorType err = DNSServiceRegister(
      &ref, kDNSServiceFlagsNoAutoRename, interface_index,
      input.instance_name.c_str(), type.c_str(), nullptr, nullptr,
      htons(input.port), static_cast<uint16_t>(txt.size()),
      txt.empty() ? nullptr : txt.data(), RegisterReply, &result);
  if (err != kDNSServiceErr_NoError) {
    throw AdvertiseError(std::string("DNSServiceRegister failed: ") +
                         dnssd::ErrorName(err) + " (" + std::to_string(err) + ")");
  }

  // The reply arrives on the daemon socket
  const int fd = DNSServiceRefSockFD(ref);
  const auto deadline = std::chrono::steady_clock::now() + options_.register_timeout;
  while (!result.done) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (fd < 0 || remaining.count() <= 0) {
      DNSServiceRefDeallocate(ref);
      throw AdvertiseError("no registration reply from the mDNS daemon");
    }
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0 && errno == EINTR) {
      continue;
    }
    if (ready < 0) {
      const std::string what = std::strerror(errno);
      DNSServiceRefDeallocate(ref);
      throw AdvertiseError("poll on the mDNS daemon socket failed: " + what);
    }
    if (ready == 0) {
      continue;
    }
    err = DNSServiceProcessResult(ref);
    if (err != kDNSServiceErr_NoError) {
      DNSServiceRefDeallocate(ref);
      throw AdvertiseError(std::string("lost the mDNS daemon: ") +
                           dnssd::ErrorName(err));
    }
  }

  if (result.error != kDNSServiceErr_NoError) {
    DNSServiceRefDeallocate(ref);
    throw AdvertiseError(std::string("registration rejected: ") +
                         dnssd::ErrorName(result.error));
  }
  LOG_DISC_TRACE("registered '{}' on interface index {}", result.name,
                 interface_index);
  return ref;
}

void DnsSdAdvertiser::release_locked() {
  for (DNSServiceRef ref : refs_) {
    DNSServiceRefDeallocate(ref);
  }
  refs_.clear();
}

AdvertisedRecord DnsSdAdvertiser::publish(const ServiceRecordInput &input) {
  if (input.addresses.empty() || input.port == 0) {
    throw AdvertiseError("incomplete service record (address or port missing)");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // A publish replaces whatever is registered
  release_locked();
  current_.reset();

  const std::string txt = dnssd::BuildTxtRecord(input.txt);
  std::vector<DNSServiceRef> refs;
  try {
    for (uint32_t index : dnssd::InterfaceIndexes(input.interfaces)) {
      refs.push_back(register_on(index, input, txt));
    }
  } catch (const AdvertiseError &) {
    for (DNSServiceRef ref : refs) {
      DNSServiceRefDeallocate(ref);
    }
    throw;
  }
  refs_ = std::move(refs);

  AdvertisedRecord record;
  record.handle = next_handle_++;
  record.service_type = input.service_type;
  record.instance_name = input.instance_name;
  // The daemon publishes the service under the system host name
  boost::system::error_code ec;
  const std::string host = boost::asio::ip::host_name(ec);
  record.host_name = ec ? input.host_name : host + ".local.";
  record.addresses = input.addresses;
  record.interfaces = input.interfaces;
  record.port = input.port;
  record.txt = input.txt;
  record.generation = input.generation;
  current_ = record;

  LOG_DISC_DEBUG("registered {} with the DNS-SD daemon on {} interface(s) "
                 "(generation {})",
                 record.full_name(), refs_.size(), record.generation);
  return record;
}

void DnsSdAdvertiser::withdraw(const AdvertisedRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (record.handle == 0 || !current_ || current_->handle != record.handle) {
    return;
  }
  current_.reset();
  release_locked();
  LOG_DISC_DEBUG("withdrew {} (generation {})", record.full_name(),
                 record.generation);
}

std::unique_ptr<ServiceAdvertiser> CreateServiceAdvertiser() {
  return std::make_unique<DnsSdAdvertiser>();
}

} // namespace discovery
} // namespace heartsock
