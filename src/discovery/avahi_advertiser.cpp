// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "discovery/avahi_advertiser.hpp"
#include "util/logging.hpp"
#include <avahi-client/client.h>
#include <avahi-client/publish.h>
#include <avahi-common/address.h>
#include <avahi-common/error.h>
#include <avahi-common/strlst.h>
#include <avahi-common/thread-watch.h>
#include <net/if.h>
#include <vector>

namespace heartsock {
namespace discovery {

namespace {

// Avahi wants names without the trailing dot and the type without ".local"
std::string StripSuffix(std::string name, const std::string &suffix) {
  if (name.size() >= suffix.size() &&
      name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
    name.erase(name.size() - suffix.size());
  }
  return name;
}

// Interfaces owning the advertised addresses, AVAHI_IF_UNSPEC if none known
std::vector<AvahiIfIndex> InterfaceIndexes(const std::vector<std::string> &names) {
  std::vector<AvahiIfIndex> indexes;
  for (const auto &name : names) {
    const unsigned index = if_nametoindex(name.c_str());
    if (index != 0) {
      indexes.push_back(static_cast<AvahiIfIndex>(index));
    }
  }
  if (indexes.empty()) {
    indexes.push_back(AVAHI_IF_UNSPEC);
  }
  return indexes;
}

void ClientCallback(AvahiClient *, AvahiClientState state, void *userdata) {
  auto *failed = static_cast<std::atomic<bool> *>(userdata);
  if (state == AVAHI_CLIENT_FAILURE) {
    failed->store(true);
    LOG_DISC_ERROR("Avahi client failure");
  }
}

void GroupCallback(AvahiEntryGroup *, AvahiEntryGroupState state, void *) {
  switch (state) {
  case AVAHI_ENTRY_GROUP_ESTABLISHED:
    LOG_DISC_DEBUG("Avahi entry group established");
    break;
  case AVAHI_ENTRY_GROUP_COLLISION:
    LOG_DISC_ERROR("Avahi reported a name collision for the service");
    break;
  case AVAHI_ENTRY_GROUP_FAILURE:
    LOG_DISC_ERROR("Avahi entry group failure");
    break;
  default:
    break;
  }
}

} // namespace

AvahiAdvertiser::AvahiAdvertiser() = default;

AvahiAdvertiser::~AvahiAdvertiser() {
  std::optional<AdvertisedRecord> record;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    record = current_;
  }
  if (record) {
    withdraw(*record);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  release_client();
}

void AvahiAdvertiser::ensure_client() {
  if (client_ && !client_failed_) {
    return;
  }
  release_client();
  client_failed_ = false;

  poll_ = avahi_threaded_poll_new();
  if (!poll_) {
    throw AdvertiseError("cannot create Avahi threaded poll");
  }

  int error = 0;
  client_ = avahi_client_new(avahi_threaded_poll_get(poll_),
                             static_cast<AvahiClientFlags>(0), ClientCallback,
                             &client_failed_, &error);
  if (!client_) {
    release_client();
    throw AdvertiseError(std::string("cannot connect to avahi-daemon: ") +
                         avahi_strerror(error));
  }

  if (avahi_threaded_poll_start(poll_) < 0) {
    release_client();
    throw AdvertiseError("cannot start Avahi poll thread");
  }
}

void AvahiAdvertiser::release_client() {
  if (poll_) {
    avahi_threaded_poll_stop(poll_);
  }
  // Freeing the client also frees its entry groups
  if (client_) {
    avahi_client_free(client_);
  }
  if (poll_) {
    avahi_threaded_poll_free(poll_);
  }
  group_ = nullptr;
  client_ = nullptr;
  poll_ = nullptr;
}

AdvertisedRecord AvahiAdvertiser::publish(const ServiceRecordInput &input) {
  if (input.addresses.empty() || input.host_name.empty() || input.port == 0) {
    throw AdvertiseError("incomplete service record (address, host name or port missing)");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ensure_client();

  const std::string type = StripSuffix(input.service_type, ".local.");
  const std::string host = StripSuffix(input.host_name, ".");

  avahi_threaded_poll_lock(poll_);
  std::string failure;
  int ret = 0;

  if (!group_) {
    group_ = avahi_entry_group_new(client_, GroupCallback, nullptr);
    if (!group_) {
      failure = std::string("cannot create entry group: ") +
                avahi_strerror(avahi_client_errno(client_));
    }
  } else {
    avahi_entry_group_reset(group_);
  }

  const auto interfaces = InterfaceIndexes(input.interfaces);
  for (size_t n = 0; failure.empty() && n < interfaces.size(); ++n) {
    AvahiStringList *txt = nullptr;
    for (const auto &entry : input.txt) {
      txt = avahi_string_list_add(txt, entry.c_str());
    }
    ret = avahi_entry_group_add_service_strlst(
        group_, interfaces[n], AVAHI_PROTO_UNSPEC,
        static_cast<AvahiPublishFlags>(0), input.instance_name.c_str(),
        type.c_str(), nullptr, host.c_str(), input.port, txt);
    avahi_string_list_free(txt);
    if (ret < 0) {
      failure = std::string("cannot add service: ") + avahi_strerror(ret);
      break;
    }

    for (size_t i = 0; i < input.addresses.size(); ++i) {
      AvahiAddress address;
      // avahi parses plain addresses only; the scope is the interface
      const auto &addr = input.addresses[i];
      const std::string text =
          addr.is_v6()
              ? boost::asio::ip::address_v6(addr.to_v6().to_bytes()).to_string()
              : addr.to_string();
      if (!avahi_address_parse(text.c_str(), AVAHI_PROTO_UNSPEC, &address)) {
        failure = "cannot parse address " + text;
        break;
      }
      ret = avahi_entry_group_add_address(group_, interfaces[n],
                                          AVAHI_PROTO_UNSPEC,
                                          AVAHI_PUBLISH_NO_REVERSE,
                                          host.c_str(), &address);
      if (ret < 0) {
        failure = "cannot add address " + text + ": " + avahi_strerror(ret);
        break;
      }
    }
  }

  if (failure.empty()) {
    ret = avahi_entry_group_commit(group_);
    if (ret < 0) {
      failure = std::string("cannot commit entry group: ") + avahi_strerror(ret);
    }
  }

  if (!failure.empty() && group_) {
    avahi_entry_group_reset(group_);
  }
  avahi_threaded_poll_unlock(poll_);

  if (!failure.empty()) {
    current_.reset();
    throw AdvertiseError(failure);
  }

  AdvertisedRecord record;
  record.handle = next_handle_++;
  record.service_type = input.service_type;
  record.instance_name = input.instance_name;
  record.host_name = input.host_name;
  record.addresses = input.addresses;
  record.interfaces = input.interfaces;
  record.port = input.port;
  record.txt = input.txt;
  record.generation = input.generation;
  current_ = record;

  LOG_DISC_DEBUG("registered {} with avahi-daemon (generation {})",
                 record.full_name(), record.generation);
  return record;
}

void AvahiAdvertiser::withdraw(const AdvertisedRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (record.handle == 0 || !current_ || current_->handle != record.handle) {
    return;
  }
  current_.reset();

  if (!poll_ || !group_) {
    return;
  }
  avahi_threaded_poll_lock(poll_);
  int ret = avahi_entry_group_reset(group_);
  avahi_threaded_poll_unlock(poll_);
  if (ret < 0) {
    LOG_DISC_WARN("cannot reset Avahi entry group: {}", avahi_strerror(ret));
  } else {
    LOG_DISC_DEBUG("withdrew {} (generation {})", record.full_name(),
                   record.generation);
  }
}

std::unique_ptr<ServiceAdvertiser> CreateServiceAdvertiser() {
  return std::make_unique<AvahiAdvertiser>();
}

} // namespace discovery
} // namespace heartsock
