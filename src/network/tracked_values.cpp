// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "network/tracked_values.hpp"
#include "network/protocol.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

namespace heartsock {
namespace network {

TrackedValues::TrackedValues(std::optional<std::filesystem::path> datadir)
    : datadir_(std::move(datadir)) {
  for (const auto &key : Keys()) {
    values_[key] = 0;
  }
}

bool TrackedValues::IsKnownKey(const std::string &key) {
  return key == protocol::keys::BPM || key == protocol::keys::BATTERY;
}

const std::vector<std::string> &TrackedValues::Keys() {
  static const std::vector<std::string> keys = {protocol::keys::BPM,
                                                protocol::keys::BATTERY};
  return keys;
}

std::optional<uint8_t> TrackedValues::get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

TrackedValues::SetOutcome TrackedValues::set(uint64_t session_id,
                                             const std::string &key,
                                             const std::string &value) {
  SetOutcome outcome;
  if (!IsKnownKey(key)) {
    outcome.result = SetResult::UnknownKey;
    return outcome;
  }
  auto parsed = util::SafeParseInt(value, 0, 255);
  if (!parsed) {
    outcome.result = SetResult::BadValue;
    return outcome;
  }
  const auto new_value = static_cast<uint8_t>(*parsed);

  std::lock_guard<std::mutex> lock(mutex_);
  if (tracker_id_ == 0) {
    tracker_id_ = session_id;
    LOG_NET_INFO("session {} is now the tracker", session_id);
  }
  if (tracker_id_ != session_id) {
    outcome.result = SetResult::TrackerConnected;
    return outcome;
  }

  uint8_t &slot = values_[key];
  outcome.result = SetResult::Ok;
  outcome.changed = slot != new_value;
  outcome.value = new_value;
  slot = new_value;

  if (outcome.changed) {
    LOG_NET_DEBUG("{} set to {}", key, static_cast<unsigned>(new_value));
    write_file_locked(key, new_value);
  }
  return outcome;
}

bool TrackedValues::release_tracker(uint64_t session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (session_id == 0 || tracker_id_ != session_id) {
    return false;
  }
  tracker_id_ = 0;
  LOG_NET_INFO("tracker session {} disconnected", session_id);
  return true;
}

uint64_t TrackedValues::tracker_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tracker_id_;
}

bool TrackedValues::write_all_files() const {
  std::lock_guard<std::mutex> lock(mutex_);
  bool ok = true;
  for (const auto &[key, value] : values_) {
    ok = write_file_locked(key, value) && ok;
  }
  return ok;
}

bool TrackedValues::write_file_locked(const std::string &key,
                                      uint8_t value) const {
  if (!datadir_) {
    return true;
  }
  const auto path = *datadir_ / (key + ".txt");
  if (!util::atomic_write_file(path, std::to_string(value))) {
    LOG_ERROR("failed to write {}", path.string());
    return false;
  }
  return true;
}

} // namespace network
} // namespace heartsock
