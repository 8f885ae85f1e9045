// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace heartsock {
namespace network {

/**
 * TrackedValues - the presence payload published by one tracker session
 *
 * Two keys, "bpm" and "battery", each an unsigned 8-bit value starting at 0.
 * The first session that sets a value successfully becomes the tracker; other
 * sessions may read but not write until the tracker goes away.
 *
 * With a data directory, each value is mirrored to <datadir>/<key>.txt so
 * local tools (stream overlays) can poll it. File writes are atomic; failures
 * are logged and never affect the in-memory value.
 *
 * Thread-safety: all methods are thread-safe.
 */
class TrackedValues {
public:
  enum class SetResult {
    Ok,                // stored (possibly unchanged)
    UnknownKey,        // key is not bpm/battery
    BadValue,          // value is not an integer in 0..255
    TrackerConnected   // another session owns the values
  };

  struct SetOutcome {
    SetResult result{SetResult::UnknownKey};
    bool changed{false};
    uint8_t value{0};
  };

  explicit TrackedValues(std::optional<std::filesystem::path> datadir = std::nullopt);

  TrackedValues(const TrackedValues &) = delete;
  TrackedValues &operator=(const TrackedValues &) = delete;

  static bool IsKnownKey(const std::string &key);

  // Keys in wire order ("bpm", "battery")
  static const std::vector<std::string> &Keys();

  std::optional<uint8_t> get(const std::string &key) const;

  // Key is checked first, then the value, then tracker ownership.
  SetOutcome set(uint64_t session_id, const std::string &key,
                 const std::string &value);

  // Release the tracker slot if session_id holds it. Returns true if it did.
  bool release_tracker(uint64_t session_id);

  // 0 when there is no tracker
  uint64_t tracker_id() const;

  // Write every value file (used once at startup). No-op without a data
  // directory. Returns false if any write failed.
  bool write_all_files() const;

  const std::optional<std::filesystem::path> &datadir() const { return datadir_; }

private:
  bool write_file_locked(const std::string &key, uint8_t value) const;

  mutable std::mutex mutex_;
  std::map<std::string, uint8_t> values_;
  uint64_t tracker_id_{0};
  std::optional<std::filesystem::path> datadir_;
};

} // namespace network
} // namespace heartsock
