// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include "network/session.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace heartsock {
namespace network {

// Thrown when the registry detects an impossible state (duplicate id).
// Treated as fatal by NetworkManager.
class RegistryInvariantViolation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

/**
 * SessionRegistry - every session that has not reached Closed, keyed by id
 *
 * Holds weak_ptrs only; sessions own themselves through their pending
 * asynchronous operations. Structural mutation and snapshot production are
 * serialized by one mutex, snapshots are consumed without it.
 *
 * Ids start at 1 and are never reused within the process.
 */
class SessionRegistry {
public:
  using EmptyCallback = std::function<void()>;

  SessionRegistry() = default;

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  uint64_t next_id() { return next_id_.fetch_add(1); }

  // Throws RegistryInvariantViolation if the id is already present
  void register_session(const SessionPtr &session);

  // Idempotent. Returns true if an entry was removed.
  bool unregister(uint64_t id);

  // Live sessions sorted by id
  std::vector<SessionPtr> snapshot() const;

  SessionPtr find(uint64_t id) const;

  size_t size() const;

  // Called (outside the lock) each time the last entry is removed
  void set_empty_callback(EmptyCallback callback);

private:
  mutable std::mutex mutex_;
  std::unordered_map<uint64_t, std::weak_ptr<Session>> sessions_;
  EmptyCallback empty_callback_;
  std::atomic<uint64_t> next_id_{1};
};

} // namespace network
} // namespace heartsock
