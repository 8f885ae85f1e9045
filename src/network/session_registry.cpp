// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "network/session_registry.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace heartsock {
namespace network {

void SessionRegistry::register_session(const SessionPtr &session) {
  if (!session) {
    throw RegistryInvariantViolation("attempt to register a null session");
  }
  const uint64_t id = session->id();

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = sessions_.try_emplace(id, session);
  if (!inserted) {
    throw RegistryInvariantViolation("duplicate session id " +
                                     std::to_string(id));
  }
  LOG_NET_TRACE("registered session {} ({} total)", id, sessions_.size());
}

bool SessionRegistry::unregister(uint64_t id) {
  EmptyCallback on_empty;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(id) == 0) {
      return false;
    }
    LOG_NET_TRACE("unregistered session {} ({} remaining)", id,
                  sessions_.size());
    if (sessions_.empty()) {
      on_empty = empty_callback_;
    }
  }
  if (on_empty) {
    on_empty();
  }
  return true;
}

std::vector<SessionPtr> SessionRegistry::snapshot() const {
  std::vector<SessionPtr> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(sessions_.size());
    for (const auto &[id, weak] : sessions_) {
      if (auto session = weak.lock()) {
        result.push_back(std::move(session));
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const SessionPtr &a, const SessionPtr &b) {
              return a->id() < b->id();
            });
  return result;
}

SessionPtr SessionRegistry::find(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second.lock();
}

size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

void SessionRegistry::set_empty_callback(EmptyCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  empty_callback_ = std::move(callback);
}

} // namespace network
} // namespace heartsock
