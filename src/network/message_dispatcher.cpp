// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "network/message_dispatcher.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <stdexcept>

namespace heartsock {
namespace network {

void MessageDispatcher::RegisterHandler(const std::string &command,
                                        CommandHandler handler) {
  if (command.empty()) {
    LOG_NET_WARN("Attempted to register handler for empty command");
    return;
  }
  if (!handler) {
    LOG_NET_ERROR("Attempted to register empty handler for command: {}", command);
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[command] = std::move(handler);
  LOG_NET_TRACE("Registered handler for command: {}", command);
}

void MessageDispatcher::UnregisterHandler(const std::string &command) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_.erase(command) > 0) {
    LOG_NET_TRACE("Unregistered handler for command: {}", command);
  }
}

bool MessageDispatcher::Dispatch(const SessionPtr &session,
                                 const std::string &text) {
  auto tokens = util::SplitWhitespace(util::ToLower(text));
  if (tokens.empty()) {
    return false;
  }
  const std::string command = tokens.front();
  tokens.erase(tokens.begin());

  CommandHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
      LOG_NET_TRACE("No handler for command: {}", command);
      return false;
    }
    handler = it->second;
  }

  // Execute outside the lock; handlers may register/unregister
  try {
    return handler(session, tokens);
  } catch (const std::exception &e) {
    LOG_NET_ERROR("Handler exception for command {}: {}", command, e.what());
    return false;
  }
}

bool MessageDispatcher::HasHandler(const std::string &command) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(command) > 0;
}

std::vector<std::string> MessageDispatcher::GetRegisteredCommands() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(handlers_.size());
  for (const auto &[cmd, _] : handlers_) {
    result.push_back(cmd);
  }
  std::sort(result.begin(), result.end());
  return result;
}

} // namespace network
} // namespace heartsock
