// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace heartsock {
namespace network {

class Session;
using SessionPtr = std::shared_ptr<Session>;

/**
 * MessageDispatcher - text command routing via handler registry
 *
 * An inbound frame is lower-cased and split on whitespace; the first token
 * selects the handler, the remaining tokens are its arguments.
 *
 * Handlers run synchronously on the io_context thread and return false when
 * the arguments are unusable; Dispatch() then reports failure so the caller
 * can answer "error: unknown input".
 *
 * Usage:
 *   MessageDispatcher dispatcher;
 *   dispatcher.RegisterHandler("ping",
 *     [](const SessionPtr& s, const std::vector<std::string>& args) {
 *       return s->send_text("pong");
 *     });
 *   dispatcher.Dispatch(session, "PING");
 */
class MessageDispatcher {
public:
  using CommandHandler = std::function<bool(
      const SessionPtr &, const std::vector<std::string> &args)>;

  MessageDispatcher() = default;
  ~MessageDispatcher() = default;

  MessageDispatcher(const MessageDispatcher &) = delete;
  MessageDispatcher &operator=(const MessageDispatcher &) = delete;

  /**
   * Register handler for a command verb (lower-case)
   * Empty verbs and empty handlers are rejected.
   */
  void RegisterHandler(const std::string &command, CommandHandler handler);

  void UnregisterHandler(const std::string &command);

  /**
   * Parse and dispatch one text frame
   *
   * @return false if the frame is empty, the verb has no handler, the handler
   * returned false, or the handler threw
   */
  bool Dispatch(const SessionPtr &session, const std::string &text);

  bool HasHandler(const std::string &command) const;

  // Sorted, for diagnostics
  std::vector<std::string> GetRegisteredCommands() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, CommandHandler> handlers_;
};

} // namespace network
} // namespace heartsock
