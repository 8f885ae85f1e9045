// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "network/message_dispatcher.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace heartsock::network;

TEST_CASE("MessageDispatcher - Basic registration and dispatch", "[network][message_dispatcher]") {
  MessageDispatcher dispatcher;

  SECTION("Register and dispatch handler") {
    bool handler_called = false;
    std::vector<std::string> received_args;

    dispatcher.RegisterHandler("get", [&](const SessionPtr &session,
                                          const std::vector<std::string> &args) {
      handler_called = true;
      received_args = args;
      return session == nullptr;
    });

    REQUIRE(dispatcher.HasHandler("get"));

    // Dispatcher only passes the session through
    REQUIRE(dispatcher.Dispatch(nullptr, "get bpm"));
    REQUIRE(handler_called);
    REQUIRE(received_args == std::vector<std::string>{"bpm"});
  }

  SECTION("Dispatch to non-existent handler returns false") {
    REQUIRE_FALSE(dispatcher.Dispatch(nullptr, "nonexistent"));
  }

  SECTION("Empty and blank frames return false") {
    REQUIRE_FALSE(dispatcher.Dispatch(nullptr, ""));
    REQUIRE_FALSE(dispatcher.Dispatch(nullptr, "   \t"));
  }

  SECTION("HasHandler returns false for unregistered command") {
    REQUIRE_FALSE(dispatcher.HasHandler("unknown"));
  }
}

TEST_CASE("MessageDispatcher - Tokenizing", "[network][message_dispatcher]") {
  MessageDispatcher dispatcher;
  std::vector<std::string> received_args;
  int calls = 0;

  dispatcher.RegisterHandler("set", [&](const SessionPtr &,
                                        const std::vector<std::string> &args) {
    ++calls;
    received_args = args;
    return true;
  });

  SECTION("Verb and arguments are lower-cased") {
    REQUIRE(dispatcher.Dispatch(nullptr, "SET BPM 80"));
    REQUIRE(received_args == std::vector<std::string>{"bpm", "80"});
  }

  SECTION("Runs of whitespace separate tokens") {
    REQUIRE(dispatcher.Dispatch(nullptr, "  set\tbattery    55 \n"));
    REQUIRE(received_args == std::vector<std::string>{"battery", "55"});
  }

  SECTION("Prefix of a verb does not match") {
    REQUIRE_FALSE(dispatcher.Dispatch(nullptr, "se bpm 1"));
    REQUIRE_FALSE(dispatcher.Dispatch(nullptr, "settings"));
    REQUIRE(calls == 0);
  }
}

TEST_CASE("MessageDispatcher - Multiple handlers", "[network][message_dispatcher]") {
  MessageDispatcher dispatcher;

  int ping_count = 0;
  int status_count = 0;

  dispatcher.RegisterHandler("ping", [&](const SessionPtr &, const std::vector<std::string> &) {
    ++ping_count;
    return true;
  });
  dispatcher.RegisterHandler("status", [&](const SessionPtr &, const std::vector<std::string> &) {
    ++status_count;
    return true;
  });

  REQUIRE(dispatcher.Dispatch(nullptr, "ping"));
  REQUIRE(dispatcher.Dispatch(nullptr, "PING"));
  REQUIRE(dispatcher.Dispatch(nullptr, "status"));

  REQUIRE(ping_count == 2);
  REQUIRE(status_count == 1);

  auto commands = dispatcher.GetRegisteredCommands();
  REQUIRE(commands == std::vector<std::string>{"ping", "status"});
}

TEST_CASE("MessageDispatcher - Handler results", "[network][message_dispatcher]") {
  MessageDispatcher dispatcher;

  SECTION("Handler returning false fails the dispatch") {
    dispatcher.RegisterHandler("ping", [](const SessionPtr &, const std::vector<std::string> &args) {
      return args.empty();
    });
    REQUIRE(dispatcher.Dispatch(nullptr, "ping"));
    REQUIRE_FALSE(dispatcher.Dispatch(nullptr, "ping extra"));
  }

  SECTION("Handler exception is contained") {
    dispatcher.RegisterHandler("get", [](const SessionPtr &, const std::vector<std::string> &) -> bool {
      throw std::runtime_error("boom");
    });
    REQUIRE_FALSE(dispatcher.Dispatch(nullptr, "get bpm"));
  }
}

TEST_CASE("MessageDispatcher - Registration edge cases", "[network][message_dispatcher]") {
  MessageDispatcher dispatcher;

  SECTION("Empty command and empty handler are rejected") {
    dispatcher.RegisterHandler("", [](const SessionPtr &, const std::vector<std::string> &) {
      return true;
    });
    dispatcher.RegisterHandler("ping", MessageDispatcher::CommandHandler{});
    REQUIRE(dispatcher.GetRegisteredCommands().empty());
  }

  SECTION("Re-registering replaces the handler") {
    int first = 0;
    int second = 0;
    dispatcher.RegisterHandler("ping", [&](const SessionPtr &, const std::vector<std::string> &) {
      ++first;
      return true;
    });
    dispatcher.RegisterHandler("ping", [&](const SessionPtr &, const std::vector<std::string> &) {
      ++second;
      return true;
    });
    REQUIRE(dispatcher.Dispatch(nullptr, "ping"));
    REQUIRE(first == 0);
    REQUIRE(second == 1);
  }

  SECTION("Unregister") {
    dispatcher.RegisterHandler("ping", [](const SessionPtr &, const std::vector<std::string> &) {
      return true;
    });
    dispatcher.UnregisterHandler("ping");
    REQUIRE_FALSE(dispatcher.HasHandler("ping"));
    REQUIRE_FALSE(dispatcher.Dispatch(nullptr, "ping"));
    // Unregistering again is harmless
    dispatcher.UnregisterHandler("ping");
  }

  SECTION("Handler may unregister itself while running") {
    dispatcher.RegisterHandler("once", [&](const SessionPtr &, const std::vector<std::string> &) {
      dispatcher.UnregisterHandler("once");
      return true;
    });
    REQUIRE(dispatcher.Dispatch(nullptr, "once"));
    REQUIRE_FALSE(dispatcher.Dispatch(nullptr, "once"));
  }
}
