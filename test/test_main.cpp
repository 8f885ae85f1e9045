// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license
// Catch2 runner: logging is initialized once before any test runs

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string &level);
void ShutdownTestLogging();

int main(int argc, char *argv[]) {
  // HEARTSOCK_TEST_LOGLEVEL=debug to see component output while debugging
  const char *env_level = std::getenv("HEARTSOCK_TEST_LOGLEVEL");
  InitializeTestLogging(env_level ? env_level : "off");

  const int result = Catch::Session().run(argc, argv);

  ShutdownTestLogging();
  return result;
}
