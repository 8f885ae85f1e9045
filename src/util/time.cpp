// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "util/time.hpp"
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace heartsock {
namespace util {

namespace {

// Mock clock state. mock_ms == 0 means mocking is disabled.
struct MockClock {
  std::mutex mutex;
  int64_t mock_ms{0};
  // Real steady time and mock time captured when mocking was enabled
  std::chrono::steady_clock::time_point steady_anchor;
  int64_t mock_anchor_ms{0};
};

MockClock &Clock() {
  static MockClock clock;
  return clock;
}

} // namespace

int64_t GetTime() {
  auto &clock = Clock();
  {
    std::lock_guard<std::mutex> lock(clock.mutex);
    if (clock.mock_ms != 0) {
      return clock.mock_ms / 1000;
    }
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  auto &clock = Clock();
  std::lock_guard<std::mutex> lock(clock.mutex);
  if (clock.mock_ms == 0) {
    return std::chrono::steady_clock::now();
  }
  return clock.steady_anchor +
         std::chrono::milliseconds(clock.mock_ms - clock.mock_anchor_ms);
}

void SetMockTime(int64_t time) {
  auto &clock = Clock();
  std::lock_guard<std::mutex> lock(clock.mutex);
  const bool was_mocking = clock.mock_ms != 0;
  clock.mock_ms = time * 1000;
  if (time != 0 && !was_mocking) {
    clock.steady_anchor = std::chrono::steady_clock::now();
    clock.mock_anchor_ms = clock.mock_ms;
  }
}

void AdvanceMockTime(std::chrono::milliseconds delta) {
  auto &clock = Clock();
  std::lock_guard<std::mutex> lock(clock.mutex);
  if (clock.mock_ms == 0) {
    return;
  }
  clock.mock_ms += delta.count();
}

int64_t GetMockTime() {
  auto &clock = Clock();
  std::lock_guard<std::mutex> lock(clock.mutex);
  return clock.mock_ms / 1000;
}

std::string FormatTime(int64_t unix_time) {
  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm tm_utc{};
  if (!gmtime_r(&t, &tm_utc)) {
    return "invalid";
  }
  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S UTC");
  return oss.str();
}

} // namespace util
} // namespace heartsock
