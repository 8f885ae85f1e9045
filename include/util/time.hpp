// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace heartsock {
namespace util {

/**
 * Mockable time source
 *
 * Production code reads time through GetTime()/GetSteadyTime(). Tests call
 * SetMockTime() / AdvanceMockTime() to move the clock without sleeping.
 *
 * While mocking is active the steady clock is simulated: it is anchored to the
 * real steady clock at the moment mocking was enabled and then moves by
 * exactly the amount the mock time moves. Mock time should only move forward.
 */

// Unix time in seconds (mock time if set)
int64_t GetTime();

std::chrono::steady_clock::time_point GetSteadyTime();

/**
 * Set mock time (Unix seconds). 0 disables mocking and returns to real time.
 */
void SetMockTime(int64_t time);

/**
 * Move mock time forward with millisecond precision.
 * No-op when mocking is disabled.
 */
void AdvanceMockTime(std::chrono::milliseconds delta);

// Current mock time in seconds, 0 when disabled
int64_t GetMockTime();

// "2025-10-25 14:33:09 UTC"
std::string FormatTime(int64_t unix_time);

// Sets mock time for the lifetime of the scope, then restores the previous
// setting.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }
  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace heartsock
