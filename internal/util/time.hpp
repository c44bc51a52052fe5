#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace resolver::util {

/*
  Time utilities. Wall clock for persisted timestamps, steady clock
  for stage durations.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMs();

// "2024-05-01T12:00:00.250Z"; 0 renders as "-".
std::string FormatUnixMillis(uint64_t ms);

// Milliseconds elapsed on the steady clock since `start`.
double ElapsedMs(std::chrono::steady_clock::time_point start);

} // namespace resolver::util
