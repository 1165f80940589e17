#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace staging::util {

/*
  Time utilities. Single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

constexpr uint64_t HoursToMillis(uint64_t hours) {
  return hours * 3'600'000ULL;
}

// UTC calendar date, YYYY-MM-DD.
std::string FormatDate(TimePoint tp);

} // namespace staging::util
