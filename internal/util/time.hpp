#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace threadnet::util {

/*
  Time utilities. All clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

int64_t   ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(int64_t micros);

// "2023-02-02T09:41:13.746514+00:00"; the fraction is omitted when zero.
std::string ToIsoString(TimePoint tp);

} // namespace threadnet::util
