#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace systock::util {

/*
  Time utilities: the clock source and
  the textual formats stored in the warehouse.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Days      = std::chrono::sys_days;

// Injected into builders so load timestamps are reproducible in tests.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
int64_t  ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(int64_t micros);

// Accepts YYYY-MM-DD optionally followed by 'T' or ' ' and a time of day.
// The date is the one written in the text; any UTC offset is ignored.
std::optional<Days> ParseDate(std::string_view text);

// Accepts YYYY-MM-DD[(T| )HH:MM[:SS[.fraction]]][Z|(+|-)HH[:]MM].
// Offsets are applied, so the result is UTC.
std::optional<TimePoint> ParseTimestamp(std::string_view text);

// "YYYY-MM-DD HH:MM:SS.ffffff" in UTC. Fixed width, so text order is time order.
std::string FormatTimestamp(TimePoint tp);
std::string FormatDate(Days day);

// YYYYMMDD as an integer, e.g. 20240131.
int64_t DayKey(Days day);

unsigned IsoWeekday(Days day); // 1 = Monday ... 7 = Sunday
unsigned IsoWeek(Days day);    // 1 ... 53
unsigned Quarter(Days day);    // 1 ... 4

} // namespace systock::util
