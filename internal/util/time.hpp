#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace taskpilot::util {

/*
  Time helpers. All clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// Zero or negative durations yield `fallback`.
std::chrono::milliseconds ToChrono(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// Whole local calendar days from the day of `from` to the day of `to`.
// Negative when `to` falls on an earlier day.
int CalendarDaysBetween(TimePoint from, TimePoint to);

// Local calendar date as YYYY-MM-DD.
std::string FormatLocalDate(TimePoint tp);

// Parses YYYY-MM-DD as local noon of that day.
std::optional<TimePoint> ParseLocalDate(const std::string& text);

} // namespace taskpilot::util
