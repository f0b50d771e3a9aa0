#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace taskpilot::util {

namespace {

// Days since the epoch of the local calendar date containing `tp`.
int64_t LocalDayNumber(TimePoint tp) {
  std::time_t t = Clock::to_time_t(tp);
  std::tm     local{};
  localtime_r(&t, &local);

  // days_from_civil (Howard Hinnant)
  int64_t        y   = local.tm_year + 1900;
  const unsigned m   = static_cast<unsigned>(local.tm_mon + 1);
  const unsigned d   = static_cast<unsigned>(local.tm_mday);
  y                 -= m <= 2;
  const int64_t  era = (y >= 0 ? y : y - 399) / 400;
  const auto     yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec   -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

std::chrono::milliseconds ToChrono(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
  if (ms.count() <= 0) return fallback;
  return ms;
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

int CalendarDaysBetween(TimePoint from, TimePoint to) {
  return static_cast<int>(LocalDayNumber(to) - LocalDayNumber(from));
}

std::string FormatLocalDate(TimePoint tp) {
  std::time_t t = Clock::to_time_t(tp);
  std::tm     local{};
  localtime_r(&t, &local);

  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d");
  return out.str();
}

std::optional<TimePoint> ParseLocalDate(const std::string& text) {
  std::tm            local{};
  std::istringstream in(text);
  in >> std::get_time(&local, "%Y-%m-%d");
  if (in.fail() || in.peek() != std::char_traits<char>::eof()) return std::nullopt;

  local.tm_hour  = 12;
  local.tm_isdst = -1;
  const std::time_t t = std::mktime(&local);
  if (t == static_cast<std::time_t>(-1)) return std::nullopt;
  return Clock::from_time_t(t);
}

} // namespace taskpilot::util
