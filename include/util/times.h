#pragma once

#include <chrono>
#include <string>
#include <string_view>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using SysClock = std::chrono::system_clock;
using SysTimePoint = std::chrono::sys_time<std::chrono::seconds>;

using LocalTimePoint = std::chrono::local_time<std::chrono::seconds>;

using milliseconds = std::chrono::milliseconds;
using seconds = std::chrono::seconds;
using minutes = std::chrono::minutes;
using hours = std::chrono::hours;
using days = std::chrono::days;

LocalTimePoint datetime_to_local(std::string_view datetime,
                                 std::string_view fmt = "%F %T");

inline LocalTimePoint date_to_local(std::string_view date) {
  return datetime_to_local(date, "%F");
}

// file name friendly stamp, e.g. 20250131_154500
std::string timestamp_str(SysTimePoint tp);

struct Timer {
  TimePoint start;
  Timer() : start{Clock::now()} {}
  double diff_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start)
        .count();
  }
};
