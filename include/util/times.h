#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using SysClock = std::chrono::system_clock;
using SysDays = std::chrono::sys_days;


// Lookback window of a forecast request, in days or unbounded.
struct Timeframe {
  static constexpr int DEFAULT_DAYS = 365;

  int days = DEFAULT_DAYS;
  bool all = false;

  static Timeframe unbounded() { return {0, true}; }

  bool contains(SysDays date, SysDays reference) const {
    return all || date >= reference - std::chrono::days{days};
  }

  std::string str() const {
    return all ? std::string{"all"} : std::to_string(days);
  }

  bool operator==(const Timeframe&) const = default;
};

// Accepts "1d", "1w", "1m", "90d", "180d", "365d", bare day counts, "Nd" and
// "all". Anything else falls back to 365 days.
Timeframe parse_timeframe(std::string_view str);

// Parses the leading "YYYY-MM-DD" of a date or datetime string.
std::optional<SysDays> parse_date(std::string_view str);

SysDays today_utc();

struct Timer {
  TimePoint start;
  Timer() : start{Clock::now()} {}
  double diff_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start)
        .count();
  }
};
