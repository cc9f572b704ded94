#include "util/times.h"
#include "util/strings.h"

#include <spdlog/spdlog.h>
#include <charconv>
#include <sstream>
#include <unordered_map>

using namespace std::chrono;

Timeframe parse_timeframe(std::string_view str) {
  static const std::unordered_map<std::string, int> named = {
      {"1d", 1},     {"1w", 7},     {"1m", 30},    {"90d", 90},
      {"180d", 180}, {"365d", 365},
  };

  auto tf = to_lower(trim(str));
  if (tf == "all")
    return Timeframe::unbounded();

  if (auto it = named.find(tf); it != named.end())
    return {it->second, false};

  std::string_view digits = tf;
  if (!digits.empty() && digits.back() == 'd')
    digits.remove_suffix(1);

  int n = 0;
  auto end = digits.data() + digits.size();
  auto [ptr, ec] = std::from_chars(digits.data(), end, n);
  if (ec != std::errc{} || ptr != end || n <= 0 ||
      digits.empty()) {
    spdlog::warn("[timeframe] invalid timeframe '{}', defaulting to {} days",
                 std::string{str}, Timeframe::DEFAULT_DAYS);
    return {};
  }

  return {n, false};
}

std::optional<SysDays> parse_date(std::string_view str) {
  str = trim(str);
  if (str.size() < 10)
    return std::nullopt;

  std::istringstream in{std::string{str.substr(0, 10)}};
  year_month_day ymd{};
  in >> parse("%F", ymd);
  if (in.fail() || !ymd.ok())
    return std::nullopt;

  return SysDays{ymd};
}

SysDays today_utc() {
  return floor<std::chrono::days>(system_clock::now());
}
