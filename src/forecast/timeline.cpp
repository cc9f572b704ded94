#include "forecast/timeline.h"
#include "util/strings.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <unordered_map>

inline const std::unordered_map<std::string, TimelineIndex> time_indices = {
    {"immediate", 0},   {"short-term", 1}, {"mid-term", 3},
    {"medium-term", 3}, {"long-term", 6},  {"unknown", UNKNOWN_TIME_INDEX},
};

TimelineIndex time_to_impact_index(std::string_view label) {
  auto it = time_indices.find(normalize_label(label));
  if (it == time_indices.end()) {
    spdlog::debug("[timeline] unrecognized time-to-impact '{}'",
                  std::string{label});
    return UNKNOWN_TIME_INDEX;
  }
  return it->second;
}

TimelinePosition weigh_timeline(const Histogram& time_to_impact) {
  TimelinePosition pos;

  double weighted = 0.0;
  for (auto& [label, count] : time_to_impact) {
    if (count <= 0)
      continue;
    weighted += time_to_impact_index(label) * static_cast<double>(count);
    pos.total += count;
  }

  if (pos.total == 0)
    return pos;

  pos.mean = weighted / pos.total;

  double variance = 0.0;
  for (auto& [label, count] : time_to_impact) {
    if (count <= 0)
      continue;
    auto d = time_to_impact_index(label) - pos.mean;
    variance += d * d * count;
  }
  pos.spread = std::sqrt(variance / pos.total);

  return pos;
}

BandWidth band_width(const TimelinePosition& pos, const ForecastConfig& cfg) {
  if (pos.spread < cfg.narrow_spread_threshold ||
      pos.total < cfg.min_count_for_narrow_band)
    return BandWidth::Narrow;
  if (pos.spread > cfg.wide_spread_threshold)
    return BandWidth::Wide;
  return BandWidth::Medium;
}

TimelineBand size_band(const TimelinePosition& pos, const ForecastConfig& cfg) {
  auto centre = static_cast<TimelineIndex>(pos.mean);

  TimelineBand band;
  switch (band_width(pos, cfg)) {
    case BandWidth::Narrow:
      band = {centre - 1, centre + 1};
      break;
    case BandWidth::Wide:
      band = {centre - 2, centre + 4};
      break;
    case BandWidth::Medium:
      band = {centre - 1, centre + 2};
      break;
  }

  return clamp_band(band, cfg.max_index);
}

TimelineBand clamp_band(TimelineBand band, int max_index) {
  bool had_width = band.end > band.start;

  band.start = std::clamp(band.start, 0, max_index);
  band.end = std::clamp(band.end, 0, max_index);

  // clamping may squash the interval; give it its width back where possible
  if (band.end < band.start || (had_width && band.end == band.start))
    band.end = std::min(max_index, band.start + 1);

  return band;
}

TimelineBand adjust_for_domain(TimelineBand band, Domain domain, int max_index) {
  auto& [start, end] = band;

  switch (domain) {
    case Domain::Healthcare:  // regulatory lag
      start = std::max(start + 1, 1);
      end = std::min(end + 2, 8);
      break;
    case Domain::Business:  // faster commercial adoption
      start = std::max(start - 1, 0);
      end = std::max(end - 1, start + 2);
      break;
    case Domain::Regulation:
      start = 0;
      end = std::min(end + 3, 9);
      break;
    case Domain::Software:
      start = std::max(start - 1, 0);
      end = std::min(start + 1, 4);
      break;
    case Domain::Robotics:  // long development cycles
      start = std::max(start + 1, 2);
      end = std::min(end + 3, 10);
      break;
    case Domain::Ethics:
      start = 0;
      end = std::min(end + 2, 8);
      break;
    case Domain::Carbon:
      start = 0;
      end = std::min(end + 4, 10);
      break;
    default:
      return band;
  }

  return clamp_band(band, max_index);
}

std::string year_label(TimelineIndex idx, const ForecastConfig& cfg) {
  idx = std::clamp(idx, 0, cfg.max_index);
  if (idx == cfg.max_index)
    return std::format("{}+", cfg.base_year + idx + 1);
  return std::to_string(cfg.base_year + idx);
}
