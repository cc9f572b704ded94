#pragma once

#include "forecast/domain.h"
#include "forecast/types.h"
#include "util/config.h"

#include <string>
#include <string_view>

inline constexpr TimelineIndex UNKNOWN_TIME_INDEX = 2;

// Weighted centre and dispersion of a time-to-impact histogram.
struct TimelinePosition {
  double mean = UNKNOWN_TIME_INDEX;
  double spread = 1.0;
  int total = 0;
};

struct TimelineBand {
  TimelineIndex start = 0;
  TimelineIndex end = 0;

  bool operator==(const TimelineBand&) const = default;
};

enum class BandWidth { Narrow, Medium, Wide };

// "immediate" -> 0, "short-term" -> 1, "mid-term" -> 3, "long-term" -> 6;
// anything unrecognized sits at UNKNOWN_TIME_INDEX.
TimelineIndex time_to_impact_index(std::string_view label);

// Empty histograms yield the neutral position (mean 2, spread 1).
TimelinePosition weigh_timeline(const Histogram& time_to_impact);

BandWidth band_width(const TimelinePosition& pos, const ForecastConfig& cfg);
TimelineBand size_band(const TimelinePosition& pos, const ForecastConfig& cfg);

// Clamps both bounds to [0, max_index] and keeps start <= end. A band that
// clamping collapses to a point is widened to [start, start + 1].
TimelineBand clamp_band(TimelineBand band, int max_index);

// Applies the domain's lag or lead to the band, at most one rule per domain.
TimelineBand adjust_for_domain(TimelineBand band, Domain domain, int max_index);

// "2024" ... and "<year>+" for the last index.
std::string year_label(TimelineIndex idx, const ForecastConfig& cfg);
