#pragma once

#include "forecast/domain.h"
#include "forecast/types.h"
#include "util/config.h"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Dissenting scenarios backed by the sentiment mix of a category. Only
// considered once a category has more than
// min_count_for_statistical_outliers labelled articles.
class StatisticalOutlierDetector {
  ForecastConfig cfg;

 public:
  explicit StatisticalOutlierDetector(const ForecastConfig& cfg) : cfg{cfg} {}

  std::vector<OutlierMarker> detect(const std::string& category,
                                    const Histogram& sentiment) const;
};

struct CuratedScenario {
  TimelineIndex x_position = 0;
  std::string label;
  Polarity polarity = Polarity::Optimistic;
};

// Pre-authored illustrative scenarios per domain. These are not derived from
// data and are appended after any statistical markers.
class CuratedScenarioLibrary {
  int version_ = 1;
  std::unordered_map<Domain, std::vector<CuratedScenario>> scenarios;

 public:
  CuratedScenarioLibrary();
  CuratedScenarioLibrary(
      int version,
      std::unordered_map<Domain, std::vector<CuratedScenario>> scenarios)
      : version_{version}, scenarios{std::move(scenarios)} {}

  // Replaces the built-in table with the one at path. Returns false and keeps
  // the current table when the file is missing or malformed.
  bool load(const std::string& path);

  const std::vector<CuratedScenario>& scenarios_for(Domain domain) const;

  std::vector<OutlierMarker> markers(const std::string& category,
                                     Domain domain,
                                     int max_index) const;

  int version() const { return version_; }
};
