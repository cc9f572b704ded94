#pragma once

#include "forecast/domain.h"
#include "forecast/outliers.h"
#include "forecast/types.h"
#include "source/source.h"
#include "util/config.h"
#include "util/times.h"

#include <expected>
#include <optional>
#include <string>
#include <vector>

struct CategoryForecast {
  ConsensusBand band;
  std::vector<OutlierMarker> outliers;
  int n_articles = 0;
};

using CategoryOutcome = std::expected<CategoryForecast, CategoryError>;

inline constexpr std::string_view DATA_ERROR_LABEL = "Data Error";

// Placeholder band shown for a category whose computation failed.
ConsensusBand data_error_band(const std::string& category);

// Turns per-category article statistics into consensus bands and outlier
// markers. Holds no state between calls; concurrent generate_forecast calls
// are safe as long as the source is.
class ForecastEngine {
  const DistributionSource& source;
  ForecastConfig cfg;
  DomainClassifier classifier;
  CuratedScenarioLibrary scenarios;
  StatisticalOutlierDetector detector;
  size_t sample_article_limit;

 public:
  ForecastEngine(const DistributionSource& source,
                 ForecastConfig cfg = {},
                 DomainClassifier classifier = {},
                 CuratedScenarioLibrary scenarios = {},
                 size_t sample_article_limit = 5);

  ForecastResult generate_forecast(
      const std::string& topic,
      const Timeframe& timeframe,
      const std::optional<std::vector<std::string>>& categories =
          std::nullopt) const;

  // Topics that have at least one category. Empty when the source fails.
  std::vector<std::string> topics_with_categories() const;

  // Fetches and computes one category; failures come back as CategoryError.
  CategoryOutcome forecast_category(const std::string& topic,
                                    const Timeframe& timeframe,
                                    const std::string& category,
                                    size_t index = 0) const;

  // Pure parts, no source access.
  ConsensusBand consensus_band(const CategoryDistribution& dist) const;
  std::vector<OutlierMarker> outliers(const CategoryDistribution& dist) const;

  const ForecastConfig& config() const { return cfg; }
  CategoryDomains domains_of(const std::string& category) const {
    return classifier.classify(category);
  }

 private:
  std::string resolve_topic(const std::string& topic,
                            std::vector<std::string>& categories) const;

  void attach_articles(std::vector<OutlierMarker>& markers,
                       const std::string& topic,
                       const std::string& category,
                       const Timeframe& timeframe) const;

  // Counts the filtered categories, including those past max_categories.
  int count_articles(const std::string& topic,
                     const Timeframe& timeframe,
                     const std::vector<std::string>& categories,
                     const std::vector<CategoryOutcome>& outcomes) const;
};
