#pragma once

#include <string>
#include <vector>

// Position on the discrete forecast timeline, 0 is the base year.
using TimelineIndex = int;

struct LabelCount {
  std::string label;
  int count = 0;
};

// Label histogram in the order the source reported it.
using Histogram = std::vector<LabelCount>;

inline int histogram_total(const Histogram& h) {
  int total = 0;
  for (auto& [_, count] : h)
    total += count;
  return total;
}

enum class ConsensusType {
  PositiveGrowth,
  MixedConsensus,
  RegulatoryCritical,
  SafetySecurity,
  WarfareDefense,
  Geopolitical,
  BusinessAutomation,
  SocietalImpact,
};

enum class Polarity { Optimistic, Pessimistic };

struct ArticleRef {
  std::string title;
  std::string source;
  std::string uri;
  std::string sentiment;
  std::string future_signal;
  std::string time_to_impact;
  std::string publication_date;
};

struct CategoryDistribution {
  std::string category;
  Histogram sentiment;
  Histogram time_to_impact;
  int total = 0;
};

struct ConsensusBand {
  std::string category;
  TimelineIndex start = 0;
  TimelineIndex end = 0;
  ConsensusType type = ConsensusType::MixedConsensus;
  std::string label;

  auto width() const { return end - start + 1; }
};

struct OutlierMarker {
  std::string category;
  TimelineIndex x_position = 0;
  std::string label;
  Polarity polarity = Polarity::Optimistic;
  std::vector<ArticleRef> supporting_articles;

  bool is_optimistic() const { return polarity == Polarity::Optimistic; }
};

struct CategoryError {
  size_t index = 0;
  std::string category;
  std::string what;
};

enum class ForecastStatus {
  Ok,
  NoCategoriesAvailable,  // topic has no categories at all
  NoMatchingCategories,   // category filter removed every category
};

struct ForecastResult {
  std::string topic;
  std::string timeframe;
  ForecastStatus status = ForecastStatus::Ok;

  std::vector<std::string> themes;
  std::vector<ConsensusBand> bands;
  std::vector<std::vector<OutlierMarker>> outliers;
  std::vector<CategoryError> errors;

  int total_articles = 0;

  // Only filled when there is nothing to show for the topic.
  std::vector<std::string> available_topics;

  // Only filled for NoMatchingCategories.
  std::vector<std::string> requested_categories;
  std::vector<std::string> available_categories;

  bool has_data() const { return status == ForecastStatus::Ok; }
  bool has_errors() const { return !errors.empty(); }
};
