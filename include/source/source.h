#pragma once

#include "forecast/types.h"
#include "util/config.h"
#include "util/times.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

struct SourceError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Where the article statistics come from. Implementations may be queried from
// several worker threads at once and report failures by throwing SourceError.
class DistributionSource {
 public:
  virtual ~DistributionSource() = default;

  virtual std::vector<std::string> get_topics() const = 0;

  virtual std::vector<std::string> get_available_categories(
      const std::string& topic) const = 0;

  virtual Histogram get_sentiment_distribution(
      const Timeframe& timeframe,
      const std::string& category,
      const std::string& topic) const = 0;

  virtual Histogram get_time_to_impact_distribution(
      const Timeframe& timeframe,
      const std::string& category,
      const std::string& topic) const = 0;

  // Counts over every timeframe; an empty category list counts the topic.
  virtual int get_total_article_count(
      const std::string& topic,
      const std::vector<std::string>& categories) const = 0;

  // Most recent first.
  virtual std::vector<ArticleRef> get_sample_articles(
      const std::string& topic,
      const std::string& category,
      const Timeframe& timeframe,
      size_t limit) const = 0;
};

CategoryDistribution fetch_distribution(const DistributionSource& source,
                                        const std::string& topic,
                                        const Timeframe& timeframe,
                                        const std::string& category);

// Builds the source named by cfg.kind. Throws SourceError when it cannot be
// opened.
std::unique_ptr<DistributionSource> make_source(const SourceConfig& cfg);
