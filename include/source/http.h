#pragma once

#include "source/source.h"

#include <string>
#include <vector>

// Queries the dashboard analytics service over HTTP. Every request is bounded
// by timeout_ms; transport errors, non-200 replies and malformed bodies throw
// SourceError.
class HttpSource : public DistributionSource {
  std::string base_url;
  int timeout_ms;

 public:
  HttpSource(std::string base_url, int timeout_ms);

  std::vector<std::string> get_topics() const override;
  std::vector<std::string> get_available_categories(
      const std::string& topic) const override;

  Histogram get_sentiment_distribution(const Timeframe& timeframe,
                                       const std::string& category,
                                       const std::string& topic) const override;
  Histogram get_time_to_impact_distribution(
      const Timeframe& timeframe,
      const std::string& category,
      const std::string& topic) const override;

  int get_total_article_count(
      const std::string& topic,
      const std::vector<std::string>& categories) const override;

  std::vector<ArticleRef> get_sample_articles(const std::string& topic,
                                              const std::string& category,
                                              const Timeframe& timeframe,
                                              size_t limit) const override;
};

// Response body decoders, shared with the tests.
Histogram parse_histogram(const std::string& body);
std::vector<std::string> parse_string_list(const std::string& body,
                                           const std::string& key);
int parse_count(const std::string& body);
std::vector<ArticleRef> parse_articles(const std::string& body);
