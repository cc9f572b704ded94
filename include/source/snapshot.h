#pragma once

#include "source/source.h"

#include <optional>
#include <string>
#include <vector>

// One analyzed article as exported by the dashboard database.
struct ArticleRecord {
  std::string uri;
  std::string title;
  std::string news_source;
  std::string topic;
  std::optional<std::string> category;
  std::optional<std::string> sentiment;
  std::optional<std::string> time_to_impact;
  std::optional<std::string> future_signal;
  std::optional<std::string> publication_date;
  std::optional<std::string> submission_date;
};

// Answers distribution queries from an in-memory article snapshot. Topic and
// category matching is case-insensitive; timeframes are measured back from
// the reference day against the submission date.
class SnapshotSource : public DistributionSource {
  std::vector<ArticleRecord> articles;
  SysDays reference;

 public:
  SnapshotSource(std::vector<ArticleRecord> articles, SysDays reference);

  static SnapshotSource from_file(const std::string& path, SysDays reference);

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

  size_t size() const { return articles.size(); }

 private:
  bool in_window(const ArticleRecord& a, const Timeframe& timeframe) const;

  template <typename Field>
  Histogram histogram(const Timeframe& timeframe,
                      const std::string& category,
                      const std::string& topic,
                      Field field) const;
};
