#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

struct ForecastConfig {
  static constexpr const char* name = "forecast_config";
  static constexpr bool debug = true;

  // Sentiment decision policy
  static constexpr double STRONG_POSITIVE_RATIO = 0.6;
  static constexpr double CRITICAL_RATIO = 0.25;
  static constexpr double NEGATIVE_RATIO = 0.35;
  static constexpr double MODERATE_POSITIVE_RATIO = 0.35;
  static constexpr double MODERATE_NEGATIVE_CAP = 0.25;

  size_t max_categories = 8;

  // Timeline
  int max_index = 10;
  int base_year = 2024;

  // Band sizing
  double narrow_spread_threshold = 0.5;
  double wide_spread_threshold = 2.0;
  int min_count_for_narrow_band = 10;

  // Statistical outliers
  int min_count_for_statistical_outliers = 5;
  double optimistic_ratio_threshold = 0.4;
  double hyperbolic_ratio_threshold = 0.2;
  double pessimistic_ratio_threshold = 0.3;
  double critical_ratio_threshold = 0.3;
  int optimistic_outlier_index = 1;
  int pessimistic_outlier_index = 6;

  size_t n_threads = 1;
};

struct SourceConfig {
  static constexpr const char* name = "source_config";
  static constexpr bool debug = false;

  std::string kind = "snapshot";  // snapshot | http

  std::string snapshot_path = "data/articles.json";
  std::string reference_date = "";  // empty means today

  std::string base_url = "http://localhost:8000";
  int timeout_ms = 5000;

  size_t sample_article_limit = 5;
};

struct DomainsConfig {
  static constexpr const char* name = "domains_config";
  static constexpr bool debug = true;

  // category name -> domain name, e.g. "AI in Hospitals" -> "healthcare"
  std::map<std::string, std::string> overrides = {};
};

struct Config {
  bool debug_en = false;

  std::string topic;
  std::string timeframe = "365";
  std::vector<std::string> categories;

  std::string out_path;
  std::string scenarios_path = "private/scenarios.json";

  std::string snapshot_path;
  std::string base_url;
  size_t n_concurrency = 0;

  bool list_topics = false;
  bool show_consensus_types = false;

  ForecastConfig forecast;
  SourceConfig source;
  DomainsConfig domains;

  void read_args(int argc, char* argv[]);
  void update();
};
