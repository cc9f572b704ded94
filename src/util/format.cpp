#include "util/format.h"
#include "forecast/consensus_types.h"
#include "forecast/timeline.h"
#include "forecast/types.h"
#include "util/config.h"

#include <algorithm>
#include <string>
#include <string_view>

inline constexpr std::string_view RESET = "\033[0m";
inline constexpr std::string_view BOLD = "\033[1m";
inline constexpr std::string_view RED = "\033[31m";
inline constexpr std::string_view BLUE = "\033[34m";

template <>
std::string to_str(const ConsensusBand& band, const ForecastConfig& cfg) {
  return std::format("{}-{} ({}..{}) {}", band.start, band.end,
                     year_label(band.start, cfg), year_label(band.end, cfg),
                     band.label);
}

template <>
std::string to_str(const OutlierMarker& m, const ForecastConfig& cfg) {
  auto color = m.is_optimistic() ? RED : BLUE;
  auto str = std::format("{}{}{} @{} {}", color, m.is_optimistic() ? "▲" : "▼",
                         RESET, year_label(m.x_position, cfg), m.label);
  if (!m.supporting_articles.empty())
    str += std::format(" [{}]", m.supporting_articles.front().title);
  return str;
}

template <>
std::string to_str(const ForecastResult& res, const ForecastConfig& cfg) {
  if (res.status == ForecastStatus::NoMatchingCategories)
    return no_match_message(res.topic, res.requested_categories,
                            res.available_categories) +
           "\n";
  if (!res.has_data())
    return no_data_message(res.topic, res.available_topics) + "\n";

  std::string str = std::format("{}{}{} ({} days), {} articles\n", BOLD,
                                res.topic, RESET, res.timeframe,
                                res.total_articles);

  for (size_t i = 0; i < res.themes.size(); i++) {
    str += std::format("  {:<32} {}\n", res.themes[i],
                       to_str(res.bands[i], cfg));
    for (auto& m : res.outliers[i])
      str += std::format("    {}\n", to_str(m, cfg));
  }

  for (auto& e : res.errors)
    str += std::format("  {}error{} {}: {}\n", RED, RESET, e.category, e.what);

  return str;
}

std::string no_data_message(const std::string& topic,
                            const std::vector<std::string>& available_topics) {
  if (available_topics.empty())
    return std::format(
        "No data available for topic: '{}'. No topics with forecast data "
        "found. Please ensure articles have been analyzed and categories have "
        "been assigned.",
        topic);

  constexpr size_t n_shown = 5;
  auto n = std::min(available_topics.size(), n_shown);
  auto topics = join(available_topics.begin(), available_topics.begin() + n);
  if (available_topics.size() > n_shown)
    topics += std::format(", and {} more", available_topics.size() - n_shown);

  return std::format(
      "No data available for topic: '{}'. Available topics with forecast "
      "data: {}. Please select a different topic or ensure articles have "
      "been analyzed and categorized.",
      topic, topics);
}

std::string no_match_message(const std::string& topic,
                             const std::vector<std::string>& requested,
                             const std::vector<std::string>& available) {
  return std::format(
      "None of the selected categories ({}) exist in topic '{}'. Available "
      "categories: {}.",
      join(requested.begin(), requested.end()), topic,
      join(available.begin(), available.end()));
}
