#include "forecast/export.h"
#include "forecast/consensus_types.h"
#include "forecast/timeline.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <glaze/glaze.hpp>

std::string_view status_name(ForecastStatus status) {
  switch (status) {
    case ForecastStatus::Ok:
      return "ok";
    case ForecastStatus::NoCategoriesAvailable:
      return "no_categories_available";
    case ForecastStatus::NoMatchingCategories:
      return "no_matching_categories";
  }
  return "ok";
}

std::string_view polarity_name(Polarity polarity) {
  return polarity == Polarity::Optimistic ? "optimistic" : "pessimistic";
}

inline std::string status_message(const ForecastResult& res) {
  switch (res.status) {
    case ForecastStatus::Ok:
      return "";
    case ForecastStatus::NoCategoriesAvailable:
      return no_data_message(res.topic, res.available_topics);
    case ForecastStatus::NoMatchingCategories:
      return no_match_message(res.topic, res.requested_categories,
                              res.available_categories);
  }
  return "";
}

struct band_t {
  std::string category;
  int start;
  int end;
  std::string start_year;
  std::string end_year;
  std::string consensus_type;
  std::string label;
  std::string color;
};

struct marker_t {
  std::string category;
  int x_position;
  std::string timeline;
  std::string label;
  std::string type;
  std::string color;
  std::vector<ArticleRef> articles;
};

struct error_t {
  size_t index;
  std::string category;
  std::string error;
};

struct forecast_t {
  std::string topic;
  std::string timeframe;
  std::string status;
  std::string message;
  std::vector<std::string> themes;
  std::vector<band_t> consensus_bands;
  std::vector<std::vector<marker_t>> outlier_markers;
  std::vector<error_t> errors;
  int total_articles;
  std::vector<std::string> available_topics;
  std::vector<std::string> requested_categories;
  std::vector<std::string> available_categories;
};

struct consensus_type_t {
  std::string key;
  std::string label;
  std::string color;
  std::string description;
  std::string rationale;
};

inline forecast_t to_payload(const ForecastResult& res,
                             const ForecastConfig& cfg) {
  forecast_t out{
      .topic = res.topic,
      .timeframe = res.timeframe,
      .status = std::string{status_name(res.status)},
      .message = status_message(res),
      .themes = res.themes,
      .consensus_bands = {},
      .outlier_markers = {},
      .errors = {},
      .total_articles = res.total_articles,
      .available_topics = res.available_topics,
      .requested_categories = res.requested_categories,
      .available_categories = res.available_categories,
  };

  for (auto& b : res.bands) {
    auto& meta = consensus_meta(b.type);
    out.consensus_bands.push_back({
        b.category,
        b.start,
        b.end,
        year_label(b.start, cfg),
        year_label(b.end, cfg),
        std::string{meta.key},
        b.label,
        std::string{meta.color},
    });
  }

  for (auto& markers : res.outliers) {
    auto& arr = out.outlier_markers.emplace_back();
    for (auto& m : markers)
      arr.push_back({
          m.category,
          m.x_position,
          year_label(m.x_position, cfg),
          m.label,
          std::string{polarity_name(m.polarity)},
          std::string{m.is_optimistic() ? OPTIMISTIC_COLOR
                                        : PESSIMISTIC_COLOR},
          m.supporting_articles,
      });
  }

  for (auto& e : res.errors)
    out.errors.push_back({e.index, e.category, e.what});

  return out;
}

std::string forecast_json(const ForecastResult& res, const ForecastConfig& cfg) {
  std::string buffer;
  auto ec = glz::write<glz::opts{.prettify = true}>(to_payload(res, cfg),
                                                    buffer);
  if (ec)
    spdlog::error("[export] error writing forecast json for {}", res.topic);
  return buffer;
}

bool write_forecast_json(const ForecastResult& res,
                         const ForecastConfig& cfg,
                         const std::string& path) {
  constexpr auto opts = glz::opts{.prettify = true};
  std::string buffer;
  auto ec = glz::write_file_json<opts>(to_payload(res, cfg), path, buffer);
  if (ec) {
    spdlog::error("[export] error writing {}", path);
    return false;
  }
  return true;
}

std::string consensus_types_json() {
  std::vector<consensus_type_t> types;
  for (auto type : all_consensus_types) {
    auto& m = consensus_meta(type);
    types.push_back({std::string{m.key}, std::string{m.label},
                     std::string{m.color}, std::string{m.description},
                     std::string{m.rationale}});
  }

  std::string buffer;
  auto ec = glz::write<glz::opts{.prettify = true}>(types, buffer);
  if (ec)
    spdlog::error("[export] error writing consensus types");
  return buffer;
}
