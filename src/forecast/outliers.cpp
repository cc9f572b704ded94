#include "forecast/outliers.h"
#include "forecast/sentiment.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <glaze/glaze.hpp>
#include <map>

std::vector<OutlierMarker> StatisticalOutlierDetector::detect(
    const std::string& category,
    const Histogram& sentiment) const {
  std::vector<OutlierMarker> markers;

  auto counts = count_sentiment(sentiment);
  if (counts.total <= cfg.min_count_for_statistical_outliers)
    return markers;

  auto r = sentiment_ratios(counts);

  spdlog::debug(
      "[outliers] ({}) optimistic={:.2f} hyperbolic={:.2f} "
      "pessimistic={:.2f} critical={:.2f} n={}",
      category, r.positive, r.hyperbolic, r.negative, r.critical, r.total);

  if (r.positive > cfg.optimistic_ratio_threshold ||
      r.hyperbolic > cfg.hyperbolic_ratio_threshold)
    markers.push_back({
        category,
        std::clamp(cfg.optimistic_outlier_index, 0, cfg.max_index),
        std::format("Rapid adoption — {}", category),
        Polarity::Optimistic,
        {},
    });

  if (r.negative > cfg.pessimistic_ratio_threshold ||
      r.critical > cfg.critical_ratio_threshold)
    markers.push_back({
        category,
        std::clamp(cfg.pessimistic_outlier_index, 0, cfg.max_index),
        std::format("Delayed impact — {}", category),
        Polarity::Pessimistic,
        {},
    });

  return markers;
}

CuratedScenarioLibrary::CuratedScenarioLibrary() {
  using enum Polarity;
  scenarios = {
      {Domain::Business,
       {{2, "Minimal disruption, bubble bursts", Optimistic},
        {5, "Full automation by 2029", Pessimistic}}},
      {Domain::Healthcare,
       {{1, "Breakthrough 2025", Optimistic},
        {7, "Regulation stalls", Pessimistic}}},
      {Domain::Regulation,
       {{1, "AGI by 2026 (startup claims)", Optimistic},
        {6, "Talent surplus emerges", Pessimistic}}},
      {Domain::Ethics,
       {{2, "Self-regulation succeeds", Optimistic},
        {7, "AI alignment failure", Pessimistic}}},
      {Domain::Software,
       {{1, "Coding obsolete 2025", Optimistic},
        {5, "Adoption resistance", Pessimistic}}},
      {Domain::Society,
       {{2, "Global cooperation emerges", Optimistic},
        {6, "Mass unemployment by 2030", Pessimistic}}},
      {Domain::Robotics,
       {{1, "Effective protocols overstated", Optimistic},
        {7, "Autonomous weapons ban", Pessimistic}}},
      {Domain::Carbon,
       {{2, "Green AI breakthrough", Optimistic},
        {5, "Climate costs override", Pessimistic}}},
  };
}

struct scenario_entry_t {
  int x = 0;
  std::string label;
  std::string polarity = "optimistic";
};

struct scenario_file_t {
  int version = 0;
  std::map<std::string, std::vector<scenario_entry_t>> domains;
};

bool CuratedScenarioLibrary::load(const std::string& path) {
  scenario_file_t file;
  auto ec = glz::read_file_json(file, path, std::string{});
  if (ec) {
    spdlog::error("[scenarios] error reading {}: {}", path,
                  glz::format_error(ec));
    return false;
  }

  std::unordered_map<Domain, std::vector<CuratedScenario>> table;
  for (auto& [name, entries] : file.domains) {
    auto domain = domain_from_name(name);
    if (!domain) {
      spdlog::error("[scenarios] {}: unknown domain '{}'", path, name);
      return false;
    }

    auto& arr = table[*domain];
    for (auto& e : entries) {
      if (e.polarity != "optimistic" && e.polarity != "pessimistic") {
        spdlog::error("[scenarios] {}: bad polarity '{}' for '{}'", path,
                      e.polarity, e.label);
        return false;
      }
      arr.push_back({e.x, e.label,
                     e.polarity == "optimistic" ? Polarity::Optimistic
                                                : Polarity::Pessimistic});
    }
  }

  version_ = file.version;
  scenarios = std::move(table);

  spdlog::info("[scenarios] loaded v{} from {} ({} domains)", version_, path,
               scenarios.size());
  return true;
}

const std::vector<CuratedScenario>& CuratedScenarioLibrary::scenarios_for(
    Domain domain) const {
  static const std::vector<CuratedScenario> none;
  auto it = scenarios.find(domain);
  return it == scenarios.end() ? none : it->second;
}

std::vector<OutlierMarker> CuratedScenarioLibrary::markers(
    const std::string& category,
    Domain domain,
    int max_index) const {
  std::vector<OutlierMarker> out;
  for (auto& s : scenarios_for(domain))
    out.push_back({
        category,
        std::clamp(s.x_position, 0, max_index),
        s.label,
        s.polarity,
        {},
    });
  return out;
}
