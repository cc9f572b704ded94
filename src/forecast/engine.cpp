#include "forecast/engine.h"
#include "forecast/consensus_types.h"
#include "forecast/sentiment.h"
#include "forecast/timeline.h"
#include "mt/thread_pool.h"
#include "util/strings.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <numeric>

ConsensusBand data_error_band(const std::string& category) {
  return {category, 1, 4, ConsensusType::MixedConsensus,
          std::string{DATA_ERROR_LABEL}};
}

ForecastEngine::ForecastEngine(const DistributionSource& source,
                               ForecastConfig cfg,
                               DomainClassifier classifier,
                               CuratedScenarioLibrary scenarios,
                               size_t sample_article_limit)
    : source{source},
      cfg{cfg},
      classifier{std::move(classifier)},
      scenarios{std::move(scenarios)},
      detector{cfg},
      sample_article_limit{sample_article_limit} {}

ConsensusBand ForecastEngine::consensus_band(
    const CategoryDistribution& dist) const {
  auto domains = classifier.classify(dist.category);

  auto pos = weigh_timeline(dist.time_to_impact);
  auto sized = size_band(pos, cfg);
  auto band = adjust_for_domain(sized, domains.timeline, cfg.max_index);

  auto ratios = sentiment_ratios(dist.sentiment);
  auto type = classify_consensus(ratios, domains);

  spdlog::debug(
      "[timeline] ({}) mean={:.2f} spread={:.2f} n={} band={}-{} "
      "adjusted={}-{} domain={}",
      dist.category, pos.mean, pos.spread, pos.total, sized.start, sized.end,
      band.start, band.end, domain_name(domains.timeline));
  spdlog::debug(
      "[sentiment] ({}) positive={:.2f} negative={:.2f} critical={:.2f} "
      "concern={} -> {}",
      dist.category, ratios.positive, ratios.negative, ratios.critical,
      domain_name(domains.concern), consensus_label(type));

  return {dist.category, band.start, band.end, type,
          std::string{consensus_label(type)}};
}

std::vector<OutlierMarker> ForecastEngine::outliers(
    const CategoryDistribution& dist) const {
  auto markers = detector.detect(dist.category, dist.sentiment);

  auto domain = classifier.classify(dist.category, DomainAspect::Scenario);
  auto curated = scenarios.markers(dist.category, domain, cfg.max_index);
  markers.insert(markers.end(), std::make_move_iterator(curated.begin()),
                 std::make_move_iterator(curated.end()));

  return markers;
}

void ForecastEngine::attach_articles(std::vector<OutlierMarker>& markers,
                                     const std::string& topic,
                                     const std::string& category,
                                     const Timeframe& timeframe) const {
  auto limit = std::min(markers.size(), sample_article_limit);
  if (limit == 0)
    return;

  try {
    auto articles =
        source.get_sample_articles(topic, category, timeframe, limit);
    for (size_t i = 0; i < markers.size() && i < articles.size(); i++)
      markers[i].supporting_articles = {articles[i]};
  } catch (const std::exception& e) {
    spdlog::warn("[outliers] ({}) no sample articles: {}", category,
                 e.what());
  }
}

CategoryOutcome ForecastEngine::forecast_category(const std::string& topic,
                                                  const Timeframe& timeframe,
                                                  const std::string& category,
                                                  size_t index) const {
  try {
    auto dist = fetch_distribution(source, topic, timeframe, category);

    CategoryForecast f{consensus_band(dist), outliers(dist), dist.total};
    attach_articles(f.outliers, topic, category, timeframe);

    spdlog::info("[forecast] ({}) {} {}-{}, {} outliers", category,
                 f.band.label, f.band.start, f.band.end, f.outliers.size());
    return f;
  } catch (const std::exception& e) {
    spdlog::error("[forecast] ({}) processing failed: {}", category, e.what());
    return std::unexpected(CategoryError{index, category, e.what()});
  }
}

std::string ForecastEngine::resolve_topic(
    const std::string& topic,
    std::vector<std::string>& categories) const {
  categories = source.get_available_categories(topic);
  if (!categories.empty())
    return topic;

  for (auto& t : source.get_topics()) {
    if (t == topic || !iequals(t, topic))
      continue;
    spdlog::info("[forecast] using topic '{}' for '{}'", t, topic);
    categories = source.get_available_categories(t);
    return t;
  }

  return topic;
}

std::vector<std::string> ForecastEngine::topics_with_categories() const {
  std::vector<std::string> topics;
  try {
    for (auto& t : source.get_topics())
      if (!source.get_available_categories(t).empty())
        topics.push_back(t);
  } catch (const std::exception& e) {
    spdlog::error("[forecast] listing topics failed: {}", e.what());
    return {};
  }
  return topics;
}

int ForecastEngine::count_articles(
    const std::string& topic,
    const Timeframe& timeframe,
    const std::vector<std::string>& categories,
    const std::vector<CategoryOutcome>& outcomes) const {
  try {
    return source.get_total_article_count(topic, categories);
  } catch (const std::exception& e) {
    spdlog::warn("[forecast] article count failed, summing categories: {}",
                 e.what());
  }

  // outcomes cover the leading categories that made it into the themes
  int total = 0;
  try {
    for (size_t i = 0; i < categories.size(); i++) {
      if (i < outcomes.size() && outcomes[i]) {
        total += outcomes[i]->n_articles;
        continue;
      }
      auto h = source.get_sentiment_distribution(timeframe, categories[i],
                                                 topic);
      total += histogram_total(h);
    }
  } catch (const std::exception& e) {
    spdlog::error("[forecast] article count fallback failed: {}", e.what());
    return 0;
  }
  return total;
}

ForecastResult ForecastEngine::generate_forecast(
    const std::string& topic,
    const Timeframe& timeframe,
    const std::optional<std::vector<std::string>>& categories) const {
  Timer timer;

  ForecastResult res;
  res.topic = topic;
  res.timeframe = timeframe.str();

  std::vector<std::string> available;
  try {
    res.topic = resolve_topic(topic, available);
  } catch (const std::exception& e) {
    spdlog::error("[forecast] categories for '{}' unavailable: {}", topic,
                  e.what());
    available.clear();
  }

  if (available.empty()) {
    spdlog::warn("[forecast] no categories for topic '{}'", topic);
    res.status = ForecastStatus::NoCategoriesAvailable;
    res.available_topics = topics_with_categories();
    return res;
  }

  if (categories) {
    auto topic_categories = available;
    std::erase_if(available, [&](auto& c) {
      return std::none_of(categories->begin(), categories->end(),
                          [&](auto& sel) { return iequals(trim(sel), c); });
    });

    if (available.empty()) {
      spdlog::warn("[forecast] none of the selected categories exist in '{}'",
                   res.topic);
      res.status = ForecastStatus::NoMatchingCategories;
      res.requested_categories = *categories;
      res.available_categories = std::move(topic_categories);
      return res;
    }
  }

  auto n = std::min(available.size(), cfg.max_categories);
  res.themes.assign(available.begin(), available.begin() + n);

  std::vector<CategoryOutcome> outcomes(n);
  auto run = [&](size_t i) {
    outcomes[i] = forecast_category(res.topic, timeframe, res.themes[i], i);
  };

  if (cfg.n_threads > 1 && n > 1) {
    std::vector<size_t> jobs(n);
    std::iota(jobs.begin(), jobs.end(), size_t{0});
    thread_pool<size_t> pool{std::min(cfg.n_threads, n),
                             [&](size_t&& i) { run(i); }, std::move(jobs)};
    pool.wait();
  } else {
    for (size_t i = 0; i < n; i++)
      run(i);
  }

  for (size_t i = 0; i < n; i++) {
    auto& outcome = outcomes[i];
    if (outcome) {
      res.bands.push_back(std::move(outcome->band));
      res.outliers.push_back(std::move(outcome->outliers));
    } else {
      res.bands.push_back(data_error_band(res.themes[i]));
      res.outliers.emplace_back();
      res.errors.push_back(outcome.error());
    }
  }

  res.total_articles =
      count_articles(res.topic, timeframe, available, outcomes);

  spdlog::info("[forecast] '{}' ({}): {} themes, {} errors, {} articles, "
               "took {:.2f}ms",
               res.topic, res.timeframe, res.themes.size(), res.errors.size(),
               res.total_articles, timer.diff_ms());
  return res;
}
