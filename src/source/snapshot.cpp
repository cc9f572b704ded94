#include "source/snapshot.h"
#include "util/strings.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <glaze/glaze.hpp>

struct snapshot_t {
  std::vector<ArticleRecord> articles;
};

SnapshotSource::SnapshotSource(std::vector<ArticleRecord> articles,
                               SysDays reference)
    : articles{std::move(articles)}, reference{reference} {}

SnapshotSource SnapshotSource::from_file(const std::string& path,
                                         SysDays reference) {
  constexpr auto opts = glz::opts{.error_on_unknown_keys = false};

  snapshot_t snapshot;
  std::string buffer;
  auto ec = glz::read_file_json<opts>(snapshot, path, buffer);
  if (ec)
    throw SourceError(std::format("error reading snapshot {}: {}", path,
                                  glz::format_error(ec, buffer)));

  spdlog::info("[source] {} articles from {}", snapshot.articles.size(), path);
  return SnapshotSource{std::move(snapshot.articles), reference};
}

bool SnapshotSource::in_window(const ArticleRecord& a,
                               const Timeframe& timeframe) const {
  if (timeframe.all)
    return true;
  auto date = parse_date(a.submission_date.value_or(""));
  return date && timeframe.contains(*date, reference);
}

std::vector<std::string> SnapshotSource::get_topics() const {
  std::vector<std::string> topics;
  for (auto& a : articles) {
    if (a.topic.empty())
      continue;
    auto seen = std::any_of(topics.begin(), topics.end(),
                            [&](auto& t) { return iequals(t, a.topic); });
    if (!seen)
      topics.push_back(a.topic);
  }
  return topics;
}

std::vector<std::string> SnapshotSource::get_available_categories(
    const std::string& topic) const {
  std::vector<std::string> categories;
  for (auto& a : articles) {
    if (!iequals(a.topic, topic) || !a.category || a.category->empty())
      continue;
    auto& cat = *a.category;
    auto seen = std::any_of(categories.begin(), categories.end(),
                            [&](auto& c) { return iequals(c, cat); });
    if (!seen)
      categories.push_back(cat);
  }
  return categories;
}

template <typename Field>
Histogram SnapshotSource::histogram(const Timeframe& timeframe,
                                    const std::string& category,
                                    const std::string& topic,
                                    Field field) const {
  Histogram h;
  for (auto& a : articles) {
    if (!iequals(a.topic, topic) || !iequals(a.category.value_or(""), category))
      continue;
    if (!in_window(a, timeframe))
      continue;

    auto label = (a.*field).value_or("");
    if (label.empty())
      label = "unknown";

    auto it = std::find_if(h.begin(), h.end(),
                           [&](auto& lc) { return lc.label == label; });
    if (it == h.end())
      h.push_back({label, 1});
    else
      it->count++;
  }
  return h;
}

Histogram SnapshotSource::get_sentiment_distribution(
    const Timeframe& timeframe,
    const std::string& category,
    const std::string& topic) const {
  return histogram(timeframe, category, topic, &ArticleRecord::sentiment);
}

Histogram SnapshotSource::get_time_to_impact_distribution(
    const Timeframe& timeframe,
    const std::string& category,
    const std::string& topic) const {
  return histogram(timeframe, category, topic, &ArticleRecord::time_to_impact);
}

int SnapshotSource::get_total_article_count(
    const std::string& topic,
    const std::vector<std::string>& categories) const {
  return static_cast<int>(
      std::count_if(articles.begin(), articles.end(), [&](auto& a) {
        if (!iequals(a.topic, topic))
          return false;
        if (categories.empty())
          return true;
        auto cat = a.category.value_or("");
        return std::any_of(categories.begin(), categories.end(),
                           [&](auto& c) { return iequals(c, cat); });
      }));
}

std::vector<ArticleRef> SnapshotSource::get_sample_articles(
    const std::string& topic,
    const std::string& category,
    const Timeframe& timeframe,
    size_t limit) const {
  std::vector<const ArticleRecord*> matches;
  for (auto& a : articles)
    if (iequals(a.topic, topic) &&
        iequals(a.category.value_or(""), category) && in_window(a, timeframe))
      matches.push_back(&a);

  // ISO dates order lexicographically; ties keep snapshot order
  std::stable_sort(matches.begin(), matches.end(), [](auto* l, auto* r) {
    return l->publication_date.value_or("") > r->publication_date.value_or("");
  });

  std::vector<ArticleRef> out;
  for (auto* a : matches) {
    if (out.size() >= limit)
      break;
    out.push_back({
        a->title,
        a->news_source,
        a->uri,
        a->sentiment.value_or(""),
        a->future_signal.value_or(""),
        a->time_to_impact.value_or(""),
        a->publication_date.value_or(""),
    });
  }
  return out;
}
