#include "source/http.h"

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

inline json parse_body(const std::string& body) {
  json root;
  try {
    root = json::parse(body);
  } catch (const json::parse_error& e) {
    throw SourceError(std::format("malformed response: {}", e.what()));
  }
  if (!root.is_object())
    throw SourceError("response is not a json object");
  return root;
}

// {"labels": [...], "values": [...]}, as the analytics service groups counts
Histogram parse_histogram(const std::string& body) {
  auto root = parse_body(body);
  auto& labels = root["labels"];
  auto& values = root["values"];
  if (!labels.is_array() || !values.is_array() ||
      labels.size() != values.size())
    throw SourceError("histogram labels and values do not line up");

  Histogram h;
  for (size_t i = 0; i < labels.size(); i++) {
    auto label = labels[i].is_string() ? labels[i].get<std::string>() : "";
    if (label.empty())
      label = "unknown";
    if (!values[i].is_number_integer())
      throw SourceError(std::format("non-integer count for '{}'", label));
    h.push_back({label, values[i].get<int>()});
  }
  return h;
}

std::vector<std::string> parse_string_list(const std::string& body,
                                           const std::string& key) {
  auto root = parse_body(body);
  auto& arr = root[key];
  if (!arr.is_array())
    throw SourceError(std::format("missing '{}' list", key));

  std::vector<std::string> out;
  for (auto& item : arr)
    if (item.is_string() && !item.get<std::string>().empty())
      out.push_back(item.get<std::string>());
  return out;
}

int parse_count(const std::string& body) {
  auto root = parse_body(body);
  if (!root["count"].is_number_integer())
    throw SourceError("missing article count");
  return root["count"].get<int>();
}

std::vector<ArticleRef> parse_articles(const std::string& body) {
  auto root = parse_body(body);
  auto& arr = root["articles"];
  if (!arr.is_array())
    throw SourceError("missing 'articles' list");

  auto str = [](const json& item, const char* key) -> std::string {
    auto it = item.find(key);
    return it != item.end() && it->is_string() ? it->get<std::string>() : "";
  };

  std::vector<ArticleRef> out;
  for (auto& item : arr) {
    if (!item.is_object())
      continue;
    out.push_back({
        str(item, "title"),
        str(item, "news_source"),
        str(item, "uri"),
        str(item, "sentiment"),
        str(item, "future_signal"),
        str(item, "time_to_impact"),
        str(item, "publication_date"),
    });
  }
  return out;
}

HttpSource::HttpSource(std::string base_url, int timeout_ms)
    : base_url{std::move(base_url)}, timeout_ms{timeout_ms} {
  while (!this->base_url.empty() && this->base_url.back() == '/')
    this->base_url.pop_back();
}

inline std::string http_get(const std::string& url,
                            cpr::Parameters params,
                            int timeout_ms) {
  spdlog::debug("[source] GET {}", url);
  cpr::Response r = cpr::Get(cpr::Url{url}, std::move(params),
                             cpr::Timeout{timeout_ms},
                             cpr::Header{{"Accept", "application/json"}});

  if (r.error)
    throw SourceError(std::format("{}: {}", url, r.error.message));
  if (r.status_code != 200)
    throw SourceError(std::format("{}: HTTP {}", url, r.status_code));

  return r.text;
}

std::vector<std::string> HttpSource::get_topics() const {
  auto body = http_get(base_url + "/api/topics", {}, timeout_ms);
  return parse_string_list(body, "topics");
}

std::vector<std::string> HttpSource::get_available_categories(
    const std::string& topic) const {
  auto body =
      http_get(base_url + "/api/categories", {{"topic", topic}}, timeout_ms);
  return parse_string_list(body, "categories");
}

Histogram HttpSource::get_sentiment_distribution(
    const Timeframe& timeframe,
    const std::string& category,
    const std::string& topic) const {
  auto body = http_get(base_url + "/api/distributions/sentiment",
                  {{"topic", topic},
                   {"category", category},
                   {"timeframe", timeframe.str()}},
                  timeout_ms);
  return parse_histogram(body);
}

Histogram HttpSource::get_time_to_impact_distribution(
    const Timeframe& timeframe,
    const std::string& category,
    const std::string& topic) const {
  auto body = http_get(base_url + "/api/distributions/time_to_impact",
                  {{"topic", topic},
                   {"category", category},
                   {"timeframe", timeframe.str()}},
                  timeout_ms);
  return parse_histogram(body);
}

int HttpSource::get_total_article_count(
    const std::string& topic,
    const std::vector<std::string>& categories) const {
  cpr::Parameters params{{"topic", topic}};
  for (auto& c : categories)
    params.Add({"category", c});

  auto body = http_get(base_url + "/api/articles/count", std::move(params),
                  timeout_ms);
  return parse_count(body);
}

std::vector<ArticleRef> HttpSource::get_sample_articles(
    const std::string& topic,
    const std::string& category,
    const Timeframe& timeframe,
    size_t limit) const {
  auto body = http_get(base_url + "/api/articles/sample",
                  {{"topic", topic},
                   {"category", category},
                   {"timeframe", timeframe.str()},
                   {"limit", std::to_string(limit)}},
                  timeout_ms);
  auto articles = parse_articles(body);
  if (articles.size() > limit)
    articles.resize(limit);
  return articles;
}
