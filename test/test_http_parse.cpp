#include "source/http.h"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("HTTP - histogram bodies", "[http]") {
  auto h = parse_histogram(
      R"({"labels": ["positive", "", null, "critical"],
          "values": [7, 2, 1, 3]})");
  REQUIRE(h.size() == 4);
  REQUIRE(h[0].label == "positive");
  REQUIRE(h[0].count == 7);
  REQUIRE(h[1].label == "unknown");
  REQUIRE(h[2].label == "unknown");
  REQUIRE(h[3].count == 3);
  REQUIRE(histogram_total(h) == 13);

  REQUIRE(parse_histogram(R"({"labels": [], "values": []})").empty());
}

TEST_CASE("HTTP - malformed histograms throw", "[http]") {
  REQUIRE_THROWS_AS(parse_histogram("not json"), SourceError);
  REQUIRE_THROWS_AS(parse_histogram("[1, 2]"), SourceError);
  REQUIRE_THROWS_AS(parse_histogram(R"({"labels": ["a"]})"), SourceError);
  REQUIRE_THROWS_AS(
      parse_histogram(R"({"labels": ["a", "b"], "values": [1]})"),
      SourceError);
  REQUIRE_THROWS_AS(parse_histogram(R"({"labels": ["a"], "values": ["1"]})"),
                    SourceError);
}

TEST_CASE("HTTP - string lists", "[http]") {
  auto topics = parse_string_list(
      R"({"topics": ["AI", "", 3, "Climate"]})", "topics");
  REQUIRE(topics == std::vector<std::string>{"AI", "Climate"});

  REQUIRE(parse_string_list(R"({"categories": []})", "categories").empty());
  REQUIRE_THROWS_AS(parse_string_list(R"({"topics": "AI"})", "topics"),
                    SourceError);
  REQUIRE_THROWS_AS(parse_string_list(R"({})", "categories"), SourceError);
}

TEST_CASE("HTTP - article counts", "[http]") {
  REQUIRE(parse_count(R"({"count": 42})") == 42);
  REQUIRE(parse_count(R"({"count": 0, "topic": "AI"})") == 0);
  REQUIRE_THROWS_AS(parse_count(R"({"count": "42"})"), SourceError);
  REQUIRE_THROWS_AS(parse_count(R"({"total": 42})"), SourceError);
}

TEST_CASE("HTTP - sample articles", "[http]") {
  auto articles = parse_articles(R"({"articles": [
      {"title": "Open models close the gap", "news_source": "Wire",
       "uri": "https://example.org/1", "sentiment": "Positive",
       "future_signal": null, "time_to_impact": "Short-term",
       "publication_date": "2025-06-01"},
      "skipped",
      {"title": "Untitled"}
  ]})");

  REQUIRE(articles.size() == 2);
  REQUIRE(articles[0].source == "Wire");
  REQUIRE(articles[0].uri == "https://example.org/1");
  REQUIRE(articles[0].future_signal.empty());
  REQUIRE(articles[0].publication_date == "2025-06-01");
  REQUIRE(articles[1].title == "Untitled");
  REQUIRE(articles[1].source.empty());

  REQUIRE_THROWS_AS(parse_articles(R"({"articles": {}})"), SourceError);
}
