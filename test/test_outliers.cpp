#include "forecast/outliers.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

TEST_CASE("Outliers - sparse data gives no statistical markers", "[outliers]") {
  StatisticalOutlierDetector detector{ForecastConfig{}};

  REQUIRE(detector.detect("AI", {}).empty());
  REQUIRE(detector.detect("AI", {{"optimistic", 5}}).empty());
  REQUIRE(detector.detect("AI", {{"critical", 3}, {"hyperbolic", 2}}).empty());
}

TEST_CASE("Outliers - optimistic and pessimistic markers", "[outliers]") {
  ForecastConfig cfg;
  StatisticalOutlierDetector detector{cfg};

  SECTION("optimism") {
    auto markers = detector.detect("AI Tools", {{"positive", 5}, {"neutral", 5}});
    REQUIRE(markers.size() == 1);
    REQUIRE(markers[0].polarity == Polarity::Optimistic);
    REQUIRE(markers[0].x_position == cfg.optimistic_outlier_index);
    REQUIRE(markers[0].label == "Rapid adoption — AI Tools");
    REQUIRE(markers[0].category == "AI Tools");
    REQUIRE(markers[0].supporting_articles.empty());
  }

  SECTION("hype alone is enough") {
    auto markers =
        detector.detect("AI Tools", {{"hyperbolic", 3}, {"neutral", 7}});
    REQUIRE(markers.size() == 1);
    REQUIRE(markers[0].is_optimistic());
  }

  SECTION("pessimism") {
    auto markers = detector.detect("AI Tools", {{"critical", 4}, {"neutral", 6}});
    REQUIRE(markers.size() == 1);
    REQUIRE(markers[0].polarity == Polarity::Pessimistic);
    REQUIRE(markers[0].x_position == cfg.pessimistic_outlier_index);
    REQUIRE(markers[0].label == "Delayed impact — AI Tools");
  }

  SECTION("both, optimistic first") {
    auto markers = detector.detect(
        "AI Tools", {{"positive", 5}, {"pessimistic", 4}, {"neutral", 1}});
    REQUIRE(markers.size() == 2);
    REQUIRE(markers[0].is_optimistic());
    REQUIRE_FALSE(markers[1].is_optimistic());
  }

  SECTION("ratios at the thresholds do not trigger") {
    auto markers = detector.detect(
        "AI Tools", {{"positive", 4}, {"hyperbolic", 2}, {"negative", 3},
                     {"neutral", 1}});
    REQUIRE(markers.empty());
  }
}

TEST_CASE("Outliers - curated scenarios per domain", "[outliers]") {
  CuratedScenarioLibrary library;

  auto business = library.markers("AI Business", Domain::Business, 10);
  REQUIRE(business.size() == 2);
  REQUIRE(business[0].x_position == 2);
  REQUIRE(business[0].is_optimistic());
  REQUIRE(business[1].x_position == 5);
  REQUIRE_FALSE(business[1].is_optimistic());
  REQUIRE(business[1].category == "AI Business");

  for (auto d : {Domain::Healthcare, Domain::Regulation, Domain::Ethics,
                 Domain::Software, Domain::Society, Domain::Robotics,
                 Domain::Carbon})
    REQUIRE(library.scenarios_for(d).size() == 2);

  REQUIRE(library.markers("LLMs", Domain::General, 10).empty());
  REQUIRE(library.markers("AI Safety", Domain::Safety, 10).empty());
}

TEST_CASE("Outliers - curated positions are clamped to the timeline",
          "[outliers]") {
  CuratedScenarioLibrary library{
      3, {{Domain::Carbon, {{9, "Late", Polarity::Pessimistic}}}}};
  auto markers = library.markers("Carbon", Domain::Carbon, 6);
  REQUIRE(markers.size() == 1);
  REQUIRE(markers[0].x_position == 6);
  REQUIRE(library.version() == 3);
}

TEST_CASE("Outliers - scenario library loads from json", "[outliers]") {
  CuratedScenarioLibrary library;
  REQUIRE(library.load(CONSENSUS_TEST_DATA "/scenarios.json"));
  REQUIRE(library.version() == 2);

  auto& healthcare = library.scenarios_for(Domain::Healthcare);
  REQUIRE(healthcare.size() == 1);
  REQUIRE(healthcare[0].label == "FDA fast track");
  REQUIRE(healthcare[0].x_position == 3);

  auto& defense = library.scenarios_for(Domain::Defense);
  REQUIRE(defense.size() == 2);
  REQUIRE(defense[1].polarity == Polarity::Pessimistic);

  // replaced, not merged
  REQUIRE(library.scenarios_for(Domain::Business).empty());
}

TEST_CASE("Outliers - bad scenario files keep the current table",
          "[outliers]") {
  CuratedScenarioLibrary library;

  REQUIRE_FALSE(library.load(CONSENSUS_TEST_DATA "/missing.json"));
  REQUIRE(library.version() == 1);
  REQUIRE(library.scenarios_for(Domain::Business).size() == 2);

  auto path = std::filesystem::temp_directory_path() / "bad_scenarios.json";
  {
    std::ofstream f{path};
    f << R"({"version": 5, "domains": {"finance": []}})";
  }
  REQUIRE_FALSE(library.load(path.string()));
  REQUIRE(library.version() == 1);
  std::filesystem::remove(path);
}
