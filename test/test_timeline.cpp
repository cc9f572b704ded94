#include "forecast/timeline.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using Catch::Approx;

TEST_CASE("Timeline - label lookup", "[timeline]") {
  REQUIRE(time_to_impact_index("immediate") == 0);
  REQUIRE(time_to_impact_index("Short-Term") == 1);
  REQUIRE(time_to_impact_index("** short-term") == 1);
  REQUIRE(time_to_impact_index("mid-term") == 3);
  REQUIRE(time_to_impact_index("medium-term") == 3);
  REQUIRE(time_to_impact_index("** long-term") == 6);
  REQUIRE(time_to_impact_index("unknown") == 2);
  REQUIRE(time_to_impact_index("next decade") == UNKNOWN_TIME_INDEX);
  REQUIRE(time_to_impact_index("") == UNKNOWN_TIME_INDEX);
}

TEST_CASE("Timeline - empty histogram is neutral", "[timeline]") {
  auto pos = weigh_timeline({});
  REQUIRE(pos.mean == Approx(2.0));
  REQUIRE(pos.spread == Approx(1.0));
  REQUIRE(pos.total == 0);

  auto zeros = weigh_timeline({{"immediate", 0}, {"long-term", 0}});
  REQUIRE(zeros.mean == Approx(2.0));
  REQUIRE(zeros.spread == Approx(1.0));
}

TEST_CASE("Timeline - weighted mean and spread", "[timeline]") {
  auto pos = weigh_timeline({{"immediate", 8}, {"short-term", 2}});
  REQUIRE(pos.total == 10);
  REQUIRE(pos.mean == Approx(0.2));
  REQUIRE(pos.spread == Approx(0.4));

  auto split = weigh_timeline({{"immediate", 5}, {"long-term", 5}});
  REQUIRE(split.mean == Approx(3.0));
  REQUIRE(split.spread == Approx(3.0));
}

TEST_CASE("Timeline - immediate-heavy histogram gives a near-term band",
          "[timeline]") {
  ForecastConfig cfg;
  auto pos = weigh_timeline({{"immediate", 8}, {"short-term", 2}});
  REQUIRE(band_width(pos, cfg) == BandWidth::Narrow);
  REQUIRE(size_band(pos, cfg) == TimelineBand{0, 1});
}

TEST_CASE("Timeline - band sizing policy order", "[timeline]") {
  ForecastConfig cfg;

  SECTION("few articles force a narrow band even when spread is wide") {
    TimelinePosition pos{4.0, 3.0, 9};
    REQUIRE(band_width(pos, cfg) == BandWidth::Narrow);
    REQUIRE(size_band(pos, cfg) == TimelineBand{3, 5});
  }

  SECTION("wide") {
    TimelinePosition pos{4.5, 2.5, 40};
    REQUIRE(band_width(pos, cfg) == BandWidth::Wide);
    REQUIRE(size_band(pos, cfg) == TimelineBand{2, 8});
  }

  SECTION("medium") {
    TimelinePosition pos{3.0, 1.0, 40};
    REQUIRE(band_width(pos, cfg) == BandWidth::Medium);
    REQUIRE(size_band(pos, cfg) == TimelineBand{2, 5});
  }

  SECTION("spread exactly at the thresholds is medium") {
    REQUIRE(band_width({3.0, 0.5, 40}, cfg) == BandWidth::Medium);
    REQUIRE(band_width({3.0, 2.0, 40}, cfg) == BandWidth::Medium);
  }
}

TEST_CASE("Timeline - clamping keeps start <= end", "[timeline]") {
  REQUIRE(clamp_band({-3, -1}, 10) == TimelineBand{0, 1});
  REQUIRE(clamp_band({12, 15}, 10) == TimelineBand{10, 10});
  REQUIRE(clamp_band({7, 4}, 10) == TimelineBand{7, 8});
  REQUIRE(clamp_band({2, 5}, 10) == TimelineBand{2, 5});
}

TEST_CASE("Timeline - domain adjustments", "[timeline]") {
  constexpr int max = 10;
  TimelineBand base{2, 5};

  REQUIRE(adjust_for_domain(base, Domain::Healthcare, max) ==
          TimelineBand{3, 7});
  REQUIRE(adjust_for_domain(base, Domain::Business, max) ==
          TimelineBand{1, 4});
  REQUIRE(adjust_for_domain(base, Domain::Regulation, max) ==
          TimelineBand{0, 8});
  REQUIRE(adjust_for_domain(base, Domain::Software, max) ==
          TimelineBand{1, 2});
  REQUIRE(adjust_for_domain(base, Domain::Robotics, max) ==
          TimelineBand{3, 8});
  REQUIRE(adjust_for_domain(base, Domain::Ethics, max) == TimelineBand{0, 7});
  REQUIRE(adjust_for_domain(base, Domain::Carbon, max) == TimelineBand{0, 9});

  REQUIRE(adjust_for_domain(base, Domain::General, max) == base);
  REQUIRE(adjust_for_domain(base, Domain::Safety, max) == base);
}

TEST_CASE("Timeline - adjusted bands stay ordered and in range",
          "[timeline]") {
  constexpr int max = 10;
  const Domain domains[] = {
      Domain::General,  Domain::Healthcare, Domain::Business,
      Domain::Regulation, Domain::Software, Domain::Robotics,
      Domain::Ethics,   Domain::Carbon,     Domain::Legal,
  };

  for (int s = 0; s <= max; s++) {
    for (int e = s; e <= max; e++) {
      for (auto d : domains) {
        auto band = adjust_for_domain({s, e}, d, max);
        REQUIRE(0 <= band.start);
        REQUIRE(band.start <= band.end);
        REQUIRE(band.end <= max);
      }
    }
  }
}

TEST_CASE("Timeline - year labels", "[timeline]") {
  ForecastConfig cfg;
  REQUIRE(year_label(0, cfg) == "2024");
  REQUIRE(year_label(6, cfg) == "2030");
  REQUIRE(year_label(10, cfg) == "2035+");
  REQUIRE(year_label(42, cfg) == "2035+");
}
