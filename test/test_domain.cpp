#include "forecast/domain.h"

#include <catch2/catch_test_macros.hpp>

using enum DomainAspect;

TEST_CASE("Domain - timeline keywords", "[domain]") {
  DomainClassifier classifier;

  REQUIRE(classifier.classify("AI in Healthcare", Timeline) ==
          Domain::Healthcare);
  REQUIRE(classifier.classify("AI Business", Timeline) == Domain::Business);
  REQUIRE(classifier.classify("AI Regulation", Timeline) ==
          Domain::Regulation);
  REQUIRE(classifier.classify("Copyright & IP", Timeline) ==
          Domain::Regulation);
  REQUIRE(classifier.classify("Software Development", Timeline) ==
          Domain::Software);
  REQUIRE(classifier.classify("Robotics", Timeline) == Domain::Robotics);
  REQUIRE(classifier.classify("AI Ethics", Timeline) == Domain::Ethics);
  REQUIRE(classifier.classify("Carbon Footprint", Timeline) ==
          Domain::Carbon);

  // concern-only keywords leave the band alone
  REQUIRE(classifier.classify("Antitrust", Timeline) == Domain::General);
  REQUIRE(classifier.classify("AI Safety", Timeline) == Domain::General);
  REQUIRE(classifier.classify("Large Language Models", Timeline) ==
          Domain::General);
}

TEST_CASE("Domain - concern keywords", "[domain]") {
  DomainClassifier classifier;

  REQUIRE(classifier.classify("Antitrust", Concern) == Domain::Legal);
  REQUIRE(classifier.classify("AI Safety", Concern) == Domain::Safety);
  REQUIRE(classifier.classify("Cybersecurity", Concern) == Domain::Safety);
  REQUIRE(classifier.classify("Military AI", Concern) == Domain::Defense);
  REQUIRE(classifier.classify("AI and Society", Concern) == Domain::Society);
  REQUIRE(classifier.classify("Geopolitics", Concern) == Domain::Geopolitics);
  REQUIRE(classifier.classify("Digital Sovereignty", Concern) ==
          Domain::Geopolitics);
  REQUIRE(classifier.classify("AI in Healthcare", Concern) ==
          Domain::General);
}

TEST_CASE("Domain - each aspect keeps its own precedence", "[domain]") {
  DomainClassifier classifier;

  auto d = classifier.classify("Healthcare Security");
  REQUIRE(d.timeline == Domain::Healthcare);
  REQUIRE(d.concern == Domain::Safety);
  REQUIRE(d.scenario == Domain::Healthcare);

  d = classifier.classify("Robotics and Warfare");
  REQUIRE(d.timeline == Domain::Robotics);
  REQUIRE(d.concern == Domain::Defense);

  d = classifier.classify("AI Ethics and Safety");
  REQUIRE(d.timeline == Domain::Ethics);
  REQUIRE(d.concern == Domain::Safety);
  REQUIRE(d.scenario == Domain::Ethics);

  d = classifier.classify("Security in Society");
  REQUIRE(d.timeline == Domain::General);
  REQUIRE(d.concern == Domain::Safety);
  REQUIRE(d.scenario == Domain::Society);

  d = classifier.classify("Healthcare Automation");
  REQUIRE(d.adoption == Domain::Workforce);
  REQUIRE(d.scenario == Domain::Healthcare);

  // business comes first for scenarios, healthcare first for timing
  d = classifier.classify("Healthcare Business");
  REQUIRE(d.timeline == Domain::Healthcare);
  REQUIRE(d.scenario == Domain::Business);
  REQUIRE(d.adoption == Domain::Business);

  // ethics before software for scenarios, the other way round for timing
  d = classifier.classify("Software Ethics");
  REQUIRE(d.timeline == Domain::Software);
  REQUIRE(d.scenario == Domain::Ethics);

  REQUIRE(classifier.classify("Regulation of Military AI", Concern) ==
          Domain::Regulation);
}

TEST_CASE("Domain - matching ignores case and padding", "[domain]") {
  DomainClassifier classifier;
  REQUIRE(classifier.classify("  HEALTHCARE  ", Timeline) ==
          Domain::Healthcare);
  REQUIRE(classifier.classify("") == CategoryDomains{});
}

TEST_CASE("Domain - overrides pin every aspect", "[domain]") {
  auto classifier = DomainClassifier::from_names({
      {"AI in Hospitals", "healthcare"},
      {"Business Ethics", "Ethics"},
      {"Mystery", "no-such-domain"},
  });

  REQUIRE(classifier.n_overrides() == 2);
  REQUIRE(classifier.classify("ai in hospitals", Timeline) ==
          Domain::Healthcare);

  auto d = classifier.classify("Business Ethics");
  REQUIRE(d == CategoryDomains{Domain::Ethics, Domain::Ethics, Domain::Ethics,
                               Domain::Ethics});

  REQUIRE(classifier.classify("Mystery") == CategoryDomains{});
  REQUIRE(classifier.classify("Business Automation", Scenario) ==
          Domain::Business);
}

TEST_CASE("Domain - names round trip", "[domain]") {
  REQUIRE(domain_from_name("geopolitics") == Domain::Geopolitics);
  REQUIRE(domain_from_name(" Workforce ") == Domain::Workforce);
  REQUIRE(domain_name(Domain::Legal) == "legal");
  REQUIRE_FALSE(domain_from_name("finance").has_value());
}
