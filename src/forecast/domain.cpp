#include "forecast/domain.h"
#include "util/strings.h"

#include <spdlog/spdlog.h>
#include <array>
#include <utility>
#include <vector>

struct DomainRule {
  Domain domain;
  std::vector<std::string_view> keywords;
};

// Band shift, first hit wins.
inline const std::vector<DomainRule> timeline_rules = {
    {Domain::Healthcare, {"healthcare"}},
    {Domain::Business, {"business"}},
    {Domain::Regulation, {"regulation", "copyright"}},
    {Domain::Software, {"software"}},
    {Domain::Robotics, {"robotics"}},
    {Domain::Ethics, {"ethics"}},
    {Domain::Carbon, {"carbon"}},
};

// Regulation and Legal share a tier, as do Ethics and Society.
inline const std::vector<DomainRule> concern_rules = {
    {Domain::Regulation, {"regulation", "copyright"}},
    {Domain::Legal, {"antitrust", "law"}},
    {Domain::Safety, {"safety", "security", "risk", "trust"}},
    {Domain::Defense, {"warfare", "military", "warbot", "defense"}},
    {Domain::Ethics, {"ethics"}},
    {Domain::Society, {"society", "societal"}},
    {Domain::Geopolitics, {"geopolit", "sovereign", "nationalism"}},
};

inline const std::vector<DomainRule> adoption_rules = {
    {Domain::Business, {"business"}},
    {Domain::Workforce, {"automation", "work", "employment"}},
};

inline const std::vector<DomainRule> scenario_rules = {
    {Domain::Business, {"business"}},
    {Domain::Healthcare, {"healthcare"}},
    {Domain::Regulation, {"regulation", "copyright"}},
    {Domain::Ethics, {"ethics"}},
    {Domain::Software, {"software"}},
    {Domain::Society, {"society"}},
    {Domain::Robotics, {"robotics"}},
    {Domain::Carbon, {"carbon"}},
};

inline const std::vector<DomainRule>& rules_for(DomainAspect aspect) {
  switch (aspect) {
    case DomainAspect::Timeline:
      return timeline_rules;
    case DomainAspect::Concern:
      return concern_rules;
    case DomainAspect::Adoption:
      return adoption_rules;
    case DomainAspect::Scenario:
      return scenario_rules;
  }
  return timeline_rules;
}

inline constexpr std::array<std::pair<Domain, std::string_view>, 14>
    domain_names = {{
        {Domain::General, "general"},
        {Domain::Healthcare, "healthcare"},
        {Domain::Business, "business"},
        {Domain::Regulation, "regulation"},
        {Domain::Software, "software"},
        {Domain::Robotics, "robotics"},
        {Domain::Ethics, "ethics"},
        {Domain::Carbon, "carbon"},
        {Domain::Legal, "legal"},
        {Domain::Safety, "safety"},
        {Domain::Defense, "defense"},
        {Domain::Society, "society"},
        {Domain::Geopolitics, "geopolitics"},
        {Domain::Workforce, "workforce"},
    }};

std::string_view domain_name(Domain domain) {
  for (auto& [d, name] : domain_names)
    if (d == domain)
      return name;
  return "general";
}

std::optional<Domain> domain_from_name(std::string_view name) {
  auto lower = to_lower(trim(name));
  for (auto& [d, n] : domain_names)
    if (n == lower)
      return d;
  return std::nullopt;
}

DomainClassifier::DomainClassifier(
    std::unordered_map<std::string, Domain> overrides) {
  for (auto& [category, domain] : overrides)
    this->overrides.emplace(to_lower(trim(category)), domain);
}

DomainClassifier DomainClassifier::from_names(
    const std::map<std::string, std::string>& names) {
  std::unordered_map<std::string, Domain> overrides;
  for (auto& [category, name] : names) {
    auto domain = domain_from_name(name);
    if (!domain) {
      spdlog::warn("[domain] unknown domain '{}' for category '{}'", name,
                   category);
      continue;
    }
    overrides.emplace(category, *domain);
  }
  return DomainClassifier{std::move(overrides)};
}

Domain DomainClassifier::classify(std::string_view category,
                                  DomainAspect aspect) const {
  auto lower = to_lower(trim(category));

  if (auto it = overrides.find(lower); it != overrides.end())
    return it->second;

  for (auto& [domain, keywords] : rules_for(aspect))
    for (auto kw : keywords)
      if (lower.find(kw) != std::string::npos)
        return domain;

  return Domain::General;
}

CategoryDomains DomainClassifier::classify(std::string_view category) const {
  return {
      classify(category, DomainAspect::Timeline),
      classify(category, DomainAspect::Concern),
      classify(category, DomainAspect::Adoption),
      classify(category, DomainAspect::Scenario),
  };
}
