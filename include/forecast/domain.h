#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

// Subject area of a category. Timeline adjustment, consensus classification
// and curated scenarios each read the category name with their own keyword
// precedence, so one category may land in a different domain for each.
enum class Domain {
  General,
  Healthcare,
  Business,
  Regulation,
  Software,
  Robotics,
  Ethics,
  Carbon,
  Legal,
  Safety,
  Defense,
  Society,
  Geopolitics,
  Workforce,
};

enum class DomainAspect {
  Timeline,  // lag or lead of the consensus band
  Concern,   // kind of criticism when it dominates
  Adoption,  // business reading of moderate optimism
  Scenario,  // curated scenario set
};

struct CategoryDomains {
  Domain timeline = Domain::General;
  Domain concern = Domain::General;
  Domain adoption = Domain::General;
  Domain scenario = Domain::General;

  bool operator==(const CategoryDomains&) const = default;
};

std::string_view domain_name(Domain domain);
std::optional<Domain> domain_from_name(std::string_view name);

class DomainClassifier {
  std::unordered_map<std::string, Domain> overrides;  // lowercased names

 public:
  DomainClassifier() = default;
  explicit DomainClassifier(std::unordered_map<std::string, Domain> overrides);

  // Reads "category": "domain" pairs; unknown domain names are logged and
  // skipped.
  static DomainClassifier from_names(
      const std::map<std::string, std::string>& names);

  // An override pins every aspect; otherwise the aspect's keyword table is
  // searched in order and the first hit wins.
  Domain classify(std::string_view category, DomainAspect aspect) const;
  CategoryDomains classify(std::string_view category) const;

  size_t n_overrides() const { return overrides.size(); }
};
