#include "forecast/sentiment.h"
#include "util/config.h"
#include "util/strings.h"

#include <string>
#include <unordered_map>

inline const std::unordered_map<std::string, SentimentBucket> buckets = {
    {"positive", SentimentBucket::Positive},
    {"optimistic", SentimentBucket::Positive},
    {"negative", SentimentBucket::Negative},
    {"pessimistic", SentimentBucket::Negative},
    {"critical", SentimentBucket::Critical},
    {"hyperbolic", SentimentBucket::Hyperbolic},
};

SentimentBucket sentiment_bucket(std::string_view label) {
  auto it = buckets.find(normalize_label(label));
  return it == buckets.end() ? SentimentBucket::Other : it->second;
}

SentimentCounts count_sentiment(const Histogram& sentiment) {
  SentimentCounts counts;
  for (auto& [label, count] : sentiment) {
    if (count <= 0)
      continue;

    counts.total += count;
    switch (sentiment_bucket(label)) {
      case SentimentBucket::Positive:
        counts.positive += count;
        break;
      case SentimentBucket::Negative:
        counts.negative += count;
        break;
      case SentimentBucket::Critical:
        counts.critical += count;
        break;
      case SentimentBucket::Hyperbolic:
        counts.hyperbolic += count;
        break;
      case SentimentBucket::Other:
        break;
    }
  }
  return counts;
}

SentimentRatios sentiment_ratios(const SentimentCounts& counts) {
  SentimentRatios ratios;
  ratios.total = counts.total;
  if (counts.total == 0)
    return ratios;

  double total = counts.total;
  ratios.positive = counts.positive / total;
  ratios.negative = counts.negative / total;
  ratios.critical = counts.critical / total;
  ratios.hyperbolic = counts.hyperbolic / total;
  return ratios;
}

ConsensusType critical_consensus(Domain domain) {
  switch (domain) {
    case Domain::Regulation:
    case Domain::Legal:
      return ConsensusType::RegulatoryCritical;
    case Domain::Safety:
      return ConsensusType::SafetySecurity;
    case Domain::Defense:
      return ConsensusType::WarfareDefense;
    case Domain::Ethics:
    case Domain::Society:
      return ConsensusType::SocietalImpact;
    case Domain::Geopolitics:
      return ConsensusType::Geopolitical;
    default:
      return ConsensusType::RegulatoryCritical;
  }
}

ConsensusType moderate_positive_consensus(Domain domain) {
  if (domain == Domain::Business || domain == Domain::Workforce)
    return ConsensusType::BusinessAutomation;
  return ConsensusType::PositiveGrowth;
}

ConsensusType classify_consensus(const SentimentRatios& r,
                                 const CategoryDomains& domains) {
  using C = ForecastConfig;

  // 1. Strong optimism
  if (r.positive >= C::STRONG_POSITIVE_RATIO)
    return ConsensusType::PositiveGrowth;

  // 2. Criticism dominates, the domain decides what kind
  if (r.critical >= C::CRITICAL_RATIO || r.negative >= C::NEGATIVE_RATIO)
    return critical_consensus(domains.concern);

  // 3. Moderate optimism
  if (r.positive >= C::MODERATE_POSITIVE_RATIO &&
      r.negative <= C::MODERATE_NEGATIVE_CAP)
    return moderate_positive_consensus(domains.adoption);

  return ConsensusType::MixedConsensus;
}
