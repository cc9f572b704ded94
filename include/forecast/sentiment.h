#pragma once

#include "forecast/domain.h"
#include "forecast/types.h"

#include <string_view>

enum class SentimentBucket { Positive, Negative, Critical, Hyperbolic, Other };

SentimentBucket sentiment_bucket(std::string_view label);

struct SentimentCounts {
  int positive = 0;
  int negative = 0;
  int critical = 0;
  int hyperbolic = 0;
  int total = 0;  // every label, bucketed or not
};

struct SentimentRatios {
  double positive = 0.0;
  double negative = 0.0;
  double critical = 0.0;
  double hyperbolic = 0.0;
  int total = 0;
};

SentimentCounts count_sentiment(const Histogram& sentiment);

// All ratios are 0 when the histogram is empty.
SentimentRatios sentiment_ratios(const SentimentCounts& counts);

inline SentimentRatios sentiment_ratios(const Histogram& sentiment) {
  return sentiment_ratios(count_sentiment(sentiment));
}

// Total over every ratio triple: always yields exactly one type. Reads the
// concern and adoption domains.
ConsensusType classify_consensus(const SentimentRatios& ratios,
                                 const CategoryDomains& domains);

// Consensus type used when criticism dominates a category of this domain.
ConsensusType critical_consensus(Domain domain);

// Consensus type used for moderate optimism in this domain.
ConsensusType moderate_positive_consensus(Domain domain);
