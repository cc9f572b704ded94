#pragma once

#include "forecast/types.h"

#include <array>
#include <string_view>

struct ConsensusMeta {
  std::string_view key;
  std::string_view label;
  std::string_view color;
  std::string_view description;
  std::string_view rationale;
};

inline constexpr std::array<ConsensusType, 8> all_consensus_types = {
    ConsensusType::PositiveGrowth,     ConsensusType::MixedConsensus,
    ConsensusType::RegulatoryCritical, ConsensusType::SafetySecurity,
    ConsensusType::WarfareDefense,     ConsensusType::Geopolitical,
    ConsensusType::BusinessAutomation, ConsensusType::SocietalImpact,
};

const ConsensusMeta& consensus_meta(ConsensusType type);

inline std::string_view consensus_label(ConsensusType type) {
  return consensus_meta(type).label;
}

inline constexpr std::string_view OPTIMISTIC_COLOR = "#e74c3c";
inline constexpr std::string_view PESSIMISTIC_COLOR = "#3498db";
