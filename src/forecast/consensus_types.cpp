#include "forecast/consensus_types.h"

#include <unordered_map>

inline const std::unordered_map<ConsensusType, ConsensusMeta> consensus_types = {
    {
        ConsensusType::PositiveGrowth,
        {"positive_growth", "Positive Growth", "#b6d7a8",
         "Strong optimistic sentiment indicating technological advancement "
         "and beneficial adoption",
         "High positive sentiment (>60%) with minimal critical concerns"},
    },
    {
        ConsensusType::MixedConsensus,
        {"mixed_consensus", "Mixed Consensus", "#ffd966",
         "Balanced perspectives with both opportunities and challenges "
         "identified",
         "Moderate positive sentiment (30-60%) with significant debate and "
         "varied viewpoints"},
    },
    {
        ConsensusType::RegulatoryCritical,
        {"regulatory_critical", "Regulatory Response", "#f4cccc",
         "Policy and legal frameworks struggling to keep pace with "
         "technological change",
         "High critical sentiment focused on governance, ethics, and legal "
         "implications"},
    },
    {
        ConsensusType::SafetySecurity,
        {"safety_security", "Safety/Security", "#e06666",
         "Risk management focus with emphasis on preventing harm and ensuring "
         "reliability",
         "High critical sentiment centered on safety protocols and security "
         "measures"},
    },
    {
        ConsensusType::WarfareDefense,
        {"warfare_defense", "Defense Applications", "#f08080",
         "Military and defense sector adoption with security implications",
         "Critical sentiment regarding dual-use technologies and military "
         "applications"},
    },
    {
        ConsensusType::Geopolitical,
        {"geopolitical", "Geopolitical Strategy", "#b4c7e7",
         "International competition and strategic national interests in "
         "technology",
         "Mixed sentiment reflecting competitive dynamics and policy "
         "considerations"},
    },
    {
        ConsensusType::BusinessAutomation,
        {"business_automation", "Business Transformation", "#ffe599",
         "Commercial adoption driving immediate market changes and disruption",
         "High positive sentiment with focus on near-term business "
         "opportunities"},
    },
    {
        ConsensusType::SocietalImpact,
        {"societal_impact", "Societal Impact", "#f6b26b",
         "Focus on broader social implications, ethics, and human-centered "
         "concerns",
         "Mixed sentiment with emphasis on social responsibility and human "
         "welfare"},
    },
};

const ConsensusMeta& consensus_meta(ConsensusType type) {
  return consensus_types.at(type);
}
