// RISKVAULT - Risk Bands
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/vault/riskband.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace riskvault {
namespace vault {

const char* RiskBandToString(RiskBand band) {
    switch (band) {
        case RiskBand::Unknown:  return "UNKNOWN";
        case RiskBand::Low:      return "LOW";
        case RiskBand::Medium:   return "MEDIUM";
        case RiskBand::High:     return "HIGH";
        case RiskBand::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<RiskBand> RiskBandFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    
    if (upper == "UNKNOWN")  return RiskBand::Unknown;
    if (upper == "LOW")      return RiskBand::Low;
    if (upper == "MEDIUM")   return RiskBand::Medium;
    if (upper == "HIGH")     return RiskBand::High;
    if (upper == "CRITICAL") return RiskBand::Critical;
    return std::nullopt;
}

// ============================================================================
// BandThresholds
// ============================================================================

BandThresholds::BandThresholds() : cuts_{3000, 7000} {}

BandThresholds BandThresholds::ThreeTier() {
    return BandThresholds();
}

BandThresholds BandThresholds::FourTier() {
    return BandThresholds(std::vector<uint32_t>{2500, 5000, 7500});
}

std::optional<BandThresholds> BandThresholds::FromCutPoints(const std::vector<uint32_t>& cuts) {
    if (cuts.empty() || cuts.size() > NUM_RISK_BANDS - 2) {
        return std::nullopt;
    }
    
    uint32_t prev = 0;
    for (uint32_t cut : cuts) {
        if (cut <= prev || cut > MAX_RISK_SCORE) {
            return std::nullopt;
        }
        prev = cut;
    }
    
    return BandThresholds(cuts);
}

RiskBand BandThresholds::Classify(uint32_t score) const {
    size_t tier = 0;
    while (tier < cuts_.size() && score >= cuts_[tier]) {
        ++tier;
    }
    return static_cast<RiskBand>(tier + 1);
}

std::string BandThresholds::ToString() const {
    std::ostringstream oss;
    for (size_t i = 0; i < cuts_.size(); ++i) {
        oss << RiskBandToString(static_cast<RiskBand>(i + 1)) << " < " << cuts_[i] << " <= ";
    }
    oss << RiskBandToString(HighestBand());
    return oss.str();
}

} // namespace vault
} // namespace riskvault
