// RISKVAULT - Risk Bands
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Coarse classification disclosed in place of the raw score. The band table
// is fixed when a vault is deployed.

#ifndef RISKVAULT_VAULT_RISKBAND_H
#define RISKVAULT_VAULT_RISKBAND_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace riskvault {
namespace vault {

// ============================================================================
// Score Constants
// ============================================================================

/// Scores are fixed-point with two decimals (0.00 - 100.00)
constexpr uint32_t SCORE_PRECISION = 100;

/// Highest representable score
constexpr uint32_t MAX_RISK_SCORE = 100 * SCORE_PRECISION;

// ============================================================================
// Risk Band
// ============================================================================

enum class RiskBand : uint8_t {
    Unknown = 0,
    Low = 1,
    Medium = 2,
    High = 3,
    Critical = 4,
};

const char* RiskBandToString(RiskBand band);

/// Parse "LOW", "medium", ... (case-insensitive)
std::optional<RiskBand> RiskBandFromString(const std::string& str);

/// Number of band slots including Unknown
constexpr size_t NUM_RISK_BANDS = 5;

// ============================================================================
// Band Thresholds
// ============================================================================

/**
 * Ascending cut points splitting [0, MAX_RISK_SCORE] into 2 to 4 bands.
 * A score s falls into band i+1 where i is the number of cut points <= s.
 * 
 * The 3-tier table {3000, 7000}:
 *   LOW < 3000 <= MEDIUM < 7000 <= HIGH
 * The 4-tier table {2500, 5000, 7500} adds CRITICAL above 7500.
 */
class BandThresholds {
public:
    /// 3-tier default (LOW/MEDIUM/HIGH)
    BandThresholds();
    
    static BandThresholds ThreeTier();
    static BandThresholds FourTier();
    
    /**
     * Build a table from explicit cut points.
     * @return nullopt unless 1 to 3 cut points, strictly ascending,
     *         each in [1, MAX_RISK_SCORE]
     */
    static std::optional<BandThresholds> FromCutPoints(const std::vector<uint32_t>& cuts);
    
    /// Classify a plaintext score (must be <= MAX_RISK_SCORE)
    RiskBand Classify(uint32_t score) const;
    
    const std::vector<uint32_t>& GetCutPoints() const { return cuts_; }
    
    /// Number of bands excluding Unknown
    size_t TierCount() const { return cuts_.size() + 1; }
    
    /// Highest band this table can produce
    RiskBand HighestBand() const { return static_cast<RiskBand>(TierCount()); }
    
    bool operator==(const BandThresholds& other) const { return cuts_ == other.cuts_; }
    bool operator!=(const BandThresholds& other) const { return !(*this == other); }
    
    std::string ToString() const;

private:
    explicit BandThresholds(std::vector<uint32_t> cuts) : cuts_(std::move(cuts)) {}
    
    std::vector<uint32_t> cuts_;
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_RISKBAND_H
