// RISKVAULT - Deployment Parameters
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Initial configuration of a vault/registry deployment. Everything except
// the band table can later be changed by the owner.

#ifndef RISKVAULT_VAULT_PARAMS_H
#define RISKVAULT_VAULT_PARAMS_H

#include "riskvault/core/types.h"
#include "riskvault/vault/riskband.h"

#include <cstdint>
#include <string>

namespace riskvault {

namespace util {
class ConfigManager;
}

namespace vault {

// ============================================================================
// Limits
// ============================================================================

constexpr Duration ONE_DAY = 24 * 60 * 60;

/// Upper bound for minUpdateInterval
constexpr Duration MAX_UPDATE_INTERVAL = ONE_DAY;

/// Bounds for score and passport validity periods
constexpr Duration MIN_VALIDITY_PERIOD = ONE_DAY;
constexpr Duration MAX_VALIDITY_PERIOD = 365 * ONE_DAY;

/// Default score and passport validity (30 days)
constexpr Duration DEFAULT_VALIDITY_PERIOD = 30 * ONE_DAY;

/// True if period lies in [MIN_VALIDITY_PERIOD, MAX_VALIDITY_PERIOD]
inline bool IsValidPeriod(Duration period) {
    return period >= MIN_VALIDITY_PERIOD && period <= MAX_VALIDITY_PERIOD;
}

// ============================================================================
// Vault Parameters
// ============================================================================

struct VaultParams {
    /// Network name (main, test, regtest)
    std::string networkID;
    
    /// Minimum seconds between submissions of one updater
    Duration minUpdateInterval{3600};
    
    /// Threshold verifications per caller per day
    uint32_t maxDailyDecryptions{10};
    
    /// Default score validity
    Duration scoreValidityPeriod{DEFAULT_VALIDITY_PERIOD};
    
    /// Passport lifetime from mint
    Duration passportValidityPeriod{DEFAULT_VALIDITY_PERIOD};
    
    /// Band table, fixed for the deployment
    BandThresholds bands;
    
    /// Ledger block number of the first transaction
    BlockHeight genesisHeight{1};
    
    static VaultParams Main();
    static VaultParams TestNet();
    static VaultParams RegTest();
    
    /// Parameters for a network name; Main() for unknown names
    static VaultParams ForNetwork(const std::string& network);
    
    /**
     * Start from the profile named by "network" and apply overrides from
     * config. Throws std::invalid_argument if a value is out of bounds.
     */
    static VaultParams FromConfig(const util::ConfigManager& config);
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_PARAMS_H
