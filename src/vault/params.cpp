// RISKVAULT - Deployment Parameters
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/vault/params.h"
#include "riskvault/util/config.h"

#include <stdexcept>

namespace riskvault {
namespace vault {

VaultParams VaultParams::Main() {
    VaultParams params;
    params.networkID = "main";
    params.minUpdateInterval = 3600;
    params.maxDailyDecryptions = 10;
    params.scoreValidityPeriod = DEFAULT_VALIDITY_PERIOD;
    params.passportValidityPeriod = DEFAULT_VALIDITY_PERIOD;
    params.bands = BandThresholds::ThreeTier();
    params.genesisHeight = 1;
    return params;
}

VaultParams VaultParams::TestNet() {
    VaultParams params = Main();
    params.networkID = "test";
    return params;
}

VaultParams VaultParams::RegTest() {
    VaultParams params = Main();
    params.networkID = "regtest";
    params.minUpdateInterval = 60;
    params.maxDailyDecryptions = 100;
    return params;
}

VaultParams VaultParams::ForNetwork(const std::string& network) {
    if (network == "test" || network == "testnet") {
        return TestNet();
    }
    if (network == "regtest") {
        return RegTest();
    }
    return Main();
}

VaultParams VaultParams::FromConfig(const util::ConfigManager& config) {
    using util::ConfigKeys::NETWORK;
    
    VaultParams params = ForNetwork(config.GetString(NETWORK, "main"));
    
    if (config.HasKey(util::ConfigKeys::MIN_UPDATE_INTERVAL)) {
        auto interval = config.TryGetInt(util::ConfigKeys::MIN_UPDATE_INTERVAL);
        if (!interval || *interval < 0) {
            throw std::invalid_argument("minupdateinterval: not a duration");
        }
        if (*interval > MAX_UPDATE_INTERVAL) {
            throw std::invalid_argument("minupdateinterval: interval too long");
        }
        params.minUpdateInterval = *interval;
    }
    
    if (config.HasKey(util::ConfigKeys::MAX_DAILY_DECRYPTIONS)) {
        auto limit = config.TryGetInt(util::ConfigKeys::MAX_DAILY_DECRYPTIONS);
        if (!limit || *limit <= 0 || *limit > UINT32_MAX) {
            throw std::invalid_argument("maxdailydecryptions: invalid limit");
        }
        params.maxDailyDecryptions = static_cast<uint32_t>(*limit);
    }
    
    if (config.HasKey(util::ConfigKeys::SCORE_VALIDITY)) {
        auto period = config.TryGetInt(util::ConfigKeys::SCORE_VALIDITY);
        if (!period || !IsValidPeriod(*period)) {
            throw std::invalid_argument("scorevalidity: invalid period");
        }
        params.scoreValidityPeriod = *period;
    }
    
    if (config.HasKey(util::ConfigKeys::PASSPORT_VALIDITY)) {
        auto period = config.TryGetInt(util::ConfigKeys::PASSPORT_VALIDITY);
        if (!period || !IsValidPeriod(*period)) {
            throw std::invalid_argument("passportvalidity: invalid period");
        }
        params.passportValidityPeriod = *period;
    }
    
    if (config.HasKey(util::ConfigKeys::BANDS)) {
        auto tiers = config.TryGetInt(util::ConfigKeys::BANDS);
        if (tiers && *tiers == 3) {
            params.bands = BandThresholds::ThreeTier();
        } else if (tiers && *tiers == 4) {
            params.bands = BandThresholds::FourTier();
        } else {
            throw std::invalid_argument("bands: expected 3 or 4");
        }
    }
    
    if (config.HasKey(util::ConfigKeys::GENESIS_HEIGHT)) {
        auto height = config.TryGetInt(util::ConfigKeys::GENESIS_HEIGHT);
        if (!height || *height <= 0) {
            throw std::invalid_argument("genesisheight: must be positive");
        }
        params.genesisHeight = static_cast<BlockHeight>(*height);
    }
    
    return params;
}

} // namespace vault
} // namespace riskvault
