// RISKVAULT - Emergency Stop
// Copyright (c) 2024 RiskVault Developers
// MIT License

#ifndef RISKVAULT_VAULT_EMERGENCY_H
#define RISKVAULT_VAULT_EMERGENCY_H

#include "riskvault/vault/errors.h"

namespace riskvault {
namespace vault {

/**
 * Pause switch consulted first by every mutating non-admin entry point.
 * Reads, threshold verification and owner administration stay available.
 */
class EmergencyStop {
public:
    bool IsPaused() const { return paused_; }
    
    /// @return true if the state changed
    bool Pause() {
        bool changed = !paused_;
        paused_ = true;
        return changed;
    }
    
    /// @return true if the state changed
    bool Unpause() {
        bool changed = paused_;
        paused_ = false;
        return changed;
    }
    
    /// ContractPaused while paused, None otherwise
    VaultError RequireNotPaused() const {
        return paused_ ? VaultError::ContractPaused : VaultError::None;
    }
    
    void Restore(bool paused) { paused_ = paused; }

private:
    bool paused_{false};
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_EMERGENCY_H
