// RISKVAULT - Access Control
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Contract owner plus the table of per-address updater state.

#ifndef RISKVAULT_VAULT_ACCESS_H
#define RISKVAULT_VAULT_ACCESS_H

#include "riskvault/core/serialize.h"
#include "riskvault/core/types.h"
#include "riskvault/vault/errors.h"

#include <cstdint>
#include <map>
#include <optional>

namespace riskvault {
namespace vault {

// ============================================================================
// Updater State
// ============================================================================

/**
 * Per-address bookkeeping. Rows are created when an address is first
 * authorized or first throttled, and are never removed.
 */
struct UpdaterState {
    bool authorized{false};
    
    /// Time of the last accepted submission (0 = never)
    Timestamp lastSubmissionTime{0};
    
    /// Threshold verifications counted in dayBucket
    uint32_t decryptionsToday{0};
    
    /// floor(time / 86400) of the counted verifications
    int64_t dayBucket{0};
    
    bool operator==(const UpdaterState& other) const {
        return authorized == other.authorized &&
               lastSubmissionTime == other.lastSubmissionTime &&
               decryptionsToday == other.decryptionsToday &&
               dayBucket == other.dayBucket;
    }
};

template<typename Stream>
void Serialize(Stream& s, const UpdaterState& state) {
    Serialize(s, state.authorized);
    Serialize(s, state.lastSubmissionTime);
    Serialize(s, state.decryptionsToday);
    Serialize(s, state.dayBucket);
}

template<typename Stream>
void Unserialize(Stream& s, UpdaterState& state) {
    Unserialize(s, state.authorized);
    Unserialize(s, state.lastSubmissionTime);
    Unserialize(s, state.decryptionsToday);
    Unserialize(s, state.dayBucket);
}

// ============================================================================
// Access Control
// ============================================================================

class AccessControl {
public:
    explicit AccessControl(const Address& owner) : owner_(owner) {}
    
    const Address& GetOwner() const { return owner_; }
    bool IsOwner(const Address& account) const { return account == owner_; }
    
    /// True for the owner and for explicitly authorized addresses
    bool IsAuthorizedUpdater(const Address& account) const;
    
    /**
     * Set the authorization flag of an updater. Idempotent.
     * @return true if the flag changed
     */
    bool SetAuthorized(const Address& account, bool authorized);
    
    /// Replace the owner. ZeroAddress for the null address.
    VaultError SetOwner(const Address& newOwner);
    
    std::optional<UpdaterState> GetState(const Address& account) const;
    
    /// State row for account, created on first use
    UpdaterState& MutableState(const Address& account) { return states_[account]; }
    
    /// Overwrite or restore a row
    void PutState(const Address& account, const UpdaterState& state) { states_[account] = state; }
    
    /// Remove a row (used only to undo a row created in a failed transaction)
    void EraseState(const Address& account) { states_.erase(account); }
    void ClearStates() { states_.clear(); }
    
    const std::map<Address, UpdaterState>& GetStates() const { return states_; }

private:
    Address owner_;
    std::map<Address, UpdaterState> states_;
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_ACCESS_H
