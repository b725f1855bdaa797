// RISKVAULT - Risk Ledger
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Deploys the vault and passport registry side by side and executes calls
// against them as serialized transactions. A rejected transaction leaves no
// trace; an accepted one advances the block number, publishes its events
// and, with a state database attached, is written as one batch. If that
// write fails the contracts are reloaded from the database and the call
// throws std::runtime_error.
//
// Listeners run after the ledger lock is released and may query the ledger.

#ifndef RISKVAULT_VAULT_LEDGER_H
#define RISKVAULT_VAULT_LEDGER_H

#include "riskvault/core/types.h"
#include "riskvault/vault/context.h"
#include "riskvault/vault/errors.h"
#include "riskvault/vault/events.h"
#include "riskvault/vault/params.h"
#include "riskvault/vault/passport.h"
#include "riskvault/vault/scorevault.h"
#include "riskvault/vault/statedb.h"
#include "riskvault/vault/verifier.h"

#include <memory>
#include <mutex>
#include <string>

namespace riskvault {
namespace vault {

/// Contract addresses of a deployment
struct Deployment {
    Address deployer;
    Address vault;
    Address registry;
    
    /// Addresses derived from the deployer (nonces 0 and 1)
    static Deployment ForDeployer(const Address& deployer);
};

class RiskLedger {
public:
    /**
     * Deploy or reopen a ledger.
     * 
     * With an empty (or no) state database the contracts are deployed by
     * deployer and linked in a genesis transaction. Otherwise state is
     * loaded from the database.
     * 
     * @param verifier Injected verifier, may be null
     * Throws std::runtime_error if stored state cannot be loaded.
     */
    RiskLedger(const VaultParams& params, const Address& deployer,
               std::shared_ptr<const ThresholdVerifier> verifier = nullptr,
               std::unique_ptr<StateDB> state = nullptr);
    
    RiskLedger(const RiskLedger&) = delete;
    RiskLedger& operator=(const RiskLedger&) = delete;
    
    // ========================================================================
    // Vault Transactions
    // ========================================================================
    
    SubmitResult SubmitRiskAnalysis(const Address& sender, const RiskAnalysis& analysis);
    VerifyResult VerifyRiskThreshold(const Address& sender, const CommitmentHash& commitment,
                                     uint32_t threshold, const Bytes& proof);
    
    VaultError SetAuthorizedUpdater(const Address& sender, const Address& updater, bool authorized);
    VaultError SetVerifier(const Address& sender, std::shared_ptr<const ThresholdVerifier> verifier);
    VaultError SetMinUpdateInterval(const Address& sender, Duration interval);
    VaultError SetMaxDailyDecryptions(const Address& sender, uint32_t limit);
    VaultError SetCustomValidityPeriod(const Address& sender, const CommitmentHash& commitment,
                                       Duration period);
    VaultError Pause(const Address& sender);
    VaultError Unpause(const Address& sender);
    VaultError TransferVaultOwnership(const Address& sender, const Address& newOwner);
    
    // ========================================================================
    // Registry Transactions
    // ========================================================================
    
    VerifyResult VerifyPassportThreshold(const Address& sender, TokenId tokenId,
                                         uint32_t threshold, const Bytes& proof);
    VaultError RevokePassport(const Address& sender, TokenId tokenId, const std::string& reason);
    VaultError SetPassportValidityPeriod(const Address& sender, Duration period);
    VaultError TransferRegistryOwnership(const Address& sender, const Address& newOwner);
    VaultError TransferFrom(const Address& sender, const Address& from, const Address& to,
                            TokenId tokenId);
    VaultError Approve(const Address& sender, const Address& approved, TokenId tokenId);
    VaultError SetApprovalForAll(const Address& sender, const Address& operatorAddr, bool approved);
    
    // ========================================================================
    // State
    // ========================================================================
    
    const RiskScoreVault& GetVault() const { return *vault_; }
    const PassportRegistry& GetRegistry() const { return *registry_; }
    const Deployment& GetDeployment() const { return deployment_; }
    const VaultParams& GetParams() const { return params_; }
    
    EventLog& GetEvents() { return events_; }
    const EventLog& GetEvents() const { return events_; }
    
    /// Ledger clock
    Timestamp Now() const;
    
    /// Block number of the last accepted transaction
    BlockHeight GetBlockNumber() const;
    
    bool IsPersistent() const { return state_ != nullptr; }

private:
    /// Run fn as one transaction on behalf of sender
    template<typename Fn>
    auto Execute(const char* name, const Address& sender, Fn&& fn);
    
    /// Write what the events since mark touched, plus configuration
    db::Status Persist(size_t mark, BlockHeight height);
    
    /// Replace in-memory contract state with what the database holds
    void Reload(std::shared_ptr<const ThresholdVerifier> verifier);
    
    VaultParams params_;
    Deployment deployment_;
    EventLog events_;
    std::unique_ptr<RiskScoreVault> vault_;
    std::unique_ptr<PassportRegistry> registry_;
    std::unique_ptr<StateDB> state_;
    BlockHeight blockNumber_{0};
    mutable std::mutex mutex_;
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_LEDGER_H
