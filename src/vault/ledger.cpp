// RISKVAULT - Risk Ledger Implementation
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/vault/ledger.h"

#include "riskvault/crypto/commitment.h"
#include "riskvault/util/logging.h"
#include "riskvault/util/time.h"

#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

namespace riskvault {
namespace vault {

namespace {

bool Succeeded(VaultError error) { return error == VaultError::None; }

template<typename R>
bool Succeeded(const R& result) { return result.ok(); }

VaultError ErrorOf(VaultError error) { return error; }

template<typename R>
VaultError ErrorOf(const R& result) { return result.error; }

} // namespace

// ============================================================================
// Deployment
// ============================================================================

Deployment Deployment::ForDeployer(const Address& deployer) {
    Deployment d;
    d.deployer = deployer;
    d.vault = crypto::DeriveContractAddress(deployer, 0);
    d.registry = crypto::DeriveContractAddress(deployer, 1);
    return d;
}

// ============================================================================
// Transaction Execution
// ============================================================================

template<typename Fn>
auto RiskLedger::Execute(const char* name, const Address& sender, Fn&& fn) {
    std::unique_lock<std::mutex> lock(mutex_);
    
    CallContext ctx = CallContext::Direct(sender, Now(), blockNumber_ + 1);
    size_t mark = events_.Mark();
    std::shared_ptr<const ThresholdVerifier> verifier = vault_->GetVerifier();
    
    auto result = fn(ctx);
    if (!Succeeded(result)) {
        events_.Rollback(mark);
        LOG_DEBUG(util::LogCategory::LEDGER) << name << " from " << sender.ToString()
                                             << " rejected: " << ErrorOf(result);
        return result;
    }
    
    if (state_) {
        db::Status s = Persist(mark, ctx.blockNumber);
        if (!s.ok()) {
            events_.Rollback(mark);
            Reload(verifier);
            throw std::runtime_error("Failed to persist block " + std::to_string(ctx.blockNumber) +
                                     ": " + s.ToString());
        }
    }
    blockNumber_ = ctx.blockNumber;
    std::vector<Event> committed = events_.Commit(mark);
    lock.unlock();
    
    LOG_DEBUG(util::LogCategory::LEDGER) << name << " accepted in block " << ctx.blockNumber;
    events_.Publish(committed);
    return result;
}

void RiskLedger::Reload(std::shared_ptr<const ThresholdVerifier> verifier) {
    vault_->ClearState();
    registry_->ClearState();
    
    db::Status s = state_->Load(*vault_, *registry_, blockNumber_);
    if (!s.ok()) {
        throw std::runtime_error("Failed to load ledger state: " + s.ToString());
    }
    vault_->RestoreVerifier(std::move(verifier));
}

RiskLedger::RiskLedger(const VaultParams& params, const Address& deployer,
                       std::shared_ptr<const ThresholdVerifier> verifier,
                       std::unique_ptr<StateDB> state)
    : params_(params)
    , state_(std::move(state))
    , blockNumber_(params.genesisHeight > 0 ? params.genesisHeight - 1 : 0) {
    bool reopen = state_ && state_->HasState();
    
    Address owner = deployer;
    if (reopen) {
        db::Status s = state_->ReadDeployer(owner);
        if (!s.ok()) {
            throw std::runtime_error("Failed to read deployment: " + s.ToString());
        }
    }
    if (owner.IsNull()) {
        throw std::runtime_error("Deployer must not be the null address");
    }
    deployment_ = Deployment::ForDeployer(owner);
    
    vault_ = std::make_unique<RiskScoreVault>(deployment_.vault, owner, params_, events_);
    
    auto [err, registry] = PassportRegistry::Deploy(deployment_.registry, owner, vault_.get(),
                                                    params_.passportValidityPeriod, events_);
    if (err != VaultError::None) {
        throw std::runtime_error(std::string("Registry deployment failed: ") +
                                 VaultErrorMessage(err));
    }
    registry_ = std::move(registry);
    
    if (reopen) {
        Reload(std::move(verifier));
        LOG_INFO(util::LogCategory::LEDGER) << "Reopened ledger at block " << blockNumber_;
        return;
    }
    
    VaultError genesis = Execute("Genesis", owner, [&](const CallContext& ctx) {
        VaultError e = vault_->SetPassportNFT(ctx, registry_.get());
        if (e == VaultError::None && verifier) {
            e = vault_->SetVerifier(ctx, verifier);
        }
        return e;
    });
    if (genesis != VaultError::None) {
        throw std::runtime_error(std::string("Genesis failed: ") + VaultErrorMessage(genesis));
    }
    
    LOG_INFO(util::LogCategory::LEDGER) << "Deployed vault " << deployment_.vault.ToString()
                                        << " and registry " << deployment_.registry.ToString()
                                        << " (" << params_.networkID << ")";
}

// ============================================================================
// Clock
// ============================================================================

Timestamp RiskLedger::Now() const {
    return util::GetTime();
}

BlockHeight RiskLedger::GetBlockNumber() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blockNumber_;
}

db::Status RiskLedger::Persist(size_t mark, BlockHeight height) {
    db::WriteBatch batch;
    const auto& events = events_.GetEvents();
    
    for (size_t i = mark; i < events.size(); ++i) {
        const EventData& data = events[i].data;
        
        if (const auto* ev = std::get_if<RiskAnalysisSubmitted>(&data)) {
            if (auto rec = vault_->GetRecord(ev->commitment)) {
                StateDB::WriteCommitment(batch, ev->commitment, *rec);
            }
            StateDB::WriteNullifier(batch, ev->nullifier);
            if (auto st = vault_->GetUpdaterState(ev->analyzer)) {
                StateDB::WriteUpdaterState(batch, ev->analyzer, *st);
            }
        } else if (const auto* ev = std::get_if<DAOVerificationPerformed>(&data)) {
            if (auto st = vault_->GetUpdaterState(ev->requester)) {
                StateDB::WriteUpdaterState(batch, ev->requester, *st);
            }
        } else if (const auto* ev = std::get_if<UpdaterAuthorized>(&data)) {
            if (auto st = vault_->GetUpdaterState(ev->updater)) {
                StateDB::WriteUpdaterState(batch, ev->updater, *st);
            }
        } else if (const auto* ev = std::get_if<CustomValidityPeriodSet>(&data)) {
            if (ev->period == 0) {
                StateDB::EraseCustomValidity(batch, ev->commitment);
            } else {
                StateDB::WriteCustomValidity(batch, ev->commitment, ev->period);
            }
        } else if (const auto* ev = std::get_if<PassportMinted>(&data)) {
            if (auto p = registry_->GetPassport(ev->tokenId)) {
                StateDB::WritePassport(batch, ev->tokenId, *p);
            }
        } else if (const auto* ev = std::get_if<PassportRevoked>(&data)) {
            if (auto p = registry_->GetPassport(ev->tokenId)) {
                StateDB::WritePassport(batch, ev->tokenId, *p);
            }
        } else if (const auto* ev = std::get_if<Transfer>(&data)) {
            if (auto p = registry_->GetPassport(ev->tokenId)) {
                StateDB::WritePassport(batch, ev->tokenId, *p);
            }
            if (registry_->GetApproved(ev->tokenId).IsNull()) {
                StateDB::EraseApproval(batch, ev->tokenId);
            }
        } else if (const auto* ev = std::get_if<Approval>(&data)) {
            if (ev->approved.IsNull()) {
                StateDB::EraseApproval(batch, ev->tokenId);
            } else {
                StateDB::WriteApproval(batch, ev->tokenId, ev->approved);
            }
        } else if (const auto* ev = std::get_if<ApprovalForAll>(&data)) {
            StateDB::WriteOperator(batch, ev->owner, ev->operatorAddr, ev->approved);
        }
    }
    
    StateDB::WriteVaultConfig(batch, vault_->GetConfigState());
    StateDB::WriteRegistryConfig(batch, registry_->GetConfigState());
    StateDB::WriteBlockNumber(batch, height);
    StateDB::WriteDeployer(batch, deployment_.deployer);
    
    return state_->Commit(batch);
}

// ============================================================================
// Vault Transactions
// ============================================================================

SubmitResult RiskLedger::SubmitRiskAnalysis(const Address& sender, const RiskAnalysis& analysis) {
    return Execute("SubmitRiskAnalysis", sender, [&](const CallContext& ctx) {
        return vault_->SubmitRiskAnalysis(ctx, analysis);
    });
}

VerifyResult RiskLedger::VerifyRiskThreshold(const Address& sender, const CommitmentHash& commitment,
                                             uint32_t threshold, const Bytes& proof) {
    return Execute("VerifyRiskThreshold", sender, [&](const CallContext& ctx) {
        return vault_->VerifyRiskThreshold(ctx, commitment, threshold, proof);
    });
}

VaultError RiskLedger::SetAuthorizedUpdater(const Address& sender, const Address& updater,
                                            bool authorized) {
    return Execute("SetAuthorizedUpdater", sender, [&](const CallContext& ctx) {
        return vault_->SetAuthorizedUpdater(ctx, updater, authorized);
    });
}

VaultError RiskLedger::SetVerifier(const Address& sender,
                                   std::shared_ptr<const ThresholdVerifier> verifier) {
    return Execute("SetVerifier", sender, [&](const CallContext& ctx) {
        return vault_->SetVerifier(ctx, verifier);
    });
}

VaultError RiskLedger::SetMinUpdateInterval(const Address& sender, Duration interval) {
    return Execute("SetMinUpdateInterval", sender, [&](const CallContext& ctx) {
        return vault_->SetMinUpdateInterval(ctx, interval);
    });
}

VaultError RiskLedger::SetMaxDailyDecryptions(const Address& sender, uint32_t limit) {
    return Execute("SetMaxDailyDecryptions", sender, [&](const CallContext& ctx) {
        return vault_->SetMaxDailyDecryptions(ctx, limit);
    });
}

VaultError RiskLedger::SetCustomValidityPeriod(const Address& sender, const CommitmentHash& commitment,
                                               Duration period) {
    return Execute("SetCustomValidityPeriod", sender, [&](const CallContext& ctx) {
        return vault_->SetCustomValidityPeriod(ctx, commitment, period);
    });
}

VaultError RiskLedger::Pause(const Address& sender) {
    return Execute("Pause", sender, [&](const CallContext& ctx) {
        return vault_->Pause(ctx);
    });
}

VaultError RiskLedger::Unpause(const Address& sender) {
    return Execute("Unpause", sender, [&](const CallContext& ctx) {
        return vault_->Unpause(ctx);
    });
}

VaultError RiskLedger::TransferVaultOwnership(const Address& sender, const Address& newOwner) {
    return Execute("TransferVaultOwnership", sender, [&](const CallContext& ctx) {
        return vault_->TransferOwnership(ctx, newOwner);
    });
}

// ============================================================================
// Registry Transactions
// ============================================================================

VerifyResult RiskLedger::VerifyPassportThreshold(const Address& sender, TokenId tokenId,
                                                 uint32_t threshold, const Bytes& proof) {
    return Execute("VerifyPassportThreshold", sender, [&](const CallContext& ctx) {
        return registry_->VerifyRiskThreshold(ctx, tokenId, threshold, proof);
    });
}

VaultError RiskLedger::RevokePassport(const Address& sender, TokenId tokenId,
                                      const std::string& reason) {
    return Execute("RevokePassport", sender, [&](const CallContext& ctx) {
        return registry_->RevokePassport(ctx, tokenId, reason);
    });
}

VaultError RiskLedger::SetPassportValidityPeriod(const Address& sender, Duration period) {
    return Execute("SetPassportValidityPeriod", sender, [&](const CallContext& ctx) {
        return registry_->SetValidityPeriod(ctx, period);
    });
}

VaultError RiskLedger::TransferRegistryOwnership(const Address& sender, const Address& newOwner) {
    return Execute("TransferRegistryOwnership", sender, [&](const CallContext& ctx) {
        return registry_->TransferOwnership(ctx, newOwner);
    });
}

VaultError RiskLedger::TransferFrom(const Address& sender, const Address& from, const Address& to,
                                    TokenId tokenId) {
    return Execute("TransferFrom", sender, [&](const CallContext& ctx) {
        return registry_->TransferFrom(ctx, from, to, tokenId);
    });
}

VaultError RiskLedger::Approve(const Address& sender, const Address& approved, TokenId tokenId) {
    return Execute("Approve", sender, [&](const CallContext& ctx) {
        return registry_->Approve(ctx, approved, tokenId);
    });
}

VaultError RiskLedger::SetApprovalForAll(const Address& sender, const Address& operatorAddr,
                                         bool approved) {
    return Execute("SetApprovalForAll", sender, [&](const CallContext& ctx) {
        return registry_->SetApprovalForAll(ctx, operatorAddr, approved);
    });
}

} // namespace vault
} // namespace riskvault
