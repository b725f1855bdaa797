// RISKVAULT - Ledger State Database Implementation
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/vault/statedb.h"

#include "riskvault/util/logging.h"

#include <stdexcept>

namespace riskvault {
namespace vault {

// ============================================================================
// Construction
// ============================================================================

StateDB::StateDB(const std::filesystem::path& dbPath, const db::Options& options) {
    std::error_code ec;
    std::filesystem::create_directories(dbPath, ec);
    if (ec) {
        throw std::runtime_error("Cannot create state directory " + dbPath.string() +
                                 ": " + ec.message());
    }
    
    auto [status, database] = db::OpenDatabase(dbPath, options);
    if (!status.ok()) {
        throw std::runtime_error("Failed to open state database: " + status.ToString());
    }
    db_ = std::move(database);
}

StateDB::StateDB(std::unique_ptr<db::Database> database) : db_(std::move(database)) {
    if (!db_) {
        throw std::runtime_error("StateDB: null database");
    }
}

bool StateDB::HasState() {
    return db_->Exists(db::MakeKey(prefix::VAULT_CONFIG));
}

// ============================================================================
// Batch Writers
// ============================================================================

void StateDB::WriteCommitment(db::WriteBatch& batch, const CommitmentHash& commitment,
                              const CommitmentRecord& rec) {
    batch.Put(db::MakeKey(prefix::COMMITMENT, commitment), db::SerializeToString(rec));
}

void StateDB::WriteNullifier(db::WriteBatch& batch, const NullifierHash& nullifier) {
    batch.Put(db::MakeKey(prefix::NULLIFIER, nullifier), db::Slice());
}

void StateDB::WriteUpdaterState(db::WriteBatch& batch, const Address& account,
                                const UpdaterState& state) {
    batch.Put(db::MakeKey(prefix::UPDATER, account), db::SerializeToString(state));
}

void StateDB::WriteCustomValidity(db::WriteBatch& batch, const CommitmentHash& commitment,
                                  Duration period) {
    batch.Put(db::MakeKey(prefix::CUSTOM_VALIDITY, commitment), db::SerializeToString(period));
}

void StateDB::EraseCustomValidity(db::WriteBatch& batch, const CommitmentHash& commitment) {
    batch.Delete(db::MakeKey(prefix::CUSTOM_VALIDITY, commitment));
}

void StateDB::WritePassport(db::WriteBatch& batch, TokenId tokenId, const Passport& passport) {
    batch.Put(db::MakeKey(prefix::PASSPORT, tokenId), db::SerializeToString(passport));
}

void StateDB::WriteApproval(db::WriteBatch& batch, TokenId tokenId, const Address& approved) {
    batch.Put(db::MakeKey(prefix::TOKEN_APPROVAL, tokenId), db::SerializeToString(approved));
}

void StateDB::EraseApproval(db::WriteBatch& batch, TokenId tokenId) {
    batch.Delete(db::MakeKey(prefix::TOKEN_APPROVAL, tokenId));
}

std::string StateDB::OperatorKey(const Address& owner, const Address& operatorAddr) {
    return db::MakeKey(prefix::OPERATOR, owner) + db::SerializeToString(operatorAddr);
}

void StateDB::WriteOperator(db::WriteBatch& batch, const Address& owner,
                            const Address& operatorAddr, bool approved) {
    std::string key = OperatorKey(owner, operatorAddr);
    if (approved) {
        batch.Put(key, db::Slice());
    } else {
        batch.Delete(key);
    }
}

void StateDB::WriteVaultConfig(db::WriteBatch& batch, const VaultConfigState& cfg) {
    batch.Put(db::MakeKey(prefix::VAULT_CONFIG), db::SerializeToString(cfg));
}

void StateDB::WriteRegistryConfig(db::WriteBatch& batch, const RegistryConfigState& cfg) {
    batch.Put(db::MakeKey(prefix::REGISTRY_CONFIG), db::SerializeToString(cfg));
}

void StateDB::WriteBlockNumber(db::WriteBatch& batch, BlockHeight height) {
    batch.Put(db::MakeKey(prefix::BLOCK_NUMBER), db::SerializeToString(static_cast<uint64_t>(height)));
}

void StateDB::WriteDeployer(db::WriteBatch& batch, const Address& deployer) {
    batch.Put(db::MakeKey(prefix::DEPLOYER), db::SerializeToString(deployer));
}

db::Status StateDB::Commit(db::WriteBatch& batch) {
    db::WriteOptions opts;
    opts.sync = true;
    db::Status s = db_->Write(opts, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "State commit failed: " << s.ToString();
        return s;
    }
    ++commits_;
    return s;
}

// ============================================================================
// Loading
// ============================================================================

db::Status StateDB::ReadDeployer(Address& deployer) {
    std::string value;
    db::Status s = db_->Get(db::MakeKey(prefix::DEPLOYER), &value);
    if (!s.ok()) {
        return s;
    }
    if (!db::DeserializeFromString(value, deployer)) {
        return db::Status::Corruption("deployer");
    }
    return db::Status::Ok();
}

template<typename Func>
db::Status StateDB::ForEach(char p, Func&& func) {
    std::string start = db::MakeKey(p);
    db::Slice startSlice(start);
    db::ReadOptions scan;
    scan.verify_checksums = true;
    scan.fill_cache = false;
    auto iter = db_->NewIterator(scan);
    for (iter->Seek(startSlice); iter->Valid() && iter->key().starts_with(startSlice); iter->Next()) {
        std::string suffix(iter->key().data() + 1, iter->key().size() - 1);
        if (!func(suffix, iter->value().ToString())) {
            return db::Status::Corruption(std::string("bad entry under prefix '") + p + "'");
        }
    }
    return iter->status();
}

db::Status StateDB::Load(RiskScoreVault& vault, PassportRegistry& registry,
                         BlockHeight& blockNumber) {
    std::string value;
    db::Status s = db_->Get(db::MakeKey(prefix::VAULT_CONFIG), &value);
    if (!s.ok()) {
        return s;
    }
    VaultConfigState vaultCfg;
    if (!db::DeserializeFromString(value, vaultCfg)) {
        return db::Status::Corruption("vault config");
    }
    
    s = db_->Get(db::MakeKey(prefix::REGISTRY_CONFIG), &value);
    if (!s.ok()) {
        return s.IsNotFound() ? db::Status::Corruption("registry config missing") : s;
    }
    RegistryConfigState registryCfg;
    if (!db::DeserializeFromString(value, registryCfg)) {
        return db::Status::Corruption("registry config");
    }
    
    uint64_t height = 0;
    s = db_->Get(db::MakeKey(prefix::BLOCK_NUMBER), &value);
    if (s.ok()) {
        if (!db::DeserializeFromString(value, height)) {
            return db::Status::Corruption("block number");
        }
    } else if (!s.IsNotFound()) {
        return s;
    }
    
    if (!vault.RestoreConfigState(vaultCfg, &registry)) {
        return db::Status::Corruption("vault config does not match deployment parameters");
    }
    blockNumber = height;
    
    s = ForEach(prefix::COMMITMENT, [&](const std::string& key, const std::string& val) {
        CommitmentHash commitment;
        CommitmentRecord rec;
        if (!db::DeserializeFromString(key, commitment) || !db::DeserializeFromString(val, rec)) {
            return false;
        }
        vault.RestoreRecord(commitment, rec);
        return true;
    });
    if (!s.ok()) return s;
    
    s = ForEach(prefix::NULLIFIER, [&](const std::string& key, const std::string&) {
        NullifierHash nullifier;
        if (!db::DeserializeFromString(key, nullifier)) {
            return false;
        }
        vault.RestoreNullifier(nullifier);
        return true;
    });
    if (!s.ok()) return s;
    
    s = ForEach(prefix::UPDATER, [&](const std::string& key, const std::string& val) {
        Address account;
        UpdaterState state;
        if (!db::DeserializeFromString(key, account) || !db::DeserializeFromString(val, state)) {
            return false;
        }
        vault.RestoreUpdaterState(account, state);
        return true;
    });
    if (!s.ok()) return s;
    
    s = ForEach(prefix::CUSTOM_VALIDITY, [&](const std::string& key, const std::string& val) {
        CommitmentHash commitment;
        Duration period = 0;
        if (!db::DeserializeFromString(key, commitment) || !db::DeserializeFromString(val, period)) {
            return false;
        }
        vault.RestoreCustomValidityPeriod(commitment, period);
        return true;
    });
    if (!s.ok()) return s;
    
    s = ForEach(prefix::PASSPORT, [&](const std::string& key, const std::string& val) {
        TokenId tokenId = 0;
        Passport passport;
        if (!db::DeserializeFromString(key, tokenId) || !db::DeserializeFromString(val, passport)) {
            return false;
        }
        registry.RestorePassport(tokenId, passport);
        return true;
    });
    if (!s.ok()) return s;
    
    s = ForEach(prefix::TOKEN_APPROVAL, [&](const std::string& key, const std::string& val) {
        TokenId tokenId = 0;
        Address approved;
        if (!db::DeserializeFromString(key, tokenId) || !db::DeserializeFromString(val, approved)) {
            return false;
        }
        registry.RestoreApproval(tokenId, approved);
        return true;
    });
    if (!s.ok()) return s;
    
    s = ForEach(prefix::OPERATOR, [&](const std::string& key, const std::string&) {
        if (key.size() != 2 * Address::SIZE) {
            return false;
        }
        Address owner(reinterpret_cast<const Byte*>(key.data()), Address::SIZE);
        Address operatorAddr(reinterpret_cast<const Byte*>(key.data()) + Address::SIZE, Address::SIZE);
        registry.RestoreOperatorApproval(owner, operatorAddr);
        return true;
    });
    if (!s.ok()) return s;
    
    registry.RestoreConfigState(registryCfg);
    
    LOG_INFO(util::LogCategory::DB) << "Loaded " << vault.CommitmentCount() << " commitments, "
                                    << registry.TotalSupply() << " passports at block "
                                    << blockNumber;
    return db::Status::Ok();
}

} // namespace vault
} // namespace riskvault
