// RISKVAULT - Ledger State Database
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Key-value layout of the vault and registry state. Each accepted
// transaction is written as one WriteBatch.

#ifndef RISKVAULT_VAULT_STATEDB_H
#define RISKVAULT_VAULT_STATEDB_H

#include "riskvault/db/database.h"
#include "riskvault/vault/access.h"
#include "riskvault/vault/passport.h"
#include "riskvault/vault/scorevault.h"

#include <filesystem>
#include <memory>

namespace riskvault {
namespace vault {

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    constexpr char COMMITMENT = 'c';        // commitment -> CommitmentRecord
    constexpr char NULLIFIER = 'n';         // nullifier -> (empty)
    constexpr char UPDATER = 'u';           // address -> UpdaterState
    constexpr char CUSTOM_VALIDITY = 'v';   // commitment -> period
    constexpr char PASSPORT = 'p';          // token id -> Passport
    constexpr char TOKEN_APPROVAL = 'a';    // token id -> approved address
    constexpr char OPERATOR = 'o';          // owner || operator -> (empty)
    constexpr char VAULT_CONFIG = 'V';      // -> VaultConfigState
    constexpr char REGISTRY_CONFIG = 'R';   // -> RegistryConfigState
    constexpr char BLOCK_NUMBER = 'B';      // -> last ledger block number
    constexpr char DEPLOYER = 'D';          // -> deployer address
}

// ============================================================================
// State Database
// ============================================================================

class StateDB {
public:
    /**
     * Open the state database under a directory.
     * Throws std::runtime_error if the database cannot be opened.
     */
    explicit StateDB(const std::filesystem::path& dbPath,
                     const db::Options& options = db::Options());
    
    /// Use an already opened database
    explicit StateDB(std::unique_ptr<db::Database> database);
    
    /// True once a vault configuration has been written
    bool HasState();
    
    // ========================================================================
    // Batch Writers
    // ========================================================================
    
    static void WriteCommitment(db::WriteBatch& batch, const CommitmentHash& commitment,
                                const CommitmentRecord& rec);
    static void WriteNullifier(db::WriteBatch& batch, const NullifierHash& nullifier);
    static void WriteUpdaterState(db::WriteBatch& batch, const Address& account,
                                  const UpdaterState& state);
    static void WriteCustomValidity(db::WriteBatch& batch, const CommitmentHash& commitment,
                                    Duration period);
    static void EraseCustomValidity(db::WriteBatch& batch, const CommitmentHash& commitment);
    static void WritePassport(db::WriteBatch& batch, TokenId tokenId, const Passport& passport);
    static void WriteApproval(db::WriteBatch& batch, TokenId tokenId, const Address& approved);
    static void EraseApproval(db::WriteBatch& batch, TokenId tokenId);
    static void WriteOperator(db::WriteBatch& batch, const Address& owner,
                              const Address& operatorAddr, bool approved);
    static void WriteVaultConfig(db::WriteBatch& batch, const VaultConfigState& cfg);
    static void WriteRegistryConfig(db::WriteBatch& batch, const RegistryConfigState& cfg);
    static void WriteBlockNumber(db::WriteBatch& batch, BlockHeight height);
    static void WriteDeployer(db::WriteBatch& batch, const Address& deployer);
    
    /// Apply a batch atomically and durably
    db::Status Commit(db::WriteBatch& batch);
    
    // ========================================================================
    // Loading
    // ========================================================================
    
    /// Deployer of the stored contracts
    db::Status ReadDeployer(Address& deployer);
    
    /**
     * Rebuild vault and registry state from the database.
     * @return Corruption for undecodable entries, NotFound if no state
     */
    db::Status Load(RiskScoreVault& vault, PassportRegistry& registry, BlockHeight& blockNumber);
    
    /// Number of batches committed through this handle
    uint64_t GetCommitCount() const { return commits_; }

private:
    static std::string OperatorKey(const Address& owner, const Address& operatorAddr);
    
    /// Visit every entry under prefix p
    template<typename Func>
    db::Status ForEach(char p, Func&& func);
    
    std::unique_ptr<db::Database> db_;
    uint64_t commits_{0};
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_STATEDB_H
