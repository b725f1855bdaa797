// RISKVAULT - Commitment and Nullifier Derivation
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Domain-separated SHA-256 constructions used by tooling and tests to build
// submission tuples. The ledger itself never recomputes a commitment.

#ifndef RISKVAULT_CRYPTO_COMMITMENT_H
#define RISKVAULT_CRYPTO_COMMITMENT_H

#include "riskvault/core/types.h"

#include <cstdint>

namespace riskvault {
namespace crypto {

/// Secret length produced by GenerateSecret
constexpr size_t SECRET_SIZE = 32;

/// Domain tags
constexpr const char* COMMITMENT_TAG = "riskvault/commitment/v1";
constexpr const char* NULLIFIER_TAG = "riskvault/nullifier/v1";
constexpr const char* CONTRACT_TAG = "riskvault/contract/v1";

/// commitment = SHA256(tag || wallet || secret)
CommitmentHash DeriveCommitment(const Address& wallet, const Bytes& secret);

/// nullifier = SHA256(tag || secret || commitment)
NullifierHash DeriveNullifier(const Bytes& secret, const CommitmentHash& commitment);

/// Deterministic address of the nonce-th contract deployed by deployer
Address DeriveContractAddress(const Address& deployer, uint64_t nonce);

/// Fresh random secret from the OpenSSL CSPRNG. Throws std::runtime_error
/// if the generator is not seeded.
Bytes GenerateSecret(size_t len = SECRET_SIZE);

} // namespace crypto
} // namespace riskvault

#endif // RISKVAULT_CRYPTO_COMMITMENT_H
