// RISKVAULT - Commitment and Nullifier Derivation
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/crypto/commitment.h"
#include "riskvault/crypto/sha256.h"
#include "riskvault/core/serialize.h"

#include <stdexcept>
#include <string>

#include <openssl/rand.h>

namespace riskvault {
namespace crypto {

CommitmentHash DeriveCommitment(const Address& wallet, const Bytes& secret) {
    SHA256 hasher;
    hasher.Write(std::string(COMMITMENT_TAG)).Write(wallet).Write(secret);
    return CommitmentHash(hasher.Finalize());
}

NullifierHash DeriveNullifier(const Bytes& secret, const CommitmentHash& commitment) {
    SHA256 hasher;
    hasher.Write(std::string(NULLIFIER_TAG)).Write(secret).Write(commitment);
    return NullifierHash(hasher.Finalize());
}

Address DeriveContractAddress(const Address& deployer, uint64_t nonce) {
    DataStream ss;
    ss << deployer << nonce;
    
    SHA256 hasher;
    hasher.Write(std::string(CONTRACT_TAG)).Write(ss.Data());
    Hash256 digest = hasher.Finalize();
    return Address(digest.data(), Address::SIZE);
}

Bytes GenerateSecret(size_t len) {
    Bytes secret(len);
    if (len > 0 && RAND_bytes(secret.data(), static_cast<int>(len)) != 1) {
        throw std::runtime_error("GenerateSecret: RAND_bytes failed");
    }
    return secret;
}

} // namespace crypto
} // namespace riskvault
