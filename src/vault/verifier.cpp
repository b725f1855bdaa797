// RISKVAULT - Proof Verification Boundary
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/vault/verifier.h"
#include "riskvault/core/serialize.h"
#include "riskvault/crypto/sha256.h"
#include "riskvault/util/logging.h"

#include <stdexcept>

namespace riskvault {
namespace vault {

// ============================================================================
// PublicInputs
// ============================================================================

Hash256 PublicInputs::Digest() const {
    SHA256 hasher;
    hasher.Write(domain).Write(payload);
    return hasher.Finalize();
}

PublicInputs PublicInputs::ForScore(const CommitmentHash& commitment,
                                    const Bytes& encryptedScore,
                                    BlockHeight blockHeight) {
    DataStream ss;
    ss << commitment << encryptedScore << static_cast<uint64_t>(blockHeight);
    return PublicInputs{SCORE_PROOF_DOMAIN, ss.Data()};
}

PublicInputs PublicInputs::ForAddress(const CommitmentHash& commitment,
                                      const NullifierHash& nullifier,
                                      const Address& recipient) {
    DataStream ss;
    ss << commitment << nullifier << recipient;
    return PublicInputs{ADDRESS_PROOF_DOMAIN, ss.Data()};
}

PublicInputs PublicInputs::ForThreshold(const CommitmentHash& commitment,
                                        const Bytes& encryptedScore,
                                        uint32_t threshold) {
    DataStream ss;
    ss << commitment << encryptedScore << threshold;
    return PublicInputs{THRESHOLD_PROOF_DOMAIN, ss.Data()};
}

// ============================================================================
// ThresholdVerifier
// ============================================================================

ThresholdVerifier::ThresholdVerifier(std::shared_ptr<const IProofVerifier> proofs,
                                     std::shared_ptr<const IScoreComparator> comparator)
    : proofs_(std::move(proofs))
    , comparator_(std::move(comparator)) {
    if (!proofs_ || !comparator_) {
        throw std::invalid_argument("ThresholdVerifier: null proof verifier or comparator");
    }
}

VaultError ThresholdVerifier::VerifySubmission(const CommitmentHash& commitment,
                                               const Bytes& encryptedScore,
                                               const Bytes& scoreProof,
                                               BlockHeight blockHeight,
                                               const NullifierHash& nullifier,
                                               const Bytes& addressProof,
                                               const Address& recipient) const {
    if (commitment.IsNull()) {
        return VaultError::InvalidProof;
    }
    
    if (!proofs_->Verify(scoreProof, PublicInputs::ForScore(commitment, encryptedScore, blockHeight))) {
        LOG_DEBUG(util::LogCategory::VAULT) << "Score proof rejected for " << commitment.ToHex();
        return VaultError::InvalidProof;
    }
    
    if (!proofs_->Verify(addressProof, PublicInputs::ForAddress(commitment, nullifier, recipient))) {
        LOG_DEBUG(util::LogCategory::VAULT) << "Address proof rejected for " << commitment.ToHex();
        return VaultError::InvalidProof;
    }
    
    return VaultError::None;
}

VaultError ThresholdVerifier::ClassifyBand(const Bytes& encryptedScore,
                                           const BandThresholds& bands,
                                           RiskBand& band) const {
    auto inRange = comparator_->IsBelow(encryptedScore, MAX_RISK_SCORE + 1);
    if (!inRange) {
        return VaultError::InvalidProof;
    }
    if (!*inRange) {
        return VaultError::ScoreExceedsMaximum;
    }
    
    const auto& cuts = bands.GetCutPoints();
    for (size_t i = 0; i < cuts.size(); ++i) {
        auto below = comparator_->IsBelow(encryptedScore, cuts[i]);
        if (!below) {
            return VaultError::InvalidProof;
        }
        if (*below) {
            band = static_cast<RiskBand>(i + 1);
            return VaultError::None;
        }
    }
    
    band = bands.HighestBand();
    return VaultError::None;
}

VaultError ThresholdVerifier::VerifyBelow(const CommitmentHash& commitment,
                                          const Bytes& encryptedScore,
                                          uint32_t threshold,
                                          const Bytes& proof,
                                          bool& below) const {
    if (!proofs_->Verify(proof, PublicInputs::ForThreshold(commitment, encryptedScore, threshold))) {
        return VaultError::InvalidProof;
    }
    
    auto result = comparator_->IsBelow(encryptedScore, threshold);
    if (!result) {
        return VaultError::InvalidProof;
    }
    
    below = *result;
    return VaultError::None;
}

// ============================================================================
// AttestorProofVerifier
// ============================================================================

AttestorProofVerifier::AttestorProofVerifier(const crypto::PublicKey& attestor)
    : attestor_(attestor) {
    if (!attestor_.IsValid()) {
        throw std::invalid_argument("AttestorProofVerifier: invalid public key");
    }
}

bool AttestorProofVerifier::Verify(const Bytes& proof, const PublicInputs& inputs) const {
    return attestor_.Verify(inputs.Digest(), proof);
}

std::string AttestorProofVerifier::GetName() const {
    return "attestor:" + attestor_.GetAddress().ToString();
}

Bytes AttestorProofVerifier::Prove(const crypto::PrivateKey& key, const PublicInputs& inputs) {
    return key.Sign(inputs.Digest());
}

} // namespace vault
} // namespace riskvault
