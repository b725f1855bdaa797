// RISKVAULT - Proof Verification Boundary
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// The proof system and the homomorphic score comparison are external.
// The ledger sees them only through IProofVerifier and IScoreComparator;
// ThresholdVerifier adapts both for the vault.

#ifndef RISKVAULT_VAULT_VERIFIER_H
#define RISKVAULT_VAULT_VERIFIER_H

#include "riskvault/core/types.h"
#include "riskvault/crypto/keys.h"
#include "riskvault/vault/errors.h"
#include "riskvault/vault/riskband.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace riskvault {
namespace vault {

// ============================================================================
// Public Inputs
// ============================================================================

/**
 * Canonical public inputs of a proof. The domain separates the three
 * statements a proof can make; the payload is the serialized statement.
 */
struct PublicInputs {
    std::string domain;
    Bytes payload;
    
    /// SHA256(domain || payload)
    Hash256 Digest() const;
    
    /// Encrypted score is bound to the commitment at blockHeight
    static PublicInputs ForScore(const CommitmentHash& commitment, const Bytes& encryptedScore,
                                 BlockHeight blockHeight);
    
    /// Submitter knows the wallet behind the commitment and the nullifier
    /// is derived from the same secret
    static PublicInputs ForAddress(const CommitmentHash& commitment,
                                   const NullifierHash& nullifier,
                                   const Address& recipient);
    
    /// Encrypted score compared against threshold
    static PublicInputs ForThreshold(const CommitmentHash& commitment,
                                     const Bytes& encryptedScore, uint32_t threshold);
};

constexpr const char* SCORE_PROOF_DOMAIN = "riskvault/proof/score";
constexpr const char* ADDRESS_PROOF_DOMAIN = "riskvault/proof/address";
constexpr const char* THRESHOLD_PROOF_DOMAIN = "riskvault/proof/threshold";

// ============================================================================
// External Interfaces
// ============================================================================

/**
 * Proof system verifier.
 */
class IProofVerifier {
public:
    virtual ~IProofVerifier() = default;
    
    virtual bool Verify(const Bytes& proof, const PublicInputs& inputs) const = 0;
    
    /// Identifier reported in VerifierUpdated
    virtual std::string GetName() const = 0;
};

/**
 * Homomorphic comparison of an encrypted score against a plaintext bound.
 */
class IScoreComparator {
public:
    virtual ~IScoreComparator() = default;
    
    /// score < threshold, or nullopt if the ciphertext cannot be evaluated
    virtual std::optional<bool> IsBelow(const Bytes& encryptedScore, uint32_t threshold) const = 0;
};

// ============================================================================
// Threshold Verifier
// ============================================================================

/**
 * Stateless adapter over the proof verifier and score comparator.
 */
class ThresholdVerifier {
public:
    /// Throws std::invalid_argument if either collaborator is null
    ThresholdVerifier(std::shared_ptr<const IProofVerifier> proofs,
                      std::shared_ptr<const IScoreComparator> comparator);
    
    /**
     * Check both submission proofs.
     * @return InvalidProof if the commitment is null or either proof fails
     */
    VaultError VerifySubmission(const CommitmentHash& commitment,
                                const Bytes& encryptedScore,
                                const Bytes& scoreProof,
                                BlockHeight blockHeight,
                                const NullifierHash& nullifier,
                                const Bytes& addressProof,
                                const Address& recipient) const;
    
    /**
     * Classify an encrypted score by walking the cut points.
     * Only the band leaves this function.
     * @return ScoreExceedsMaximum above MAX_RISK_SCORE, InvalidProof if the
     *         comparator cannot evaluate the ciphertext
     */
    VaultError ClassifyBand(const Bytes& encryptedScore, const BandThresholds& bands,
                            RiskBand& band) const;
    
    /**
     * Verify the threshold proof and evaluate score < threshold.
     * @return InvalidProof if the proof fails or evaluation is impossible
     */
    VaultError VerifyBelow(const CommitmentHash& commitment, const Bytes& encryptedScore,
                           uint32_t threshold, const Bytes& proof, bool& below) const;
    
    std::string GetName() const { return proofs_->GetName(); }

private:
    std::shared_ptr<const IProofVerifier> proofs_;
    std::shared_ptr<const IScoreComparator> comparator_;
};

// ============================================================================
// Attestor Proof Verifier
// ============================================================================

/**
 * Accepts a proof iff it is a DER ECDSA signature by the attestor key over
 * the digest of the public inputs.
 */
class AttestorProofVerifier : public IProofVerifier {
public:
    /// Throws std::invalid_argument if the key is not a valid point
    explicit AttestorProofVerifier(const crypto::PublicKey& attestor);
    
    bool Verify(const Bytes& proof, const PublicInputs& inputs) const override;
    std::string GetName() const override;
    
    /// Produce a proof accepted by a verifier holding key's public half
    static Bytes Prove(const crypto::PrivateKey& key, const PublicInputs& inputs);

private:
    crypto::PublicKey attestor_;
};

} // namespace vault
} // namespace riskvault

#endif // RISKVAULT_VAULT_VERIFIER_H
