// RISKVAULT - Key Management
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// secp256k1 ECDSA keys over OpenSSL. Attestor keys sign the public inputs
// of a submission; the ledger verifies the signatures as proofs.

#ifndef RISKVAULT_CRYPTO_KEYS_H
#define RISKVAULT_CRYPTO_KEYS_H

#include "riskvault/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace riskvault {
namespace crypto {

// ============================================================================
// PublicKey
// ============================================================================

class PublicKey {
public:
    /// Size of compressed public key (SEC1)
    static constexpr size_t COMPRESSED_SIZE = 33;
    
    /// Size of uncompressed public key (SEC1)
    static constexpr size_t UNCOMPRESSED_SIZE = 65;
    
    PublicKey() = default;
    
    /// Construct from serialized SEC1 bytes (validity checked by IsValid)
    explicit PublicKey(const std::vector<uint8_t>& data) : data_(data) {}
    
    /// True if the bytes decode to a point on the curve
    bool IsValid() const;
    
    bool IsCompressed() const { return data_.size() == COMPRESSED_SIZE; }
    
    const std::vector<uint8_t>& GetBytes() const { return data_; }
    
    /// Verify a DER-encoded ECDSA signature over a 32-byte hash
    bool Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const;
    
    /// Account address: first 20 bytes of SHA256 of the serialized key
    Address GetAddress() const;
    
    std::string ToHex() const;
    
    /// Parse from hex; nullopt if malformed or not on the curve
    static std::optional<PublicKey> FromHex(const std::string& hex);
    
    bool operator==(const PublicKey& other) const { return data_ == other.data_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    std::vector<uint8_t> data_;
};

// ============================================================================
// PrivateKey
// ============================================================================

class PrivateKey {
public:
    static constexpr size_t SIZE = 32;
    
    /// Invalid key
    PrivateKey() { data_.fill(0); }
    
    ~PrivateKey();
    
    PrivateKey(const PrivateKey&) = default;
    PrivateKey& operator=(const PrivateKey&) = default;
    
    /// Generate a new random key. Throws std::runtime_error if the RNG fails.
    static PrivateKey Generate();
    
    /// Load from 32 big-endian bytes; nullopt if outside [1, n-1]
    static std::optional<PrivateKey> FromBytes(const std::vector<uint8_t>& data);
    
    static std::optional<PrivateKey> FromHex(const std::string& hex);
    
    bool IsValid() const { return valid_; }
    
    /// Compressed public key; invalid PublicKey if this key is invalid
    PublicKey GetPublicKey() const;
    
    /// DER-encoded ECDSA signature, empty on failure
    std::vector<uint8_t> Sign(const Hash256& hash) const;
    
    std::string ToHex() const;

private:
    std::array<uint8_t, SIZE> data_;
    bool valid_{false};
};

} // namespace crypto
} // namespace riskvault

#endif // RISKVAULT_CRYPTO_KEYS_H
