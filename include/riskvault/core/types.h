// RISKVAULT - Core Types Header
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Fundamental value types shared by the ledger, the passport registry and
// the storage layer.

#ifndef RISKVAULT_CORE_TYPES_H
#define RISKVAULT_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace riskvault {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer (ciphertexts, proofs, signatures)
using Bytes = std::vector<Byte>;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Duration in seconds
using Duration = int64_t;

/// Sequential passport token identifier
using TokenId = uint64_t;

/// Height of a block on the analyzed chain
using BlockHeight = uint64_t;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width opaque byte string. Hex form is plain byte order with an
/// optional "0x" prefix on input.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes, zero-padding short input
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }
    
    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        return std::all_of(data_.begin(), data_.end(), [](Byte b) { return b == 0; });
    }
    
    void SetNull() noexcept { data_.fill(0); }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    /// Lexicographic byte order, used for ordered containers and storage keys
    bool operator<(const BaseHash& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }
    
    /// Lowercase hex without prefix
    std::string ToHex() const;
    
    /// Parse hex (with or without 0x). Throws std::invalid_argument.
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    explicit Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}
    
    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit account address. The all-zero value is the null address.
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    explicit Address(const BaseHash<160>& h) : BaseHash<160>(h) {}
    
    /// "0x"-prefixed hex form
    std::string ToString() const { return "0x" + ToHex(); }
    
    static Address FromHex(const std::string& hex) {
        return Address(BaseHash<160>::FromHex(hex));
    }
};

// ============================================================================
// Type-safe Hash Aliases
// ============================================================================

/// Commitment binding a wallet to a secret (opaque to the ledger)
class CommitmentHash : public Hash256 {
public:
    using Hash256::Hash256;
    CommitmentHash() = default;
    explicit CommitmentHash(const Hash256& h) : Hash256(h) {}
    
    static CommitmentHash FromHex(const std::string& hex) {
        return CommitmentHash(Hash256::FromHex(hex));
    }
};

/// One-time anti-replay tag for a submitted analysis
class NullifierHash : public Hash256 {
public:
    using Hash256::Hash256;
    NullifierHash() = default;
    explicit NullifierHash(const Hash256& h) : Hash256(h) {}
    
    static NullifierHash FromHex(const std::string& hex) {
        return NullifierHash(Hash256::FromHex(hex));
    }
};

} // namespace riskvault

#endif // RISKVAULT_CORE_TYPES_H
