// RISKVAULT - SHA256 Hash Function
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL EVP.

#ifndef RISKVAULT_CRYPTO_SHA256_H
#define RISKVAULT_CRYPTO_SHA256_H

#include "riskvault/core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace riskvault {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;
    
    /// Initializes to empty state. Throws std::runtime_error if OpenSSL
    /// cannot allocate a digest context.
    SHA256();
    ~SHA256();
    
    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;
    
    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);
    
    SHA256& Write(const Bytes& data) { return Write(data.data(), data.size()); }
    
    template<size_t BITS>
    SHA256& Write(const BaseHash<BITS>& hash) { return Write(hash.data(), hash.size()); }
    
    /// Write a string without length prefix (used for domain tags)
    SHA256& Write(const std::string& str) {
        return Write(reinterpret_cast<const Byte*>(str.data()), str.size());
    }
    
    /// Finalize the hash and write to output (OUTPUT_SIZE bytes).
    /// The hasher must be Reset() before reuse.
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    /// Finalize into a Hash256
    Hash256 Finalize();
    
    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const;
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const Bytes& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace riskvault

#endif // RISKVAULT_CRYPTO_SHA256_H
