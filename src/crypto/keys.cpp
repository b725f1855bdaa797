// RISKVAULT - Key Management Implementation
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/crypto/keys.h"
#include "riskvault/crypto/sha256.h"
#include "riskvault/core/hex.h"
#include "riskvault/util/logging.h"

#include <memory>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>

namespace riskvault {
namespace crypto {

// ============================================================================
// OpenSSL Helpers
// ============================================================================

namespace {

struct ECKeyDeleter { void operator()(EC_KEY* k) const { EC_KEY_free(k); } };
struct ECPointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct BNDeleter { void operator()(BIGNUM* b) const { BN_clear_free(b); } };

using ECKeyPtr = std::unique_ptr<EC_KEY, ECKeyDeleter>;
using ECPointPtr = std::unique_ptr<EC_POINT, ECPointDeleter>;
using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;

ECKeyPtr NewCurveKey() {
    return ECKeyPtr(EC_KEY_new_by_curve_name(NID_secp256k1));
}

/// EC_KEY holding the public point decoded from SEC1 bytes
ECKeyPtr DecodePublicKey(const std::vector<uint8_t>& data) {
    if (data.size() != PublicKey::COMPRESSED_SIZE && data.size() != PublicKey::UNCOMPRESSED_SIZE) {
        return nullptr;
    }
    
    ECKeyPtr eckey = NewCurveKey();
    if (!eckey) {
        return nullptr;
    }
    
    const EC_GROUP* group = EC_KEY_get0_group(eckey.get());
    ECPointPtr point(EC_POINT_new(group));
    if (!point) {
        return nullptr;
    }
    
    if (!EC_POINT_oct2point(group, point.get(), data.data(), data.size(), nullptr)) {
        return nullptr;
    }
    
    if (!EC_KEY_set_public_key(eckey.get(), point.get())) {
        return nullptr;
    }
    
    return eckey;
}

/// EC_KEY holding the private scalar and its public point
ECKeyPtr DecodePrivateKey(const uint8_t* data) {
    ECKeyPtr eckey = NewCurveKey();
    if (!eckey) {
        return nullptr;
    }
    
    BNPtr priv(BN_bin2bn(data, PrivateKey::SIZE, nullptr));
    if (!priv) {
        return nullptr;
    }
    
    const EC_GROUP* group = EC_KEY_get0_group(eckey.get());
    const BIGNUM* order = EC_GROUP_get0_order(group);
    if (BN_is_zero(priv.get()) || BN_cmp(priv.get(), order) >= 0) {
        return nullptr;
    }
    
    if (!EC_KEY_set_private_key(eckey.get(), priv.get())) {
        return nullptr;
    }
    
    // pubkey = privateKey * G
    ECPointPtr pub(EC_POINT_new(group));
    if (!pub || !EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, nullptr)) {
        return nullptr;
    }
    
    if (!EC_KEY_set_public_key(eckey.get(), pub.get())) {
        return nullptr;
    }
    
    return eckey;
}

} // anonymous namespace

// ============================================================================
// PublicKey Implementation
// ============================================================================

bool PublicKey::IsValid() const {
    return DecodePublicKey(data_) != nullptr;
}

bool PublicKey::Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const {
    if (signature.empty()) {
        return false;
    }
    
    ECKeyPtr eckey = DecodePublicKey(data_);
    if (!eckey) {
        return false;
    }
    
    int result = ECDSA_verify(0, hash.data(), static_cast<int>(hash.size()),
                              signature.data(), static_cast<int>(signature.size()),
                              eckey.get());
    return result == 1;
}

Address PublicKey::GetAddress() const {
    Hash256 digest = SHA256Hash(data_);
    return Address(digest.data(), Address::SIZE);
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_);
}

std::optional<PublicKey> PublicKey::FromHex(const std::string& hex) {
    if (!IsValidHex(StripHexPrefix(hex))) {
        return std::nullopt;
    }
    PublicKey key(HexToBytes(hex));
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

PrivateKey::~PrivateKey() {
    OPENSSL_cleanse(data_.data(), data_.size());
}

PrivateKey PrivateKey::Generate() {
    ECKeyPtr eckey = NewCurveKey();
    if (!eckey || EC_KEY_generate_key(eckey.get()) != 1) {
        throw std::runtime_error("PrivateKey::Generate: EC_KEY_generate_key failed");
    }
    
    PrivateKey key;
    const BIGNUM* priv = EC_KEY_get0_private_key(eckey.get());
    if (BN_bn2binpad(priv, key.data_.data(), SIZE) != static_cast<int>(SIZE)) {
        throw std::runtime_error("PrivateKey::Generate: BN_bn2binpad failed");
    }
    key.valid_ = true;
    return key;
}

std::optional<PrivateKey> PrivateKey::FromBytes(const std::vector<uint8_t>& data) {
    if (data.size() != SIZE || !DecodePrivateKey(data.data())) {
        return std::nullopt;
    }
    
    PrivateKey key;
    std::copy(data.begin(), data.end(), key.data_.begin());
    key.valid_ = true;
    return key;
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    if (!IsValidHex(StripHexPrefix(hex))) {
        return std::nullopt;
    }
    return FromBytes(HexToBytes(hex));
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }
    
    ECKeyPtr eckey = DecodePrivateKey(data_.data());
    if (!eckey) {
        return PublicKey();
    }
    
    const EC_GROUP* group = EC_KEY_get0_group(eckey.get());
    const EC_POINT* point = EC_KEY_get0_public_key(eckey.get());
    
    std::vector<uint8_t> out(PublicKey::COMPRESSED_SIZE);
    size_t len = EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED,
                                    out.data(), out.size(), nullptr);
    if (len != PublicKey::COMPRESSED_SIZE) {
        LOG_ERROR(util::LogCategory::CRYPTO) << "EC_POINT_point2oct failed";
        return PublicKey();
    }
    return PublicKey(out);
}

std::vector<uint8_t> PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) {
        return {};
    }
    
    ECKeyPtr eckey = DecodePrivateKey(data_.data());
    if (!eckey) {
        return {};
    }
    
    std::vector<uint8_t> signature(static_cast<size_t>(ECDSA_size(eckey.get())));
    unsigned int sigLen = 0;
    if (ECDSA_sign(0, hash.data(), static_cast<int>(hash.size()),
                   signature.data(), &sigLen, eckey.get()) != 1) {
        LOG_ERROR(util::LogCategory::CRYPTO) << "ECDSA_sign failed";
        return {};
    }
    signature.resize(sigLen);
    return signature;
}

std::string PrivateKey::ToHex() const {
    return BytesToHex(data_.data(), data_.size());
}

} // namespace crypto
} // namespace riskvault
