// RISKVAULT - Core Types Implementation
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/core/types.h"
#include "riskvault/core/hex.h"

namespace riskvault {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for " +
                                    std::to_string(SIZE) + "-byte value");
    }
    
    std::vector<Byte> bytes = HexToBytes(digits);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

} // namespace riskvault
