// RISKVAULT - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 RiskVault Developers
// MIT License

#ifndef RISKVAULT_CORE_HEX_H
#define RISKVAULT_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace riskvault {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes. Accepts an optional "0x" prefix.
/// Throws std::invalid_argument on odd length or non-hex characters.
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is valid hex (an optional "0x" prefix is allowed)
bool IsValidHex(const std::string& str);

/// Strip a leading "0x" / "0X"
std::string StripHexPrefix(const std::string& hex);

} // namespace riskvault

#endif // RISKVAULT_CORE_HEX_H
