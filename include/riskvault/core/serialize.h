// RISKVAULT - Serialization Header
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Little-endian binary serialization used for persisted ledger state and
// for the canonical encoding of proof public inputs.

#ifndef RISKVAULT_CORE_SERIALIZE_H
#define RISKVAULT_CORE_SERIALIZE_H

#include "riskvault/core/types.h"

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <stdexcept>
#include <ios>
#include <utility>

namespace riskvault {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for a serialized length prefix (32 MB)
static constexpr uint64_t MAX_SIZE = 0x02000000;

namespace detail {

/// Byte-swaps on big-endian hosts so integers always travel little-endian
template<typename T>
inline T ToLittleEndian(T value) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    uint8_t bytes[sizeof(T)];
    std::memcpy(bytes, &value, sizeof(T));
    for (size_t i = 0; i < sizeof(T) / 2; ++i) {
        std::swap(bytes[i], bytes[sizeof(T) - 1 - i]);
    }
    std::memcpy(&value, bytes, sizeof(T));
#endif
    return value;
}

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
private:
    std::vector<uint8_t> data_;
    size_t read_pos_ = 0;

public:
    DataStream() = default;
    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}
    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}
    
    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - read_pos_; }
    bool empty() const noexcept { return size() == 0; }
    
    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }
    
    /// Whole buffer, including bytes already read
    const std::vector<uint8_t>& Data() const noexcept { return data_; }
    
    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }
    
    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }
    
    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        if (len > 0) {
            std::memcpy(dst, data_.data() + read_pos_, len);
        }
        read_pos_ += len;
    }
    
    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }
    
    template<typename T>
    DataStream& operator<<(const T& obj);
    
    template<typename T>
    DataStream& operator>>(T& obj);
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

template<typename T, typename Stream>
inline void WriteLE(Stream& s, T value) {
    value = detail::ToLittleEndian(value);
    s.Write(reinterpret_cast<const uint8_t*>(&value), sizeof(T));
}

template<typename T, typename Stream>
inline T ReadLE(Stream& s) {
    T value;
    s.Read(reinterpret_cast<uint8_t*>(&value), sizeof(T));
    return detail::ToLittleEndian(value);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================

/// Length prefix: one byte below 0xFD, otherwise a marker byte followed by
/// a 2, 4 or 8 byte little-endian width. Decoding rejects non-minimal forms.
template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 0xFD) {
        WriteLE<uint8_t>(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        WriteLE<uint8_t>(s, 0xFD);
        WriteLE<uint16_t>(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        WriteLE<uint8_t>(s, 0xFE);
        WriteLE<uint32_t>(s, static_cast<uint32_t>(size));
    } else {
        WriteLE<uint8_t>(s, 0xFF);
        WriteLE<uint64_t>(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    const uint8_t marker = ReadLE<uint8_t>(s);
    uint64_t size = marker;
    uint64_t floor = 0;
    switch (marker) {
        case 0xFD: size = ReadLE<uint16_t>(s); floor = 0xFD; break;
        case 0xFE: size = ReadLE<uint32_t>(s); floor = 0x10000; break;
        case 0xFF: size = ReadLE<uint64_t>(s); floor = 0x100000000ULL; break;
        default: break;
    }
    if (size < floor) {
        throw std::ios_base::failure("ReadCompactSize(): non-canonical encoding");
    }
    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { WriteLE<uint8_t>(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ReadLE<uint8_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { WriteLE<uint32_t>(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ReadLE<uint32_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { WriteLE<uint64_t>(s, a); }
template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { WriteLE<uint64_t>(s, static_cast<uint64_t>(a)); }
template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ReadLE<uint64_t>(s); }
template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ReadLE<uint64_t>(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { WriteLE<uint8_t>(s, a ? 1 : 0); }
template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ReadLE<uint8_t>(s) != 0); }

// ============================================================================
// Byte Vectors and Strings
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v) {
    WriteCompactSize(s, v.size());
    if (!v.empty()) {
        s.Write(v.data(), v.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v) {
    uint64_t size = ReadCompactSize(s);
    v.resize(size);
    if (size > 0) {
        s.Read(v.data(), size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

// ============================================================================
// Fixed-Width Hashes and Addresses
// ============================================================================

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

// ============================================================================
// DataStream Stream Operators
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace riskvault

#endif // RISKVAULT_CORE_SERIALIZE_H
