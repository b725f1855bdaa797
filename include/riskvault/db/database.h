// RISKVAULT - Database Abstraction Layer
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Abstract key-value store interface used to persist ledger state.
// Implementations: LevelDB (on disk) and an in-memory map.

#ifndef RISKVAULT_DB_DATABASE_H
#define RISKVAULT_DB_DATABASE_H

#include "riskvault/core/types.h"
#include "riskvault/core/serialize.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <ios>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace riskvault {
namespace db {

// ============================================================================
// Status
// ============================================================================

/// Outcome of a storage operation
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND,
        CORRUPTION,
        NOT_SUPPORTED,
        INVALID_ARGUMENT,
        IO_ERROR,
    };
    
    Status() = default;
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}
    
    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(NOT_FOUND, std::move(msg)); }
    static Status Corruption(std::string msg = "") { return Status(CORRUPTION, std::move(msg)); }
    static Status NotSupported(std::string msg = "") { return Status(NOT_SUPPORTED, std::move(msg)); }
    static Status InvalidArgument(std::string msg = "") { return Status(INVALID_ARGUMENT, std::move(msg)); }
    static Status IOError(std::string msg = "") { return Status(IO_ERROR, std::move(msg)); }
    
    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsNotSupported() const { return code_ == NOT_SUPPORTED; }
    bool IsIOError() const { return code_ == IO_ERROR; }
    
    Code code() const { return code_; }
    const std::string& message() const { return message_; }
    
    /// "OK", or "<Code>: <message>"
    std::string ToString() const;

private:
    Code code_{OK};
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/// Non-owning view of a key or value
class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}
    
    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    
    std::string ToString() const { return std::string(data_, size_); }
    
    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;
    
    /// Block cache in bytes, 0 for none
    size_t block_cache_size = 8 * 1024 * 1024;
    
    /// Bloom filter bits per key, 0 for none
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    bool verify_checksums = false;
    
    /// Off for bulk scans that should not evict hot blocks
    bool fill_cache = true;
};

struct WriteOptions {
    /// fsync before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/// Writes applied atomically in insertion order
class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }
    
    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }
    
    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }
    
    /// func(key, value); value is nullopt for deletes
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
};

// ============================================================================
// Iterator
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;
    
    virtual bool Valid() const = 0;
    
    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    
    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    virtual ~Database() = default;
    
    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;
    
    Status Get(const Slice& key, std::string* value) { return Get(ReadOptions(), key, value); }
    Status Put(const Slice& key, const Slice& value) { return Put(WriteOptions(), key, value); }
    Status Delete(const Slice& key) { return Delete(WriteOptions(), key); }
    Status Write(WriteBatch* batch) { return Write(WriteOptions(), batch); }
    std::unique_ptr<Iterator> NewIterator() { return NewIterator(ReadOptions()); }
    
    bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open an on-disk database at path.
 * @return NotSupported (and no database) when the build has no on-disk backend
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete the database at path and its directory
Status DestroyDatabase(const std::filesystem::path& path);

/// True if OpenDatabase can create on-disk databases in this build
bool HasPersistentBackend();

// ============================================================================
// Serialization Helpers
// ============================================================================

/// Encode obj with the project's serialization
template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

/**
 * Deserialize an object from a byte string.
 * Fails on truncated input and on trailing bytes.
 */
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    try {
        Unserialize(ss, obj);
    } catch (const std::ios_base::failure&) {
        return false;
    }
    return ss.empty();
}

/// Table prefix, optionally followed by a raw or serialized key
inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key.data(), key.size());
    return result;
}

template<typename T>
std::string MakeKey(char prefix, const T& obj) {
    std::string result(1, prefix);
    result += SerializeToString(obj);
    return result;
}

} // namespace db
} // namespace riskvault

#endif // RISKVAULT_DB_DATABASE_H
