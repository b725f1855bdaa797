// RISKVAULT - Database Backends
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// LevelDB implementation of the database interface, and the in-memory
// database used by tests and throwaway ledgers.

#ifndef RISKVAULT_DB_LEVELDB_H
#define RISKVAULT_DB_LEVELDB_H

#include "riskvault/db/database.h"

#include <iterator>
#include <map>
#include <mutex>

#ifdef RISKVAULT_USE_LEVELDB
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>
#endif

namespace riskvault {
namespace db {

#ifdef RISKVAULT_USE_LEVELDB

/// Map a LevelDB status onto ours
Status FromLevelDBStatus(const leveldb::Status& s);

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;
    
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}
    
    bool Valid() const override { return iter_->Valid(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }
    
    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }
    
    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }
    
    Status status() const override { return FromLevelDBStatus(iter_->status()); }
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    
    static leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
        leveldb::ReadOptions lo;
        lo.verify_checksums = opts.verify_checksums;
        lo.fill_cache = opts.fill_cache;
        return lo;
    }
    
    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }
    
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache, 
                    const leveldb::FilterPolicy* filter)
        : db_(db), cache_(cache), filter_policy_(filter) {}
    
    ~LevelDBDatabase() override {
        // The DB must close before the cache and filter it references
        db_.reset();
        cache_.reset();
        filter_policy_.reset();
    }
    
    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override {
        return FromLevelDBStatus(db_->Get(MakeReadOptions(options),
                                          leveldb::Slice(key.data(), key.size()), value));
    }
    
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        return FromLevelDBStatus(db_->Put(MakeWriteOptions(options),
                                          leveldb::Slice(key.data(), key.size()),
                                          leveldb::Slice(value.data(), value.size())));
    }
    
    Status Delete(const WriteOptions& options, const Slice& key) override {
        return FromLevelDBStatus(db_->Delete(MakeWriteOptions(options),
                                             leveldb::Slice(key.data(), key.size())));
    }
    
    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        return FromLevelDBStatus(db_->Write(MakeWriteOptions(options), &lb));
    }
    
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
    }
};

#endif // RISKVAULT_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Iterator over a snapshot of a MemoryDatabase.
 */
class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
    
public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : data_(std::move(snapshot)), iter_(data_.end()) {}
    
    bool Valid() const override { return iter_ != data_.end(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }
    
    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

/**
 * Ordered in-memory key-value store. Contents are lost on destruction.
 */
class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
    
public:
    MemoryDatabase() = default;
    
    Status Get(const ReadOptions&, const Slice& key, std::string* value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key.ToString());
        if (it == data_.end()) {
            return Status::NotFound();
        }
        *value = it->second;
        return Status::Ok();
    }
    
    Status Put(const WriteOptions&, const Slice& key, const Slice& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_[key.ToString()] = value.ToString();
        return Status::Ok();
    }
    
    Status Delete(const WriteOptions&, const Slice& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.erase(key.ToString());
        return Status::Ok();
    }
    
    Status Write(const WriteOptions&, WriteBatch* batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                data_[key] = *value;
            } else {
                data_.erase(key);
            }
        });
        return Status::Ok();
    }
    
    std::unique_ptr<Iterator> NewIterator(const ReadOptions&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::make_unique<MemoryIterator>(data_);
    }
    
    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }
    
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }
};

} // namespace db
} // namespace riskvault

#endif // RISKVAULT_DB_LEVELDB_H
