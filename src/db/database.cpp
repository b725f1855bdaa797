// RISKVAULT - Database Implementation
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/db/database.h"
#include "riskvault/db/leveldb.h"
#include "riskvault/util/logging.h"

#include <system_error>

namespace riskvault {
namespace db {

std::string Status::ToString() const {
    const char* name = "Unknown";
    switch (code_) {
        case OK:               return "OK";
        case NOT_FOUND:        name = "NotFound"; break;
        case CORRUPTION:       name = "Corruption"; break;
        case NOT_SUPPORTED:    name = "NotSupported"; break;
        case INVALID_ARGUMENT: name = "InvalidArgument"; break;
        case IO_ERROR:         name = "IOError"; break;
    }
    return std::string(name) + ": " + message_;
}

#ifdef RISKVAULT_USE_LEVELDB

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

#endif // RISKVAULT_USE_LEVELDB

// ============================================================================
// Database Factory Functions
// ============================================================================

bool HasPersistentBackend() {
#ifdef RISKVAULT_USE_LEVELDB
    return true;
#else
    return false;
#endif
}

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
#ifdef RISKVAULT_USE_LEVELDB
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError(path.string() + ": " + ec.message()), nullptr};
        }
    }
    
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    
    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }
    
    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }
    
    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        delete cache;
        delete filter;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        return {FromLevelDBStatus(s), nullptr};
    }
    
    LOG_DEBUG(util::LogCategory::DB) << "Opened LevelDB at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(raw, cache, filter)};
#else
    (void)options;
    return {Status::NotSupported("built without LevelDB, cannot open " + path.string()),
            nullptr};
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef RISKVAULT_USE_LEVELDB
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return FromLevelDBStatus(s);
    }
#endif
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return Status::IOError(ec.message());
    }
    return Status::Ok();
}

} // namespace db
} // namespace riskvault
