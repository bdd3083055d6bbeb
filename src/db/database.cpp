// VALORIA - Database Implementation
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include "valoria/db/database.h"
#include "valoria/db/leveldb.h"
#include "valoria/util/logging.h"

#include <system_error>

namespace valoria {
namespace db {

// ============================================================================
// Status
// ============================================================================

std::string Status::ToString() const {
    const char* name = "OK";
    switch (code_) {
        case OK:               name = "OK"; break;
        case NOT_FOUND:        name = "NotFound"; break;
        case CORRUPTION:       name = "Corruption"; break;
        case NOT_SUPPORTED:    name = "NotSupported"; break;
        case INVALID_ARGUMENT: name = "InvalidArgument"; break;
        case IO_ERROR:         name = "IOError"; break;
    }
    if (message_.empty()) {
        return name;
    }
    return std::string(name) + ": " + message_;
}

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions& /*options*/, const Slice& key,
                           std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions& /*options*/, const Slice& key,
                           const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions& /*options*/, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions& /*options*/, WriteBatch* batch) {
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

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions& /*options*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
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
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    // 10 bits per key bloom filter for point lookups
    const leveldb::FilterPolicy* filter = leveldb::NewBloomFilterPolicy(10);
    lo.filter_policy = filter;

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        delete cache;
        delete filter;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        return {FromLevelDBStatus(s), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened LevelDB store at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(raw, cache, filter)};
}

std::unique_ptr<Database> OpenMemoryDatabase() {
    return std::make_unique<MemoryDatabase>();
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return FromLevelDBStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

// ============================================================================
// Prefix Scans
// ============================================================================

size_t ForEachWithPrefix(Database& db, const std::string& keyPrefix,
                         const std::function<bool(const Slice&, const Slice&)>& func) {
    auto it = db.NewIterator();
    size_t visited = 0;
    const Slice prefixSlice(keyPrefix);

    for (it->Seek(prefixSlice); it->Valid(); it->Next()) {
        const Slice key = it->key();
        if (!key.starts_with(prefixSlice)) {
            break;
        }
        ++visited;
        if (!func(key, it->value())) {
            break;
        }
    }

    Status status = it->status();
    if (!status.ok()) {
        throw StorageError(status);
    }
    return visited;
}

} // namespace db
} // namespace valoria
