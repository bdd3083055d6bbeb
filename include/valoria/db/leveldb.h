// VALORIA - Database Backends
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// LevelDB-backed durable store and an in-memory store with the same
// interface. The in-memory store is used by tests and ephemeral runs.

#ifndef VALORIA_DB_LEVELDB_H
#define VALORIA_DB_LEVELDB_H

#include "valoria/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>

#include <map>
#include <mutex>

namespace valoria {
namespace db {

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
    void SeekToFirst() override { iter_->SeekToFirst(); }
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
    // Declaration order matters: db_ is destroyed before the cache and
    // filter policy it references.
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::unique_ptr<leveldb::DB> db_;

    static leveldb::ReadOptions ToLevelDB(const ReadOptions& opts) {
        leveldb::ReadOptions lo;
        lo.verify_checksums = opts.verify_checksums;
        lo.fill_cache = opts.fill_cache;
        return lo;
    }

    static leveldb::WriteOptions ToLevelDB(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }

public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter)
        : cache_(cache), filterPolicy_(filter), db_(db) {}

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override {
        return FromLevelDBStatus(
            db_->Get(ToLevelDB(options), leveldb::Slice(key.data(), key.size()), value));
    }

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        return FromLevelDBStatus(
            db_->Put(ToLevelDB(options),
                     leveldb::Slice(key.data(), key.size()),
                     leveldb::Slice(value.data(), value.size())));
    }

    Status Delete(const WriteOptions& options, const Slice& key) override {
        return FromLevelDBStatus(
            db_->Delete(ToLevelDB(options), leveldb::Slice(key.data(), key.size())));
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
        return FromLevelDBStatus(db_->Write(ToLevelDB(options), &lb));
    }

    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(ToLevelDB(options)));
    }
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Ordered in-memory store. Iterators work on a snapshot taken when they are
 * created, so writes made while iterating are not observed.
 */
class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }
};

class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> snapshot_;
    std::map<std::string, std::string>::const_iterator iter_;

public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : snapshot_(std::move(snapshot)), iter_(snapshot_.end()) {}

    bool Valid() const override { return iter_ != snapshot_.end(); }
    void SeekToFirst() override { iter_ = snapshot_.begin(); }
    void Seek(const Slice& target) override { iter_ = snapshot_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != snapshot_.end()) {
            ++iter_;
        }
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

} // namespace db
} // namespace valoria

#endif // VALORIA_DB_LEVELDB_H
