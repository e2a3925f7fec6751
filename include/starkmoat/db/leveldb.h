// STARKMOAT - LevelDB and In-Memory Databases
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// LevelDB implementation of the database interface, plus an in-memory
// implementation for tests and throwaway registries.

#ifndef STARKMOAT_DB_LEVELDB_H
#define STARKMOAT_DB_LEVELDB_H

#include <starkmoat/db/database.h>

#include <leveldb/db.h>
#include <leveldb/write_batch.h>

#include <iterator>
#include <map>
#include <mutex>

namespace starkmoat {
namespace db {

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
    
    Status status() const override;
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;
    std::filesystem::path path_;
    
    static leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
        leveldb::ReadOptions lo;
        lo.verify_checksums = opts.verify_checksums;
        return lo;
    }
    
    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }
    
public:
    LevelDBDatabase(leveldb::DB* db, const std::filesystem::path& path)
        : db_(db), path_(path) {}
    
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
    
    const std::filesystem::path& GetPath() const { return path_; }
};

/// Convert a LevelDB status to ours
Status ConvertStatus(const leveldb::Status& s);

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Simple in-memory database. Contents are lost when it is destroyed.
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
    
    /// The iterator reads the live map; do not write while iterating
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    
    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }
};

/**
 * Iterator for MemoryDatabase.
 */
class MemoryIterator : public Iterator {
private:
    const std::map<std::string, std::string>& data_;
    std::map<std::string, std::string>::const_iterator iter_;
    
public:
    explicit MemoryIterator(const std::map<std::string, std::string>& data)
        : data_(data), iter_(data_.end()) {}
    
    bool Valid() const override { return iter_ != data_.end(); }
    
    void SeekToFirst() override { iter_ = data_.begin(); }
    
    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
    }
    
    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }
    
    Slice key() const override { return Slice(iter_->first); }
    
    Slice value() const override { return Slice(iter_->second); }
    
    Status status() const override { return Status::Ok(); }
};

inline std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions&) {
    return std::make_unique<MemoryIterator>(data_);
}

} // namespace db
} // namespace starkmoat

#endif // STARKMOAT_DB_LEVELDB_H
