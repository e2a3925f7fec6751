// STARKMOAT - Database Implementation
// Copyright (c) 2024 STARKMOAT Developers
// MIT License

#include <starkmoat/db/database.h>
#include <starkmoat/db/leveldb.h>
#include <starkmoat/util/logging.h>

namespace starkmoat {
namespace db {

// ============================================================================
// Status Conversion
// ============================================================================

Status ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBIterator::status() const {
    return ConvertStatus(iter_->status());
}

// ============================================================================
// LevelDBDatabase
// ============================================================================

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    leveldb::Slice lkey(key.data(), key.size());
    return ConvertStatus(db_->Get(MakeReadOptions(options), lkey, value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    leveldb::Slice lkey(key.data(), key.size());
    leveldb::Slice lval(value.data(), value.size());
    return ConvertStatus(db_->Put(MakeWriteOptions(options), lkey, lval));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    leveldb::Slice lkey(key.data(), key.size());
    return ConvertStatus(db_->Delete(MakeWriteOptions(options), lkey));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return ConvertStatus(db_->Write(MakeWriteOptions(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;
    
    if (options.create_if_missing && path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return {Status::IOError(ec.message()), nullptr};
        }
    }
    
    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        return {ConvertStatus(s), nullptr};
    }
    
    LOG_DEBUG(util::LogCategory::DB) << "Opened database " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, path)};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return Status::IOError(s.ToString());
    }
    return Status::Ok();
}

} // namespace db
} // namespace starkmoat
