// STARKMOAT - Database Abstraction Layer
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// Abstract key-value database interface. The root registry persists its
// state through it; LevelDB backs it on disk, MemoryDatabase in tests.

#ifndef STARKMOAT_DB_DATABASE_H
#define STARKMOAT_DB_DATABASE_H

#include <starkmoat/core/types.h>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace starkmoat {
namespace db {

// ============================================================================
// Status
// ============================================================================

/// Outcome of a storage call. NOT_FOUND is an ordinary answer to Get, the
/// other codes are failures.
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };
    
    Status() = default;
    Status(Code code, std::string msg = "") : code_(code), message_(std::move(msg)) {}
    
    static Status Ok() { return {}; }
    static Status NotFound(const std::string& msg = "") { return {NOT_FOUND, msg}; }
    static Status Corruption(const std::string& msg = "") { return {CORRUPTION, msg}; }
    static Status NotSupported(const std::string& msg = "") { return {NOT_SUPPORTED, msg}; }
    static Status InvalidArgument(const std::string& msg = "") { return {INVALID_ARGUMENT, msg}; }
    static Status IOError(const std::string& msg = "") { return {IO_ERROR, msg}; }
    
    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }
    
    Code code() const { return code_; }
    const std::string& message() const { return message_; }
    
    /// "OK", or "<Code>: <message>"
    std::string ToString() const {
        if (ok()) {
            return "OK";
        }
        return std::string(CodeName(code_)) + ": " + message_;
    }

private:
    static const char* CodeName(Code code) {
        switch (code) {
            case OK:               return "OK";
            case NOT_FOUND:        return "NotFound";
            case CORRUPTION:       return "Corruption";
            case NOT_SUPPORTED:    return "NotSupported";
            case INVALID_ARGUMENT: return "InvalidArgument";
            case IO_ERROR:         return "IOError";
        }
        return "Unknown";
    }
    
    Code code_{OK};
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/// Non-owning view of a key or value. The bytes must outlive the Slice.
class Slice {
public:
    Slice() = default;
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}
    
    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    char operator[](size_t n) const { return data_[n]; }

    std::string ToString() const { return std::string(data_, size_); }
    
    bool starts_with(const Slice& x) const {
        return size_ >= x.size_ && std::memcmp(data_, x.data_, x.size_) == 0;
    }
    
    bool operator==(const Slice& b) const {
        return size_ == b.size_ && std::memcmp(data_, b.data_, size_) == 0;
    }
    bool operator!=(const Slice& b) const { return !(*this == b); }

private:
    const char* data_{nullptr};
    size_t size_{0};
};

// ============================================================================
// Options
// ============================================================================

/// Open options, passed through to LevelDB. The defaults suit a store of a
/// few hundred small records.
struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;
    size_t write_buffer_size = 1024 * 1024;
    int max_open_files = 64;
};

struct ReadOptions {
    bool verify_checksums = false;
};

struct WriteOptions {
    /// fsync before the write returns
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/**
 * Ordered puts and deletes applied all-or-nothing by Database::Write.
 * A later operation on the same key wins.
 */
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
    
    /// Visit operations in order; a nullopt value is a delete
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

/// Forward cursor over keys in bytewise order
class Iterator {
public:
    virtual ~Iterator() = default;
    
    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;
    
    /// Only meaningful while Valid()
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

/**
 * Key-value store interface.
 * 
 * Backends implement the option-taking overloads; the short forms use
 * default options. Derived classes re-export them with a using-declaration.
 */
class Database {
public:
    virtual ~Database() = default;
    
    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;
    
    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }
    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }
    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }
    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }
    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }
    
    /// True if Get succeeds for key
    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open (by default create) a LevelDB store at path. Missing parent
 * directories are created. The pointer is null unless the status is ok.
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete the LevelDB store at path and everything in it
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Key Prefixes for Database Namespacing
// ============================================================================

namespace prefix {
    // Root registry
    constexpr char REGISTRY_ADMIN = 'a';        // -> admin identity
    constexpr char REGISTRY_CURRENT = 'c';      // -> current root
    constexpr char REGISTRY_ACCEPTED = 'r';     // root -> (empty)
    constexpr char REGISTRY_TRANSITION = 't';   // sequence -> transition record
}

/// prefix byte followed by key
inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key.data(), key.size());
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

} // namespace db
} // namespace starkmoat

#endif // STARKMOAT_DB_DATABASE_H
