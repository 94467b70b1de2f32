// LOCKVAULT - Database Abstraction Layer
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// Abstract key-value store used for vault positions, vault state and the
// token ledger. The on-disk backend is LevelDB; an in-memory store is used
// in tests and when LevelDB is not available.

#ifndef LOCKVAULT_DB_DATABASE_H
#define LOCKVAULT_DB_DATABASE_H

#include "lockvault/core/types.h"
#include "lockvault/core/serialize.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <ios>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lockvault {
namespace db {

// ============================================================================
// Database Status
// ============================================================================

/// Outcome of a store call; NotFound is an ordinary miss, anything else
/// other than ok() is a failure the caller reports upward
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND,
        CORRUPTION,
        INVALID_ARGUMENT,
        IO_ERROR,
    };

    Status() = default;
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(NOT_FOUND, std::move(msg)); }
    static Status Corruption(std::string msg = "") { return Status(CORRUPTION, std::move(msg)); }
    static Status InvalidArgument(std::string msg = "") {
        return Status(INVALID_ARGUMENT, std::move(msg));
    }
    static Status IOError(std::string msg = "") { return Status(IO_ERROR, std::move(msg)); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }

    /// "OK", or "<Kind>: <message>"
    std::string ToString() const;

private:
    Code code_{OK};
    std::string message_;
};

// ============================================================================
// Slice - borrowed key or value bytes
// ============================================================================

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

    /// Used to stop prefix scans over one record kind
    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    bool operator==(const Slice& b) const {
        return size_ == b.size_ && std::memcmp(data_, b.data_, size_) == 0;
    }
    bool operator!=(const Slice& b) const { return !(*this == b); }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Database Options
// ============================================================================

/// Open-time tuning for the LevelDB backend
struct Options {
    bool create_if_missing = true;
    size_t write_buffer_size = 4 * 1024 * 1024;
    int max_open_files = 64;
    size_t block_cache_size = 8 * 1024 * 1024;   // 0 disables the cache
    bool compression = true;
    int bloom_filter_bits = 10;                   // 0 disables the filter
};

struct ReadOptions {
    bool verify_checksums = false;
};

struct WriteOptions {
    /// Vault and ledger writes are synced unless a caller opts out
    bool sync = true;
};

// ============================================================================
// WriteBatch - atomic batch of writes
// ============================================================================

class WriteBatch {
private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;

public:
    WriteBatch() = default;

    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    size_t Count() const { return operations_.size(); }

    /// Visit operations in insertion order; a missing value is a delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }
};

// ============================================================================
// Iterator
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;

    /// Seek to the first key >= target
    virtual void Seek(const Slice& target) = 0;

    virtual void Next() = 0;

    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database - abstract key-value store
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }

    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }

    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }

    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }

    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;
    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }

    /// Backend name for diagnostics ("leveldb", "memory")
    virtual std::string GetName() const = 0;
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open a database at the specified path.
 *
 * Without LevelDB support compiled in, an empty in-memory database is
 * returned and nothing survives the process.
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete all data at path
Status DestroyDatabase(const std::filesystem::path& path);

/// True when persistent storage is compiled in
bool HasPersistentBackend();

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

/**
 * Deserialize an object from a byte string.
 * Truncated input and trailing garbage are both rejected.
 */
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Unserialize(ss, obj);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    // Vault store
    constexpr char POSITION = 'p';        // address -> position
    constexpr char VAULT_STATE = 'g';     // -> global vault state

    // Ledger store
    constexpr char BALANCE = 'b';         // address -> balance
    constexpr char ALLOWANCE = 'a';       // owner || spender -> allowance
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

template<typename T>
std::string MakeKey(char prefix, const T& obj) {
    std::string result(1, prefix);
    DataStream ss;
    Serialize(ss, obj);
    result.append(reinterpret_cast<const char*>(ss.data()), ss.size());
    return result;
}

template<typename T1, typename T2>
std::string MakeKey(char prefix, const T1& first, const T2& second) {
    std::string result(1, prefix);
    DataStream ss;
    Serialize(ss, first);
    Serialize(ss, second);
    result.append(reinterpret_cast<const char*>(ss.data()), ss.size());
    return result;
}

} // namespace db
} // namespace lockvault

#endif // LOCKVAULT_DB_DATABASE_H
