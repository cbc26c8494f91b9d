// TypeProof - Ledger Store
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Persistent key-value store behind the leaderboard contract. A contract
// call stages all of its writes in a WriteSet and applies them at the end,
// so a call either commits every write or none.

#ifndef TYPEPROOF_LEDGER_STORE_H
#define TYPEPROOF_LEDGER_STORE_H

#include "typeproof/core/types.h"
#include "typeproof/core/serialize.h"
#include "typeproof/ledger/keys.h"

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace typeproof {
namespace ledger {

// ============================================================================
// Store Status
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        IO_ERROR = 3,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const {
        if (ok()) return "OK";
        std::string result;
        switch (code_) {
            case NOT_FOUND: result = "NotFound: "; break;
            case CORRUPTION: result = "Corruption: "; break;
            case IO_ERROR: result = "IOError: "; break;
            default: result = "Unknown: "; break;
        }
        return result + message_;
    }

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// WriteSet
// ============================================================================

/// Writes staged by one contract call
class WriteSet {
public:
    WriteSet() = default;

    void Set(const LedgerKey& key, Bytes value) {
        writes_.emplace_back(EncodeKey(key), std::move(value));
    }

    /// Serialize and stage a value
    template<typename T>
    void SetValue(const LedgerKey& key, const T& value) {
        DataStream s;
        s << value;
        Set(key, s.Release());
    }

    void Clear() { writes_.clear(); }
    size_t Count() const { return writes_.size(); }
    bool Empty() const { return writes_.empty(); }

    /// Visit writes in staging order as (encoded key, value)
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& w : writes_) {
            func(w.first, w.second);
        }
    }

private:
    std::vector<std::pair<std::string, Bytes>> writes_;
};

// ============================================================================
// LedgerStore
// ============================================================================

class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    /// Read a value; NotFound if absent
    virtual Status Get(const LedgerKey& key, Bytes* value) const = 0;

    /// Apply every write atomically
    virtual Status Apply(const WriteSet& writes) = 0;

    /// Check if a key exists; storage failures count as absent
    virtual bool Has(const LedgerKey& key) const {
        Bytes value;
        return Get(key, &value).ok();
    }
};

/**
 * Read and deserialize a value.
 * @return NotFound if absent, Corruption if the bytes do not decode
 */
template<typename T>
Status ReadValue(const LedgerStore& store, const LedgerKey& key, T& out) {
    Bytes raw;
    Status status = store.Get(key, &raw);
    if (!status.ok()) {
        return status;
    }
    DataStream s(std::move(raw));
    T value;
    try {
        s >> value;
    } catch (const std::ios_base::failure& e) {
        return Status::Corruption(KeyToString(key) + ": " + e.what());
    }
    if (!s.empty()) {
        return Status::Corruption(KeyToString(key) + ": trailing bytes");
    }
    out = std::move(value);
    return Status::Ok();
}

// ============================================================================
// In-Memory Store
// ============================================================================

/// Map-backed store for tests and embedding
class MemoryLedgerStore : public LedgerStore {
public:
    MemoryLedgerStore() = default;

    Status Get(const LedgerKey& key, Bytes* value) const override;
    Status Apply(const WriteSet& writes) override;

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }

private:
    std::map<std::string, Bytes> data_;
    mutable std::mutex mutex_;
};

} // namespace ledger
} // namespace typeproof

#endif // TYPEPROOF_LEDGER_STORE_H
