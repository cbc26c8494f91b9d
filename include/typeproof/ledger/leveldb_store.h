// TypeProof - LevelDB Ledger Store
// Copyright (c) 2024 TypeProof Developers
// MIT License

#ifndef TYPEPROOF_LEDGER_LEVELDB_STORE_H
#define TYPEPROOF_LEDGER_LEVELDB_STORE_H

#include "typeproof/ledger/store.h"

#include <leveldb/db.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>

#include <memory>
#include <string>
#include <utility>

namespace typeproof {
namespace ledger {

/**
 * Options for opening a LevelDB store.
 */
struct LevelDBOptions {
    /// Create the database if it doesn't exist
    bool create_if_missing = true;

    /// Enable paranoid checks
    bool paranoid_checks = false;

    /// Sync every applied write set to disk
    bool sync = true;

    /// LRU cache size for blocks (0 to disable)
    size_t block_cache_size = 8 * 1024 * 1024;

    /// Bloom filter bits per key (0 to disable)
    int bloom_filter_bits = 10;
};

/**
 * Ledger store on a LevelDB directory. A WriteSet is applied as one
 * leveldb::WriteBatch.
 */
class LevelDBLedgerStore : public LedgerStore {
public:
    ~LevelDBLedgerStore() override;

    /**
     * Open a store at the specified path.
     * @return Pair of (status, store pointer); the pointer is null on failure
     */
    static std::pair<Status, std::unique_ptr<LevelDBLedgerStore>> Open(
        const std::string& path, const LevelDBOptions& options = LevelDBOptions());

    Status Get(const LedgerKey& key, Bytes* value) const override;
    Status Apply(const WriteSet& writes) override;

    const std::string& GetPath() const { return path_; }

private:
    LevelDBLedgerStore(leveldb::DB* db, leveldb::Cache* cache,
                       const leveldb::FilterPolicy* filter,
                       std::string path, bool sync);

    static Status ConvertStatus(const leveldb::Status& s);

    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    std::string path_;
    bool sync_;
};

} // namespace ledger
} // namespace typeproof

#endif // TYPEPROOF_LEDGER_LEVELDB_STORE_H
