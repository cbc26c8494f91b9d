// TypeProof - LevelDB Ledger Store
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/ledger/leveldb_store.h"
#include "typeproof/util/logging.h"

#include <leveldb/write_batch.h>

namespace typeproof {
namespace ledger {

LevelDBLedgerStore::LevelDBLedgerStore(leveldb::DB* db, leveldb::Cache* cache,
                                       const leveldb::FilterPolicy* filter,
                                       std::string path, bool sync)
    : db_(db), cache_(cache), filter_policy_(filter), path_(std::move(path)), sync_(sync) {}

LevelDBLedgerStore::~LevelDBLedgerStore() {
    // Close in correct order
    db_.reset();
    cache_.reset();
    filter_policy_.reset();
}

Status LevelDBLedgerStore::ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    return Status::IOError(s.ToString());
}

std::pair<Status, std::unique_ptr<LevelDBLedgerStore>> LevelDBLedgerStore::Open(
    const std::string& path, const LevelDBOptions& options)
{
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
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

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path, &db);
    if (!s.ok()) {
        delete cache;
        delete filter;
        LOG_ERROR(util::LogCategory::DB) << "failed to open " << path << ": " << s.ToString();
        return {ConvertStatus(s), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "opened ledger store at " << path;
    std::unique_ptr<LevelDBLedgerStore> store(
        new LevelDBLedgerStore(db, cache, filter, path, options.sync));
    return {Status::Ok(), std::move(store)};
}

Status LevelDBLedgerStore::Get(const LedgerKey& key, Bytes* value) const {
    std::string raw;
    leveldb::Status s = db_->Get(leveldb::ReadOptions(), EncodeKey(key), &raw);
    if (!s.ok()) {
        return ConvertStatus(s);
    }
    value->assign(raw.begin(), raw.end());
    return Status::Ok();
}

Status LevelDBLedgerStore::Apply(const WriteSet& writes) {
    leveldb::WriteBatch batch;
    writes.Iterate([&batch](const std::string& key, const Bytes& value) {
        batch.Put(key, leveldb::Slice(reinterpret_cast<const char*>(value.data()),
                                      value.size()));
    });

    leveldb::WriteOptions wo;
    wo.sync = sync_;
    Status status = ConvertStatus(db_->Write(wo, &batch));
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "write failed: " << status.ToString();
    }
    return status;
}

} // namespace ledger
} // namespace typeproof
