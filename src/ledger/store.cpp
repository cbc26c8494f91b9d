// TypeProof - Ledger Store
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/ledger/store.h"

namespace typeproof {
namespace ledger {

Status MemoryLedgerStore::Get(const LedgerKey& key, Bytes* value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(EncodeKey(key));
    if (it == data_.end()) {
        return Status::NotFound(KeyToString(key));
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryLedgerStore::Apply(const WriteSet& writes) {
    std::lock_guard<std::mutex> lock(mutex_);
    writes.Iterate([this](const std::string& key, const Bytes& value) {
        data_[key] = value;
    });
    return Status::Ok();
}

} // namespace ledger
} // namespace typeproof
