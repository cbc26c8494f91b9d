// TypeProof - Ledger Host Services
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Services the leaderboard contract gets from the ledger it runs on:
// caller authorization and the current sequence number.

#ifndef TYPEPROOF_LEDGER_HOST_H
#define TYPEPROOF_LEDGER_HOST_H

#include "typeproof/core/types.h"
#include "typeproof/ledger/entries.h"

#include <set>

namespace typeproof {
namespace ledger {

// ============================================================================
// Authorization
// ============================================================================

class IAuthorizer {
public:
    virtual ~IAuthorizer() = default;

    /// Whether the current caller controls `address`
    virtual bool RequireAuth(const Address& address) = 0;
};

/// Authorizes the addresses that signed the current session
class SessionAuthorizer : public IAuthorizer {
public:
    SessionAuthorizer() = default;

    void Authorize(const Address& address) { signers_.insert(address); }
    void Revoke(const Address& address) { signers_.erase(address); }
    void Clear() { signers_.clear(); }

    bool RequireAuth(const Address& address) override {
        return signers_.count(address) > 0;
    }

private:
    std::set<Address> signers_;
};

// ============================================================================
// Ledger Info
// ============================================================================

class ILedgerInfo {
public:
    virtual ~ILedgerInfo() = default;

    /// Sequence number of the ledger being closed
    virtual LedgerSeq Sequence() const = 0;
};

/// Sequence set by the embedder
class ManualLedgerInfo : public ILedgerInfo {
public:
    explicit ManualLedgerInfo(LedgerSeq sequence = 0) : sequence_(sequence) {}

    LedgerSeq Sequence() const override { return sequence_; }

    void SetSequence(LedgerSeq sequence) { sequence_ = sequence; }
    void Advance() { ++sequence_; }

private:
    LedgerSeq sequence_;
};

} // namespace ledger
} // namespace typeproof

#endif // TYPEPROOF_LEDGER_HOST_H
