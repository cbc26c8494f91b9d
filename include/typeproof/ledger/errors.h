// TypeProof - Ledger Errors
// Copyright (c) 2024 TypeProof Developers
// MIT License

#ifndef TYPEPROOF_LEDGER_ERRORS_H
#define TYPEPROOF_LEDGER_ERRORS_H

namespace typeproof {
namespace ledger {

/// Result of a leaderboard contract call. Any value other than OK means
/// the call wrote nothing.
enum class LedgerError {
    OK = 0,

    // Initialization
    ALREADY_INITIALIZED,
    NOT_INITIALIZED,

    // Input validation
    INVALID_NAME,
    INVALID_PROMPT_HASH,
    INVALID_CHALLENGE,
    CHALLENGE_EXISTS,
    INVALID_IMAGE_ID,

    // Proof
    PROOF_VERIFICATION_FAILED,

    // Authorization
    AUTH_REQUIRED,

    // Store
    STORAGE_ERROR,
    CORRUPT_STATE,
};

/// Convert error to string
const char* LedgerErrorToString(LedgerError err);

} // namespace ledger
} // namespace typeproof

#endif // TYPEPROOF_LEDGER_ERRORS_H
