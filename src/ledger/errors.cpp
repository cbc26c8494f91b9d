// TypeProof - Ledger Errors
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/ledger/errors.h"

namespace typeproof {
namespace ledger {

const char* LedgerErrorToString(LedgerError err) {
    switch (err) {
        case LedgerError::OK: return "OK";
        case LedgerError::ALREADY_INITIALIZED: return "Already initialized";
        case LedgerError::NOT_INITIALIZED: return "Not initialized";
        case LedgerError::INVALID_NAME: return "Invalid name";
        case LedgerError::INVALID_PROMPT_HASH: return "Invalid prompt hash";
        case LedgerError::INVALID_CHALLENGE: return "Invalid challenge";
        case LedgerError::CHALLENGE_EXISTS: return "Challenge already configured";
        case LedgerError::INVALID_IMAGE_ID: return "Invalid image id";
        case LedgerError::PROOF_VERIFICATION_FAILED: return "Proof verification failed";
        case LedgerError::AUTH_REQUIRED: return "Authorization required";
        case LedgerError::STORAGE_ERROR: return "Storage error";
        case LedgerError::CORRUPT_STATE: return "Corrupt ledger state";
        default: return "Unknown error";
    }
}

} // namespace ledger
} // namespace typeproof
