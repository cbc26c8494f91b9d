// TypeProof - Replay and Codec Errors
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/proof/errors.h"

namespace typeproof {
namespace proof {

const char* ProofErrorToString(ProofError err) {
    switch (err) {
        case ProofError::OK: return "OK";
        case ProofError::PROMPT_HASH_MISMATCH: return "Prompt hash mismatch";
        case ProofError::EMPTY_PROMPT: return "Prompt is empty";
        case ProofError::NON_ASCII_PROMPT: return "Prompt must be ASCII";
        case ProofError::PROMPT_TOO_LONG: return "Prompt too long";
        case ProofError::EVENTS_TRUNCATED: return "Event stream length mismatch";
        case ProofError::TOO_MANY_EVENTS: return "Too many events";
        case ProofError::INVALID_KEY: return "Invalid key code";
        case ProofError::DELAY_TOO_SHORT: return "Key delay below minimum";
        case ProofError::DURATION_TOO_SHORT: return "Duration too short";
        case ProofError::DURATION_OVERFLOW: return "Duration overflow";
        case ProofError::LENGTH_MISMATCH: return "Journal length mismatch";
        default: return "Unknown error";
    }
}

} // namespace proof
} // namespace typeproof
