// TypeProof - Replay and Codec Errors
// Copyright (c) 2024 TypeProof Developers
// MIT License

#ifndef TYPEPROOF_PROOF_ERRORS_H
#define TYPEPROOF_PROOF_ERRORS_H

namespace typeproof {
namespace proof {

/// Errors raised while normalizing, decoding or replaying typing input.
/// Any of these aborts the computation; no journal is produced.
enum class ProofError {
    OK = 0,

    // Binding
    PROMPT_HASH_MISMATCH,
    EMPTY_PROMPT,
    NON_ASCII_PROMPT,
    PROMPT_TOO_LONG,

    // Event stream
    EVENTS_TRUNCATED,
    TOO_MANY_EVENTS,
    INVALID_KEY,

    // Replay
    DELAY_TOO_SHORT,
    DURATION_TOO_SHORT,
    DURATION_OVERFLOW,

    // Journal
    LENGTH_MISMATCH,
};

/// Convert error to string
const char* ProofErrorToString(ProofError err);

} // namespace proof
} // namespace typeproof

#endif // TYPEPROOF_PROOF_ERRORS_H
