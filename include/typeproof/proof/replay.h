// TypeProof - Replay Scoring Engine
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Deterministic function from (prompt, keystroke stream) to a scored journal.
// The same code runs inside the prover and in off-path rechecks, so it must
// not depend on anything but its input: no clocks, no logging, no globals.

#ifndef TYPEPROOF_PROOF_REPLAY_H
#define TYPEPROOF_PROOF_REPLAY_H

#include "typeproof/core/types.h"
#include "typeproof/core/serialize.h"
#include "typeproof/proof/errors.h"
#include "typeproof/proof/journal.h"

#include <cstdint>

namespace typeproof {
namespace proof {

// ============================================================================
// Scoring Constants
// ============================================================================

/// Anti-automation floor on every inter-key delay
constexpr uint16_t MIN_DELAY_MS = 10;

/// Total duration must be at least this many ms per prompt character
constexpr uint64_t MIN_MS_PER_CHAR = 40;

/// Basis points of a perfect accuracy
constexpr uint64_t ACCURACY_SCALE = 10000;

/// 60000 ms per minute / 5 chars per word * 100 (x100 fixed point)
constexpr uint64_t WPM_X100_NUMERATOR = 1200000;

// ============================================================================
// Replay Input
// ============================================================================

/**
 * Everything the replay program reads. The serialized form is the input
 * stream handed to a prover: challenge id, prompt hash and player key first,
 * then the private prompt and event bytes.
 */
struct ReplayInput {
    ChallengeId challengeId{0};
    PlayerKey player;
    /// Claimed SHA-256 of promptBytes
    Hash256 promptHash;
    /// Normalized prompt
    Bytes promptBytes;
    /// Encoded event stream
    Bytes eventBytes;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        s << challengeId << promptHash << player << promptBytes << eventBytes;
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        s >> challengeId >> promptHash >> player >> promptBytes >> eventBytes;
    }
};

/// Serialize an input into a prover input stream
Bytes SerializeReplayInput(const ReplayInput& input);

/// Parse a prover input stream; false if malformed or has trailing bytes
bool ParseReplayInput(const Bytes& stream, ReplayInput& input);

// ============================================================================
// Replay
// ============================================================================

struct ReplayResult {
    ProofError error{ProofError::OK};
    Journal journal;

    /// Reconstructed text after applying every key
    Bytes output;
    /// Positions where output matches the prompt
    uint32_t correctChars{0};
    /// Decoded events replayed
    size_t eventCount{0};

    bool IsValid() const { return error == ProofError::OK; }
};

/**
 * Run the replay program.
 *
 * Checks, in order: prompt hash binding, non-empty prompt, event stream
 * decoding, per-event delay floor and duration accumulation, total duration
 * floor. On any failure the journal is left default and must not be used.
 */
ReplayResult RunReplay(const ReplayInput& input);

/// Re-run the replay and compare the resulting journal hash
bool RecheckJournal(const ReplayInput& input, const Hash256& expectedJournalHash);

/// Fixed identity of this replay program (the image id provers bind to)
const ImageId& ReplayProgramId();

} // namespace proof
} // namespace typeproof

#endif // TYPEPROOF_PROOF_REPLAY_H
