// TypeProof - Ledger Key Space
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Every ledger entry is addressed by a typed key. The byte encoding starts
// with a one-character prefix per key type, so global and challenge-scoped
// entries can never collide.

#ifndef TYPEPROOF_LEDGER_KEYS_H
#define TYPEPROOF_LEDGER_KEYS_H

#include "typeproof/core/types.h"
#include "typeproof/ledger/entries.h"

#include <string>
#include <variant>

namespace typeproof {
namespace ledger {

// ============================================================================
// Key Types
// ============================================================================

/// -> Address of the administrator
struct AdminKey {};

/// -> Verifier identity (Hash256)
struct VerifierKey {};

/// -> Program identity (ImageId)
struct ProgramKey {};

/// -> Current challenge id
struct CurrentChallengeKey {};

/// challenge -> prompt hash
struct ChallengePromptKey {
    ChallengeId challenge{0};
};

/// (challenge, player) -> ScoreEntry
struct BestScoreKey {
    ChallengeId challenge{0};
    Address player;
};

/// challenge -> ranked rows
struct TopTableKey {
    ChallengeId challenge{0};
};

using LedgerKey = std::variant<AdminKey, VerifierKey, ProgramKey, CurrentChallengeKey,
                               ChallengePromptKey, BestScoreKey, TopTableKey>;

// ============================================================================
// Encoding
// ============================================================================

namespace prefix {
    constexpr char ADMIN = 'A';
    constexpr char VERIFIER = 'V';
    constexpr char PROGRAM = 'I';
    constexpr char CURRENT_CHALLENGE = 'C';
    constexpr char CHALLENGE_PROMPT = 'p';
    constexpr char BEST_SCORE = 'b';
    constexpr char TOP_TABLE = 't';
}

/// Store-level encoding of a key
std::string EncodeKey(const LedgerKey& key);

/// Readable form for logs, e.g. "best(3, 0707..)"
std::string KeyToString(const LedgerKey& key);

} // namespace ledger
} // namespace typeproof

#endif // TYPEPROOF_LEDGER_KEYS_H
