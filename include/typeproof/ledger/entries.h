// TypeProof - Leaderboard Entries
// Copyright (c) 2024 TypeProof Developers
// MIT License

#ifndef TYPEPROOF_LEDGER_ENTRIES_H
#define TYPEPROOF_LEDGER_ENTRIES_H

#include "typeproof/core/types.h"

#include <cstdint>
#include <string>

namespace typeproof {
namespace ledger {

/// Authenticated ledger identity; players are addressed by their public key
using Address = PlayerKey;

/// Rows kept in a challenge's top table
constexpr size_t TOP_N = 20;

/// Display name limits
constexpr size_t MIN_NAME_LEN = 1;
constexpr size_t MAX_NAME_LEN = 24;
constexpr unsigned char NAME_CHAR_MIN = 0x20;
constexpr unsigned char NAME_CHAR_MAX = 0x7E;

/// Name of 1..24 printable ASCII characters
bool IsValidName(const std::string& name);

// ============================================================================
// Score Entry
// ============================================================================

/// A player's best run on one challenge
struct ScoreEntry {
    uint64_t score{0};
    uint32_t wpmX100{0};
    uint32_t accuracyBps{0};
    uint32_t durationMs{0};
    /// Display name given with the best run
    std::string name;
    /// Ledger sequence at submission
    LedgerSeq submittedLedger{0};

    bool operator==(const ScoreEntry& other) const {
        return score == other.score && wpmX100 == other.wpmX100 &&
               accuracyBps == other.accuracyBps && durationMs == other.durationMs &&
               name == other.name && submittedLedger == other.submittedLedger;
    }

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        s << score << wpmX100 << accuracyBps << durationMs << name << submittedLedger;
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        s >> score >> wpmX100 >> accuracyBps >> durationMs >> name >> submittedLedger;
    }
};

// ============================================================================
// Leaderboard Row
// ============================================================================

/// Ranked view of a player's best; carries no duration or timestamp
struct LeaderboardRow {
    Address player;
    std::string name;
    uint64_t score{0};
    uint32_t wpmX100{0};
    uint32_t accuracyBps{0};

    bool operator==(const LeaderboardRow& other) const {
        return player == other.player && name == other.name && score == other.score &&
               wpmX100 == other.wpmX100 && accuracyBps == other.accuracyBps;
    }

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        s << player << name << score << wpmX100 << accuracyBps;
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        s >> player >> name >> score >> wpmX100 >> accuracyBps;
    }
};

} // namespace ledger
} // namespace typeproof

#endif // TYPEPROOF_LEDGER_ENTRIES_H
