// TypeProof - Leaderboard Contract
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Score submission validator and best-score leaderboard.
//
// Lifecycle: uninitialized -> initialized (admin, verifier identity and
// program identity recorded) -> challenges configured (prompt hash per
// challenge, set once) -> one challenge marked current. Scores are accepted
// only for the current challenge.
//
// Calls run one at a time in ledger order. Every call stages its writes and
// applies them together at the end; a call that returns an error has
// written nothing.

#ifndef TYPEPROOF_LEDGER_LEADERBOARD_H
#define TYPEPROOF_LEDGER_LEADERBOARD_H

#include "typeproof/core/types.h"
#include "typeproof/ledger/entries.h"
#include "typeproof/ledger/errors.h"
#include "typeproof/ledger/host.h"
#include "typeproof/ledger/store.h"
#include "typeproof/proof/journal.h"
#include "typeproof/proof/verifier.h"

#include <optional>
#include <string>
#include <vector>

namespace typeproof {
namespace ledger {

/// Arguments of a score submission
struct ScoreSubmission {
    ChallengeId challengeId{0};
    Address player;
    std::string name;
    Hash256 promptHash;
    uint64_t score{0};
    uint32_t wpmX100{0};
    uint32_t accuracyBps{0};
    uint32_t durationMs{0};
    Hash256 journalHash;
    ImageId imageId;
    Bytes seal;

    /// Submission carrying a proven journal's fields
    static ScoreSubmission FromJournal(const proof::Journal& journal, const std::string& name,
                                       const Hash256& journalHash, const ImageId& imageId,
                                       const Bytes& seal);
};

class LeaderboardContract {
public:
    LeaderboardContract(LedgerStore& store, IAuthorizer& auth, const ILedgerInfo& ledger,
                        const proof::IProofVerifier& verifier);

    // ========================================================================
    // Administration
    // ========================================================================

    /// Record admin, verifier and program identities; once only
    LedgerError Init(const Address& admin, const Hash256& verifierId, const ImageId& imageId);

    /// Record a challenge's prompt hash. Admin only; a configured challenge
    /// cannot be changed (CHALLENGE_EXISTS).
    LedgerError SetChallenge(ChallengeId challengeId, const Hash256& promptHash);

    /// Mark a configured challenge as current. Admin only.
    LedgerError SetCurrentChallenge(ChallengeId challengeId);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Current challenge and its prompt hash; NOT_INITIALIZED if none is set
    LedgerError GetCurrentChallenge(ChallengeId& challengeId, Hash256& promptHash) const;

    /// A player's best entry; nullopt if the player never scored
    LedgerError GetBest(ChallengeId challengeId, const Address& player,
                        std::optional<ScoreEntry>& entry) const;

    /// Ranked top table; empty if nobody scored
    LedgerError GetTop(ChallengeId challengeId, std::vector<LeaderboardRow>& rows) const;

    // ========================================================================
    // Submission
    // ========================================================================

    /**
     * Validate a submission and merge it into the leaderboard.
     *
     * Checks run in order and the first failure is returned: player
     * authorization, display name, challenge prompt hash, current
     * challenge, program identity, proof. A score not strictly above the
     * player's best is accepted as a no-op.
     *
     * @param improved Set to whether the player's best changed
     */
    LedgerError SubmitScore(const ScoreSubmission& submission, bool* improved = nullptr);

private:
    /// Admin lookup plus authorization
    LedgerError RequireAdmin();

    /// Typed read; `found` reports presence, absent is not an error
    template<typename T>
    LedgerError Read(const LedgerKey& key, T& out, bool& found) const;

    /// Typed read of a value that must exist; `missing` is reported if absent
    template<typename T>
    LedgerError ReadRequired(const LedgerKey& key, T& out, LedgerError missing) const;

    LedgerError Commit(const WriteSet& writes, const char* op);

    LedgerStore& store_;
    IAuthorizer& auth_;
    const ILedgerInfo& ledger_;
    const proof::IProofVerifier& verifier_;
};

} // namespace ledger
} // namespace typeproof

#endif // TYPEPROOF_LEDGER_LEADERBOARD_H
