// TypeProof - Leaderboard Contract
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/ledger/leaderboard.h"
#include "typeproof/ledger/ranking.h"
#include "typeproof/util/logging.h"

namespace typeproof {
namespace ledger {

ScoreSubmission ScoreSubmission::FromJournal(const proof::Journal& journal,
                                             const std::string& name,
                                             const Hash256& journalHash,
                                             const ImageId& imageId,
                                             const Bytes& seal) {
    ScoreSubmission sub;
    sub.challengeId = journal.challengeId;
    sub.player = journal.playerKey;
    sub.name = name;
    sub.promptHash = journal.promptHash;
    sub.score = journal.score;
    sub.wpmX100 = journal.wpmX100;
    sub.accuracyBps = journal.accuracyBps;
    sub.durationMs = journal.durationMs;
    sub.journalHash = journalHash;
    sub.imageId = imageId;
    sub.seal = seal;
    return sub;
}

LeaderboardContract::LeaderboardContract(LedgerStore& store, IAuthorizer& auth,
                                         const ILedgerInfo& ledger,
                                         const proof::IProofVerifier& verifier)
    : store_(store), auth_(auth), ledger_(ledger), verifier_(verifier) {}

// ============================================================================
// Store Helpers
// ============================================================================

template<typename T>
LedgerError LeaderboardContract::Read(const LedgerKey& key, T& out, bool& found) const {
    found = false;
    Status status = ReadValue(store_, key, out);
    if (status.ok()) {
        found = true;
        return LedgerError::OK;
    }
    if (status.IsNotFound()) {
        return LedgerError::OK;
    }
    LOG_ERROR(util::LogCategory::LEDGER) << "read " << KeyToString(key) << ": "
                                         << status.ToString();
    return status.IsCorruption() ? LedgerError::CORRUPT_STATE : LedgerError::STORAGE_ERROR;
}

template<typename T>
LedgerError LeaderboardContract::ReadRequired(const LedgerKey& key, T& out,
                                              LedgerError missing) const {
    bool found = false;
    LedgerError err = Read(key, out, found);
    if (err != LedgerError::OK) {
        return err;
    }
    return found ? LedgerError::OK : missing;
}

LedgerError LeaderboardContract::Commit(const WriteSet& writes, const char* op) {
    Status status = store_.Apply(writes);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << op << ": " << status.ToString();
        return LedgerError::STORAGE_ERROR;
    }
    return LedgerError::OK;
}

LedgerError LeaderboardContract::RequireAdmin() {
    Address admin;
    LedgerError err = ReadRequired(AdminKey{}, admin, LedgerError::NOT_INITIALIZED);
    if (err != LedgerError::OK) {
        return err;
    }
    if (!auth_.RequireAuth(admin)) {
        return LedgerError::AUTH_REQUIRED;
    }
    return LedgerError::OK;
}

// ============================================================================
// Administration
// ============================================================================

LedgerError LeaderboardContract::Init(const Address& admin, const Hash256& verifierId,
                                      const ImageId& imageId) {
    Address existing;
    bool found = false;
    LedgerError err = Read(AdminKey{}, existing, found);
    if (err != LedgerError::OK) {
        return err;
    }
    if (found) {
        return LedgerError::ALREADY_INITIALIZED;
    }

    WriteSet writes;
    writes.SetValue(AdminKey{}, admin);
    writes.SetValue(VerifierKey{}, verifierId);
    writes.SetValue(ProgramKey{}, imageId);
    err = Commit(writes, "init");
    if (err == LedgerError::OK) {
        LOG_INFO(util::LogCategory::LEDGER) << "initialized, program " << imageId.ToHex();
    }
    return err;
}

LedgerError LeaderboardContract::SetChallenge(ChallengeId challengeId,
                                              const Hash256& promptHash) {
    LedgerError err = RequireAdmin();
    if (err != LedgerError::OK) {
        return err;
    }

    Hash256 existing;
    bool found = false;
    err = Read(ChallengePromptKey{challengeId}, existing, found);
    if (err != LedgerError::OK) {
        return err;
    }
    if (found) {
        return LedgerError::CHALLENGE_EXISTS;
    }

    WriteSet writes;
    writes.SetValue(ChallengePromptKey{challengeId}, promptHash);
    err = Commit(writes, "set challenge");
    if (err == LedgerError::OK) {
        LOG_INFO(util::LogCategory::LEDGER) << "challenge " << challengeId
                                            << " prompt " << promptHash.ToHex();
    }
    return err;
}

LedgerError LeaderboardContract::SetCurrentChallenge(ChallengeId challengeId) {
    LedgerError err = RequireAdmin();
    if (err != LedgerError::OK) {
        return err;
    }
    if (!store_.Has(ChallengePromptKey{challengeId})) {
        return LedgerError::INVALID_CHALLENGE;
    }

    WriteSet writes;
    writes.SetValue(CurrentChallengeKey{}, challengeId);
    err = Commit(writes, "set current challenge");
    if (err == LedgerError::OK) {
        LOG_INFO(util::LogCategory::LEDGER) << "current challenge " << challengeId;
    }
    return err;
}

// ============================================================================
// Queries
// ============================================================================

LedgerError LeaderboardContract::GetCurrentChallenge(ChallengeId& challengeId,
                                                     Hash256& promptHash) const {
    ChallengeId current = 0;
    LedgerError err = ReadRequired(CurrentChallengeKey{}, current,
                                   LedgerError::NOT_INITIALIZED);
    if (err != LedgerError::OK) {
        return err;
    }
    Hash256 hash;
    err = ReadRequired(ChallengePromptKey{current}, hash, LedgerError::INVALID_CHALLENGE);
    if (err != LedgerError::OK) {
        return err;
    }
    challengeId = current;
    promptHash = hash;
    return LedgerError::OK;
}

LedgerError LeaderboardContract::GetBest(ChallengeId challengeId, const Address& player,
                                         std::optional<ScoreEntry>& entry) const {
    ScoreEntry stored;
    bool found = false;
    LedgerError err = Read(BestScoreKey{challengeId, player}, stored, found);
    if (err != LedgerError::OK) {
        return err;
    }
    entry = found ? std::optional<ScoreEntry>(stored) : std::nullopt;
    return LedgerError::OK;
}

LedgerError LeaderboardContract::GetTop(ChallengeId challengeId,
                                        std::vector<LeaderboardRow>& rows) const {
    std::vector<LeaderboardRow> stored;
    bool found = false;
    LedgerError err = Read(TopTableKey{challengeId}, stored, found);
    if (err != LedgerError::OK) {
        return err;
    }
    rows = found ? std::move(stored) : std::vector<LeaderboardRow>();
    return LedgerError::OK;
}

// ============================================================================
// Submission
// ============================================================================

LedgerError LeaderboardContract::SubmitScore(const ScoreSubmission& sub, bool* improved) {
    if (improved) {
        *improved = false;
    }

    if (!auth_.RequireAuth(sub.player)) {
        return LedgerError::AUTH_REQUIRED;
    }
    if (!IsValidName(sub.name)) {
        return LedgerError::INVALID_NAME;
    }

    // Prompt binding
    Hash256 storedPrompt;
    LedgerError err = ReadRequired(ChallengePromptKey{sub.challengeId}, storedPrompt,
                                   LedgerError::INVALID_CHALLENGE);
    if (err != LedgerError::OK) {
        return err;
    }
    if (storedPrompt != sub.promptHash) {
        return LedgerError::INVALID_PROMPT_HASH;
    }

    ChallengeId current = 0;
    err = ReadRequired(CurrentChallengeKey{}, current, LedgerError::INVALID_CHALLENGE);
    if (err != LedgerError::OK) {
        return err;
    }
    if (sub.challengeId != current) {
        return LedgerError::INVALID_CHALLENGE;
    }

    // Program binding
    ImageId storedImage;
    err = ReadRequired(ProgramKey{}, storedImage, LedgerError::NOT_INITIALIZED);
    if (err != LedgerError::OK) {
        return err;
    }
    if (storedImage != sub.imageId) {
        return LedgerError::INVALID_IMAGE_ID;
    }

    Hash256 verifierId;
    err = ReadRequired(VerifierKey{}, verifierId, LedgerError::NOT_INITIALIZED);
    if (err != LedgerError::OK) {
        return err;
    }
    if (!verifier_.Verify(verifierId, sub.journalHash, sub.imageId, sub.seal)) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "proof rejected for journal "
                                             << sub.journalHash.ToHex();
        return LedgerError::PROOF_VERIFICATION_FAILED;
    }

    // Best score
    const BestScoreKey bestKey{sub.challengeId, sub.player};
    ScoreEntry best;
    bool hasBest = false;
    err = Read(bestKey, best, hasBest);
    if (err != LedgerError::OK) {
        return err;
    }
    if (hasBest && sub.score <= best.score) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "score " << sub.score
                                             << " does not beat best " << best.score;
        return LedgerError::OK;
    }

    ScoreEntry entry;
    entry.score = sub.score;
    entry.wpmX100 = sub.wpmX100;
    entry.accuracyBps = sub.accuracyBps;
    entry.durationMs = sub.durationMs;
    entry.name = sub.name;
    entry.submittedLedger = ledger_.Sequence();

    std::vector<LeaderboardRow> top;
    bool hasTop = false;
    err = Read(TopTableKey{sub.challengeId}, top, hasTop);
    if (err != LedgerError::OK) {
        return err;
    }

    LeaderboardRow row;
    row.player = sub.player;
    row.name = sub.name;
    row.score = sub.score;
    row.wpmX100 = sub.wpmX100;
    row.accuracyBps = sub.accuracyBps;

    WriteSet writes;
    writes.SetValue(bestKey, entry);
    if (UpsertTopTable(top, row)) {
        writes.SetValue(TopTableKey{sub.challengeId}, top);
    }
    err = Commit(writes, "submit score");
    if (err != LedgerError::OK) {
        return err;
    }

    if (improved) {
        *improved = true;
    }
    LOG_INFO(util::LogCategory::LEDGER) << "challenge " << sub.challengeId << ": "
                                        << sub.name << " scored " << sub.score;
    return LedgerError::OK;
}

} // namespace ledger
} // namespace typeproof
