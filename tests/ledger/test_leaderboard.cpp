// TypeProof - Leaderboard Contract Tests
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include <gtest/gtest.h>
#include "typeproof/ledger/leaderboard.h"
#include "typeproof/ledger/host.h"
#include "typeproof/ledger/store.h"
#include "typeproof/proof/events.h"
#include "typeproof/proof/issuer.h"
#include "typeproof/proof/prompt.h"
#include "typeproof/proof/prover.h"
#include "typeproof/proof/replay.h"
#include "typeproof/proof/verifier.h"

#include <optional>
#include <string>
#include <vector>

namespace typeproof {
namespace ledger {
namespace test {

// ============================================================================
// Test Store
// ============================================================================

/// Memory store whose Apply can be made to fail
class FailingStore : public LedgerStore {
public:
    Status Get(const LedgerKey& key, Bytes* value) const override {
        return inner.Get(key, value);
    }

    Status Apply(const WriteSet& writes) override {
        ++applyCalls;
        if (failApply) {
            return Status::IOError("disk full");
        }
        return inner.Apply(writes);
    }

    MemoryLedgerStore inner;
    bool failApply{false};
    int applyCalls{0};
};

// ============================================================================
// Fixture
// ============================================================================

class LeaderboardTest : public ::testing::Test {
protected:
    static constexpr ChallengeId CHALLENGE = 1;
    static constexpr const char* PROMPT = "hello world";

    LeaderboardTest()
        : ledgerInfo_(42),
          contract_(store_, auth_, ledgerInfo_, verifier_) {}

    void SetUp() override {
        auth_.Authorize(admin_);
        ASSERT_EQ(contract_.Init(admin_, proof::SealVerifier::DefaultId(),
                                 proof::ReplayProgramId()),
                  LedgerError::OK);
        ASSERT_EQ(contract_.SetChallenge(CHALLENGE, PromptHash(PROMPT)), LedgerError::OK);
        ASSERT_EQ(contract_.SetCurrentChallenge(CHALLENGE), LedgerError::OK);
    }

    static Hash256 PromptHash(const std::string& prompt) {
        Hash256 hash;
        EXPECT_EQ(proof::HashRawPrompt(prompt, hash), proof::ProofError::OK);
        return hash;
    }

    /// Prove a mistake-free run typed at a fixed per-key delay
    static proof::ProveResult Prove(const Address& player, uint16_t delayMs,
                                    ChallengeId challenge = CHALLENGE,
                                    const std::string& prompt = PROMPT) {
        Bytes normalized;
        EXPECT_EQ(proof::NormalizePrompt(prompt, normalized), proof::ProofError::OK);
        proof::LocalProver prover;
        proof::ProofIssuer issuer(prover, proof::IssuerOptions());
        proof::ProveOutcome outcome = issuer.Prove(
            challenge, player, prompt, proof::EventsForText(normalized, delayMs));
        EXPECT_TRUE(outcome.IsValid()) << outcome.message;
        return outcome.result;
    }

    static ScoreSubmission Submission(const Address& player, uint16_t delayMs,
                                      const std::string& name,
                                      ChallengeId challenge = CHALLENGE,
                                      const std::string& prompt = PROMPT) {
        proof::ProveResult r = Prove(player, delayMs, challenge, prompt);
        return ScoreSubmission::FromJournal(r.journal, name, r.journalHash, r.imageId,
                                            r.seal);
    }

    /// Authorize and submit as `player`
    LedgerError SubmitAs(const Address& player, uint16_t delayMs, const std::string& name,
                         bool* improved = nullptr) {
        auth_.Authorize(player);
        return contract_.SubmitScore(Submission(player, delayMs, name), improved);
    }

    std::vector<LeaderboardRow> Top(ChallengeId challenge = CHALLENGE) {
        std::vector<LeaderboardRow> rows;
        EXPECT_EQ(contract_.GetTop(challenge, rows), LedgerError::OK);
        return rows;
    }

    std::optional<ScoreEntry> Best(const Address& player, ChallengeId challenge = CHALLENGE) {
        std::optional<ScoreEntry> entry;
        EXPECT_EQ(contract_.GetBest(challenge, player, entry), LedgerError::OK);
        return entry;
    }

    MemoryLedgerStore store_;
    SessionAuthorizer auth_;
    ManualLedgerInfo ledgerInfo_;
    proof::SealVerifier verifier_;
    LeaderboardContract contract_;

    Address admin_ = Address::Filled(0xad);
    Address alice_ = Address::Filled(0xa1);
    Address bob_ = Address::Filled(0xb0);
};

// ============================================================================
// Administration
// ============================================================================

TEST_F(LeaderboardTest, InitOnlyOnce) {
    EXPECT_EQ(contract_.Init(alice_, proof::SealVerifier::DefaultId(),
                             proof::ReplayProgramId()),
              LedgerError::ALREADY_INITIALIZED);
}

TEST_F(LeaderboardTest, AdminOperationsRequireAdminAuth) {
    auth_.Revoke(admin_);
    EXPECT_EQ(contract_.SetChallenge(2, PromptHash("other")), LedgerError::AUTH_REQUIRED);
    EXPECT_EQ(contract_.SetCurrentChallenge(CHALLENGE), LedgerError::AUTH_REQUIRED);

    // Someone else signing does not help
    auth_.Authorize(alice_);
    EXPECT_EQ(contract_.SetChallenge(2, PromptHash("other")), LedgerError::AUTH_REQUIRED);
}

TEST_F(LeaderboardTest, AdminOperationsBeforeInit) {
    MemoryLedgerStore store;
    LeaderboardContract fresh(store, auth_, ledgerInfo_, verifier_);
    EXPECT_EQ(fresh.SetChallenge(1, PromptHash(PROMPT)), LedgerError::NOT_INITIALIZED);
    EXPECT_EQ(fresh.SetCurrentChallenge(1), LedgerError::NOT_INITIALIZED);
    EXPECT_EQ(store.Size(), 0u);
}

TEST_F(LeaderboardTest, ChallengePromptIsImmutable) {
    EXPECT_EQ(contract_.SetChallenge(CHALLENGE, PromptHash("something else")),
              LedgerError::CHALLENGE_EXISTS);

    ChallengeId id = 0;
    Hash256 hash;
    ASSERT_EQ(contract_.GetCurrentChallenge(id, hash), LedgerError::OK);
    EXPECT_EQ(hash, PromptHash(PROMPT));
}

TEST_F(LeaderboardTest, SetCurrentRequiresConfiguredChallenge) {
    EXPECT_EQ(contract_.SetCurrentChallenge(99), LedgerError::INVALID_CHALLENGE);

    ChallengeId id = 0;
    Hash256 hash;
    ASSERT_EQ(contract_.GetCurrentChallenge(id, hash), LedgerError::OK);
    EXPECT_EQ(id, CHALLENGE);
}

TEST_F(LeaderboardTest, CurrentChallengeUnset) {
    MemoryLedgerStore store;
    LeaderboardContract fresh(store, auth_, ledgerInfo_, verifier_);
    ASSERT_EQ(fresh.Init(admin_, proof::SealVerifier::DefaultId(), proof::ReplayProgramId()),
              LedgerError::OK);
    ASSERT_EQ(fresh.SetChallenge(5, PromptHash(PROMPT)), LedgerError::OK);

    ChallengeId id = 0;
    Hash256 hash;
    EXPECT_EQ(fresh.GetCurrentChallenge(id, hash), LedgerError::NOT_INITIALIZED);

    // Configured but not current
    auth_.Authorize(alice_);
    EXPECT_EQ(fresh.SubmitScore(Submission(alice_, 120, "alice", 5)),
              LedgerError::INVALID_CHALLENGE);
}

TEST_F(LeaderboardTest, QueriesOnEmptyChallenge) {
    EXPECT_TRUE(Top(7).empty());
    EXPECT_FALSE(Best(alice_, 7).has_value());
}

// ============================================================================
// Accepted Submissions
// ============================================================================

TEST_F(LeaderboardTest, AcceptsProvenScore) {
    bool improved = false;
    ASSERT_EQ(SubmitAs(alice_, 120, "alice", &improved), LedgerError::OK);
    EXPECT_TRUE(improved);

    auto best = Best(alice_);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->score, 10000u);
    EXPECT_EQ(best->wpmX100, 10000u);
    EXPECT_EQ(best->accuracyBps, 10000u);
    EXPECT_EQ(best->durationMs, 11u * 120u);
    EXPECT_EQ(best->name, "alice");
    EXPECT_EQ(best->submittedLedger, 42u);

    auto top = Top();
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].player, alice_);
    EXPECT_EQ(top[0].name, "alice");
    EXPECT_EQ(top[0].score, 10000u);
}

TEST_F(LeaderboardTest, LowerOrEqualScoreIsNoOp) {
    ASSERT_EQ(SubmitAs(alice_, 100, "fast alice"), LedgerError::OK);
    ledgerInfo_.Advance();

    bool improved = true;
    EXPECT_EQ(SubmitAs(alice_, 150, "slow alice", &improved), LedgerError::OK);
    EXPECT_FALSE(improved);

    improved = true;
    EXPECT_EQ(SubmitAs(alice_, 100, "same alice", &improved), LedgerError::OK);
    EXPECT_FALSE(improved);

    auto best = Best(alice_);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->name, "fast alice");
    EXPECT_EQ(best->score, 12000u);
    EXPECT_EQ(best->submittedLedger, 42u);

    auto top = Top();
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].name, "fast alice");
}

TEST_F(LeaderboardTest, ImprovementReplacesBestAndRow) {
    ASSERT_EQ(SubmitAs(alice_, 150, "alice"), LedgerError::OK);
    ASSERT_EQ(SubmitAs(bob_, 120, "bob"), LedgerError::OK);
    ledgerInfo_.SetSequence(50);

    bool improved = false;
    ASSERT_EQ(SubmitAs(alice_, 100, "alice2", &improved), LedgerError::OK);
    EXPECT_TRUE(improved);

    auto best = Best(alice_);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->score, 12000u);
    EXPECT_EQ(best->name, "alice2");
    EXPECT_EQ(best->submittedLedger, 50u);

    auto top = Top();
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].player, alice_);
    EXPECT_EQ(top[0].name, "alice2");
    EXPECT_EQ(top[1].player, bob_);
}

TEST_F(LeaderboardTest, EqualScoresOrderedByPlayer) {
    ASSERT_EQ(SubmitAs(bob_, 120, "bob"), LedgerError::OK);
    ASSERT_EQ(SubmitAs(alice_, 120, "alice"), LedgerError::OK);

    auto top = Top();
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].player, alice_);
    EXPECT_EQ(top[1].player, bob_);
}

TEST_F(LeaderboardTest, TopTableKeepsTwentyBest) {
    // Player i types at 100 + 5i ms per key, so scores fall with i
    std::vector<Address> players;
    for (int i = 0; i < static_cast<int>(TOP_N); ++i) {
        Address player = Address::Filled(static_cast<Byte>(0x10 + i));
        players.push_back(player);
        ASSERT_EQ(SubmitAs(player, static_cast<uint16_t>(100 + 5 * i),
                           "p" + std::to_string(i)),
                  LedgerError::OK);
    }
    ASSERT_EQ(Top().size(), TOP_N);

    // Below the minimum: best recorded, table untouched
    Address slow = Address::Filled(0x01);
    bool improved = false;
    ASSERT_EQ(SubmitAs(slow, 200, "slow", &improved), LedgerError::OK);
    EXPECT_TRUE(improved);
    EXPECT_TRUE(Best(slow).has_value());
    auto top = Top();
    ASSERT_EQ(top.size(), TOP_N);
    EXPECT_EQ(top.back().player, players.back());

    // Above everyone: the minimum is evicted
    Address fast = Address::Filled(0x02);
    ASSERT_EQ(SubmitAs(fast, 90, "fast"), LedgerError::OK);
    top = Top();
    ASSERT_EQ(top.size(), TOP_N);
    EXPECT_EQ(top.front().player, fast);
    for (const auto& row : top) {
        EXPECT_NE(row.player, players.back());
        EXPECT_NE(row.player, slow);
    }
    for (size_t i = 1; i < top.size(); ++i) {
        EXPECT_GE(top[i - 1].score, top[i].score);
    }

    // The evicted player's best survives
    EXPECT_TRUE(Best(players.back()).has_value());
}

// ============================================================================
// Rejected Submissions
// ============================================================================

TEST_F(LeaderboardTest, RequiresPlayerAuth) {
    bool improved = true;
    EXPECT_EQ(contract_.SubmitScore(Submission(alice_, 120, "alice"), &improved),
              LedgerError::AUTH_REQUIRED);
    EXPECT_FALSE(improved);
    EXPECT_FALSE(Best(alice_).has_value());
}

TEST_F(LeaderboardTest, RejectsInvalidNames) {
    EXPECT_EQ(SubmitAs(alice_, 120, ""), LedgerError::INVALID_NAME);
    EXPECT_EQ(SubmitAs(alice_, 120, std::string(25, 'a')), LedgerError::INVALID_NAME);
    EXPECT_EQ(SubmitAs(alice_, 120, "tab\tname"), LedgerError::INVALID_NAME);
    EXPECT_EQ(SubmitAs(alice_, 120, "caf\xc3\xa9"), LedgerError::INVALID_NAME);
    EXPECT_TRUE(Top().empty());

    EXPECT_EQ(SubmitAs(alice_, 120, std::string(24, 'a')), LedgerError::OK);
}

TEST_F(LeaderboardTest, RejectsUnknownChallenge) {
    auth_.Authorize(alice_);
    EXPECT_EQ(contract_.SubmitScore(Submission(alice_, 120, "alice", 9)),
              LedgerError::INVALID_CHALLENGE);
    EXPECT_FALSE(Best(alice_, 9).has_value());
}

TEST_F(LeaderboardTest, RejectsOtherPrompt) {
    auth_.Authorize(alice_);
    EXPECT_EQ(contract_.SubmitScore(Submission(alice_, 120, "alice", CHALLENGE,
                                               "hello there")),
              LedgerError::INVALID_PROMPT_HASH);
}

TEST_F(LeaderboardTest, RejectsChallengeNoLongerCurrent) {
    ASSERT_EQ(contract_.SetChallenge(2, PromptHash("second prompt")), LedgerError::OK);
    ASSERT_EQ(contract_.SetCurrentChallenge(2), LedgerError::OK);

    EXPECT_EQ(SubmitAs(alice_, 120, "alice"), LedgerError::INVALID_CHALLENGE);

    EXPECT_EQ(contract_.SubmitScore(Submission(alice_, 120, "alice", 2, "second prompt")),
              LedgerError::OK);
    EXPECT_EQ(Top(2).size(), 1u);
    EXPECT_TRUE(Top(CHALLENGE).empty());
}

TEST_F(LeaderboardTest, RejectsOtherProgram) {
    auth_.Authorize(alice_);
    ScoreSubmission sub = Submission(alice_, 120, "alice");
    sub.imageId = ImageId::Filled(0x99);
    EXPECT_EQ(contract_.SubmitScore(sub), LedgerError::INVALID_IMAGE_ID);
}

TEST_F(LeaderboardTest, RejectsBadProof) {
    auth_.Authorize(alice_);
    ScoreSubmission good = Submission(alice_, 120, "alice");

    ScoreSubmission badSeal = good;
    ASSERT_FALSE(badSeal.seal.empty());
    badSeal.seal.back() ^= 0x01;
    EXPECT_EQ(contract_.SubmitScore(badSeal), LedgerError::PROOF_VERIFICATION_FAILED);

    ScoreSubmission badJournal = good;
    badJournal.journalHash[0] ^= 0x01;
    EXPECT_EQ(contract_.SubmitScore(badJournal), LedgerError::PROOF_VERIFICATION_FAILED);

    ScoreSubmission noSeal = good;
    noSeal.seal.clear();
    EXPECT_EQ(contract_.SubmitScore(noSeal), LedgerError::PROOF_VERIFICATION_FAILED);

    EXPECT_FALSE(Best(alice_).has_value());
    EXPECT_EQ(contract_.SubmitScore(good), LedgerError::OK);
}

TEST_F(LeaderboardTest, RejectsProofForOtherVerifier) {
    MemoryLedgerStore store;
    LeaderboardContract other(store, auth_, ledgerInfo_, verifier_);
    ASSERT_EQ(other.Init(admin_, Hash256::Filled(0x55), proof::ReplayProgramId()),
              LedgerError::OK);
    ASSERT_EQ(other.SetChallenge(CHALLENGE, PromptHash(PROMPT)), LedgerError::OK);
    ASSERT_EQ(other.SetCurrentChallenge(CHALLENGE), LedgerError::OK);

    auth_.Authorize(alice_);
    EXPECT_EQ(other.SubmitScore(Submission(alice_, 120, "alice")),
              LedgerError::PROOF_VERIFICATION_FAILED);
}

TEST_F(LeaderboardTest, AcceptAllVerifierSkipsProofCheck) {
    MemoryLedgerStore store;
    proof::AcceptAllVerifier acceptAll;
    LeaderboardContract open(store, auth_, ledgerInfo_, acceptAll);
    ASSERT_EQ(open.Init(admin_, Hash256(), proof::ReplayProgramId()), LedgerError::OK);
    ASSERT_EQ(open.SetChallenge(CHALLENGE, PromptHash(PROMPT)), LedgerError::OK);
    ASSERT_EQ(open.SetCurrentChallenge(CHALLENGE), LedgerError::OK);

    auth_.Authorize(alice_);
    ScoreSubmission sub = Submission(alice_, 120, "alice");
    sub.seal.clear();
    EXPECT_EQ(open.SubmitScore(sub), LedgerError::OK);
}

// ============================================================================
// Storage Failures
// ============================================================================

TEST(LeaderboardStorageTest, FailedCommitWritesNothing) {
    FailingStore store;
    SessionAuthorizer auth;
    ManualLedgerInfo info(1);
    proof::SealVerifier verifier;
    LeaderboardContract contract(store, auth, info, verifier);

    Address admin = Address::Filled(0xad);
    Address player = Address::Filled(0x42);
    auth.Authorize(admin);
    auth.Authorize(player);

    Hash256 promptHash;
    ASSERT_EQ(proof::HashRawPrompt("hello world", promptHash), proof::ProofError::OK);
    ASSERT_EQ(contract.Init(admin, proof::SealVerifier::DefaultId(), proof::ReplayProgramId()),
              LedgerError::OK);
    ASSERT_EQ(contract.SetChallenge(1, promptHash), LedgerError::OK);
    ASSERT_EQ(contract.SetCurrentChallenge(1), LedgerError::OK);
    size_t before = store.inner.Size();

    Bytes normalized;
    ASSERT_EQ(proof::NormalizePrompt("hello world", normalized), proof::ProofError::OK);
    proof::LocalProver prover;
    proof::ProofIssuer issuer(prover, proof::IssuerOptions());
    proof::ProveOutcome outcome =
        issuer.Prove(1, player, "hello world", proof::EventsForText(normalized, 120));
    ASSERT_TRUE(outcome.IsValid());
    ScoreSubmission sub = ScoreSubmission::FromJournal(
        outcome.result.journal, "player", outcome.result.journalHash,
        outcome.result.imageId, outcome.result.seal);

    store.failApply = true;
    bool improved = true;
    EXPECT_EQ(contract.SubmitScore(sub, &improved), LedgerError::STORAGE_ERROR);
    EXPECT_FALSE(improved);
    EXPECT_EQ(store.inner.Size(), before);
    EXPECT_EQ(contract.SetChallenge(2, promptHash), LedgerError::STORAGE_ERROR);
    EXPECT_FALSE(store.inner.Has(ChallengePromptKey{2}));

    store.failApply = false;
    EXPECT_EQ(contract.SubmitScore(sub, &improved), LedgerError::OK);
    EXPECT_TRUE(improved);
    EXPECT_TRUE(store.inner.Has(BestScoreKey{1, player}));
    EXPECT_TRUE(store.inner.Has(TopTableKey{1}));
}

TEST(LeaderboardStorageTest, RejectedCallsDoNotApply) {
    FailingStore store;
    SessionAuthorizer auth;
    ManualLedgerInfo info;
    proof::SealVerifier verifier;
    LeaderboardContract contract(store, auth, info, verifier);

    Address admin = Address::Filled(0xad);
    auth.Authorize(admin);
    ASSERT_EQ(contract.Init(admin, proof::SealVerifier::DefaultId(), proof::ReplayProgramId()),
              LedgerError::OK);
    int applied = store.applyCalls;

    EXPECT_EQ(contract.Init(admin, Hash256(), ImageId()), LedgerError::ALREADY_INITIALIZED);
    EXPECT_EQ(contract.SetCurrentChallenge(3), LedgerError::INVALID_CHALLENGE);
    EXPECT_EQ(store.applyCalls, applied);
}

TEST(LeaderboardStorageTest, CorruptTableReported) {
    MemoryLedgerStore store;
    SessionAuthorizer auth;
    ManualLedgerInfo info;
    proof::SealVerifier verifier;
    LeaderboardContract contract(store, auth, info, verifier);

    WriteSet writes;
    writes.Set(TopTableKey{1}, Bytes{0x05, 0x00});
    ASSERT_TRUE(store.Apply(writes).ok());

    std::vector<LeaderboardRow> rows;
    EXPECT_EQ(contract.GetTop(1, rows), LedgerError::CORRUPT_STATE);
    EXPECT_TRUE(rows.empty());
}

} // namespace test
} // namespace ledger
} // namespace typeproof
