// TypeProof - LevelDB Ledger Store Tests
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include <gtest/gtest.h>
#include "typeproof/ledger/leveldb_store.h"
#include "typeproof/ledger/host.h"
#include "typeproof/ledger/leaderboard.h"
#include "typeproof/proof/events.h"
#include "typeproof/proof/issuer.h"
#include "typeproof/proof/prompt.h"
#include "typeproof/proof/prover.h"
#include "typeproof/proof/replay.h"
#include "typeproof/proof/verifier.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace typeproof {
namespace ledger {
namespace test {

class LevelDBStoreTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("typeproof_ledger_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<LevelDBLedgerStore> OpenStore(const std::string& name = "ledger") {
        LevelDBOptions opts;
        opts.sync = false;
        auto [status, store] = LevelDBLedgerStore::Open((testDir_ / name).string(), opts);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(store);
    }
};

TEST_F(LevelDBStoreTest, OpenCreatesDirectory) {
    auto store = OpenStore();
    ASSERT_NE(store, nullptr);
    EXPECT_TRUE(std::filesystem::exists(testDir_ / "ledger"));
    EXPECT_EQ(store->GetPath(), (testDir_ / "ledger").string());
}

TEST_F(LevelDBStoreTest, OpenMissingWithoutCreateFails) {
    LevelDBOptions opts;
    opts.create_if_missing = false;
    auto [status, store] = LevelDBLedgerStore::Open((testDir_ / "absent").string(), opts);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(store, nullptr);
}

TEST_F(LevelDBStoreTest, ApplyAndGet) {
    auto store = OpenStore();
    ASSERT_NE(store, nullptr);

    Bytes value;
    EXPECT_TRUE(store->Get(AdminKey{}, &value).IsNotFound());
    EXPECT_FALSE(store->Has(AdminKey{}));

    WriteSet writes;
    writes.SetValue(AdminKey{}, Address::Filled(0xad));
    writes.SetValue(CurrentChallengeKey{}, ChallengeId{3});
    ASSERT_TRUE(store->Apply(writes).ok());

    Address admin;
    ASSERT_TRUE(ReadValue(*store, AdminKey{}, admin).ok());
    EXPECT_EQ(admin, Address::Filled(0xad));

    ChallengeId current = 0;
    ASSERT_TRUE(ReadValue(*store, CurrentChallengeKey{}, current).ok());
    EXPECT_EQ(current, 3u);
}

TEST_F(LevelDBStoreTest, LaterWriteInSetWins) {
    auto store = OpenStore();
    ASSERT_NE(store, nullptr);

    WriteSet writes;
    writes.SetValue(CurrentChallengeKey{}, ChallengeId{1});
    writes.SetValue(CurrentChallengeKey{}, ChallengeId{2});
    ASSERT_TRUE(store->Apply(writes).ok());

    ChallengeId current = 0;
    ASSERT_TRUE(ReadValue(*store, CurrentChallengeKey{}, current).ok());
    EXPECT_EQ(current, 2u);
}

TEST_F(LevelDBStoreTest, PersistsAcrossReopen) {
    ScoreEntry entry;
    entry.score = 10000;
    entry.wpmX100 = 10000;
    entry.accuracyBps = 10000;
    entry.durationMs = 1320;
    entry.name = "alice";
    entry.submittedLedger = 17;
    const BestScoreKey key{1, Address::Filled(0xa1)};

    {
        auto store = OpenStore();
        ASSERT_NE(store, nullptr);
        WriteSet writes;
        writes.SetValue(key, entry);
        ASSERT_TRUE(store->Apply(writes).ok());
    }

    auto store = OpenStore();
    ASSERT_NE(store, nullptr);
    ScoreEntry loaded;
    ASSERT_TRUE(ReadValue(*store, key, loaded).ok());
    EXPECT_EQ(loaded, entry);
    EXPECT_FALSE(store->Has(BestScoreKey{2, Address::Filled(0xa1)}));
}

TEST_F(LevelDBStoreTest, UndecodableValueIsCorruption) {
    auto store = OpenStore();
    ASSERT_NE(store, nullptr);

    WriteSet writes;
    writes.Set(AdminKey{}, Bytes{0x01, 0x02});
    ASSERT_TRUE(store->Apply(writes).ok());

    Address admin;
    EXPECT_TRUE(ReadValue(*store, AdminKey{}, admin).IsCorruption());
}

TEST_F(LevelDBStoreTest, ContractStateSurvivesReopen) {
    const Address admin = Address::Filled(0xad);
    const Address player = Address::Filled(0x42);
    SessionAuthorizer auth;
    auth.Authorize(admin);
    auth.Authorize(player);
    ManualLedgerInfo info(9);
    proof::SealVerifier verifier;

    Hash256 promptHash;
    ASSERT_EQ(proof::HashRawPrompt("hello world", promptHash), proof::ProofError::OK);

    Bytes normalized;
    ASSERT_EQ(proof::NormalizePrompt("hello world", normalized), proof::ProofError::OK);
    proof::LocalProver prover;
    proof::ProofIssuer issuer(prover, proof::IssuerOptions());
    proof::ProveOutcome outcome =
        issuer.Prove(1, player, "hello world", proof::EventsForText(normalized, 120));
    ASSERT_TRUE(outcome.IsValid()) << outcome.message;

    {
        auto store = OpenStore();
        ASSERT_NE(store, nullptr);
        LeaderboardContract contract(*store, auth, info, verifier);
        ASSERT_EQ(contract.Init(admin, proof::SealVerifier::DefaultId(),
                                proof::ReplayProgramId()),
                  LedgerError::OK);
        ASSERT_EQ(contract.SetChallenge(1, promptHash), LedgerError::OK);
        ASSERT_EQ(contract.SetCurrentChallenge(1), LedgerError::OK);

        ScoreSubmission sub = ScoreSubmission::FromJournal(
            outcome.result.journal, "player", outcome.result.journalHash,
            outcome.result.imageId, outcome.result.seal);
        ASSERT_EQ(contract.SubmitScore(sub), LedgerError::OK);
    }

    auto store = OpenStore();
    ASSERT_NE(store, nullptr);
    LeaderboardContract contract(*store, auth, info, verifier);

    EXPECT_EQ(contract.Init(admin, Hash256(), ImageId()), LedgerError::ALREADY_INITIALIZED);

    ChallengeId current = 0;
    Hash256 currentHash;
    ASSERT_EQ(contract.GetCurrentChallenge(current, currentHash), LedgerError::OK);
    EXPECT_EQ(current, 1u);
    EXPECT_EQ(currentHash, promptHash);

    std::optional<ScoreEntry> best;
    ASSERT_EQ(contract.GetBest(1, player, best), LedgerError::OK);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->score, 10000u);
    EXPECT_EQ(best->submittedLedger, 9u);

    std::vector<LeaderboardRow> top;
    ASSERT_EQ(contract.GetTop(1, top), LedgerError::OK);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].player, player);
}

} // namespace test
} // namespace ledger
} // namespace typeproof
