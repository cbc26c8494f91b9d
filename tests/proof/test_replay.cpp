// TypeProof - Replay Scoring Tests
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include <gtest/gtest.h>
#include "typeproof/proof/replay.h"
#include "typeproof/proof/events.h"
#include "typeproof/proof/prompt.h"
#include "typeproof/crypto/sha256.h"

#include <string>
#include <vector>

namespace typeproof {
namespace proof {
namespace test {

// ============================================================================
// Test Utilities
// ============================================================================

class ReplayTest : public ::testing::Test {
protected:
    static ReplayInput MakeInput(const std::string& prompt,
                                 const std::vector<ReplayEvent>& events) {
        ReplayInput input;
        input.challengeId = 1;
        input.player = PlayerKey::Filled(7);
        input.promptBytes.assign(prompt.begin(), prompt.end());
        input.promptHash = SHA256Hash(input.promptBytes);
        EXPECT_EQ(EncodeEvents(events, input.eventBytes), ProofError::OK);
        return input;
    }

    static std::vector<ReplayEvent> Typing(const std::string& text, uint16_t delayMs) {
        return EventsForText(Bytes(text.begin(), text.end()), delayMs);
    }

    static uint8_t Key(char c) { return KeyForChar(static_cast<Byte>(c)); }
};

// ============================================================================
// Scoring
// ============================================================================

TEST_F(ReplayTest, PerfectRun) {
    ReplayResult result = RunReplay(MakeInput("hello world", Typing("hello world", 120)));
    ASSERT_TRUE(result.IsValid()) << ProofErrorToString(result.error);

    const Journal& j = result.journal;
    EXPECT_EQ(j.challengeId, 1u);
    EXPECT_EQ(j.playerKey, PlayerKey::Filled(7));
    EXPECT_EQ(j.promptHash, SHA256Hash(std::string("hello world")));
    EXPECT_EQ(j.durationMs, 1320u);
    EXPECT_EQ(j.accuracyBps, 10000u);
    EXPECT_EQ(j.wpmX100, 10000u);
    EXPECT_EQ(j.score, 10000u);
    EXPECT_EQ(result.correctChars, 11u);
    EXPECT_EQ(result.eventCount, 11u);
    EXPECT_EQ(std::string(result.output.begin(), result.output.end()), "hello world");
}

TEST_F(ReplayTest, TypoLowersAccuracy) {
    std::vector<ReplayEvent> events = {{100, Key('a')}, {100, Key('x')}, {100, Key('c')}};
    ReplayResult result = RunReplay(MakeInput("abc", events));
    ASSERT_TRUE(result.IsValid());

    EXPECT_EQ(result.correctChars, 2u);
    EXPECT_EQ(result.journal.accuracyBps, 6666u);
    EXPECT_EQ(result.journal.wpmX100, 12000u);
    EXPECT_EQ(result.journal.score, 7999u);
}

TEST_F(ReplayTest, BackspaceCorrectsTypo) {
    std::vector<ReplayEvent> events = {
        {100, Key('a')}, {100, Key('x')}, {100, KEY_BACKSPACE}, {100, Key('b')}};
    ReplayResult result = RunReplay(MakeInput("ab", events));
    ASSERT_TRUE(result.IsValid());

    EXPECT_EQ(std::string(result.output.begin(), result.output.end()), "ab");
    EXPECT_EQ(result.journal.accuracyBps, 10000u);
    EXPECT_EQ(result.journal.durationMs, 400u);
    EXPECT_EQ(result.journal.wpmX100, 6000u);
    EXPECT_EQ(result.journal.score, 6000u);
}

TEST_F(ReplayTest, BackspaceOnEmptyOutputIsNoop) {
    std::vector<ReplayEvent> events = {{100, KEY_BACKSPACE}, {100, Key('a')}};
    ReplayResult result = RunReplay(MakeInput("a", events));
    ASSERT_TRUE(result.IsValid());
    EXPECT_EQ(std::string(result.output.begin(), result.output.end()), "a");
}

TEST_F(ReplayTest, EnterAddsTimeButNoOutput) {
    auto events = Typing("ab", 100);
    events.push_back(ReplayEvent{200, KEY_ENTER});
    ReplayResult result = RunReplay(MakeInput("ab", events));
    ASSERT_TRUE(result.IsValid());

    EXPECT_EQ(result.output.size(), 2u);
    EXPECT_EQ(result.journal.durationMs, 400u);
    EXPECT_EQ(result.journal.wpmX100, 6000u);
}

TEST_F(ReplayTest, ExtraOutputCountsTowardSpeedOnly) {
    std::vector<ReplayEvent> events = {{50, Key('a')}, {50, Key('b')}};
    ReplayResult result = RunReplay(MakeInput("a", events));
    ASSERT_TRUE(result.IsValid());

    EXPECT_EQ(result.journal.accuracyBps, 10000u);
    EXPECT_EQ(result.journal.wpmX100, 24000u);
}

TEST_F(ReplayTest, Deterministic) {
    ReplayInput input = MakeInput("the quick fox", Typing("the quick fox", 95));
    ReplayResult a = RunReplay(input);
    ReplayResult b = RunReplay(input);
    ASSERT_TRUE(a.IsValid());
    EXPECT_EQ(EncodeJournal(a.journal), EncodeJournal(b.journal));
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(ReplayTest, PromptHashMismatch) {
    ReplayInput input = MakeInput("hello", Typing("hello", 100));
    input.promptHash[0] ^= 0x01;
    EXPECT_EQ(RunReplay(input).error, ProofError::PROMPT_HASH_MISMATCH);
}

TEST_F(ReplayTest, EmptyPrompt) {
    EXPECT_EQ(RunReplay(MakeInput("", Typing("a", 100))).error, ProofError::EMPTY_PROMPT);
}

TEST_F(ReplayTest, BindingCheckedBeforeEvents) {
    ReplayInput input = MakeInput("hello", Typing("hello", 100));
    input.eventBytes = Bytes{0x01};
    EXPECT_EQ(RunReplay(input).error, ProofError::EVENTS_TRUNCATED);
    input.promptHash = Hash256();
    EXPECT_EQ(RunReplay(input).error, ProofError::PROMPT_HASH_MISMATCH);
}

TEST_F(ReplayTest, InvalidKey) {
    ReplayInput input = MakeInput("ab", {});
    input.eventBytes = Bytes{0x02, 0x00, 100, 0x00, 0, 5, 0x00, 29};
    EXPECT_EQ(RunReplay(input).error, ProofError::INVALID_KEY);
}

TEST_F(ReplayTest, DelayFloor) {
    auto events = Typing("hello", 100);
    events[2].delayMs = MIN_DELAY_MS - 1;
    EXPECT_EQ(RunReplay(MakeInput("hello", events)).error, ProofError::DELAY_TOO_SHORT);

    events[2].delayMs = MIN_DELAY_MS;
    events.push_back(ReplayEvent{200, KEY_ENTER});
    EXPECT_TRUE(RunReplay(MakeInput("hello", events)).IsValid());
}

TEST_F(ReplayTest, DurationFloor) {
    // 11 characters need at least 440 ms
    EXPECT_TRUE(RunReplay(MakeInput("hello world", Typing("hello world", 40))).IsValid());
    EXPECT_EQ(RunReplay(MakeInput("hello world", Typing("hello world", 39))).error,
              ProofError::DURATION_TOO_SHORT);
}

TEST_F(ReplayTest, NoEventsIsTooShort) {
    EXPECT_EQ(RunReplay(MakeInput("a", {})).error, ProofError::DURATION_TOO_SHORT);
}

TEST_F(ReplayTest, FailedRunLeavesJournalDefault) {
    ReplayResult result = RunReplay(MakeInput("hello", Typing("hello", 5)));
    EXPECT_FALSE(result.IsValid());
    EXPECT_EQ(result.journal, Journal());
}

// ============================================================================
// Input Stream and Identity
// ============================================================================

TEST_F(ReplayTest, InputStreamParses) {
    ReplayInput input = MakeInput("hello", Typing("hello", 100));
    Bytes stream = SerializeReplayInput(input);

    ReplayInput parsed;
    ASSERT_TRUE(ParseReplayInput(stream, parsed));
    EXPECT_EQ(parsed.challengeId, input.challengeId);
    EXPECT_EQ(parsed.player, input.player);
    EXPECT_EQ(parsed.promptHash, input.promptHash);
    EXPECT_EQ(parsed.promptBytes, input.promptBytes);
    EXPECT_EQ(parsed.eventBytes, input.eventBytes);
}

TEST_F(ReplayTest, MalformedInputStream) {
    Bytes stream = SerializeReplayInput(MakeInput("hello", Typing("hello", 100)));
    ReplayInput parsed;

    Bytes truncated(stream.begin(), stream.end() - 1);
    EXPECT_FALSE(ParseReplayInput(truncated, parsed));

    Bytes trailing = stream;
    trailing.push_back(0);
    EXPECT_FALSE(ParseReplayInput(trailing, parsed));
}

TEST_F(ReplayTest, RecheckJournal) {
    ReplayInput input = MakeInput("hello", Typing("hello", 100));
    ReplayResult result = RunReplay(input);
    ASSERT_TRUE(result.IsValid());

    EXPECT_TRUE(RecheckJournal(input, JournalHash(result.journal)));
    EXPECT_FALSE(RecheckJournal(input, Hash256()));
}

TEST_F(ReplayTest, ProgramIdIsStable) {
    EXPECT_FALSE(ReplayProgramId().IsNull());
    EXPECT_EQ(ReplayProgramId(), ReplayProgramId());
}

} // namespace test
} // namespace proof
} // namespace typeproof
