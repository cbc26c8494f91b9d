// TypeProof - Journal Codec Tests
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include <gtest/gtest.h>
#include "typeproof/proof/journal.h"
#include "typeproof/crypto/sha256.h"

namespace typeproof {
namespace proof {
namespace test {

namespace {

Journal SampleJournal() {
    Journal j;
    j.challengeId = 0x01020304;
    j.playerKey = PlayerKey::Filled(0xaa);
    j.promptHash = Hash256::Filled(0xbb);
    j.score = 0x1122334455667788ULL;
    j.wpmX100 = 0x0a0b0c0d;
    j.accuracyBps = 9876;
    j.durationMs = 1320;
    return j;
}

} // namespace

TEST(JournalTest, FieldOffsets) {
    JournalBytes bytes = EncodeJournal(SampleJournal());
    ASSERT_EQ(bytes.size(), 88u);

    // challenge_id, little-endian
    EXPECT_EQ(bytes[0], 0x04);
    EXPECT_EQ(bytes[3], 0x01);
    // player key and prompt hash, raw
    EXPECT_EQ(bytes[4], 0xaa);
    EXPECT_EQ(bytes[35], 0xaa);
    EXPECT_EQ(bytes[36], 0xbb);
    EXPECT_EQ(bytes[67], 0xbb);
    // score
    EXPECT_EQ(bytes[68], 0x88);
    EXPECT_EQ(bytes[75], 0x11);
    // wpm_x100
    EXPECT_EQ(bytes[76], 0x0d);
    EXPECT_EQ(bytes[79], 0x0a);
    // accuracy_bps = 9876 = 0x2694
    EXPECT_EQ(bytes[80], 0x94);
    EXPECT_EQ(bytes[81], 0x26);
    // duration_ms = 1320 = 0x0528
    EXPECT_EQ(bytes[84], 0x28);
    EXPECT_EQ(bytes[85], 0x05);
    EXPECT_EQ(bytes[87], 0x00);
}

TEST(JournalTest, DecodeInvertsEncode) {
    Journal in = SampleJournal();
    JournalBytes bytes = EncodeJournal(in);

    Journal out;
    ASSERT_EQ(DecodeJournal(bytes.data(), bytes.size(), out), ProofError::OK);
    EXPECT_EQ(out, in);
}

TEST(JournalTest, DecodeRejectsWrongLength) {
    JournalBytes bytes = EncodeJournal(SampleJournal());
    Journal out;
    EXPECT_EQ(DecodeJournal(bytes.data(), 87, out), ProofError::LENGTH_MISMATCH);
    Bytes longer(bytes.begin(), bytes.end());
    longer.push_back(0);
    EXPECT_EQ(DecodeJournal(longer, out), ProofError::LENGTH_MISMATCH);
    EXPECT_EQ(DecodeJournal(Bytes{}, out), ProofError::LENGTH_MISMATCH);
}

TEST(JournalTest, HashIsSha256OfEncoding) {
    Journal j = SampleJournal();
    JournalBytes bytes = EncodeJournal(j);
    EXPECT_EQ(JournalHash(j), SHA256Hash(bytes.data(), bytes.size()));
    EXPECT_EQ(JournalHash(bytes), JournalHash(j));

    Journal other = j;
    other.score += 1;
    EXPECT_NE(JournalHash(other), JournalHash(j));
    EXPECT_NE(other, j);
}

} // namespace test
} // namespace proof
} // namespace typeproof
