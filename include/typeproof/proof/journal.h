// TypeProof - Journal Codec
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// The journal is the public output a proof attests to. Its 88-byte layout
// is a wire contract shared by the proving and verifying sides:
//
//   offset  size  field
//        0     4  challenge_id   (u32 LE)
//        4    32  player_pubkey
//       36    32  prompt_hash
//       68     8  score          (u64 LE)
//       76     4  wpm_x100       (u32 LE)
//       80     4  accuracy_bps   (u32 LE)
//       84     4  duration_ms    (u32 LE)
//
// There is no version field; any change to this layout is breaking.

#ifndef TYPEPROOF_PROOF_JOURNAL_H
#define TYPEPROOF_PROOF_JOURNAL_H

#include "typeproof/core/types.h"
#include "typeproof/proof/errors.h"

#include <array>
#include <cstdint>
#include <string>

namespace typeproof {
namespace proof {

/// Encoded journal size in bytes
constexpr size_t JOURNAL_SIZE = 88;

using JournalBytes = std::array<Byte, JOURNAL_SIZE>;

struct Journal {
    ChallengeId challengeId{0};
    PlayerKey playerKey;
    Hash256 promptHash;
    uint64_t score{0};
    uint32_t wpmX100{0};
    uint32_t accuracyBps{0};
    uint32_t durationMs{0};

    bool operator==(const Journal& other) const;
    bool operator!=(const Journal& other) const { return !(*this == other); }

    std::string ToString() const;
};

/// Encode to the canonical 88-byte layout
JournalBytes EncodeJournal(const Journal& journal);

/// Decode the canonical layout
/// @return LENGTH_MISMATCH unless len is exactly JOURNAL_SIZE
ProofError DecodeJournal(const Byte* data, size_t len, Journal& journal);

inline ProofError DecodeJournal(const Bytes& data, Journal& journal) {
    return DecodeJournal(data.data(), data.size(), journal);
}

/// Content identity of a journal: SHA-256 of its encoding
Hash256 JournalHash(const Journal& journal);
Hash256 JournalHash(const JournalBytes& bytes);

} // namespace proof
} // namespace typeproof

#endif // TYPEPROOF_PROOF_JOURNAL_H
