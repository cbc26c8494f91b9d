// TypeProof - Journal Codec
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/proof/journal.h"
#include "typeproof/core/serialize.h"
#include "typeproof/crypto/sha256.h"

#include <sstream>

namespace typeproof {
namespace proof {

bool Journal::operator==(const Journal& other) const {
    return challengeId == other.challengeId &&
           playerKey == other.playerKey &&
           promptHash == other.promptHash &&
           score == other.score &&
           wpmX100 == other.wpmX100 &&
           accuracyBps == other.accuracyBps &&
           durationMs == other.durationMs;
}

std::string Journal::ToString() const {
    std::ostringstream oss;
    oss << "Journal(challenge=" << challengeId
        << ", player=" << playerKey.ToHex().substr(0, 16)
        << ", score=" << score
        << ", wpm_x100=" << wpmX100
        << ", accuracy_bps=" << accuracyBps
        << ", duration_ms=" << durationMs << ")";
    return oss.str();
}

JournalBytes EncodeJournal(const Journal& journal) {
    DataStream s;
    s.reserve(JOURNAL_SIZE);
    s << journal.challengeId
      << journal.playerKey
      << journal.promptHash
      << journal.score
      << journal.wpmX100
      << journal.accuracyBps
      << journal.durationMs;

    JournalBytes out;
    std::copy(s.Data().begin(), s.Data().end(), out.begin());
    return out;
}

ProofError DecodeJournal(const Byte* data, size_t len, Journal& journal) {
    if (len != JOURNAL_SIZE) {
        return ProofError::LENGTH_MISMATCH;
    }

    DataStream s(data, len);
    Journal decoded;
    s >> decoded.challengeId
      >> decoded.playerKey
      >> decoded.promptHash
      >> decoded.score
      >> decoded.wpmX100
      >> decoded.accuracyBps
      >> decoded.durationMs;

    journal = decoded;
    return ProofError::OK;
}

Hash256 JournalHash(const JournalBytes& bytes) {
    return SHA256Hash(bytes.data(), bytes.size());
}

Hash256 JournalHash(const Journal& journal) {
    return JournalHash(EncodeJournal(journal));
}

} // namespace proof
} // namespace typeproof
