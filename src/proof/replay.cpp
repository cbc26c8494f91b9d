// TypeProof - Replay Scoring Engine
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/proof/replay.h"
#include "typeproof/proof/events.h"
#include "typeproof/crypto/sha256.h"

#include <algorithm>
#include <limits>
#include <vector>

namespace typeproof {
namespace proof {

// ============================================================================
// Input Stream
// ============================================================================

Bytes SerializeReplayInput(const ReplayInput& input) {
    DataStream s;
    s << input;
    return s.Release();
}

bool ParseReplayInput(const Bytes& stream, ReplayInput& input) {
    DataStream s(stream);
    ReplayInput parsed;
    try {
        s >> parsed;
    } catch (const std::ios_base::failure&) {
        return false;
    }
    if (!s.empty()) {
        return false;
    }
    input = std::move(parsed);
    return true;
}

// ============================================================================
// Replay
// ============================================================================

namespace {

void ApplyKey(Bytes& output, uint8_t key) {
    if (key <= KEY_LETTER_MAX) {
        output.push_back(static_cast<Byte>('a' + key));
    } else if (key == KEY_SPACE) {
        output.push_back(' ');
    } else if (key == KEY_BACKSPACE) {
        if (!output.empty()) {
            output.pop_back();
        }
    }
    // KEY_ENTER leaves the output untouched
}

ReplayResult Fail(ProofError err) {
    ReplayResult result;
    result.error = err;
    return result;
}

} // namespace

ReplayResult RunReplay(const ReplayInput& input) {
    // Binding
    if (SHA256Hash(input.promptBytes) != input.promptHash) {
        return Fail(ProofError::PROMPT_HASH_MISMATCH);
    }
    const uint64_t promptLen = input.promptBytes.size();
    if (promptLen == 0) {
        return Fail(ProofError::EMPTY_PROMPT);
    }

    std::vector<ReplayEvent> events;
    ProofError err = DecodeEvents(input.eventBytes, events);
    if (err != ProofError::OK) {
        return Fail(err);
    }

    ReplayResult result;
    result.eventCount = events.size();
    uint64_t durationMs = 0;
    for (const auto& ev : events) {
        if (ev.delayMs < MIN_DELAY_MS) {
            return Fail(ProofError::DELAY_TOO_SHORT);
        }
        if (durationMs > std::numeric_limits<uint64_t>::max() - ev.delayMs) {
            return Fail(ProofError::DURATION_OVERFLOW);
        }
        durationMs += ev.delayMs;
        ApplyKey(result.output, ev.key);
    }

    if (durationMs < promptLen * MIN_MS_PER_CHAR || durationMs == 0) {
        return Fail(ProofError::DURATION_TOO_SHORT);
    }
    // The journal carries a u32 duration
    if (durationMs > std::numeric_limits<uint32_t>::max()) {
        return Fail(ProofError::DURATION_OVERFLOW);
    }

    const uint64_t typedChars = result.output.size();
    const size_t overlap = std::min(result.output.size(), input.promptBytes.size());
    uint64_t correct = 0;
    for (size_t i = 0; i < overlap; ++i) {
        if (result.output[i] == input.promptBytes[i]) {
            ++correct;
        }
    }
    result.correctChars = static_cast<uint32_t>(correct);

    const uint64_t accuracyBps = correct * ACCURACY_SCALE / promptLen;
    const uint64_t wpmX100 = typedChars * WPM_X100_NUMERATOR / durationMs;

    Journal& j = result.journal;
    j.challengeId = input.challengeId;
    j.playerKey = input.player;
    j.promptHash = input.promptHash;
    j.accuracyBps = static_cast<uint32_t>(accuracyBps);
    j.wpmX100 = static_cast<uint32_t>(wpmX100);
    j.score = static_cast<uint64_t>(j.wpmX100) * j.accuracyBps / ACCURACY_SCALE;
    j.durationMs = static_cast<uint32_t>(durationMs);
    return result;
}

bool RecheckJournal(const ReplayInput& input, const Hash256& expectedJournalHash) {
    ReplayResult result = RunReplay(input);
    if (!result.IsValid()) {
        return false;
    }
    return JournalHash(result.journal) == expectedJournalHash;
}

// ============================================================================
// Program Identity
// ============================================================================

namespace {

constexpr const char* REPLAY_PROGRAM_DESCRIPTOR = "typeproof/replay-scoring/v1";

ImageId ComputeReplayProgramId() {
    // Descriptor plus every constant that changes the program's output
    DataStream s;
    s << std::string(REPLAY_PROGRAM_DESCRIPTOR)
      << MIN_DELAY_MS
      << MIN_MS_PER_CHAR
      << ACCURACY_SCALE
      << WPM_X100_NUMERATOR
      << KEY_SPACE
      << KEY_BACKSPACE
      << KEY_ENTER
      << static_cast<uint32_t>(JOURNAL_SIZE);
    return SHA256Hash(s.Data());
}

} // namespace

const ImageId& ReplayProgramId() {
    static const ImageId id = ComputeReplayProgramId();
    return id;
}

} // namespace proof
} // namespace typeproof
