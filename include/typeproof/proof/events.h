// TypeProof - Keystroke Event Stream
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Wire format: u16 little-endian event count, then 3 bytes per event
// (u16 little-endian delay in milliseconds, u8 key code).

#ifndef TYPEPROOF_PROOF_EVENTS_H
#define TYPEPROOF_PROOF_EVENTS_H

#include "typeproof/core/types.h"
#include "typeproof/proof/errors.h"

#include <cstdint>
#include <vector>

namespace typeproof {
namespace proof {

// ============================================================================
// Key Codes
// ============================================================================

/// Letters a..z are key codes 0..25
constexpr uint8_t KEY_LETTER_MAX = 25;
constexpr uint8_t KEY_SPACE = 26;
constexpr uint8_t KEY_BACKSPACE = 27;
/// End marker; produces no output
constexpr uint8_t KEY_ENTER = 28;
constexpr uint8_t KEY_MAX = KEY_ENTER;

/// Bytes per encoded event
constexpr size_t EVENT_WIRE_SIZE = 3;

/// Bytes of the count prefix
constexpr size_t EVENT_COUNT_SIZE = 2;

/// Largest count the u16 prefix can carry
constexpr size_t MAX_EVENT_COUNT = 0xFFFF;

/// One keystroke: delay since the previous key, then the key
struct ReplayEvent {
    uint16_t delayMs{0};
    uint8_t key{0};

    bool operator==(const ReplayEvent& other) const {
        return delayMs == other.delayMs && key == other.key;
    }
};

/// Encode events into the wire format.
/// @return TOO_MANY_EVENTS above 65535 events, INVALID_KEY for key codes above 28
ProofError EncodeEvents(const std::vector<ReplayEvent>& events, Bytes& out);

/// Decode the wire format.
/// @return EVENTS_TRUNCATED if the declared count disagrees with the byte
///         count, INVALID_KEY for key codes above 28
ProofError DecodeEvents(const Byte* data, size_t len, std::vector<ReplayEvent>& events);

inline ProofError DecodeEvents(const Bytes& data, std::vector<ReplayEvent>& events) {
    return DecodeEvents(data.data(), data.size(), events);
}

/// Declared event count of an encoded stream, without validating the body
/// @return false if fewer than two bytes are present
bool PeekEventCount(const Bytes& data, size_t& count);

/// Key code for a normalized prompt character; KEY_ENTER for anything
/// that cannot be typed
uint8_t KeyForChar(Byte c);

/// Keystrokes that type a normalized prompt exactly, with a fixed delay
std::vector<ReplayEvent> EventsForText(const Bytes& text, uint16_t delayMs);

} // namespace proof
} // namespace typeproof

#endif // TYPEPROOF_PROOF_EVENTS_H
