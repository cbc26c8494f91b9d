// TypeProof - Keystroke Event Stream
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/proof/events.h"
#include "typeproof/core/serialize.h"

namespace typeproof {
namespace proof {

ProofError EncodeEvents(const std::vector<ReplayEvent>& events, Bytes& out) {
    out.clear();
    if (events.size() > MAX_EVENT_COUNT) {
        return ProofError::TOO_MANY_EVENTS;
    }

    DataStream s;
    s.reserve(EVENT_COUNT_SIZE + events.size() * EVENT_WIRE_SIZE);
    ser_writedata16(s, static_cast<uint16_t>(events.size()));
    for (const auto& ev : events) {
        if (ev.key > KEY_MAX) {
            return ProofError::INVALID_KEY;
        }
        ser_writedata16(s, ev.delayMs);
        ser_writedata8(s, ev.key);
    }
    out = s.Release();
    return ProofError::OK;
}

ProofError DecodeEvents(const Byte* data, size_t len, std::vector<ReplayEvent>& events) {
    events.clear();
    if (len < EVENT_COUNT_SIZE) {
        return ProofError::EVENTS_TRUNCATED;
    }

    DataStream s(data, len);
    size_t count = ser_readdata16(s);
    if (len != EVENT_COUNT_SIZE + count * EVENT_WIRE_SIZE) {
        return ProofError::EVENTS_TRUNCATED;
    }

    events.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        ReplayEvent ev;
        ev.delayMs = ser_readdata16(s);
        ev.key = ser_readdata8(s);
        if (ev.key > KEY_MAX) {
            events.clear();
            return ProofError::INVALID_KEY;
        }
        events.push_back(ev);
    }
    return ProofError::OK;
}

bool PeekEventCount(const Bytes& data, size_t& count) {
    if (data.size() < EVENT_COUNT_SIZE) {
        return false;
    }
    count = static_cast<size_t>(data[0]) | (static_cast<size_t>(data[1]) << 8);
    return true;
}

uint8_t KeyForChar(Byte c) {
    if (c >= 'a' && c <= 'z') {
        return static_cast<uint8_t>(c - 'a');
    }
    if (c == ' ') {
        return KEY_SPACE;
    }
    return KEY_ENTER;
}

std::vector<ReplayEvent> EventsForText(const Bytes& text, uint16_t delayMs) {
    std::vector<ReplayEvent> events;
    events.reserve(text.size());
    for (Byte c : text) {
        events.push_back(ReplayEvent{delayMs, KeyForChar(c)});
    }
    return events;
}

} // namespace proof
} // namespace typeproof
