// TypeProof - Leaderboard Entries
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/ledger/entries.h"

namespace typeproof {
namespace ledger {

bool IsValidName(const std::string& name) {
    if (name.size() < MIN_NAME_LEN || name.size() > MAX_NAME_LEN) {
        return false;
    }
    for (char ch : name) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < NAME_CHAR_MIN || c > NAME_CHAR_MAX) {
            return false;
        }
    }
    return true;
}

} // namespace ledger
} // namespace typeproof
