// TypeProof - Ledger Key Space
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/ledger/keys.h"

namespace typeproof {
namespace ledger {

namespace {

// Challenge ids are written big-endian so a challenge's keys sort by id
void WriteChallenge(std::string& out, ChallengeId id) {
    out.push_back(static_cast<char>((id >> 24) & 0xFF));
    out.push_back(static_cast<char>((id >> 16) & 0xFF));
    out.push_back(static_cast<char>((id >> 8) & 0xFF));
    out.push_back(static_cast<char>(id & 0xFF));
}

struct KeyEncoder {
    std::string operator()(const AdminKey&) const { return std::string(1, prefix::ADMIN); }
    std::string operator()(const VerifierKey&) const { return std::string(1, prefix::VERIFIER); }
    std::string operator()(const ProgramKey&) const { return std::string(1, prefix::PROGRAM); }
    std::string operator()(const CurrentChallengeKey&) const {
        return std::string(1, prefix::CURRENT_CHALLENGE);
    }

    std::string operator()(const ChallengePromptKey& k) const {
        std::string out(1, prefix::CHALLENGE_PROMPT);
        WriteChallenge(out, k.challenge);
        return out;
    }

    std::string operator()(const BestScoreKey& k) const {
        std::string out(1, prefix::BEST_SCORE);
        WriteChallenge(out, k.challenge);
        out.append(reinterpret_cast<const char*>(k.player.data()), k.player.size());
        return out;
    }

    std::string operator()(const TopTableKey& k) const {
        std::string out(1, prefix::TOP_TABLE);
        WriteChallenge(out, k.challenge);
        return out;
    }
};

struct KeyPrinter {
    std::string operator()(const AdminKey&) const { return "admin"; }
    std::string operator()(const VerifierKey&) const { return "verifier"; }
    std::string operator()(const ProgramKey&) const { return "program"; }
    std::string operator()(const CurrentChallengeKey&) const { return "current"; }

    std::string operator()(const ChallengePromptKey& k) const {
        return "prompt(" + std::to_string(k.challenge) + ")";
    }

    std::string operator()(const BestScoreKey& k) const {
        return "best(" + std::to_string(k.challenge) + ", " +
               k.player.ToHex().substr(0, 8) + "..)";
    }

    std::string operator()(const TopTableKey& k) const {
        return "top(" + std::to_string(k.challenge) + ")";
    }
};

} // namespace

std::string EncodeKey(const LedgerKey& key) {
    return std::visit(KeyEncoder{}, key);
}

std::string KeyToString(const LedgerKey& key) {
    return std::visit(KeyPrinter{}, key);
}

} // namespace ledger
} // namespace typeproof
