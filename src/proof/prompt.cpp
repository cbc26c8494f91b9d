// TypeProof - Prompt Normalization
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/proof/prompt.h"
#include "typeproof/crypto/sha256.h"

namespace typeproof {
namespace proof {

namespace {

// Space and \t \n \v \f \r
inline bool IsAsciiWhitespace(unsigned char c) {
    return c == 0x20 || (c >= 0x09 && c <= 0x0D);
}

} // namespace

ProofError NormalizePrompt(const std::string& raw, Bytes& normalized) {
    normalized.clear();
    normalized.reserve(raw.size());

    // Start "inside" a space so leading whitespace is dropped
    bool inSpace = true;
    for (char ch : raw) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c > 0x7F) {
            normalized.clear();
            return ProofError::NON_ASCII_PROMPT;
        }
        if (IsAsciiWhitespace(c)) {
            if (!inSpace) {
                normalized.push_back(' ');
                inSpace = true;
            }
            continue;
        }
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<unsigned char>(c + ('a' - 'A'));
        }
        normalized.push_back(c);
        inSpace = false;
    }

    if (!normalized.empty() && normalized.back() == ' ') {
        normalized.pop_back();
    }
    return ProofError::OK;
}

Hash256 PromptHash(const Bytes& normalized) {
    return SHA256Hash(normalized);
}

ProofError HashRawPrompt(const std::string& raw, Hash256& hash) {
    Bytes normalized;
    ProofError err = NormalizePrompt(raw, normalized);
    if (err != ProofError::OK) {
        return err;
    }
    hash = PromptHash(normalized);
    return ProofError::OK;
}

} // namespace proof
} // namespace typeproof
