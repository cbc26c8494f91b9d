// TypeProof - Prompt Normalization
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// A prompt is bound to a challenge by the SHA-256 of its normalized form:
// ASCII only, letters lower-cased, whitespace runs collapsed to one space,
// no leading or trailing space.

#ifndef TYPEPROOF_PROOF_PROMPT_H
#define TYPEPROOF_PROOF_PROMPT_H

#include "typeproof/core/types.h"
#include "typeproof/proof/errors.h"

#include <string>

namespace typeproof {
namespace proof {

/// Normalize a raw prompt.
/// @return NON_ASCII_PROMPT if any byte is above 0x7F, OK otherwise
ProofError NormalizePrompt(const std::string& raw, Bytes& normalized);

/// SHA-256 of normalized prompt bytes
Hash256 PromptHash(const Bytes& normalized);

/// Normalize then hash
ProofError HashRawPrompt(const std::string& raw, Hash256& hash);

} // namespace proof
} // namespace typeproof

#endif // TYPEPROOF_PROOF_PROMPT_H
