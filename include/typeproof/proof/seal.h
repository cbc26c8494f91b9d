// TypeProof - Development Seals
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Seal scheme of the in-process proof backend. Every seal is an
// HMAC-SHA256 keyed by the program identity over a domain tag and the
// journal digest, so a seal only checks out for the program and journal it
// was made for. This is tamper evidence, not zero knowledge: anyone holding
// the program identity can mint seals.

#ifndef TYPEPROOF_PROOF_SEAL_H
#define TYPEPROOF_PROOF_SEAL_H

#include "typeproof/core/types.h"

#include <array>
#include <cstdint>

namespace typeproof {
namespace proof {

/// Bytes of the verifier selector in front of a Groth16 seal
constexpr size_t SEAL_SELECTOR_SIZE = 4;

/// Size of a Groth16 seal: selector plus MAC
constexpr size_t GROTH16_SEAL_SIZE = SEAL_SELECTOR_SIZE + 32;

using SealSelector = std::array<Byte, SEAL_SELECTOR_SIZE>;

/// Selector identifying the development Groth16 verifier
const SealSelector& Groth16Selector();

/// Seal of segment `index` out of `count`
Hash256 SegmentSeal(const ImageId& imageId, const Hash256& journalDigest,
                    uint32_t index, uint32_t count);

/// Seal of a succinct receipt
Hash256 SuccinctSeal(const ImageId& imageId, const Hash256& journalDigest);

/// Selector-prefixed seal of a Groth16 receipt
Bytes Groth16Seal(const ImageId& imageId, const Hash256& journalDigest);

/// Check a selector-prefixed Groth16 seal in constant time
bool CheckGroth16Seal(const Bytes& seal, const ImageId& imageId,
                      const Hash256& journalDigest);

} // namespace proof
} // namespace typeproof

#endif // TYPEPROOF_PROOF_SEAL_H
