// TypeProof - Development Seals
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/proof/seal.h"
#include "typeproof/core/serialize.h"
#include "typeproof/crypto/hmac.h"
#include "typeproof/crypto/sha256.h"

#include <algorithm>
#include <string>

namespace typeproof {
namespace proof {

namespace {

constexpr const char* TAG_SEGMENT = "typeproof/seal/segment";
constexpr const char* TAG_SUCCINCT = "typeproof/seal/succinct";
constexpr const char* TAG_GROTH16 = "typeproof/seal/groth16";

Hash256 MacOver(const ImageId& imageId, const DataStream& message) {
    HMAC_SHA256 mac(imageId);
    mac.Write(message.Data());
    return mac.Finalize();
}

} // namespace

const SealSelector& Groth16Selector() {
    static const SealSelector selector = [] {
        Hash256 digest = SHA256Hash(std::string(TAG_GROTH16));
        SealSelector out;
        std::copy(digest.begin(), digest.begin() + SEAL_SELECTOR_SIZE, out.begin());
        return out;
    }();
    return selector;
}

Hash256 SegmentSeal(const ImageId& imageId, const Hash256& journalDigest,
                    uint32_t index, uint32_t count) {
    DataStream s;
    s << std::string(TAG_SEGMENT) << index << count << journalDigest;
    return MacOver(imageId, s);
}

Hash256 SuccinctSeal(const ImageId& imageId, const Hash256& journalDigest) {
    DataStream s;
    s << std::string(TAG_SUCCINCT) << journalDigest;
    return MacOver(imageId, s);
}

Bytes Groth16Seal(const ImageId& imageId, const Hash256& journalDigest) {
    DataStream s;
    s << std::string(TAG_GROTH16) << journalDigest;
    Hash256 mac = MacOver(imageId, s);

    const SealSelector& selector = Groth16Selector();
    Bytes seal(selector.begin(), selector.end());
    seal.insert(seal.end(), mac.begin(), mac.end());
    return seal;
}

bool CheckGroth16Seal(const Bytes& seal, const ImageId& imageId,
                      const Hash256& journalDigest) {
    if (seal.size() != GROTH16_SEAL_SIZE) {
        return false;
    }
    Bytes expected = Groth16Seal(imageId, journalDigest);
    return ConstantTimeEqual(seal.data(), expected.data(), GROTH16_SEAL_SIZE);
}

} // namespace proof
} // namespace typeproof
