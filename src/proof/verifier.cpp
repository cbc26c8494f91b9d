// TypeProof - Ledger-side Proof Verifier
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/proof/verifier.h"
#include "typeproof/proof/seal.h"
#include "typeproof/crypto/sha256.h"
#include "typeproof/util/logging.h"

#include <string>

namespace typeproof {
namespace proof {

bool AcceptAllVerifier::Verify(const Hash256& /*verifierId*/, const Hash256& journalHash,
                               const ImageId& /*imageId*/, const Bytes& /*seal*/) const {
    LOG_WARN(util::LogCategory::PROOF)
        << "accepting proof for journal " << journalHash.ToHex()
        << " without verification";
    return true;
}

const Hash256& SealVerifier::DefaultId() {
    static const Hash256 id = SHA256Hash(std::string("typeproof/seal-verifier/v1"));
    return id;
}

bool SealVerifier::Verify(const Hash256& verifierId, const Hash256& journalHash,
                          const ImageId& imageId, const Bytes& seal) const {
    if (verifierId != verifierId_) {
        LOG_DEBUG(util::LogCategory::PROOF) << "verifier identity mismatch";
        return false;
    }
    if (!CheckGroth16Seal(seal, imageId, journalHash)) {
        LOG_DEBUG(util::LogCategory::PROOF)
            << "seal rejected for journal " << journalHash.ToHex();
        return false;
    }
    return true;
}

} // namespace proof
} // namespace typeproof
