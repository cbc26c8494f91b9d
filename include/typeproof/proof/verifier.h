// TypeProof - Ledger-side Proof Verifier
// Copyright (c) 2024 TypeProof Developers
// MIT License

#ifndef TYPEPROOF_PROOF_VERIFIER_H
#define TYPEPROOF_PROOF_VERIFIER_H

#include "typeproof/core/types.h"

namespace typeproof {
namespace proof {

/**
 * Proof check consulted by the score submission validator.
 *
 * The validator only sees a bool, so a stub and a real cryptographic
 * verifier are interchangeable without touching the state machine.
 */
class IProofVerifier {
public:
    virtual ~IProofVerifier() = default;

    /**
     * @param verifierId Verifier identity recorded at ledger initialization
     * @param journalHash SHA-256 of the 88-byte journal
     * @param imageId Program identity the proof claims
     * @param seal Transport-encoded proof blob
     */
    virtual bool Verify(const Hash256& verifierId, const Hash256& journalHash,
                        const ImageId& imageId, const Bytes& seal) const = 0;
};

/**
 * Accepts every proof. Placeholder for deployments with no verifier
 * available; never use it where scores matter. Logs a warning per call.
 */
class AcceptAllVerifier : public IProofVerifier {
public:
    bool Verify(const Hash256& verifierId, const Hash256& journalHash,
                const ImageId& imageId, const Bytes& seal) const override;
};

/**
 * Checks Groth16-style seals from the development seal scheme.
 * Rejects calls addressed to any verifier identity other than its own.
 */
class SealVerifier : public IProofVerifier {
public:
    explicit SealVerifier(const Hash256& verifierId = DefaultId()) : verifierId_(verifierId) {}

    /// Identity of the development seal verifier
    static const Hash256& DefaultId();

    bool Verify(const Hash256& verifierId, const Hash256& journalHash,
                const ImageId& imageId, const Bytes& seal) const override;

    const Hash256& GetVerifierId() const { return verifierId_; }

private:
    Hash256 verifierId_;
};

} // namespace proof
} // namespace typeproof

#endif // TYPEPROOF_PROOF_VERIFIER_H
