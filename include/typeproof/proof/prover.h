// TypeProof - Prover Interface
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// The prover is an opaque collaborator: it executes the replay program on
// a serialized input stream and returns a receipt. LocalProver is the
// in-process development backend.

#ifndef TYPEPROOF_PROOF_PROVER_H
#define TYPEPROOF_PROOF_PROVER_H

#include "typeproof/core/types.h"
#include "typeproof/proof/errors.h"
#include "typeproof/proof/receipt.h"

#include <cstdint>
#include <string>

namespace typeproof {
namespace proof {

/// Default events per composite segment
constexpr uint32_t DEFAULT_SEGMENT_EVENTS = 1024;

struct ProverOpts {
    ReceiptKind kind{ReceiptKind::Groth16};

    /// Events replayed per composite segment
    uint32_t segmentEvents{DEFAULT_SEGMENT_EVENTS};
};

/// Outcome of a proving run
struct ProveInfo {
    bool success{false};

    /// Set when the program itself rejected its input
    ProofError error{ProofError::OK};

    /// Human-readable failure reason
    std::string message;

    Receipt receipt;
};

/**
 * Opaque prover. Implementations must be deterministic in the journal they
 * commit: equal input streams produce byte-identical journals.
 */
class IProver {
public:
    virtual ~IProver() = default;

    /// Execute the program on `inputStream` and prove the run
    virtual ProveInfo Prove(const Bytes& inputStream, const ProverOpts& opts) = 0;

    /// Check a receipt against a program identity
    virtual bool Verify(const Receipt& receipt, const ImageId& imageId) const = 0;

    /// Identity of the program this prover executes
    virtual const ImageId& ProgramId() const = 0;

    virtual const char* Name() const = 0;
};

/**
 * In-process backend: runs the replay program directly and seals the
 * journal with the development seal scheme.
 */
class LocalProver : public IProver {
public:
    LocalProver() = default;

    ProveInfo Prove(const Bytes& inputStream, const ProverOpts& opts) override;
    bool Verify(const Receipt& receipt, const ImageId& imageId) const override;
    const ImageId& ProgramId() const override;
    const char* Name() const override { return "local"; }

    /// Number of composite segments for an event count
    static uint32_t SegmentCount(size_t eventCount, uint32_t segmentEvents);
};

} // namespace proof
} // namespace typeproof

#endif // TYPEPROOF_PROOF_PROVER_H
