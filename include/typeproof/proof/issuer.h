// TypeProof - Proof Issuance Pipeline
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Turns (challenge, player, raw prompt, keystrokes) into a self-verified
// proof ready for submission. A call blocks for the whole proving run and
// cannot be cancelled.

#ifndef TYPEPROOF_PROOF_ISSUER_H
#define TYPEPROOF_PROOF_ISSUER_H

#include "typeproof/core/types.h"
#include "typeproof/proof/errors.h"
#include "typeproof/proof/events.h"
#include "typeproof/proof/journal.h"
#include "typeproof/proof/prover.h"
#include "typeproof/proof/receipt.h"

#include <string>
#include <vector>

namespace typeproof {

namespace util {
class ConfigManager;
}

namespace proof {

/// Default cap on events accepted for proving
constexpr size_t DEFAULT_MAX_EVENTS = 4096;

/// Default cap on normalized prompt length
constexpr size_t DEFAULT_MAX_PROMPT_CHARS = 256;

// ============================================================================
// Options
// ============================================================================

struct IssuerOptions {
    /// Receipt strength to request; Groth16 also makes it mandatory
    ReceiptKind receiptKind{ReceiptKind::Groth16};

    size_t maxEvents{DEFAULT_MAX_EVENTS};
    size_t maxPromptChars{DEFAULT_MAX_PROMPT_CHARS};
    uint32_t segmentEvents{DEFAULT_SEGMENT_EVENTS};

    /**
     * Load from configuration. The receipt kind comes from the
     * TYPEPROOF_RECEIPT_KIND environment variable when set, otherwise from
     * `receiptkind`; unrecognized names select Groth16.
     */
    static IssuerOptions FromConfig(const util::ConfigManager& config);

    /// Whether anything weaker than Groth16 must be rejected
    bool RequiresGroth16() const { return receiptKind == ReceiptKind::Groth16; }
};

// ============================================================================
// Results
// ============================================================================

enum class ProveStatus {
    OK = 0,
    /// Prompt or event stream rejected before proving
    INVALID_INPUT,
    /// Prover could not produce a receipt
    PROVER_FAILED,
    /// Receipt did not verify against the program identity
    VERIFICATION_FAILED,
    /// Groth16 was required and the prover returned something weaker
    GROTH16_REQUIRED,
    /// Committed journal is malformed or not bound to the request
    JOURNAL_MISMATCH,
    /// Receipt carries no extractable seal
    SEAL_UNSUPPORTED,
};

const char* ProveStatusToString(ProveStatus status);

struct ProveResult {
    Journal journal;
    JournalBytes journalBytes{};
    /// Transport-encoded proof blob
    Bytes seal;
    ImageId imageId;
    Hash256 journalHash;
};

struct ProveOutcome {
    ProveStatus status{ProveStatus::OK};
    /// Underlying replay/codec error, if any
    ProofError error{ProofError::OK};
    /// Failure reason, surfaced verbatim to the caller
    std::string message;
    ProveResult result;

    bool IsValid() const { return status == ProveStatus::OK; }

    static ProveOutcome Failure(ProveStatus status, ProofError error, std::string message);
};

// ============================================================================
// Issuer
// ============================================================================

class ProofIssuer {
public:
    ProofIssuer(IProver& prover, IssuerOptions options);

    /// Prove an encoded event stream
    ProveOutcome Prove(ChallengeId challengeId, const PlayerKey& player,
                       const std::string& prompt, const Bytes& eventBytes) const;

    /// Prove a raw event list
    ProveOutcome Prove(ChallengeId challengeId, const PlayerKey& player,
                       const std::string& prompt,
                       const std::vector<ReplayEvent>& events) const;

    const IssuerOptions& GetOptions() const { return options_; }

private:
    IProver& prover_;
    IssuerOptions options_;
};

} // namespace proof
} // namespace typeproof

#endif // TYPEPROOF_PROOF_ISSUER_H
