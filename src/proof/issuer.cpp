// TypeProof - Proof Issuance Pipeline
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/proof/issuer.h"
#include "typeproof/proof/prompt.h"
#include "typeproof/proof/replay.h"
#include "typeproof/util/config.h"
#include "typeproof/util/logging.h"

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace typeproof {
namespace proof {

// ============================================================================
// Options
// ============================================================================

IssuerOptions IssuerOptions::FromConfig(const util::ConfigManager& config) {
    IssuerOptions opts;

    std::string kind = config.GetString(util::ConfigKeys::RECEIPTKIND,
                                        ReceiptKindToString(ReceiptKind::Groth16));
    if (const char* env = std::getenv(util::RECEIPT_KIND_ENV)) {
        kind = env;
    }
    if (!ReceiptKindFromString(kind)) {
        LOG_WARN(util::LogCategory::CONFIG)
            << "unknown receipt kind '" << kind << "', using groth16";
    }
    opts.receiptKind = ReceiptKindOrStrongest(kind);

    opts.maxEvents = static_cast<size_t>(
        config.GetUInt(util::ConfigKeys::MAXEVENTS, DEFAULT_MAX_EVENTS));
    opts.maxPromptChars = static_cast<size_t>(
        config.GetUInt(util::ConfigKeys::MAXPROMPTCHARS, DEFAULT_MAX_PROMPT_CHARS));
    opts.segmentEvents = static_cast<uint32_t>(
        config.GetUInt(util::ConfigKeys::SEGMENTEVENTS, DEFAULT_SEGMENT_EVENTS));
    return opts;
}

// ============================================================================
// Results
// ============================================================================

const char* ProveStatusToString(ProveStatus status) {
    switch (status) {
        case ProveStatus::OK: return "OK";
        case ProveStatus::INVALID_INPUT: return "Invalid input";
        case ProveStatus::PROVER_FAILED: return "Prover failed";
        case ProveStatus::VERIFICATION_FAILED: return "Receipt verification failed";
        case ProveStatus::GROTH16_REQUIRED: return "Groth16 receipt required";
        case ProveStatus::JOURNAL_MISMATCH: return "Journal mismatch";
        case ProveStatus::SEAL_UNSUPPORTED: return "Unsupported receipt for seal extraction";
        default: return "Unknown status";
    }
}

ProveOutcome ProveOutcome::Failure(ProveStatus status, ProofError error, std::string message) {
    ProveOutcome outcome;
    outcome.status = status;
    outcome.error = error;
    outcome.message = std::move(message);
    return outcome;
}

// ============================================================================
// Issuer
// ============================================================================

ProofIssuer::ProofIssuer(IProver& prover, IssuerOptions options)
    : prover_(prover), options_(std::move(options)) {}

ProveOutcome ProofIssuer::Prove(ChallengeId challengeId, const PlayerKey& player,
                                const std::string& prompt,
                                const std::vector<ReplayEvent>& events) const {
    Bytes eventBytes;
    ProofError err = EncodeEvents(events, eventBytes);
    if (err != ProofError::OK) {
        return ProveOutcome::Failure(ProveStatus::INVALID_INPUT, err, ProofErrorToString(err));
    }
    return Prove(challengeId, player, prompt, eventBytes);
}

ProveOutcome ProofIssuer::Prove(ChallengeId challengeId, const PlayerKey& player,
                                const std::string& prompt, const Bytes& eventBytes) const {
    // Input limits
    ReplayInput input;
    input.challengeId = challengeId;
    input.player = player;
    input.eventBytes = eventBytes;

    ProofError err = NormalizePrompt(prompt, input.promptBytes);
    if (err != ProofError::OK) {
        return ProveOutcome::Failure(ProveStatus::INVALID_INPUT, err, ProofErrorToString(err));
    }
    if (input.promptBytes.size() > options_.maxPromptChars) {
        std::ostringstream msg;
        msg << "prompt exceeds " << options_.maxPromptChars << " characters";
        return ProveOutcome::Failure(ProveStatus::INVALID_INPUT,
                                     ProofError::PROMPT_TOO_LONG, msg.str());
    }
    size_t eventCount = 0;
    if (PeekEventCount(eventBytes, eventCount) && eventCount > options_.maxEvents) {
        std::ostringstream msg;
        msg << "event stream exceeds " << options_.maxEvents << " events";
        return ProveOutcome::Failure(ProveStatus::INVALID_INPUT,
                                     ProofError::TOO_MANY_EVENTS, msg.str());
    }
    input.promptHash = PromptHash(input.promptBytes);

    LogDebugF(util::LogCategory::PROOF, "proving challenge %u with %s backend (%s)",
              challengeId, prover_.Name(), ReceiptKindToString(options_.receiptKind));

    // Prove
    ProverOpts opts;
    opts.kind = options_.receiptKind;
    opts.segmentEvents = options_.segmentEvents;

    ProveInfo info;
    {
        util::ScopedLogTimer timer(util::LogCategory::PROOF, "prove");
        info = prover_.Prove(SerializeReplayInput(input), opts);
    }
    if (!info.success) {
        LOG_WARN(util::LogCategory::PROOF) << "prover failed: " << info.message;
        return ProveOutcome::Failure(ProveStatus::PROVER_FAILED, info.error, info.message);
    }
    const Receipt& receipt = info.receipt;

    // Self-verify against the fixed program identity
    const ImageId& imageId = ReplayProgramId();
    if (!prover_.Verify(receipt, imageId)) {
        LOG_ERROR(util::LogCategory::PROOF) << "receipt failed verification";
        return ProveOutcome::Failure(ProveStatus::VERIFICATION_FAILED, ProofError::OK,
                                     "receipt verification failed");
    }
    if (options_.RequiresGroth16() && receipt.kind != ReceiptKind::Groth16) {
        std::string msg = std::string("expected Groth16 receipt, prover returned ") +
                          ReceiptKindToString(receipt.kind);
        LOG_ERROR(util::LogCategory::PROOF) << msg;
        return ProveOutcome::Failure(ProveStatus::GROTH16_REQUIRED, ProofError::OK, msg);
    }

    // Journal
    ProveOutcome outcome;
    ProveResult& result = outcome.result;
    err = DecodeJournal(receipt.journal, result.journal);
    if (err != ProofError::OK) {
        return ProveOutcome::Failure(ProveStatus::JOURNAL_MISMATCH, err, ProofErrorToString(err));
    }
    if (result.journal.challengeId != challengeId ||
        result.journal.playerKey != player ||
        result.journal.promptHash != input.promptHash) {
        return ProveOutcome::Failure(ProveStatus::JOURNAL_MISMATCH, ProofError::OK,
                                     "journal not bound to the requested challenge");
    }
    std::copy(receipt.journal.begin(), receipt.journal.end(), result.journalBytes.begin());
    result.journalHash = JournalHash(result.journalBytes);
    result.imageId = imageId;

    if (!ExtractSeal(receipt, result.seal)) {
        return ProveOutcome::Failure(ProveStatus::SEAL_UNSUPPORTED, ProofError::OK,
                                     "unsupported receipt type for seal extraction");
    }

    LOG_INFO(util::LogCategory::PROOF) << "issued " << result.journal.ToString();
    return outcome;
}

} // namespace proof
} // namespace typeproof
