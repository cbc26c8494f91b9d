// TypeProof - Local Prover
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/proof/prover.h"
#include "typeproof/proof/replay.h"
#include "typeproof/proof/seal.h"
#include "typeproof/crypto/hmac.h"
#include "typeproof/crypto/sha256.h"
#include "typeproof/util/logging.h"

namespace typeproof {
namespace proof {

uint32_t LocalProver::SegmentCount(size_t eventCount, uint32_t segmentEvents) {
    if (segmentEvents == 0 || eventCount == 0) {
        return 1;
    }
    return static_cast<uint32_t>((eventCount + segmentEvents - 1) / segmentEvents);
}

const ImageId& LocalProver::ProgramId() const {
    return ReplayProgramId();
}

ProveInfo LocalProver::Prove(const Bytes& inputStream, const ProverOpts& opts) {
    ProveInfo info;

    ReplayInput input;
    if (!ParseReplayInput(inputStream, input)) {
        info.message = "malformed prover input stream";
        return info;
    }

    ReplayResult run = RunReplay(input);
    if (!run.IsValid()) {
        info.error = run.error;
        info.message = std::string("replay failed: ") + ProofErrorToString(run.error);
        LOG_DEBUG(util::LogCategory::PROVER) << info.message;
        return info;
    }

    JournalBytes journal = EncodeJournal(run.journal);
    const Hash256 digest = JournalHash(journal);
    const ImageId& imageId = ProgramId();

    Receipt& receipt = info.receipt;
    receipt.kind = opts.kind;
    receipt.journal.assign(journal.begin(), journal.end());

    switch (opts.kind) {
        case ReceiptKind::Composite: {
            uint32_t count = SegmentCount(run.eventCount, opts.segmentEvents);
            for (uint32_t i = 0; i < count; ++i) {
                Hash256 mac = SegmentSeal(imageId, digest, i, count);
                receipt.segments.push_back(SegmentReceipt{i, Bytes(mac.begin(), mac.end())});
            }
            break;
        }
        case ReceiptKind::Succinct: {
            Hash256 mac = SuccinctSeal(imageId, digest);
            receipt.seal.assign(mac.begin(), mac.end());
            break;
        }
        case ReceiptKind::Groth16:
            receipt.seal = Groth16Seal(imageId, digest);
            break;
    }

    LogDebugF(util::LogCategory::PROVER, "%s receipt for challenge %u (%zu segments)",
              ReceiptKindToString(opts.kind), run.journal.challengeId,
              receipt.segments.size());
    info.success = true;
    return info;
}

bool LocalProver::Verify(const Receipt& receipt, const ImageId& imageId) const {
    const Hash256 digest = SHA256Hash(receipt.journal);

    switch (receipt.kind) {
        case ReceiptKind::Composite: {
            if (receipt.segments.empty() || receipt.assumptions != 0) {
                return false;
            }
            const uint32_t count = static_cast<uint32_t>(receipt.segments.size());
            for (uint32_t i = 0; i < count; ++i) {
                const SegmentReceipt& segment = receipt.segments[i];
                Hash256 expected = SegmentSeal(imageId, digest, i, count);
                if (segment.index != i || segment.seal.size() != expected.size() ||
                    !ConstantTimeEqual(segment.seal.data(), expected.data(), expected.size())) {
                    return false;
                }
            }
            return true;
        }
        case ReceiptKind::Succinct: {
            Hash256 expected = SuccinctSeal(imageId, digest);
            return receipt.seal.size() == expected.size() &&
                   ConstantTimeEqual(receipt.seal.data(), expected.data(), expected.size());
        }
        case ReceiptKind::Groth16:
            return CheckGroth16Seal(receipt.seal, imageId, digest);
    }
    return false;
}

} // namespace proof
} // namespace typeproof
