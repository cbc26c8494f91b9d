// TypeProof - Proof Receipts
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// A receipt is what a prover hands back: the committed journal plus the
// proof material in one of three strengths.

#ifndef TYPEPROOF_PROOF_RECEIPT_H
#define TYPEPROOF_PROOF_RECEIPT_H

#include "typeproof/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace typeproof {
namespace proof {

// ============================================================================
// Receipt Kind
// ============================================================================

/// Proof strength, weakest first
enum class ReceiptKind {
    /// One seal per execution segment; fast, large
    Composite,

    /// Segments compressed into a single seal
    Succinct,

    /// Transport-compatible seal; the only kind accepted for submission
    Groth16,
};

/// Lowercase name ("composite", "succinct", "groth16")
const char* ReceiptKindToString(ReceiptKind kind);

/// Parse a kind name, case-insensitive
std::optional<ReceiptKind> ReceiptKindFromString(const std::string& str);

/// Parse a kind name; unrecognized or empty input selects Groth16
ReceiptKind ReceiptKindOrStrongest(const std::string& str);

// ============================================================================
// Receipt
// ============================================================================

/// Proof material for one execution segment of a composite receipt
struct SegmentReceipt {
    uint32_t index{0};
    Bytes seal;
};

struct Receipt {
    ReceiptKind kind{ReceiptKind::Composite};

    /// Journal bytes committed by the program
    Bytes journal;

    /// Composite only: segment seals in execution order
    std::vector<SegmentReceipt> segments;

    /// Composite only: unresolved assumption receipts
    uint32_t assumptions{0};

    /// Succinct and Groth16 only
    Bytes seal;
};

/**
 * Extract the transport-encoded proof blob.
 *
 * Groth16 and Succinct yield their seal. A composite receipt with one
 * segment and no assumptions yields that segment's seal unmodified;
 * otherwise every segment seal is concatenated in order.
 *
 * @return false if the receipt carries no seal material to extract
 */
bool ExtractSeal(const Receipt& receipt, Bytes& seal);

} // namespace proof
} // namespace typeproof

#endif // TYPEPROOF_PROOF_RECEIPT_H
