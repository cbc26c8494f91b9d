// TypeProof - Proof Receipts
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/proof/receipt.h"

#include <algorithm>
#include <cctype>

namespace typeproof {
namespace proof {

const char* ReceiptKindToString(ReceiptKind kind) {
    switch (kind) {
        case ReceiptKind::Composite: return "composite";
        case ReceiptKind::Succinct: return "succinct";
        case ReceiptKind::Groth16: return "groth16";
        default: return "unknown";
    }
}

std::optional<ReceiptKind> ReceiptKindFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "composite") return ReceiptKind::Composite;
    if (lower == "succinct") return ReceiptKind::Succinct;
    if (lower == "groth16") return ReceiptKind::Groth16;
    return std::nullopt;
}

ReceiptKind ReceiptKindOrStrongest(const std::string& str) {
    return ReceiptKindFromString(str).value_or(ReceiptKind::Groth16);
}

bool ExtractSeal(const Receipt& receipt, Bytes& seal) {
    seal.clear();
    switch (receipt.kind) {
        case ReceiptKind::Groth16:
        case ReceiptKind::Succinct:
            seal = receipt.seal;
            break;

        case ReceiptKind::Composite:
            if (receipt.assumptions == 0 && receipt.segments.size() == 1) {
                seal = receipt.segments.front().seal;
                break;
            }
            for (const auto& segment : receipt.segments) {
                seal.insert(seal.end(), segment.seal.begin(), segment.seal.end());
            }
            break;

        default:
            return false;
    }
    return !seal.empty();
}

} // namespace proof
} // namespace typeproof
