// TypeProof - Core Types Header
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// This file defines fundamental types used throughout TypeProof.

#ifndef TYPEPROOF_CORE_TYPES_H
#define TYPEPROOF_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <cstring>

namespace typeproof {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Owned byte buffer
using Bytes = std::vector<Byte>;

/// Challenge identifier
using ChallengeId = uint32_t;

/// Ledger sequence number
using LedgerSeq = uint32_t;

// ============================================================================
// Fixed-size Blobs
// ============================================================================

/// Fixed-size opaque byte string.
/// Ordering is lexicographic over the stored bytes, so it is a total order
/// that does not depend on how the value is displayed.
template<size_t N>
class FixedBlob {
public:
    static constexpr size_t SIZE = N;

    /// Default constructor - creates null blob
    FixedBlob() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit FixedBlob(const std::array<Byte, N>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero padded)
    FixedBlob(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, N));
        }
    }

    /// Blob with every byte set to value
    static FixedBlob Filled(Byte value) noexcept {
        FixedBlob blob;
        blob.data_.fill(value);
        return blob;
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    constexpr size_t size() const noexcept { return N; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + N; }
    const Byte* end() const noexcept { return data_.data() + N; }

    const std::array<Byte, N>& Array() const noexcept { return data_; }

    bool operator==(const FixedBlob& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const FixedBlob& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const FixedBlob& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), N) < 0;
    }

    /// Lowercase hex in storage order
    std::string ToHex() const;

    /// Parse from hex; returns false if the input is not exactly 2*N hex digits
    static bool FromHex(const std::string& hex, FixedBlob& out);

protected:
    std::array<Byte, N> data_;
};

/// 256-bit hash (32 bytes)
using Hash256 = FixedBlob<32>;

/// Player identity: 32-byte public key
using PlayerKey = FixedBlob<32>;

/// Program identity (image id) of a provable computation
using ImageId = FixedBlob<32>;

} // namespace typeproof

#include "typeproof/core/hex.h"

namespace typeproof {

template<size_t N>
std::string FixedBlob<N>::ToHex() const {
    return BytesToHex(data_.data(), N);
}

template<size_t N>
bool FixedBlob<N>::FromHex(const std::string& hex, FixedBlob& out) {
    if (hex.size() != N * 2 || !IsValidHex(hex)) {
        return false;
    }
    std::vector<Byte> bytes = HexToBytes(hex);
    if (bytes.size() != N) {
        return false;
    }
    out = FixedBlob(bytes.data(), bytes.size());
    return true;
}

} // namespace typeproof

#endif // TYPEPROOF_CORE_TYPES_H
