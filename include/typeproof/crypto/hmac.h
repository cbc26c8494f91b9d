// TypeProof - HMAC (Hash-based Message Authentication Code)
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// HMAC-SHA256 (RFC 2104) backed by OpenSSL.

#ifndef TYPEPROOF_CRYPTO_HMAC_H
#define TYPEPROOF_CRYPTO_HMAC_H

#include <cstdint>
#include <cstddef>
#include <vector>
#include "typeproof/core/types.h"

namespace typeproof {

/**
 * HMAC-SHA256 message authentication code.
 *
 * Message bytes are buffered by Write() and authenticated in Finalize().
 */
class HMAC_SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    HMAC_SHA256(const Byte* key, size_t keyLen);

    template<size_t N>
    explicit HMAC_SHA256(const FixedBlob<N>& key)
        : HMAC_SHA256(key.data(), N) {}

    /// Destructor - clears key material
    ~HMAC_SHA256();

    HMAC_SHA256(const HMAC_SHA256&) = delete;
    HMAC_SHA256& operator=(const HMAC_SHA256&) = delete;

    HMAC_SHA256& Write(const Byte* data, size_t len);

    HMAC_SHA256& Write(const Bytes& data) {
        return Write(data.data(), data.size());
    }

    template<size_t N>
    HMAC_SHA256& Write(const FixedBlob<N>& blob) {
        return Write(blob.data(), N);
    }

    /// Compute the MAC over everything written so far
    Hash256 Finalize() const;

private:
    Bytes key_;
    Bytes message_;
};

/// One-shot HMAC-SHA256
Hash256 HMACSHA256(const Byte* key, size_t keyLen, const Byte* data, size_t len);

/// Constant-time equality of two byte ranges of equal length
bool ConstantTimeEqual(const Byte* a, const Byte* b, size_t len);

} // namespace typeproof

#endif // TYPEPROOF_CRYPTO_HMAC_H
