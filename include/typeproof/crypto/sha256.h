// TypeProof - SHA256 Hash Function
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// SHA-256 (FIPS 180-4) backed by OpenSSL's EVP digest interface.

#ifndef TYPEPROOF_CRYPTO_SHA256_H
#define TYPEPROOF_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include "typeproof/core/types.h"

namespace typeproof {

/// Incremental SHA-256 hasher
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const Bytes& data) {
        return Write(data.data(), data.size());
    }

    /// Finalize the hash and write to output.
    /// The hasher is reset afterwards and may be reused.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Finalize into a Hash256
    Hash256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const Bytes& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace typeproof

#endif // TYPEPROOF_CRYPTO_SHA256_H
