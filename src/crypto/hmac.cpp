// TypeProof - HMAC Implementation
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/crypto/hmac.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace typeproof {

HMAC_SHA256::HMAC_SHA256(const Byte* key, size_t keyLen)
    : key_(key, key + keyLen) {}

HMAC_SHA256::~HMAC_SHA256() {
    if (!key_.empty()) {
        OPENSSL_cleanse(key_.data(), key_.size());
    }
}

HMAC_SHA256& HMAC_SHA256::Write(const Byte* data, size_t len) {
    message_.insert(message_.end(), data, data + len);
    return *this;
}

Hash256 HMAC_SHA256::Finalize() const {
    return HMACSHA256(key_.data(), key_.size(), message_.data(), message_.size());
}

Hash256 HMACSHA256(const Byte* key, size_t keyLen, const Byte* data, size_t len) {
    static const Byte EMPTY = 0;
    Hash256 out;
    unsigned int outLen = 0;
    const unsigned char* result = HMAC(EVP_sha256(),
                                       keyLen > 0 ? key : &EMPTY, static_cast<int>(keyLen),
                                       len > 0 ? data : &EMPTY, len,
                                       out.data(), &outLen);
    if (result == nullptr || outLen != HMAC_SHA256::OUTPUT_SIZE) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return out;
}

bool ConstantTimeEqual(const Byte* a, const Byte* b, size_t len) {
    return CRYPTO_memcmp(a, b, len) == 0;
}

} // namespace typeproof
