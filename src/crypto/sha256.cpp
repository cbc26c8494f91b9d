// TypeProof - SHA256 Implementation
// Copyright (c) 2024 TypeProof Developers
// MIT License

#include "typeproof/crypto/sha256.h"

#include <openssl/evp.h>
#include <stdexcept>

namespace typeproof {

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        Init();
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }

    void Init() {
        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
        }
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    impl_->Init();
}

Hash256 SHA256::Finalize() {
    Hash256 result;
    Finalize(result.data());
    return result;
}

SHA256& SHA256::Reset() {
    impl_->Init();
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    SHA256 hasher;
    hasher.Write(data, len);
    return hasher.Finalize();
}

} // namespace typeproof
