// STAKELEDGER - SHA256 Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace stakeledger {

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() {
        ctx = EVP_MD_CTX_new();
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
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

SHA256::SHA256() : impl_(new Impl()) {
    try {
        impl_->Init();
    } catch (...) {
        delete impl_;
        throw;
    }
}

SHA256::~SHA256() {
    delete impl_;
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

Hash256 SHA256::Finalize() {
    std::array<Byte, OUTPUT_SIZE> out{};
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, out.data(), &outLen) != 1 ||
        outLen != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return Hash256(out);
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

} // namespace stakeledger
