/**
 * Utility functions implementation
 * Uses OpenSSL for SHAKE128/SHAKE256 XOF and random bytes
 */

#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace dilithium {

namespace {

const EVP_MD* shake_md(ShakeVariant variant) {
    return variant == ShakeVariant::SHAKE128 ? EVP_shake128() : EVP_shake256();
}

} // namespace

// ShakeStream implementation
ShakeStream::ShakeStream(ShakeVariant variant)
    : rate_(variant == ShakeVariant::SHAKE128 ? 168 : 136) {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }

    if (EVP_DigestInit_ex(ctx_, shake_md(variant), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Failed to init SHAKE");
    }
}

ShakeStream::~ShakeStream() {
    EVP_MD_CTX_free(ctx_);
}

ShakeStream::ShakeStream(ShakeStream&& other) noexcept
    : ctx_(std::exchange(other.ctx_, nullptr)),
      rate_(other.rate_),
      buffer_(std::move(other.buffer_)),
      total_read_(other.total_read_),
      finalized_(other.finalized_) {}

ShakeStream& ShakeStream::operator=(ShakeStream&& other) noexcept {
    if (this != &other) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = std::exchange(other.ctx_, nullptr);
        rate_ = other.rate_;
        buffer_ = std::move(other.buffer_);
        total_read_ = other.total_read_;
        finalized_ = other.finalized_;
    }
    return *this;
}

ShakeStream& ShakeStream::absorb(std::span<const uint8_t> data) {
    if (finalized_) {
        throw std::logic_error("SHAKE stream already squeezed");
    }
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHAKE");
    }
    return *this;
}

void ShakeStream::squeeze(std::span<uint8_t> out) {
    finalized_ = true;

    size_t needed = total_read_ + out.size();
    if (buffer_.size() < needed) {
        // Finalize a copy of the absorbed state so later squeezes can
        // extend the output without absorbing again
        size_t len = needed + 8 * rate_;
        EVP_MD_CTX* copy = EVP_MD_CTX_new();
        if (!copy) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
        std::vector<uint8_t> output(len);
        if (EVP_MD_CTX_copy_ex(copy, ctx_) != 1 ||
            EVP_DigestFinalXOF(copy, output.data(), len) != 1) {
            EVP_MD_CTX_free(copy);
            throw std::runtime_error("Failed to squeeze SHAKE");
        }
        EVP_MD_CTX_free(copy);
        buffer_ = std::move(output);
    }

    std::copy_n(buffer_.begin() + static_cast<std::ptrdiff_t>(total_read_),
                out.size(), out.begin());
    total_read_ += out.size();
}

void shake256(std::span<uint8_t> out,
              std::initializer_list<std::span<const uint8_t>> inputs) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }

    if (EVP_DigestInit_ex(ctx, EVP_shake256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Failed to init SHAKE256");
    }

    for (auto input : inputs) {
        if (EVP_DigestUpdate(ctx, input.data(), input.size()) != 1) {
            EVP_MD_CTX_free(ctx);
            throw std::runtime_error("Failed to update SHAKE256");
        }
    }

    if (EVP_DigestFinalXOF(ctx, out.data(), out.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Failed to finalize SHAKE256");
    }

    EVP_MD_CTX_free(ctx);
}

void SystemRandom::fill(std::span<uint8_t> out) {
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
}

DeterministicRandom::DeterministicRandom(std::span<const uint8_t> seed) {
    xof_.absorb(seed);
}

void DeterministicRandom::fill(std::span<uint8_t> out) {
    xof_.squeeze(out);
}

} // namespace dilithium
