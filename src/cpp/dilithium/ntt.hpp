/**
 * Number Theoretic Transform (NTT) for Dilithium
 *
 * The NTT enables efficient polynomial multiplication in
 * R_q = Z_q[X]/(X^256 + 1). Both directions work in place on Montgomery
 * scaled root tables and leave their outputs unreduced.
 */

#ifndef DILITHIUM_NTT_HPP
#define DILITHIUM_NTT_HPP

#include "params.hpp"
#include "reduce.hpp"

namespace dilithium {

/**
 * Forward NTT
 *
 * Decimation in frequency, levels of length 128 down to 1. Coefficients may
 * grow to roughly 16q, so callers reduce before comparing or packing.
 */
inline void ntt(Poly& p) noexcept {
    size_t k = 1;
    for (size_t len = 128; len > 0; len >>= 1) {
        for (size_t start = 0; start < N; start += 2 * len) {
            uint64_t zeta = ZETAS[k++];
            for (size_t j = start; j < start + len; ++j) {
                uint32_t t = montgomery_reduce(zeta * p[j + len]);
                p[j + len] = p[j] + 2 * Q - t;
                p[j] += t;
            }
        }
    }
}

/**
 * Inverse NTT followed by multiplication with the Montgomery factor
 *
 * The final scaling by F = mont^2 / 256 removes one Montgomery factor left by
 * pointwise products and the 1/256 normalisation. Input coefficients must
 * be reduced.
 */
inline void invntt_frominvmont(Poly& p) noexcept {
    constexpr uint64_t F = ((MONT * MONT % Q) * (Q - 1) % Q) * ((Q - 1) >> 8) % Q;

    size_t k = 1;
    for (size_t len = 1; len < N; len <<= 1) {
        for (size_t start = 0; start < N; start += 2 * len) {
            uint64_t zeta = ZETAS_INV[k++];
            for (size_t j = start; j < start + len; ++j) {
                uint32_t t = p[j];
                p[j] += p[j + len];
                p[j + len] = t + 256 * Q - p[j + len];
                p[j + len] = montgomery_reduce(zeta * p[j + len]);
            }
        }
    }

    for (size_t j = 0; j < N; ++j) {
        p[j] = montgomery_reduce(F * p[j]);
    }
}

} // namespace dilithium

#endif // DILITHIUM_NTT_HPP
