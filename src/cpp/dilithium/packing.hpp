/**
 * Key and signature encoding for Dilithium
 *
 * Public key:  rho || t1
 * Secret key:  rho || key || tr || s1 || s2 || t0
 * Signature:   z || h || c
 *
 * The hint h is stored as the sorted positions of its ones followed by one
 * running total per component. The challenge c is stored as a presence bitmap
 * of its nonzero coefficients followed by a 64-bit little-endian sign mask.
 */

#ifndef DILITHIUM_PACKING_HPP
#define DILITHIUM_PACKING_HPP

#include "params.hpp"
#include "poly.hpp"
#include "polyvec.hpp"
#include <span>
#include <algorithm>

namespace dilithium {

template <const Params& P>
void pk_pack(std::span<uint8_t> pk,
             std::span<const uint8_t> rho,
             const PolyVec<P.k>& t1) noexcept {
    std::copy_n(rho.begin(), SEEDBYTES, pk.begin());
    size_t offset = SEEDBYTES;

    for (size_t i = 0; i < P.k; ++i) {
        polyt1_pack(pk.subspan(offset, POLT1_SIZE_PACKED), t1[i]);
        offset += POLT1_SIZE_PACKED;
    }
}

template <const Params& P>
void pk_unpack(std::span<uint8_t> rho,
               PolyVec<P.k>& t1,
               std::span<const uint8_t> pk) noexcept {
    std::copy_n(pk.begin(), SEEDBYTES, rho.begin());
    size_t offset = SEEDBYTES;

    for (size_t i = 0; i < P.k; ++i) {
        polyt1_unpack(t1[i], pk.subspan(offset, POLT1_SIZE_PACKED));
        offset += POLT1_SIZE_PACKED;
    }
}

template <const Params& P>
void sk_pack(std::span<uint8_t> sk,
             std::span<const uint8_t> rho,
             std::span<const uint8_t> key,
             std::span<const uint8_t> tr,
             const PolyVec<P.l>& s1,
             const PolyVec<P.k>& s2,
             const PolyVec<P.k>& t0) noexcept {
    constexpr size_t eta_bytes = P.poleta_size_packed();

    auto out = std::copy_n(rho.begin(), SEEDBYTES, sk.begin());
    out = std::copy_n(key.begin(), SEEDBYTES, out);
    std::copy_n(tr.begin(), CRHBYTES, out);
    size_t offset = 2 * SEEDBYTES + CRHBYTES;

    for (size_t i = 0; i < P.l; ++i) {
        polyeta_pack<P>(sk.subspan(offset, eta_bytes), s1[i]);
        offset += eta_bytes;
    }

    for (size_t i = 0; i < P.k; ++i) {
        polyeta_pack<P>(sk.subspan(offset, eta_bytes), s2[i]);
        offset += eta_bytes;
    }

    for (size_t i = 0; i < P.k; ++i) {
        polyt0_pack(sk.subspan(offset, POLT0_SIZE_PACKED), t0[i]);
        offset += POLT0_SIZE_PACKED;
    }
}

template <const Params& P>
void sk_unpack(std::span<uint8_t> rho,
               std::span<uint8_t> key,
               std::span<uint8_t> tr,
               PolyVec<P.l>& s1,
               PolyVec<P.k>& s2,
               PolyVec<P.k>& t0,
               std::span<const uint8_t> sk) noexcept {
    constexpr size_t eta_bytes = P.poleta_size_packed();

    std::copy_n(sk.begin(), SEEDBYTES, rho.begin());
    std::copy_n(sk.begin() + SEEDBYTES, SEEDBYTES, key.begin());
    std::copy_n(sk.begin() + 2 * SEEDBYTES, CRHBYTES, tr.begin());
    size_t offset = 2 * SEEDBYTES + CRHBYTES;

    for (size_t i = 0; i < P.l; ++i) {
        polyeta_unpack<P>(s1[i], sk.subspan(offset, eta_bytes));
        offset += eta_bytes;
    }

    for (size_t i = 0; i < P.k; ++i) {
        polyeta_unpack<P>(s2[i], sk.subspan(offset, eta_bytes));
        offset += eta_bytes;
    }

    for (size_t i = 0; i < P.k; ++i) {
        polyt0_unpack(t0[i], sk.subspan(offset, POLT0_SIZE_PACKED));
        offset += POLT0_SIZE_PACKED;
    }
}

template <const Params& P>
void sig_pack(std::span<uint8_t> sig,
              const PolyVec<P.l>& z,
              const PolyVec<P.k>& h,
              const Poly& c) noexcept {
    size_t offset = 0;
    for (size_t i = 0; i < P.l; ++i) {
        polyz_pack(sig.subspan(offset, POLZ_SIZE_PACKED), z[i]);
        offset += POLZ_SIZE_PACKED;
    }

    // Encode h
    auto hb = sig.subspan(offset, P.omega + P.k);
    std::fill(hb.begin(), hb.end(), 0);
    size_t k = 0;
    for (size_t i = 0; i < P.k; ++i) {
        for (size_t j = 0; j < N; ++j) {
            if (h[i][j] != 0) {
                hb[k++] = static_cast<uint8_t>(j);
            }
        }
        hb[P.omega + i] = static_cast<uint8_t>(k);
    }
    offset += P.omega + P.k;

    // Encode c
    auto cb = sig.subspan(offset, N / 8 + 8);
    std::fill(cb.begin(), cb.end(), 0);
    uint64_t signs = 0;
    uint64_t mask = 1;
    for (size_t i = 0; i < N / 8; ++i) {
        for (size_t j = 0; j < 8; ++j) {
            if (c[8 * i + j] != 0) {
                cb[i] |= static_cast<uint8_t>(1u << j);
                if (c[8 * i + j] == Q - 1) {
                    signs |= mask;
                }
                mask <<= 1;
            }
        }
    }
    for (size_t i = 0; i < 8; ++i) {
        cb[N / 8 + i] = static_cast<uint8_t>(signs >> (8 * i));
    }
}

/**
 * Decode a signature
 *
 * Returns false if the hint section is malformed (running totals that
 * decrease or exceed OMEGA, positions that are not strictly increasing within
 * a component, nonzero padding) or if the sign mask has any of bits 60..63
 * set. No exception is thrown for malformed input.
 */
template <const Params& P>
[[nodiscard]] bool sig_unpack(PolyVec<P.l>& z,
                              PolyVec<P.k>& h,
                              Poly& c,
                              std::span<const uint8_t> sig) noexcept {
    size_t offset = 0;
    for (size_t i = 0; i < P.l; ++i) {
        polyz_unpack(z[i], sig.subspan(offset, POLZ_SIZE_PACKED));
        offset += POLZ_SIZE_PACKED;
    }

    // Decode h
    auto hb = sig.subspan(offset, P.omega + P.k);
    h = PolyVec<P.k>{};
    size_t k = 0;
    for (size_t i = 0; i < P.k; ++i) {
        size_t total = hb[P.omega + i];
        if (total < k || total > P.omega) {
            return false;
        }

        for (size_t j = k; j < total; ++j) {
            // Positions must be strictly increasing within a component
            if (j > k && hb[j] <= hb[j - 1]) {
                return false;
            }
            h[i][hb[j]] = 1;
        }

        k = total;
    }

    for (size_t j = k; j < P.omega; ++j) {
        if (hb[j] != 0) {
            return false;
        }
    }
    offset += P.omega + P.k;

    // Decode c
    auto cb = sig.subspan(offset, N / 8 + 8);
    uint64_t signs = 0;
    for (size_t i = 0; i < 8; ++i) {
        signs |= static_cast<uint64_t>(cb[N / 8 + i]) << (8 * i);
    }

    // Extra sign bits are zero for strong unforgeability
    if (signs >> 60) {
        return false;
    }

    c.fill(0);
    uint64_t mask = 1;
    for (size_t i = 0; i < N / 8; ++i) {
        for (size_t j = 0; j < 8; ++j) {
            if ((cb[i] >> j) & 1) {
                c[8 * i + j] = (signs & mask) ? Q - 1 : 1;
                mask <<= 1;
            }
        }
    }

    return true;
}

} // namespace dilithium

#endif // DILITHIUM_PACKING_HPP
