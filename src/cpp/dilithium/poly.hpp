/**
 * Polynomial arithmetic, sampling and serialisation for Dilithium
 *
 * All arithmetic works in place on unsigned coefficients and leaves results
 * unreduced; callers renormalise with poly_reduce, poly_csubq or poly_freeze
 * where the next step needs it.
 */

#ifndef DILITHIUM_POLY_HPP
#define DILITHIUM_POLY_HPP

#include "params.hpp"
#include "utils.hpp"
#include <array>
#include <span>

namespace dilithium {

// Arithmetic
void poly_reduce(Poly& a) noexcept;
void poly_csubq(Poly& a) noexcept;
void poly_freeze(Poly& a) noexcept;
void poly_add(Poly& c, const Poly& a, const Poly& b) noexcept;
void poly_add_assign(Poly& a, const Poly& b) noexcept;

/**
 * c = a + 2q - b, so inputs below 2q never underflow
 */
void poly_sub(Poly& c, const Poly& a, const Poly& b) noexcept;

void poly_shift_left(Poly& a, int k) noexcept;
void poly_ntt(Poly& a) noexcept;
void poly_invntt_montgomery(Poly& a) noexcept;

/**
 * Pointwise product in the NTT domain, one Montgomery factor removed
 */
void poly_pointwise_invmontgomery(Poly& c, const Poly& a, const Poly& b) noexcept;

// Rounding
void poly_power2round(Poly& a0, Poly& a1, const Poly& a) noexcept;
void poly_decompose(Poly& a0, Poly& a1, const Poly& a) noexcept;

/**
 * Hint polynomial for (a, b); returns the number of ones
 */
size_t poly_make_hint(Poly& h, const Poly& a, const Poly& b) noexcept;

void poly_use_hint(Poly& b, const Poly& a, const Poly& h) noexcept;

/**
 * Infinity norm check on a reduced polynomial
 *
 * Returns true if some coefficient, read as a centred representative,
 * has absolute value of at least bound.
 */
[[nodiscard]] bool poly_chknorm(const Poly& a, uint32_t bound) noexcept;

// Sampling

/**
 * Uniform coefficients in [0, q) from a SHAKE128 stream
 *
 * Takes 3 bytes per candidate and keeps the low 23 bits when below q.
 */
void poly_uniform(Poly& a, Shake128Stream& xof);

/**
 * Coefficients in [-(GAMMA1 - 1), GAMMA1 - 1], stored as q + GAMMA1 - 1 - t,
 * from SHAKE256(seed || mu || nonce) with a little-endian 16-bit nonce
 */
void poly_uniform_gamma1m1(Poly& a,
                           std::span<const uint8_t> seed,
                           std::span<const uint8_t> mu,
                           uint16_t nonce);

namespace detail {

template <const Params& P>
size_t rej_eta(Poly& a, size_t ctr, std::span<const uint8_t> buf) noexcept {
    size_t pos = 0;
    while (ctr < N && pos < buf.size()) {
        uint32_t t0, t1;
        if constexpr (P.eta <= 3) {
            t0 = buf[pos] & 0x07;
            t1 = buf[pos] >> 5;
        } else {
            t0 = buf[pos] & 0x0F;
            t1 = buf[pos] >> 4;
        }
        ++pos;

        if (t0 <= 2 * P.eta) {
            a[ctr++] = Q + P.eta - t0;
        }
        if (t1 <= 2 * P.eta && ctr < N) {
            a[ctr++] = Q + P.eta - t1;
        }
    }
    return ctr;
}

} // namespace detail

/**
 * Coefficients in [-ETA, ETA], stored as q + ETA - t, from
 * SHAKE256(seed || nonce)
 */
template <const Params& P>
void poly_uniform_eta(Poly& a, std::span<const uint8_t> seed, uint8_t nonce) {
    Shake256Stream xof;
    xof.absorb(seed);
    xof.absorb(std::span<const uint8_t>(&nonce, 1));

    std::array<uint8_t, 2 * Shake256Stream::RATE> buf{};
    xof.squeeze(buf);
    size_t ctr = detail::rej_eta<P>(a, 0, buf);

    while (ctr < N) {
        auto block = std::span(buf).first(Shake256Stream::RATE);
        xof.squeeze(block);
        ctr = detail::rej_eta<P>(a, ctr, block);
    }
}

// Serialisation

template <const Params& P>
void polyeta_pack(std::span<uint8_t> r, const Poly& a) noexcept {
    BitWriter w(r);
    for (size_t i = 0; i < N; ++i) {
        w.write(static_cast<uint8_t>(Q + P.eta - a[i]), P.setabits);
    }
}

template <const Params& P>
void polyeta_unpack(Poly& r, std::span<const uint8_t> a) noexcept {
    BitReader br(a);
    for (size_t i = 0; i < N; ++i) {
        r[i] = Q + P.eta - br.read(P.setabits);
    }
}

void polyt1_pack(std::span<uint8_t> r, const Poly& a) noexcept;
void polyt1_unpack(Poly& r, std::span<const uint8_t> a) noexcept;
void polyt0_pack(std::span<uint8_t> r, const Poly& a) noexcept;
void polyt0_unpack(Poly& r, std::span<const uint8_t> a) noexcept;
void polyz_pack(std::span<uint8_t> r, const Poly& a) noexcept;
void polyz_unpack(Poly& r, std::span<const uint8_t> a) noexcept;
void polyw1_pack(std::span<uint8_t> r, const Poly& a) noexcept;

} // namespace dilithium

#endif // DILITHIUM_POLY_HPP
