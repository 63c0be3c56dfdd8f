/**
 * Polynomial operations implementation
 */

#include "poly.hpp"
#include "ntt.hpp"
#include "reduce.hpp"
#include "rounding.hpp"
#include <tuple>

namespace dilithium {

namespace {

constexpr uint32_t T0_OFFSET = 1u << (D - 1);
constexpr int T1_BITS = QBITS - D;
constexpr int Z_BITS = QBITS - 3;

size_t rej_gamma1m1(Poly& a, size_t ctr, std::span<const uint8_t> buf) noexcept {
    size_t pos = 0;
    while (ctr < N && pos + 5 <= buf.size()) {
        uint32_t t0 = buf[pos];
        t0 |= static_cast<uint32_t>(buf[pos + 1]) << 8;
        t0 |= static_cast<uint32_t>(buf[pos + 2]) << 16;
        t0 &= 0xFFFFF;

        uint32_t t1 = buf[pos + 2] >> 4;
        t1 |= static_cast<uint32_t>(buf[pos + 3]) << 4;
        t1 |= static_cast<uint32_t>(buf[pos + 4]) << 12;

        pos += 5;

        if (t0 <= 2 * GAMMA1 - 2) {
            a[ctr++] = Q + GAMMA1 - 1 - t0;
        }
        if (t1 <= 2 * GAMMA1 - 2 && ctr < N) {
            a[ctr++] = Q + GAMMA1 - 1 - t1;
        }
    }
    return ctr;
}

} // namespace

void poly_reduce(Poly& a) noexcept {
    for (auto& c : a) {
        c = reduce32(c);
    }
}

void poly_csubq(Poly& a) noexcept {
    for (auto& c : a) {
        c = csubq(c);
    }
}

void poly_freeze(Poly& a) noexcept {
    for (auto& c : a) {
        c = freeze(c);
    }
}

void poly_add(Poly& c, const Poly& a, const Poly& b) noexcept {
    for (size_t i = 0; i < N; ++i) {
        c[i] = a[i] + b[i];
    }
}

void poly_add_assign(Poly& a, const Poly& b) noexcept {
    for (size_t i = 0; i < N; ++i) {
        a[i] += b[i];
    }
}

void poly_sub(Poly& c, const Poly& a, const Poly& b) noexcept {
    for (size_t i = 0; i < N; ++i) {
        c[i] = a[i] + 2 * Q - b[i];
    }
}

void poly_shift_left(Poly& a, int k) noexcept {
    for (auto& c : a) {
        c <<= k;
    }
}

void poly_ntt(Poly& a) noexcept {
    ntt(a);
}

void poly_invntt_montgomery(Poly& a) noexcept {
    invntt_frominvmont(a);
}

void poly_pointwise_invmontgomery(Poly& c, const Poly& a, const Poly& b) noexcept {
    for (size_t i = 0; i < N; ++i) {
        c[i] = montgomery_reduce(static_cast<uint64_t>(a[i]) * b[i]);
    }
}

void poly_power2round(Poly& a0, Poly& a1, const Poly& a) noexcept {
    for (size_t i = 0; i < N; ++i) {
        std::tie(a0[i], a1[i]) = power2round(a[i]);
    }
}

void poly_decompose(Poly& a0, Poly& a1, const Poly& a) noexcept {
    for (size_t i = 0; i < N; ++i) {
        std::tie(a0[i], a1[i]) = decompose(a[i]);
    }
}

size_t poly_make_hint(Poly& h, const Poly& a, const Poly& b) noexcept {
    size_t s = 0;
    for (size_t i = 0; i < N; ++i) {
        h[i] = make_hint(a[i], b[i]);
        s += h[i];
    }
    return s;
}

void poly_use_hint(Poly& b, const Poly& a, const Poly& h) noexcept {
    for (size_t i = 0; i < N; ++i) {
        b[i] = use_hint(a[i], h[i]);
    }
}

bool poly_chknorm(const Poly& a, uint32_t bound) noexcept {
    constexpr int32_t half = static_cast<int32_t>((Q - 1) / 2);

    for (auto c : a) {
        // Absolute value of the centred representative
        int32_t t = half - static_cast<int32_t>(c);
        t ^= t >> 31;
        t = half - t;

        if (static_cast<uint32_t>(t) >= bound) {
            return true;
        }
    }
    return false;
}

void poly_uniform(Poly& a, Shake128Stream& xof) {
    constexpr size_t RATE = Shake128Stream::RATE;
    std::array<uint8_t, 5 * RATE> buf{};
    size_t buflen = buf.size();
    xof.squeeze(buf);

    size_t ctr = 0;
    size_t pos = 0;
    while (ctr < N) {
        if (pos + 3 > buflen) {
            // Carry the unused tail in front of the next block
            size_t off = buflen - pos;
            for (size_t i = 0; i < off; ++i) {
                buf[i] = buf[pos + i];
            }
            xof.squeeze(std::span(buf).subspan(off, RATE));
            buflen = off + RATE;
            pos = 0;
        }

        uint32_t t = buf[pos];
        t |= static_cast<uint32_t>(buf[pos + 1]) << 8;
        t |= static_cast<uint32_t>(buf[pos + 2]) << 16;
        t &= 0x7FFFFF;
        pos += 3;

        if (t < Q) {
            a[ctr++] = t;
        }
    }
}

void poly_uniform_gamma1m1(Poly& a,
                           std::span<const uint8_t> seed,
                           std::span<const uint8_t> mu,
                           uint16_t nonce) {
    const uint8_t nonce_bytes[2] = {
        static_cast<uint8_t>(nonce),
        static_cast<uint8_t>(nonce >> 8),
    };

    Shake256Stream xof;
    xof.absorb(seed).absorb(mu).absorb(nonce_bytes);

    std::array<uint8_t, 5 * Shake256Stream::RATE> buf{};
    xof.squeeze(buf);
    size_t ctr = rej_gamma1m1(a, 0, buf);

    while (ctr < N) {
        auto block = std::span(buf).first(Shake256Stream::RATE);
        xof.squeeze(block);
        ctr = rej_gamma1m1(a, ctr, block);
    }
}

void polyt1_pack(std::span<uint8_t> r, const Poly& a) noexcept {
    BitWriter w(r);
    for (auto c : a) {
        w.write(c, T1_BITS);
    }
}

void polyt1_unpack(Poly& r, std::span<const uint8_t> a) noexcept {
    BitReader br(a);
    for (auto& c : r) {
        c = br.read(T1_BITS);
    }
}

void polyt0_pack(std::span<uint8_t> r, const Poly& a) noexcept {
    BitWriter w(r);
    for (auto c : a) {
        w.write(Q + T0_OFFSET - c, D);
    }
}

void polyt0_unpack(Poly& r, std::span<const uint8_t> a) noexcept {
    BitReader br(a);
    for (auto& c : r) {
        c = Q + T0_OFFSET - br.read(D);
    }
}

void polyz_pack(std::span<uint8_t> r, const Poly& a) noexcept {
    BitWriter w(r);
    for (auto c : a) {
        // Map to the positive range [0, 2*GAMMA1 - 2]
        uint32_t t = GAMMA1 - 1 - c;
        t += static_cast<uint32_t>(static_cast<int32_t>(t) >> 31) & Q;
        w.write(t, Z_BITS);
    }
}

void polyz_unpack(Poly& r, std::span<const uint8_t> a) noexcept {
    BitReader br(a);
    for (auto& c : r) {
        c = GAMMA1 - 1 - br.read(Z_BITS);
        c += static_cast<uint32_t>(static_cast<int32_t>(c) >> 31) & Q;
    }
}

void polyw1_pack(std::span<uint8_t> r, const Poly& a) noexcept {
    BitWriter w(r);
    for (auto c : a) {
        w.write(c, 4);
    }
}

} // namespace dilithium
