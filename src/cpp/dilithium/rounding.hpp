/**
 * Rounding and hint functions for Dilithium
 *
 * Low parts are returned offset by q, so a centred value r0 is carried as
 * q + r0 and stays unsigned. High parts of decompose lie in [0, 16).
 */

#ifndef DILITHIUM_ROUNDING_HPP
#define DILITHIUM_ROUNDING_HPP

#include "params.hpp"
#include <cstdint>
#include <utility>

namespace dilithium {

/**
 * Power2Round
 * Split a into (a0, a1) with a = a1 * 2^D + (a0 - q) and
 * a0 - q in (-2^(D-1), 2^(D-1)].
 */
[[nodiscard]] constexpr std::pair<uint32_t, uint32_t> power2round(uint32_t a) noexcept {
    int32_t t = static_cast<int32_t>(a & ((1u << D) - 1));
    t -= (1 << (D - 1)) + 1;
    t += (t >> 31) & (1 << D);
    t -= (1 << (D - 1)) - 1;
    return {Q + static_cast<uint32_t>(t), (a - static_cast<uint32_t>(t)) >> D};
}

/**
 * Decompose
 * Split a into (a0, a1) with a = a1 * ALPHA + (a0 - q), except for the top
 * interval which wraps to a1 = 0 with a0 lowered by one.
 */
[[nodiscard]] constexpr std::pair<uint32_t, uint32_t> decompose(uint32_t a) noexcept {
    constexpr int32_t alpha = static_cast<int32_t>(ALPHA);

    // Centralized remainder mod ALPHA
    int32_t t = static_cast<int32_t>(a & 0x7FFFF);
    t += static_cast<int32_t>((a >> 19) << 9);
    t -= alpha / 2 + 1;
    t += (t >> 31) & alpha;
    t -= alpha / 2 - 1;
    a -= static_cast<uint32_t>(t);

    // a is now a multiple of ALPHA; the quotient is (a >> 19) + 1 unless a == 0
    int32_t u = static_cast<int32_t>(a) - 1;
    u >>= 31;
    a = (a >> 19) + 1;
    a -= static_cast<uint32_t>(u & 1);

    // Quotient 16 folds to 0 and pulls the low part down by one
    return {Q + static_cast<uint32_t>(t) - (a >> 4), a & 0xF};
}

/**
 * MakeHint: 1 iff a and b have different high parts
 */
[[nodiscard]] constexpr uint32_t make_hint(uint32_t a, uint32_t b) noexcept {
    return decompose(a).second != decompose(b).second ? 1 : 0;
}

/**
 * UseHint: correct the high part of a in the direction of its low part
 */
[[nodiscard]] constexpr uint32_t use_hint(uint32_t a, uint32_t hint) noexcept {
    auto [a0, a1] = decompose(a);

    if (hint == 0) {
        return a1;
    }
    if (a0 > Q) {
        return (a1 + 1) & 0xF;
    }
    return (a1 - 1) & 0xF;
}

} // namespace dilithium

#endif // DILITHIUM_ROUNDING_HPP
