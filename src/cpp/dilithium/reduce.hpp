/**
 * Modular reduction for Dilithium
 *
 * Montgomery reduction and the special-form reduction that exploits
 * q = 2^23 - 2^13 + 1.
 */

#ifndef DILITHIUM_REDUCE_HPP
#define DILITHIUM_REDUCE_HPP

#include "params.hpp"
#include <cstdint>

namespace dilithium {

/**
 * Montgomery reduction: for a <= q * 2^32 returns a * 2^(-32) mod q in [0, 2q)
 */
[[nodiscard]] constexpr uint32_t montgomery_reduce(uint64_t a) noexcept {
    uint64_t t = a * QINV;
    t &= (uint64_t{1} << 32) - 1;
    t *= Q;
    t += a;
    return static_cast<uint32_t>(t >> 32);
}

/**
 * Partial reduction: result is congruent to a and smaller than 2^23 + 2^22
 */
[[nodiscard]] constexpr uint32_t reduce32(uint32_t a) noexcept {
    uint32_t t = a & 0x7FFFFF;
    a >>= 23;
    t += (a << 13) - a;
    return t;
}

/**
 * Subtract q if a >= q, without branching
 */
[[nodiscard]] constexpr uint32_t csubq(uint32_t a) noexcept {
    a -= Q;
    a += static_cast<uint32_t>(static_cast<int32_t>(a) >> 31) & Q;
    return a;
}

/**
 * Canonical representative in [0, q)
 */
[[nodiscard]] constexpr uint32_t freeze(uint32_t a) noexcept {
    return csubq(reduce32(a));
}

} // namespace dilithium

#endif // DILITHIUM_REDUCE_HPP
