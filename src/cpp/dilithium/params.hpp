/**
 * Dilithium Parameter Sets
 *
 * This header defines the core constants and the four parameter modes of the
 * Dilithium lattice signature scheme. A mode is selected at compile time by
 * passing one of the Params objects below as a template argument.
 */

#ifndef DILITHIUM_PARAMS_HPP
#define DILITHIUM_PARAMS_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string_view>

namespace dilithium {

// Global constants
inline constexpr size_t SEEDBYTES = 32;
inline constexpr size_t CRHBYTES = 48;
inline constexpr size_t N = 256;             // Polynomial degree
inline constexpr uint32_t Q = 8380417;       // Modulus q = 2^23 - 2^13 + 1
inline constexpr int QBITS = 23;
inline constexpr uint32_t ROOT_OF_UNITY = 1753;
inline constexpr int D = 14;                 // Dropped bits from t
inline constexpr uint32_t GAMMA1 = (Q - 1) / 16;
inline constexpr uint32_t GAMMA2 = GAMMA1 / 2;
inline constexpr uint32_t ALPHA = 2 * GAMMA2;
inline constexpr size_t TAU = 60;            // Nonzero coefficients in challenge

inline constexpr uint64_t MONT = 4193792;    // 2^32 mod q
inline constexpr uint64_t QINV = 4236238847; // -q^(-1) mod 2^32

// Packed polynomial sizes
inline constexpr size_t POLT1_SIZE_PACKED = (N * (QBITS - D)) / 8;
inline constexpr size_t POLT0_SIZE_PACKED = (N * D) / 8;
inline constexpr size_t POLZ_SIZE_PACKED = (N * (QBITS - 3)) / 8;
inline constexpr size_t POLW1_SIZE_PACKED = (N * 4) / 8;

// Polynomial type
using Poly = std::array<uint32_t, N>;

/**
 * Parameter set for one Dilithium mode
 */
struct Params {
    std::string_view name;
    size_t k;           // Rows in matrix A
    size_t l;           // Columns in matrix A
    uint32_t eta;       // Secret key coefficient bound
    int setabits;       // Bits per packed secret coefficient
    uint32_t beta;      // Rejection margin
    size_t omega;       // Maximum number of 1s in hint

    [[nodiscard]] constexpr size_t poleta_size_packed() const noexcept {
        return (N * setabits) / 8;
    }

    [[nodiscard]] constexpr size_t pk_size() const noexcept {
        return SEEDBYTES + k * POLT1_SIZE_PACKED;  // rho + t1 encoding
    }

    [[nodiscard]] constexpr size_t sk_size() const noexcept {
        return 2 * SEEDBYTES + CRHBYTES
             + (l + k) * poleta_size_packed()
             + k * POLT0_SIZE_PACKED;
    }

    [[nodiscard]] constexpr size_t sig_size() const noexcept {
        return l * POLZ_SIZE_PACKED + (omega + k) + (N / 8 + 8);
    }
};

// Mode 0: weak
inline constexpr Params MODE0_PARAMS = {
    .name = "Dilithium-0",
    .k = 3,
    .l = 2,
    .eta = 7,
    .setabits = 4,
    .beta = 375,
    .omega = 64,
};

// Mode 1: medium
inline constexpr Params MODE1_PARAMS = {
    .name = "Dilithium-1",
    .k = 4,
    .l = 3,
    .eta = 6,
    .setabits = 4,
    .beta = 325,
    .omega = 80,
};

// Mode 2: recommended
inline constexpr Params MODE2_PARAMS = {
    .name = "Dilithium-2",
    .k = 5,
    .l = 4,
    .eta = 5,
    .setabits = 4,
    .beta = 275,
    .omega = 96,
};

// Mode 3: very high
inline constexpr Params MODE3_PARAMS = {
    .name = "Dilithium-3",
    .k = 6,
    .l = 5,
    .eta = 3,
    .setabits = 3,
    .beta = 175,
    .omega = 120,
};

/**
 * Compute 8-bit reversal
 */
[[nodiscard]] constexpr uint8_t bitrev8(uint8_t x) noexcept {
    uint8_t result = 0;
    for (int i = 0; i < 8; ++i) {
        result = static_cast<uint8_t>((result << 1) | (x & 1));
        x >>= 1;
    }
    return result;
}

/**
 * Compute modular exponentiation
 */
[[nodiscard]] constexpr uint64_t mod_pow(uint64_t base, unsigned exp, uint64_t mod) noexcept {
    uint64_t result = 1;
    base %= mod;
    while (exp > 0) {
        if (exp & 1) {
            result = (result * base) % mod;
        }
        exp >>= 1;
        base = (base * base) % mod;
    }
    return result;
}

/**
 * Root powers in Montgomery form: MONT * ROOT^BitRev8(k) for k = 1..255.
 * Entry 0 is never read.
 */
[[nodiscard]] constexpr std::array<uint32_t, N> compute_zetas() noexcept {
    std::array<uint32_t, N> zetas{};
    for (size_t k = 1; k < N; ++k) {
        zetas[k] = static_cast<uint32_t>(
            MONT * mod_pow(ROOT_OF_UNITY, bitrev8(static_cast<uint8_t>(k)), Q) % Q);
    }
    return zetas;
}

inline constexpr auto ZETAS = compute_zetas();

/**
 * Inverse root powers: ZETAS_INV[k] = q - ZETAS[256 - k]
 */
[[nodiscard]] constexpr std::array<uint32_t, N> compute_zetas_inv() noexcept {
    std::array<uint32_t, N> zetas_inv{};
    for (size_t k = 1; k < N; ++k) {
        zetas_inv[k] = Q - ZETAS[N - k];
    }
    return zetas_inv;
}

inline constexpr auto ZETAS_INV = compute_zetas_inv();

static_assert(ZETAS[1] == 25847, "Unexpected root of unity table");
static_assert(ZETAS_INV[1] == 6403635, "Unexpected inverse root table");

} // namespace dilithium

#endif // DILITHIUM_PARAMS_HPP
