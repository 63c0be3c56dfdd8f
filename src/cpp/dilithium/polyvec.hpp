/**
 * Fixed-length vectors of polynomials
 *
 * PolyVec<LEN> is instantiated at the matrix dimensions L and K of a mode.
 * Every operation applies the matching poly_* function to each component.
 */

#ifndef DILITHIUM_POLYVEC_HPP
#define DILITHIUM_POLYVEC_HPP

#include "params.hpp"
#include "poly.hpp"
#include <array>

namespace dilithium {

template <size_t LEN>
struct PolyVec {
    std::array<Poly, LEN> vec{};

    Poly& operator[](size_t i) noexcept { return vec[i]; }
    const Poly& operator[](size_t i) const noexcept { return vec[i]; }

    static constexpr size_t size() noexcept { return LEN; }

    bool operator==(const PolyVec&) const = default;

    void add_assign(const PolyVec& b) noexcept {
        for (size_t i = 0; i < LEN; ++i) {
            poly_add_assign(vec[i], b.vec[i]);
        }
    }

    [[nodiscard]] PolyVec with_add(const PolyVec& b) const noexcept {
        PolyVec r;
        for (size_t i = 0; i < LEN; ++i) {
            poly_add(r.vec[i], vec[i], b.vec[i]);
        }
        return r;
    }

    // Component-wise a + 2q - b
    [[nodiscard]] PolyVec with_sub(const PolyVec& b) const noexcept {
        PolyVec r;
        for (size_t i = 0; i < LEN; ++i) {
            poly_sub(r.vec[i], vec[i], b.vec[i]);
        }
        return r;
    }

    void shift_left(int k) noexcept {
        for (auto& p : vec) {
            poly_shift_left(p, k);
        }
    }

    void ntt() noexcept {
        for (auto& p : vec) {
            poly_ntt(p);
        }
    }

    void invntt_montgomery() noexcept {
        for (auto& p : vec) {
            poly_invntt_montgomery(p);
        }
    }

    void reduce() noexcept {
        for (auto& p : vec) {
            poly_reduce(p);
        }
    }

    void csubq() noexcept {
        for (auto& p : vec) {
            poly_csubq(p);
        }
    }

    void freeze() noexcept {
        for (auto& p : vec) {
            poly_freeze(p);
        }
    }

    /**
     * True if any component fails poly_chknorm against bound
     */
    [[nodiscard]] bool chknorm(uint32_t bound) const noexcept {
        for (const auto& p : vec) {
            if (poly_chknorm(p, bound)) {
                return true;
            }
        }
        return false;
    }

    void decompose(PolyVec& v0, PolyVec& v1) const noexcept {
        for (size_t i = 0; i < LEN; ++i) {
            poly_decompose(v0.vec[i], v1.vec[i], vec[i]);
        }
    }

    void power2round(PolyVec& v0, PolyVec& v1) const noexcept {
        for (size_t i = 0; i < LEN; ++i) {
            poly_power2round(v0.vec[i], v1.vec[i], vec[i]);
        }
    }
};

/**
 * Inner product of u and v in the NTT domain, then reduce32 on each
 * coefficient
 */
template <size_t LEN>
void polyvec_pointwise_acc_invmontgomery(Poly& w, const PolyVec<LEN>& u,
                                         const PolyVec<LEN>& v) noexcept {
    Poly t{};
    poly_pointwise_invmontgomery(w, u[0], v[0]);
    for (size_t i = 1; i < LEN; ++i) {
        poly_pointwise_invmontgomery(t, u[i], v[i]);
        poly_add_assign(w, t);
    }
    poly_reduce(w);
}

/**
 * Hint vector for (u, v); returns the total number of ones
 */
template <size_t LEN>
size_t polyvec_make_hint(PolyVec<LEN>& h, const PolyVec<LEN>& u,
                         const PolyVec<LEN>& v) noexcept {
    size_t s = 0;
    for (size_t i = 0; i < LEN; ++i) {
        s += poly_make_hint(h[i], u[i], v[i]);
    }
    return s;
}

template <size_t LEN>
void polyvec_use_hint(PolyVec<LEN>& w, const PolyVec<LEN>& u,
                      const PolyVec<LEN>& h) noexcept {
    for (size_t i = 0; i < LEN; ++i) {
        poly_use_hint(w[i], u[i], h[i]);
    }
}

} // namespace dilithium

#endif // DILITHIUM_POLYVEC_HPP
