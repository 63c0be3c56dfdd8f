/**
 * Dilithium Core Implementation
 *
 * This module implements the main Dilithium operations:
 * - Key Generation
 * - Signing (Fiat-Shamir with aborts)
 * - Verification
 *
 * Each mode is a separate instantiation of the Dilithium class template, so
 * every key, signature and intermediate buffer has a size fixed at compile
 * time.
 */

#ifndef DILITHIUM_DILITHIUM_HPP
#define DILITHIUM_DILITHIUM_HPP

#include "params.hpp"
#include "utils.hpp"
#include "poly.hpp"
#include "polyvec.hpp"
#include "packing.hpp"
#include <array>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

namespace dilithium {

/**
 * Dilithium Digital Signature Algorithm
 *
 * Provides key generation, signing, and verification for the parameter
 * mode P. Instances hold no state; keys and signatures are plain byte arrays
 * owned by the caller.
 */
template <const Params& P>
class Dilithium {
public:
    static constexpr size_t PUBLIC_KEY_BYTES = P.pk_size();
    static constexpr size_t SECRET_KEY_BYTES = P.sk_size();
    static constexpr size_t SIGNATURE_BYTES = P.sig_size();

    // Upper bound on rejection loop iterations in sign
    static constexpr int MAX_SIGN_ATTEMPTS = 1000;

    using PublicKey = std::array<uint8_t, PUBLIC_KEY_BYTES>;
    using SecretKey = std::array<uint8_t, SECRET_KEY_BYTES>;
    using Signature = std::array<uint8_t, SIGNATURE_BYTES>;

    using PolyVecL = PolyVec<P.l>;
    using PolyVecK = PolyVec<P.k>;
    using Matrix = std::array<PolyVecL, P.k>;

    [[nodiscard]] static constexpr const Params& params() noexcept { return P; }

    /**
     * ExpandA
     * Expand rho to the K x L matrix A in the NTT domain, entry (i, j)
     * sampled from SHAKE128(rho || i + 16 * j)
     */
    static void expand_mat(Matrix& mat, std::span<const uint8_t> rho) {
        for (size_t i = 0; i < P.k; ++i) {
            for (size_t j = 0; j < P.l; ++j) {
                const uint8_t index = static_cast<uint8_t>(i + (j << 4));
                Shake128Stream xof;
                xof.absorb(rho.first(SEEDBYTES)).absorb(std::span<const uint8_t>(&index, 1));
                poly_uniform(mat[i][j], xof);
            }
        }
    }

    /**
     * Challenge
     * Hash mu and the packed high bits w1 to a polynomial with exactly TAU
     * coefficients in {1, q - 1} and all others zero
     */
    static void challenge(Poly& c, std::span<const uint8_t> mu, const PolyVecK& w1) {
        constexpr size_t RATE = Shake256Stream::RATE;

        std::array<uint8_t, P.k * POLW1_SIZE_PACKED> w1_packed{};
        for (size_t i = 0; i < P.k; ++i) {
            polyw1_pack(std::span(w1_packed).subspan(i * POLW1_SIZE_PACKED, POLW1_SIZE_PACKED), w1[i]);
        }

        Shake256Stream xof;
        xof.absorb(mu.first(CRHBYTES)).absorb(w1_packed);

        std::array<uint8_t, RATE> buf{};
        xof.squeeze(buf);

        // First 8 bytes are the sign bits
        uint64_t signs = 0;
        for (size_t i = 0; i < 8; ++i) {
            signs |= static_cast<uint64_t>(buf[i]) << (8 * i);
        }
        size_t pos = 8;
        uint64_t mask = 1;

        c.fill(0);
        for (size_t i = N - TAU; i < N; ++i) {
            // Rejection sampling for b in [0, i]
            size_t b;
            do {
                if (pos >= RATE) {
                    xof.squeeze(buf);
                    pos = 0;
                }
                b = buf[pos++];
            } while (b > i);

            c[i] = c[b];
            c[b] = (signs & mask) ? Q - 1 : 1;
            mask <<= 1;
        }
    }

    /**
     * Key Generation
     * Draw 32 bytes from rng and derive the key pair from them
     *
     * @param rng Any object with fill(std::span<uint8_t>)
     */
    template <typename Rng>
    void keypair(Rng& rng, PublicKey& pk, SecretKey& sk) const {
        // Step 1: Expand the random seed to rho, rho' and key
        std::array<uint8_t, SEEDBYTES> seed{};
        rng.fill(seed);

        std::array<uint8_t, 3 * SEEDBYTES> seedbuf{};
        shake256(seedbuf, {seed});
        auto rho = std::span<const uint8_t>(seedbuf).subspan(0, SEEDBYTES);
        auto rhoprime = std::span<const uint8_t>(seedbuf).subspan(SEEDBYTES, SEEDBYTES);
        auto key = std::span<const uint8_t>(seedbuf).subspan(2 * SEEDBYTES, SEEDBYTES);

        // Step 2: Expand matrix
        Matrix mat;
        expand_mat(mat, rho);

        // Step 3: Sample short vectors s1 and s2
        PolyVecL s1;
        PolyVecK s2;
        uint8_t nonce = 0;
        for (size_t i = 0; i < P.l; ++i) {
            poly_uniform_eta<P>(s1[i], rhoprime, nonce++);
        }
        for (size_t i = 0; i < P.k; ++i) {
            poly_uniform_eta<P>(s2[i], rhoprime, nonce++);
        }

        // Step 4: t = A * s1 + s2
        PolyVecL s1hat = s1;
        s1hat.ntt();

        PolyVecK t;
        for (size_t i = 0; i < P.k; ++i) {
            polyvec_pointwise_acc_invmontgomery(t[i], mat[i], s1hat);
            poly_reduce(t[i]);
            poly_invntt_montgomery(t[i]);
        }

        t.add_assign(s2);
        t.freeze();

        // Step 5: Extract t1 and write public key
        PolyVecK t0, t1;
        t.power2round(t0, t1);
        pk_pack<P>(pk, rho, t1);

        // Step 6: tr = CRH(pk), write secret key
        std::array<uint8_t, CRHBYTES> tr{};
        shake256(tr, {pk});
        sk_pack<P>(sk, rho, key, tr, s1, s2, t0);
    }

    /**
     * Generate a key pair from the system CSPRNG
     */
    [[nodiscard]] std::pair<PublicKey, SecretKey> keypair() const {
        SystemRandom rng;
        std::pair<PublicKey, SecretKey> keys{};
        keypair(rng, keys.first, keys.second);
        return keys;
    }

    /**
     * Generate a reproducible key pair from a caller supplied seed
     */
    [[nodiscard]] std::pair<PublicKey, SecretKey>
    keypair_from_seed(std::span<const uint8_t> seed) const {
        DeterministicRandom rng(seed);
        std::pair<PublicKey, SecretKey> keys{};
        keypair(rng, keys.first, keys.second);
        return keys;
    }

    /**
     * Sign a message into a caller provided buffer
     *
     * Signing is deterministic: the same (message, secret key) pair always
     * gives the same signature.
     *
     * @throws std::invalid_argument if sk is not SECRET_KEY_BYTES long
     * @throws std::runtime_error if MAX_SIGN_ATTEMPTS iterations are rejected
     */
    void sign_into(Signature& sig,
                   std::span<const uint8_t> message,
                   std::span<const uint8_t> sk) const {
        if (sk.size() != SECRET_KEY_BYTES) {
            throw std::invalid_argument("Secret key must be " +
                                        std::to_string(SECRET_KEY_BYTES) + " bytes");
        }

        // Step 1: Decode secret key
        std::array<uint8_t, SEEDBYTES> rho{}, key{};
        std::array<uint8_t, CRHBYTES> tr{};
        PolyVecL s1;
        PolyVecK s2, t0;
        sk_unpack<P>(rho, key, tr, s1, s2, t0, sk);

        // Step 2: mu = CRH(tr || message)
        std::array<uint8_t, CRHBYTES> mu{};
        shake256(mu, {tr, message});

        // Step 3: Expand matrix and transform vectors
        Matrix mat;
        expand_mat(mat, rho);
        s1.ntt();
        s2.ntt();
        t0.ntt();

        uint16_t nonce = 0;
        for (int attempt = 0; attempt < MAX_SIGN_ATTEMPTS; ++attempt) {
            // Step 4: Sample masking vector y
            PolyVecL y;
            for (size_t i = 0; i < P.l; ++i) {
                poly_uniform_gamma1m1(y[i], key, mu, nonce++);
            }

            // Step 5: w = A * y, split off high bits w1
            PolyVecL yhat = y;
            yhat.ntt();

            PolyVecK w;
            for (size_t i = 0; i < P.k; ++i) {
                polyvec_pointwise_acc_invmontgomery(w[i], mat[i], yhat);
                poly_invntt_montgomery(w[i]);
            }
            w.csubq();

            PolyVecK tmp, w1;
            w.decompose(tmp, w1);

            // Step 6: Challenge
            Poly c;
            challenge(c, mu, w1);
            Poly chat = c;
            poly_ntt(chat);

            // Step 7: z = y + c * s1, check norm
            PolyVecL z;
            for (size_t i = 0; i < P.l; ++i) {
                poly_pointwise_invmontgomery(z[i], chat, s1[i]);
                poly_invntt_montgomery(z[i]);
            }
            z.add_assign(y);
            z.freeze();
            if (z.chknorm(GAMMA1 - P.beta)) {
                continue;
            }

            // Step 8: Low bits of w - c * s2 must be small, high bits unchanged
            PolyVecK wcs20;
            for (size_t i = 0; i < P.k; ++i) {
                poly_pointwise_invmontgomery(wcs20[i], chat, s2[i]);
                poly_invntt_montgomery(wcs20[i]);
            }
            PolyVecK wcs2 = w.with_sub(wcs20);
            wcs2.freeze();
            wcs2.decompose(wcs20, tmp);
            wcs20.csubq();
            if (wcs20.chknorm(GAMMA2 - P.beta)) {
                continue;
            }
            if (tmp != w1) {
                continue;
            }

            // Step 9: Hint for w - c * s2 + c * t0
            PolyVecK ct0;
            for (size_t i = 0; i < P.k; ++i) {
                poly_pointwise_invmontgomery(ct0[i], chat, t0[i]);
                poly_invntt_montgomery(ct0[i]);
            }
            ct0.csubq();
            if (ct0.chknorm(GAMMA2)) {
                continue;
            }

            tmp = wcs2.with_add(ct0);
            tmp.csubq();

            PolyVecK h;
            size_t n = polyvec_make_hint(h, wcs2, tmp);
            if (n > P.omega) {
                continue;
            }

            // Step 10: Signature found
            sig_pack<P>(sig, z, h, c);
            return;
        }

        throw std::runtime_error("Signing failed: too many rejection attempts");
    }

    /**
     * Sign a message
     *
     * @param message Message to sign
     * @param sk Secret key, SECRET_KEY_BYTES long
     * @return Signature
     */
    [[nodiscard]] Signature sign(std::span<const uint8_t> message,
                                 std::span<const uint8_t> sk) const {
        Signature sig{};
        sign_into(sig, message, sk);
        return sig;
    }

    /**
     * Verify a signature
     *
     * Returns false for malformed or wrongly sized inputs as well as for
     * signatures that do not match.
     */
    [[nodiscard]] bool verify(std::span<const uint8_t> message,
                              std::span<const uint8_t> sig,
                              std::span<const uint8_t> pk) const {
        if (sig.size() != SIGNATURE_BYTES || pk.size() != PUBLIC_KEY_BYTES) {
            return false;
        }

        // Step 1: Decode public key and signature
        std::array<uint8_t, SEEDBYTES> rho{};
        PolyVecK t1;
        pk_unpack<P>(rho, t1, pk);

        PolyVecL z;
        PolyVecK h;
        Poly c;
        if (!sig_unpack<P>(z, h, c, sig)) {
            return false;
        }
        if (z.chknorm(GAMMA1 - P.beta)) {
            return false;
        }

        // Step 2: mu = CRH(CRH(pk) || message)
        std::array<uint8_t, CRHBYTES> tr{}, mu{};
        shake256(tr, {pk});
        shake256(mu, {tr, message});

        // Step 3: A * z - c * t1 * 2^D
        Matrix mat;
        expand_mat(mat, rho);

        z.ntt();
        PolyVecK tmp1;
        for (size_t i = 0; i < P.k; ++i) {
            polyvec_pointwise_acc_invmontgomery(tmp1[i], mat[i], z);
        }

        Poly chat = c;
        poly_ntt(chat);
        t1.shift_left(D);
        t1.ntt();
        PolyVecK tmp2;
        for (size_t i = 0; i < P.k; ++i) {
            poly_pointwise_invmontgomery(tmp2[i], chat, t1[i]);
        }

        PolyVecK tmp = tmp1.with_sub(tmp2);
        tmp.reduce();
        tmp.invntt_montgomery();
        tmp.csubq();

        // Step 4: Reconstruct w1 and recompute the challenge
        PolyVecK w1;
        polyvec_use_hint(w1, tmp, h);

        Poly cp;
        challenge(cp, mu, w1);

        uint32_t diff = 0;
        for (size_t i = 0; i < N; ++i) {
            diff |= c[i] ^ cp[i];
        }
        return diff == 0;
    }
};

using Dilithium0 = Dilithium<MODE0_PARAMS>;
using Dilithium1 = Dilithium<MODE1_PARAMS>;
using Dilithium2 = Dilithium<MODE2_PARAMS>;
using Dilithium3 = Dilithium<MODE3_PARAMS>;

} // namespace dilithium

#endif // DILITHIUM_DILITHIUM_HPP
