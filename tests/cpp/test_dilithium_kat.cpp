/**
 * Dilithium Known Answer Tests
 *
 * Fixed vectors for matrix expansion, secret and masking samplers, the
 * challenge hash, and digests of a deterministic key pair and signature.
 * Inputs: rho = 00 01 .. 1f, mu = 64 65 .. 93, key seed = 32 zero bytes.
 */

#include "dilithium/dilithium.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <utility>

using namespace dilithium;

// Test result tracking
static int tests_passed = 0;
static int tests_failed = 0;

// Helper function to convert bytes to hex string
std::string bytes_to_hex(std::span<const uint8_t> bytes) {
    std::stringstream ss;
    for (uint8_t b : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

// SHAKE256 digest of a buffer, 32 bytes, as hex
std::string digest_hex(std::span<const uint8_t> data) {
    std::array<uint8_t, 32> out{};
    shake256(out, {data});
    return bytes_to_hex(out);
}

// Centred value of coefficients stored as q + v
std::vector<int32_t> centred_prefix(const Poly& p, size_t count) {
    std::vector<int32_t> v;
    for (size_t i = 0; i < count; ++i) {
        v.push_back(static_cast<int32_t>(p[i]) - static_cast<int32_t>(Q));
    }
    return v;
}

#define KAT_TEST(name) \
    std::cout << "KAT: " << name << "... " << std::flush; \
    try

#define KAT_END \
    std::cout << "PASSED" << std::endl; \
    ++tests_passed; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << std::endl; \
        ++tests_failed; \
    } catch (...) { \
        std::cout << "FAILED: Unknown exception" << std::endl; \
        ++tests_failed; \
    }

#define KAT_ASSERT(cond, msg) \
    if (!(cond)) throw std::runtime_error(msg)

static std::array<uint8_t, SEEDBYTES> test_rho() {
    std::array<uint8_t, SEEDBYTES> rho{};
    for (size_t i = 0; i < SEEDBYTES; ++i) {
        rho[i] = static_cast<uint8_t>(i);
    }
    return rho;
}

static std::array<uint8_t, CRHBYTES> test_mu() {
    std::array<uint8_t, CRHBYTES> mu{};
    for (size_t i = 0; i < CRHBYTES; ++i) {
        mu[i] = static_cast<uint8_t>(100 + i);
    }
    return mu;
}

/**
 * ExpandA for Dilithium-2
 */
void test_expand_mat_kat() {
    KAT_TEST("Dilithium-2 ExpandA") {
        auto rho = test_rho();
        Dilithium2::Matrix mat;
        Dilithium2::expand_mat(mat, rho);

        const std::vector<uint32_t> a00 = {7551071, 1288428, 2488403, 3070368,
                                           2020510, 2953874, 3553432, 1112587};
        const std::vector<uint32_t> a10 = {6174012, 6798155, 2942551, 5995649,
                                           3008663, 1135489, 8141965, 7497284};
        const std::vector<uint32_t> a01 = {2862409, 7890977, 8067761, 1347425,
                                           7126442, 2196327, 4314988, 3217424};
        const std::vector<uint32_t> a43_tail = {3898492, 4071452, 3341999, 3911648};

        KAT_ASSERT(std::vector<uint32_t>(mat[0][0].begin(), mat[0][0].begin() + 8) == a00,
                   "A[0][0] mismatch");
        KAT_ASSERT(std::vector<uint32_t>(mat[1][0].begin(), mat[1][0].begin() + 8) == a10,
                   "A[1][0] mismatch");
        KAT_ASSERT(std::vector<uint32_t>(mat[0][1].begin(), mat[0][1].begin() + 8) == a01,
                   "A[0][1] mismatch");
        KAT_ASSERT(std::vector<uint32_t>(mat[4][3].end() - 4, mat[4][3].end()) == a43_tail,
                   "A[4][3] tail mismatch");
    KAT_END
}

/**
 * Secret coefficient sampler, both packing widths
 */
void test_uniform_eta_kat() {
    auto rho = test_rho();

    KAT_TEST("Dilithium-2 uniform_eta nonces 0 and 1") {
        Poly a{};
        poly_uniform_eta<MODE2_PARAMS>(a, rho, 0);
        KAT_ASSERT(centred_prefix(a, 8) == (std::vector<int32_t>{1, -5, 4, 3, 0, 0, -3, -2}),
                   "nonce 0 mismatch");
        poly_uniform_eta<MODE2_PARAMS>(a, rho, 1);
        KAT_ASSERT(centred_prefix(a, 8) == (std::vector<int32_t>{2, -3, 3, 2, -2, 4, 2, 5}),
                   "nonce 1 mismatch");
    KAT_END

    KAT_TEST("Dilithium-3 uniform_eta nonces 0 and 1") {
        Poly a{};
        poly_uniform_eta<MODE3_PARAMS>(a, rho, 0);
        KAT_ASSERT(centred_prefix(a, 8) == (std::vector<int32_t>{-1, -2, 2, 2, -1, -2, -2, 1}),
                   "nonce 0 mismatch");
        poly_uniform_eta<MODE3_PARAMS>(a, rho, 1);
        KAT_ASSERT(centred_prefix(a, 8) == (std::vector<int32_t>{2, 3, 2, 0, 0, 2, 2, 3}),
                   "nonce 1 mismatch");
    KAT_END
}

/**
 * Masking vector sampler
 */
void test_uniform_gamma1m1_kat() {
    KAT_TEST("uniform_gamma1m1 nonces 0 and 1") {
        auto rho = test_rho();
        auto mu = test_mu();
        Poly a{};

        poly_uniform_gamma1m1(a, rho, mu, 0);
        KAT_ASSERT(centred_prefix(a, 8) ==
                       (std::vector<int32_t>{177628, -343132, -221940, 475845,
                                             148610, 457339, -188668, 28458}),
                   "nonce 0 mismatch");

        poly_uniform_gamma1m1(a, rho, mu, 1);
        KAT_ASSERT(centred_prefix(a, 8) ==
                       (std::vector<int32_t>{-479672, 12254, 154693, 442590,
                                             247798, -293642, 501819, -230628}),
                   "nonce 1 mismatch");
    KAT_END
}

/**
 * Challenge for Dilithium-2 with w1[i][j] = (i + j) mod 16
 */
void test_challenge_kat() {
    KAT_TEST("Dilithium-2 challenge") {
        auto mu = test_mu();
        Dilithium2::PolyVecK w1;
        for (size_t i = 0; i < MODE2_PARAMS.k; ++i) {
            for (size_t j = 0; j < N; ++j) {
                w1[i][j] = static_cast<uint32_t>((i + j) & 15);
            }
        }

        Poly c{};
        Dilithium2::challenge(c, mu, w1);

        // (index, sign) of every nonzero coefficient
        const std::vector<std::pair<int, int>> expected = {
            {4, -1}, {6, -1}, {7, 1}, {10, 1}, {17, 1}, {27, -1}, {28, 1}, {29, 1},
            {30, -1}, {32, -1}, {39, 1}, {43, -1}, {45, -1}, {53, 1}, {59, 1}, {73, 1},
            {77, 1}, {79, 1}, {85, 1}, {87, -1}, {88, -1}, {89, -1}, {91, -1}, {95, -1},
            {97, 1}, {102, 1}, {110, -1}, {113, 1}, {114, 1}, {121, -1}, {124, -1}, {125, 1},
            {128, 1}, {129, 1}, {134, 1}, {142, 1}, {149, -1}, {150, 1}, {151, 1}, {157, 1},
            {158, -1}, {159, 1}, {164, 1}, {166, -1}, {180, -1}, {181, -1}, {188, -1}, {197, 1},
            {202, 1}, {209, -1}, {211, 1}, {215, -1}, {221, 1}, {222, 1}, {224, -1}, {235, 1},
            {243, -1}, {247, -1}, {253, 1}, {255, 1},
        };

        std::vector<std::pair<int, int>> got;
        for (size_t i = 0; i < N; ++i) {
            if (c[i] == 1) {
                got.emplace_back(static_cast<int>(i), 1);
            } else if (c[i] == Q - 1) {
                got.emplace_back(static_cast<int>(i), -1);
            } else {
                KAT_ASSERT(c[i] == 0, "Unexpected challenge coefficient");
            }
        }

        KAT_ASSERT(got.size() == TAU, "Challenge weight mismatch");
        KAT_ASSERT(got == expected, "Challenge mismatch");
    KAT_END
}

/**
 * Deterministic key pair and signature, key seed of 32 zero bytes
 */
void test_deterministic_keypair_kat() {
    const std::vector<uint8_t> seed(32, 0);
    const std::vector<uint8_t> message = {'a', 'b', 'c'};

    KAT_TEST("Dilithium-2 keypair and signature") {
        Dilithium2 dsa;
        auto [pk, sk] = dsa.keypair_from_seed(seed);

        KAT_ASSERT(bytes_to_hex(std::span<const uint8_t>(pk).first(8)) == "b64bc1b2dcc382de",
                   "Public key prefix mismatch");
        KAT_ASSERT(digest_hex(pk) ==
                       "0922a91f0830e0dcefb39041482be0a7807d545ada8d6e41ed63183ef2551a04",
                   "Public key digest mismatch");
        KAT_ASSERT(digest_hex(sk) ==
                       "985eac2d9660f55324a7cd882c622b6674fb6f8b785c24ef6e03c9179cd6b367",
                   "Secret key digest mismatch");

        auto sig = dsa.sign(message, sk);
        KAT_ASSERT(digest_hex(sig) ==
                       "37c505d12ad8fce9f4d9ccc9da55c5a19fc4b1f9decdc2d1727c4657565960fc",
                   "Signature digest mismatch");
        KAT_ASSERT(dsa.verify(message, sig, pk), "Signature does not verify");
    KAT_END

    KAT_TEST("Dilithium-0 keypair and signature") {
        Dilithium0 dsa;
        auto [pk, sk] = dsa.keypair_from_seed(seed);

        KAT_ASSERT(digest_hex(pk) ==
                       "dc3df7fea8aea4863d5687101d6ad74eae9fe4cca56b128524cb1f1e547b0994",
                   "Public key digest mismatch");
        KAT_ASSERT(digest_hex(sk) ==
                       "20de4d93e245ecd5fb3a1753982ec147db7f0511d609b599430c1adae9a2b616",
                   "Secret key digest mismatch");

        auto sig = dsa.sign(message, sk);
        KAT_ASSERT(digest_hex(sig) ==
                       "9a74dd7236b0d6921342fac4d1a4162bd8a067c0be2a0a66e8ecdfe168286278",
                   "Signature digest mismatch");
        KAT_ASSERT(dsa.verify(message, sig, pk), "Signature does not verify");
    KAT_END

    KAT_TEST("Dilithium-3 keypair and signature") {
        Dilithium3 dsa;
        auto [pk, sk] = dsa.keypair_from_seed(seed);

        KAT_ASSERT(digest_hex(pk) ==
                       "84d88e5f47f762c556db15aa766e9449eca30fb3acb41bf1edfc618c7bbc31ed",
                   "Public key digest mismatch");
        KAT_ASSERT(digest_hex(sk) ==
                       "7cc13dc2750aee7fc74e71453a363709efb97c04d42883ab898e26d87f498793",
                   "Secret key digest mismatch");

        auto sig = dsa.sign(message, sk);
        KAT_ASSERT(digest_hex(sig) ==
                       "07391e12480b86227da5675e422c78de56e2705033a1384784c3365b92c52dc7",
                   "Signature digest mismatch");
        KAT_ASSERT(dsa.verify(message, sig, pk), "Signature does not verify");
    KAT_END
}

int main() {
    std::cout << "=== Dilithium Known Answer Tests ===" << std::endl << std::endl;

    std::cout << "--- Samplers ---" << std::endl;
    test_expand_mat_kat();
    test_uniform_eta_kat();
    test_uniform_gamma1m1_kat();

    std::cout << std::endl << "--- Challenge ---" << std::endl;
    test_challenge_kat();

    std::cout << std::endl << "--- Key pair and signature ---" << std::endl;
    test_deterministic_keypair_kat();

    std::cout << std::endl << "=== KAT Results ===" << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
