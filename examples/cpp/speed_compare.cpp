/**
 * Dilithium vs Ed25519 Speed Comparison
 *
 * Times key generation, signing and verification of Dilithium against
 * Ed25519 from OpenSSL, the classical signer a dual signature pairs it with.
 *
 * Usage:
 *   ./dilithium_speed [iterations] [mode]
 *
 * Examples:
 *   ./dilithium_speed
 *   ./dilithium_speed 500 3
 */

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <chrono>
#include <stdexcept>
#include <tuple>

#include <openssl/evp.h>

#include "dilithium/dilithium.hpp"

namespace {

using Clock = std::chrono::high_resolution_clock;

struct Timing {
    double keygen_us = 0;
    double sign_us = 0;
    double verify_us = 0;
};

double elapsed_us(Clock::time_point start, Clock::time_point end) {
    return std::chrono::duration<double, std::micro>(end - start).count();
}

/**
 * Ed25519 through the OpenSSL EVP_PKEY interface
 */
class Ed25519 {
public:
    Ed25519() {
        EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_PKEY_CTX");
        }
        if (EVP_PKEY_keygen_init(ctx) != 1 || EVP_PKEY_keygen(ctx, &key_) != 1) {
            EVP_PKEY_CTX_free(ctx);
            throw std::runtime_error("Failed to generate Ed25519 key");
        }
        EVP_PKEY_CTX_free(ctx);
    }

    ~Ed25519() {
        EVP_PKEY_free(key_);
    }

    Ed25519(const Ed25519&) = delete;
    Ed25519& operator=(const Ed25519&) = delete;

    [[nodiscard]] std::vector<uint8_t> sign(const std::vector<uint8_t>& message) const {
        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }

        std::vector<uint8_t> sig(64);
        size_t sig_len = sig.size();
        if (EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, key_) != 1 ||
            EVP_DigestSign(ctx, sig.data(), &sig_len, message.data(), message.size()) != 1) {
            EVP_MD_CTX_free(ctx);
            throw std::runtime_error("Ed25519 signing failed");
        }
        EVP_MD_CTX_free(ctx);
        sig.resize(sig_len);
        return sig;
    }

    [[nodiscard]] bool verify(const std::vector<uint8_t>& message,
                              const std::vector<uint8_t>& sig) const {
        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }

        bool ok = EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, key_) == 1 &&
                  EVP_DigestVerify(ctx, sig.data(), sig.size(),
                                   message.data(), message.size()) == 1;
        EVP_MD_CTX_free(ctx);
        return ok;
    }

private:
    EVP_PKEY* key_ = nullptr;
};

template<typename DSA>
Timing time_dilithium(int iterations, const std::vector<uint8_t>& message) {
    DSA dsa;
    Timing t;

    typename DSA::PublicKey pk{};
    typename DSA::SecretKey sk{};
    typename DSA::Signature sig{};

    for (int i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        std::tie(pk, sk) = dsa.keypair();
        auto mid = Clock::now();
        dsa.sign_into(sig, message, sk);
        auto end = Clock::now();
        bool valid = dsa.verify(message, sig, pk);
        auto done = Clock::now();

        if (!valid) {
            throw std::runtime_error("Dilithium signature failed to verify");
        }

        t.keygen_us += elapsed_us(start, mid);
        t.sign_us += elapsed_us(mid, end);
        t.verify_us += elapsed_us(end, done);
    }

    t.keygen_us /= iterations;
    t.sign_us /= iterations;
    t.verify_us /= iterations;
    return t;
}

Timing time_ed25519(int iterations, const std::vector<uint8_t>& message) {
    Timing t;

    for (int i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        Ed25519 ed;
        auto mid = Clock::now();
        auto sig = ed.sign(message);
        auto end = Clock::now();
        bool valid = ed.verify(message, sig);
        auto done = Clock::now();

        if (!valid) {
            throw std::runtime_error("Ed25519 signature failed to verify");
        }

        t.keygen_us += elapsed_us(start, mid);
        t.sign_us += elapsed_us(mid, end);
        t.verify_us += elapsed_us(end, done);
    }

    t.keygen_us /= iterations;
    t.sign_us /= iterations;
    t.verify_us /= iterations;
    return t;
}

void print_row(const std::string& name, const Timing& t) {
    std::cout << "  " << std::setw(14) << name
              << std::setw(14) << t.keygen_us
              << std::setw(14) << t.sign_us
              << std::setw(14) << t.verify_us << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    int iterations = 100;
    std::string mode = "2";

    try {
        if (argc > 1) {
            iterations = std::stoi(argv[1]);
        }
        if (argc > 2) {
            mode = argv[2];
        }
        if (iterations <= 0) {
            throw std::invalid_argument("iterations must be positive");
        }
    } catch (const std::exception& e) {
        std::cerr << "Usage: " << argv[0] << " [iterations] [mode]" << std::endl;
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::string message_str = "The quick brown fox jumps over the lazy dog";
    std::vector<uint8_t> message(message_str.begin(), message_str.end());

    try {
        Timing dilithium_timing;
        if (mode == "0") {
            dilithium_timing = time_dilithium<dilithium::Dilithium0>(iterations, message);
        } else if (mode == "1") {
            dilithium_timing = time_dilithium<dilithium::Dilithium1>(iterations, message);
        } else if (mode == "2") {
            dilithium_timing = time_dilithium<dilithium::Dilithium2>(iterations, message);
        } else if (mode == "3") {
            dilithium_timing = time_dilithium<dilithium::Dilithium3>(iterations, message);
        } else {
            std::cerr << "Unknown mode: " << mode << " (expected 0, 1, 2 or 3)" << std::endl;
            return 1;
        }

        Timing ed_timing = time_ed25519(iterations, message);

        std::cout << "Average over " << iterations << " iterations (microseconds)" << std::endl;
        std::cout << std::fixed << std::setprecision(1);
        std::cout << "  " << std::setw(14) << "Algorithm"
                  << std::setw(14) << "KeyGen"
                  << std::setw(14) << "Sign"
                  << std::setw(14) << "Verify" << std::endl;
        std::cout << "  " << std::string(56, '-') << std::endl;
        print_row("Dilithium-" + mode, dilithium_timing);
        print_row("Ed25519", ed_timing);

        double ratio = (dilithium_timing.sign_us + dilithium_timing.verify_us) /
                       (ed_timing.sign_us + ed_timing.verify_us);
        std::cout << "\n  Dilithium sign+verify is " << ratio
                  << "x the cost of Ed25519" << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}
