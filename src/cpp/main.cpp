/**
 * Dilithium Signature Demo
 * Key generation, signing, and verification for the four parameter modes
 *
 * Usage:
 *   ./dilithium_demo [mode]
 *
 * mode is 0, 1, 2 or 3 (default: 2). Pass "all" to run every mode.
 */

#include "dilithium/dilithium.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <chrono>
#include <span>
#include <algorithm>

void print_hex(std::span<const uint8_t> data, size_t max_len = 32) {
    for (size_t i = 0; i < std::min(data.size(), max_len); ++i) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(data[i]);
    }
    if (data.size() > max_len) {
        std::cout << "...";
    }
    std::cout << std::dec;
}

template<typename DSA>
bool demo_dilithium() {
    DSA dsa;
    const auto& params = dsa.params();

    std::cout << "\n=== " << params.name << " Demo ===" << std::endl;
    std::cout << "\nParameter set: " << params.name << std::endl;
    std::cout << "  k = " << params.k << ", l = " << params.l << std::endl;
    std::cout << "  eta = " << params.eta << ", beta = " << params.beta
              << ", omega = " << params.omega << std::endl;

    // Generate keys
    std::cout << "\n1. Generating key pair..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();
    auto [pk, sk] = dsa.keypair();
    auto end = std::chrono::high_resolution_clock::now();
    auto keygen_us = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();

    std::cout << "   Public key size: " << pk.size() << " bytes" << std::endl;
    std::cout << "   Secret key size: " << sk.size() << " bytes" << std::endl;
    std::cout << "   KeyGen time: " << keygen_us << " us" << std::endl;
    std::cout << "   Public key (first 32 bytes): ";
    print_hex(pk);
    std::cout << std::endl;

    // Sign a message
    std::string message_str = "Hello, Dilithium! This is a test message for lattice signatures.";
    std::vector<uint8_t> message(message_str.begin(), message_str.end());

    std::cout << "\n2. Signing message..." << std::endl;
    std::cout << "   Message: \"" << message_str << "\"" << std::endl;

    start = std::chrono::high_resolution_clock::now();
    auto signature = dsa.sign(message, sk);
    end = std::chrono::high_resolution_clock::now();
    auto sign_us = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();

    std::cout << "   Signature size: " << signature.size() << " bytes" << std::endl;
    std::cout << "   Sign time: " << sign_us << " us" << std::endl;
    std::cout << "   Signature (first 32 bytes): ";
    print_hex(signature);
    std::cout << std::endl;

    // Verify signature
    std::cout << "\n3. Verifying signature..." << std::endl;
    start = std::chrono::high_resolution_clock::now();
    bool valid = dsa.verify(message, signature, pk);
    end = std::chrono::high_resolution_clock::now();
    auto verify_us = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();

    std::cout << "   Valid: " << (valid ? "YES" : "NO") << std::endl;
    std::cout << "   Verify time: " << verify_us << " us" << std::endl;

    // Test with modified message
    std::cout << "\n4. Testing with modified message..." << std::endl;
    std::vector<uint8_t> modified_message = message;
    modified_message[0] ^= 0x01;  // Flip one bit
    bool invalid = dsa.verify(modified_message, signature, pk);
    std::cout << "   Valid (should be NO): " << (invalid ? "YES" : "NO") << std::endl;

    // Deterministic signing
    std::cout << "\n5. Deterministic signing test..." << std::endl;
    auto sig1 = dsa.sign(message, sk);
    auto sig2 = dsa.sign(message, sk);
    std::cout << "   Signatures match: " << (sig1 == sig2 ? "YES" : "NO") << std::endl;

    return valid && !invalid && sig1 == sig2;
}

void print_sizes() {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  Size Comparison" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    std::cout << std::setfill(' ');
    std::cout << "  " << std::setw(16) << "Mode" << std::setw(12) << "PK Size"
              << std::setw(12) << "SK Size" << std::setw(12) << "Sig Size" << std::endl;
    std::cout << "  " << std::string(52, '-') << std::endl;

    for (const dilithium::Params* p : {&dilithium::MODE0_PARAMS, &dilithium::MODE1_PARAMS,
                            &dilithium::MODE2_PARAMS, &dilithium::MODE3_PARAMS}) {
        std::cout << "  " << std::setw(16) << p->name
                  << std::setw(10) << p->pk_size() << " B"
                  << std::setw(10) << p->sk_size() << " B"
                  << std::setw(10) << p->sig_size() << " B" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::string mode = argc > 1 ? argv[1] : "2";

    std::cout << std::string(60, '=') << std::endl;
    std::cout << "  Dilithium Lattice Signature Demo" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    try {
        if (mode != "0" && mode != "1" && mode != "2" && mode != "3" && mode != "all") {
            std::cerr << "Unknown mode: " << mode << " (expected 0, 1, 2, 3 or all)" << std::endl;
            return 1;
        }

        bool ok = true;
        if (mode == "0" || mode == "all") ok = demo_dilithium<dilithium::Dilithium0>() && ok;
        if (mode == "1" || mode == "all") ok = demo_dilithium<dilithium::Dilithium1>() && ok;
        if (mode == "2" || mode == "all") ok = demo_dilithium<dilithium::Dilithium2>() && ok;
        if (mode == "3" || mode == "all") ok = demo_dilithium<dilithium::Dilithium3>() && ok;

        print_sizes();

        std::cout << "\n" << std::string(60, '=') << std::endl;
        if (!ok) {
            std::cerr << "  Demo finished with unexpected results" << std::endl;
            return 1;
        }
        std::cout << "  All demos completed successfully!" << std::endl;
        std::cout << std::string(60, '=') << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}
