/**
 * Utility classes for the Dilithium implementation
 *
 * Bit cursors used by the polynomial codecs, SHAKE extendable-output
 * streams and the random sources consumed by key generation.
 */

#ifndef DILITHIUM_UTILS_HPP
#define DILITHIUM_UTILS_HPP

#include <cstdint>
#include <cstddef>
#include <vector>
#include <span>
#include <initializer_list>

// Forward declare OpenSSL types
extern "C" {
    struct evp_md_ctx_st;
    typedef struct evp_md_ctx_st EVP_MD_CTX;
}

namespace dilithium {

/**
 * Writes fixed-width integers into a byte buffer, least significant bit
 * first. A value straddling a byte boundary continues in the low bits of
 * the next byte.
 */
class BitWriter {
public:
    explicit BitWriter(std::span<uint8_t> out) noexcept : out_(out) {}

    void write(uint32_t value, int bits) noexcept {
        acc_ |= static_cast<uint64_t>(value & ((uint32_t{1} << bits) - 1)) << nbits_;
        nbits_ += bits;
        while (nbits_ >= 8) {
            out_[pos_++] = static_cast<uint8_t>(acc_);
            acc_ >>= 8;
            nbits_ -= 8;
        }
    }

    // Emit a trailing partial byte, zero padded
    void flush() noexcept {
        if (nbits_ > 0) {
            out_[pos_++] = static_cast<uint8_t>(acc_);
            acc_ = 0;
            nbits_ = 0;
        }
    }

    [[nodiscard]] size_t position() const noexcept { return pos_; }

private:
    std::span<uint8_t> out_;
    size_t pos_ = 0;
    uint64_t acc_ = 0;
    int nbits_ = 0;
};

/**
 * Reads fixed-width integers written by BitWriter
 */
class BitReader {
public:
    explicit BitReader(std::span<const uint8_t> in) noexcept : in_(in) {}

    [[nodiscard]] uint32_t read(int bits) noexcept {
        while (nbits_ < bits) {
            acc_ |= static_cast<uint64_t>(in_[pos_++]) << nbits_;
            nbits_ += 8;
        }
        uint32_t value = static_cast<uint32_t>(acc_) & ((uint32_t{1} << bits) - 1);
        acc_ >>= bits;
        nbits_ -= bits;
        return value;
    }

    [[nodiscard]] size_t position() const noexcept { return pos_; }

private:
    std::span<const uint8_t> in_;
    size_t pos_ = 0;
    uint64_t acc_ = 0;
    int nbits_ = 0;
};

enum class ShakeVariant {
    SHAKE128,
    SHAKE256,
};

/**
 * SHAKE XOF stream
 *
 * Absorb any number of byte strings, then squeeze output in as many calls as
 * needed. Each squeeze continues where the previous one stopped. Absorbing
 * after the first squeeze throws std::logic_error.
 */
class ShakeStream {
public:
    explicit ShakeStream(ShakeVariant variant);
    ~ShakeStream();

    ShakeStream(const ShakeStream&) = delete;
    ShakeStream& operator=(const ShakeStream&) = delete;
    ShakeStream(ShakeStream&& other) noexcept;
    ShakeStream& operator=(ShakeStream&& other) noexcept;

    ShakeStream& absorb(std::span<const uint8_t> data);
    void squeeze(std::span<uint8_t> out);

    [[nodiscard]] size_t rate() const noexcept { return rate_; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
    size_t rate_ = 0;
    std::vector<uint8_t> buffer_;
    size_t total_read_ = 0;
    bool finalized_ = false;
};

/**
 * SHAKE128 XOF stream
 */
class Shake128Stream : public ShakeStream {
public:
    static constexpr size_t RATE = 168;

    Shake128Stream() : ShakeStream(ShakeVariant::SHAKE128) {}
};

/**
 * SHAKE256 XOF stream
 */
class Shake256Stream : public ShakeStream {
public:
    static constexpr size_t RATE = 136;

    Shake256Stream() : ShakeStream(ShakeVariant::SHAKE256) {}
};

/**
 * SHAKE256 over the concatenation of inputs, filling out completely
 */
void shake256(std::span<uint8_t> out,
              std::initializer_list<std::span<const uint8_t>> inputs);

/**
 * Operating system backed CSPRNG (OpenSSL RAND_bytes)
 */
class SystemRandom {
public:
    void fill(std::span<uint8_t> out);
};

/**
 * Reproducible byte source: the SHAKE256 output stream of a seed
 *
 * Used for deterministic key generation and for tests. Not a substitute for
 * SystemRandom when generating production keys.
 */
class DeterministicRandom {
public:
    explicit DeterministicRandom(std::span<const uint8_t> seed);

    void fill(std::span<uint8_t> out);

private:
    Shake256Stream xof_;
};

} // namespace dilithium

#endif // DILITHIUM_UTILS_HPP
