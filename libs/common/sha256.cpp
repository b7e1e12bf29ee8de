/**
 * @file sha256.cpp
 * @brief SHA-256 implementation (standalone, no external dependency)
 *
 * Also hosts the stable id helpers, which are thin wrappers over the digest.
 */

#include "ossensor/common.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <ranges>
#include <span>

namespace ossensor::common {

namespace {

// SHA-256 round constants
constexpr std::array<uint32_t, 64> K = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
}};

[[nodiscard]] constexpr uint32_t ch(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (~x & z);
}

[[nodiscard]] constexpr uint32_t maj(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] constexpr uint32_t sigma0(uint32_t x) noexcept {
    return std::rotr(x, 2U) ^ std::rotr(x, 13U) ^ std::rotr(x, 22U);
}

[[nodiscard]] constexpr uint32_t sigma1(uint32_t x) noexcept {
    return std::rotr(x, 6U) ^ std::rotr(x, 11U) ^ std::rotr(x, 25U);
}

[[nodiscard]] constexpr uint32_t gamma0(uint32_t x) noexcept {
    return std::rotr(x, 7U) ^ std::rotr(x, 18U) ^ (x >> 3U);
}

[[nodiscard]] constexpr uint32_t gamma1(uint32_t x) noexcept {
    return std::rotr(x, 17U) ^ std::rotr(x, 19U) ^ (x >> 10U);
}

class Sha256Hasher {
public:
    Sha256Hasher() { reset(); }

    void reset() {
        m_state = {0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
                   0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19};
        m_bit_count = 0;
        m_buffer_len = 0;
    }

    void update(std::span<const uint8_t> data) {
        for (auto byte : data) {
            m_buffer[m_buffer_len++] = byte;
            if (m_buffer_len == m_buffer.size()) {
                transform();
                m_bit_count += 512;
                m_buffer_len = 0;
            }
        }
    }

    void update(std::string_view data) {
        update(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(data.data()), data.size()));
    }

    [[nodiscard]] std::array<uint8_t, 32> finalize() {
        const uint64_t total_bits = m_bit_count + m_buffer_len * 8;

        m_buffer[m_buffer_len++] = 0x80;
        if (m_buffer_len > 56) {
            while (m_buffer_len < 64) m_buffer[m_buffer_len++] = 0;
            transform();
            m_buffer_len = 0;
        }
        while (m_buffer_len < 56) m_buffer[m_buffer_len++] = 0;

        // Message length, big-endian
        for (auto i : std::views::iota(0, 8) | std::views::reverse) {
            const auto shift = static_cast<uint64_t>(i) * 8U;
            m_buffer[m_buffer_len++] = static_cast<uint8_t>(total_bits >> shift);
        }
        transform();

        std::array<uint8_t, 32> digest{};
        for (std::size_t i = 0; i < m_state.size(); ++i) {
            const uint32_t word = m_state[i];
            digest[i * 4uz + 0uz] = static_cast<uint8_t>(word >> 24);
            digest[i * 4uz + 1uz] = static_cast<uint8_t>(word >> 16);
            digest[i * 4uz + 2uz] = static_cast<uint8_t>(word >> 8);
            digest[i * 4uz + 3uz] = static_cast<uint8_t>(word);
        }
        return digest;
    }

private:
    void transform() {
        std::array<uint32_t, 64> w{};

        for (std::size_t i = 0; i < 16; ++i) {
            uint32_t val{};
            std::memcpy(&val, &m_buffer[i * 4uz], sizeof(val));
            if constexpr (std::endian::native == std::endian::little) {
                w[i] = std::byteswap(val);
            } else {
                w[i] = val;
            }
        }
        for (std::size_t i = 16; i < w.size(); ++i) {
            w[i] = gamma1(w[i - 2]) + w[i - 7] + gamma0(w[i - 15]) + w[i - 16];
        }

        uint32_t a = m_state[0], b = m_state[1], c = m_state[2], d = m_state[3];
        uint32_t e = m_state[4], f = m_state[5], g = m_state[6], h = m_state[7];

        for (std::size_t i = 0; i < w.size(); ++i) {
            const uint32_t t1 = h + sigma1(e) + ch(e, f, g) + K[i] + w[i];
            const uint32_t t2 = sigma0(a) + maj(a, b, c);
            h = g; g = f; f = e; e = d + t1;
            d = c; c = b; b = a; a = t1 + t2;
        }

        m_state[0] += a; m_state[1] += b; m_state[2] += c; m_state[3] += d;
        m_state[4] += e; m_state[5] += f; m_state[6] += g; m_state[7] += h;
    }

    std::array<uint32_t, 8> m_state{};
    std::array<uint8_t, 64> m_buffer{};
    std::size_t m_buffer_len = 0;
    uint64_t m_bit_count = 0;
};

[[nodiscard]] std::string to_hex(const std::array<uint8_t, 32>& digest) {
    constexpr std::string_view kDigits = "0123456789abcdef";
    std::string result;
    result.reserve(digest.size() * 2);
    for (uint8_t b : digest) {
        result += kDigits[b >> 4U];
        result += kDigits[b & 0x0fU];
    }
    return result;
}

}  // namespace

std::string sha256(std::string_view data) {
    Sha256Hasher hasher;
    hasher.update(data);
    return to_hex(hasher.finalize());
}

std::string sha256_prefixed(std::string_view data) {
    return "sha256:" + sha256(data);
}

std::string short_digest(std::initializer_list<std::string_view> fields) {
    Sha256Hasher hasher;
    bool first = true;
    for (auto field : fields) {
        if (!first) {
            hasher.update(std::string_view("\x1f", 1));
        }
        first = false;
        hasher.update(field);
    }
    return to_hex(hasher.finalize()).substr(0, kStableDigestLength);
}

std::string make_stable_id(std::string_view prefix, std::initializer_list<std::string_view> fields) {
    return std::string(prefix) + short_digest(fields);
}

}  // namespace ossensor::common
