#include "semsearch/sha256.h"
#include <algorithm>
#include <cstring>

namespace semsearch::crypto {

    namespace {

        constexpr std::uint32_t kRound[64] = {
            0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
            0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
            0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
            0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
            0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
            0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
            0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
            0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
        };

        inline std::uint32_t rotr(std::uint32_t x, unsigned n) { return (x >> n) | (x << (32 - n)); }

    }

    void Sha256::reset() {
        static constexpr std::uint32_t initial[8] = {
            0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
            0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
        };
        std::memcpy(m_state, initial, sizeof(m_state));
        std::memset(m_block, 0, sizeof(m_block));
        m_fill = 0;
        m_total_bits = 0;
    }

    void Sha256::update(const void* data, std::size_t len) {
        const auto* bytes = static_cast<const std::uint8_t*>(data);
        m_total_bits += static_cast<std::uint64_t>(len) * 8;
        while (len > 0) {
            std::size_t take = std::min(len, sizeof(m_block) - m_fill);
            std::memcpy(m_block + m_fill, bytes, take);
            m_fill += take;
            bytes += take;
            len -= take;
            if (m_fill == sizeof(m_block)) {
                compress();
                m_fill = 0;
            }
        }
    }

    std::string Sha256::hex_digest() {
        std::uint64_t bits = m_total_bits;

        m_block[m_fill++] = 0x80;
        if (m_fill > 56) {
            std::memset(m_block + m_fill, 0, sizeof(m_block) - m_fill);
            compress();
            m_fill = 0;
        }
        std::memset(m_block + m_fill, 0, 56 - m_fill);
        for (int i = 0; i < 8; ++i) {
            m_block[63 - i] = static_cast<std::uint8_t>(bits >> (8 * i));
        }
        compress();

        static const char* digits = "0123456789abcdef";
        std::string out;
        out.reserve(64);
        for (std::uint32_t word : m_state) {
            for (int shift = 28; shift >= 0; shift -= 4) {
                out.push_back(digits[(word >> shift) & 0xf]);
            }
        }
        reset();
        return out;
    }

    void Sha256::compress() {
        std::uint32_t w[64];
        for (int i = 0; i < 16; ++i) {
            w[i] = (std::uint32_t(m_block[i * 4]) << 24) | (std::uint32_t(m_block[i * 4 + 1]) << 16) |
                   (std::uint32_t(m_block[i * 4 + 2]) << 8) | std::uint32_t(m_block[i * 4 + 3]);
        }
        for (int i = 16; i < 64; ++i) {
            std::uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
            std::uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
            w[i] = w[i - 16] + s0 + w[i - 7] + s1;
        }

        std::uint32_t v[8];
        std::memcpy(v, m_state, sizeof(v));

        for (int i = 0; i < 64; ++i) {
            std::uint32_t e = v[4];
            std::uint32_t a = v[0];
            std::uint32_t t1 = v[7] + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25)) + ((e & v[5]) ^ (~e & v[6])) + kRound[i] + w[i];
            std::uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22)) + ((a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]));
            v[7] = v[6];
            v[6] = v[5];
            v[5] = v[4];
            v[4] = v[3] + t1;
            v[3] = v[2];
            v[2] = v[1];
            v[1] = v[0];
            v[0] = t1 + t2;
        }

        for (int i = 0; i < 8; ++i) m_state[i] += v[i];
    }

}
