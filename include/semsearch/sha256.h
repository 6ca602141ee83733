#ifndef SEMSEARCH_SHA256_H
#define SEMSEARCH_SHA256_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace semsearch::crypto {

    /**
     * @brief Incremental SHA-256 used to fingerprint documents and corpora.
     */
    class Sha256 {
    public:
        Sha256() { reset(); }

        void update(const void* data, std::size_t len);
        void update(const std::string& text) { update(text.data(), text.size()); }

        /**
         * @brief Finishes the digest and returns it as lowercase hex.
         * The object is reset afterwards and can be reused.
         */
        std::string hex_digest();

        static std::string hash(const std::string& text) {
            Sha256 sha;
            sha.update(text);
            return sha.hex_digest();
        }

    private:
        std::uint32_t m_state[8];
        std::uint8_t m_block[64];
        std::size_t m_fill;
        std::uint64_t m_total_bits;

        void reset();
        void compress();
    };

}
#endif
