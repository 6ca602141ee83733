#pragma once

#include <string>
#include <vector>
#include "semsearch/types.hpp"

namespace semsearch::engine {

    struct ChunkerOptions {
        size_t chunk_size = 500; // bytes
        size_t overlap = 50;
    };

    /**
     * @brief Splits document text into overlapping, gap-free chunks.
     *
     * Boundaries prefer paragraph, line, sentence and word breaks, in that order,
     * and fall back to a hard cut at chunk_size.
     */
    class Chunker {
    public:
        /**
         * @throws Error(InvalidConfiguration) if chunk_size is zero or overlap >= chunk_size.
         */
        explicit Chunker(ChunkerOptions options = {});

        std::vector<Chunk> split(const Document& document) const;
        std::vector<Chunk> split(const std::string& text, const std::string& source) const;

        const ChunkerOptions& options() const { return m_options; }

    private:
        ChunkerOptions m_options;

        size_t find_end(const std::string& text, size_t start) const;
        size_t next_start(const std::string& text, size_t start, size_t end) const;
    };

}
