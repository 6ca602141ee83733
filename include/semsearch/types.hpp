#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace semsearch::engine {

    struct Document {
        std::string id;        // filename
        std::string text;
        std::uintmax_t size = 0;
        std::string hash;      // sha256 of text, hex
    };

    struct Chunk {
        std::size_t index = 0;  // position within the source document
        std::string content;
        std::string source;
        std::size_t start_offset = 0;
        std::size_t end_offset = 0;
    };

    struct SearchResult {
        std::size_t rank = 0;   // 1-based
        std::string content;
        std::string source_document;
        float similarity_score = 0.0f;
        std::size_t chunk_index = 0;
    };

    struct IndexInfo {
        std::string id;
        std::string model_id;
        std::string runtime;
        std::string backend_id;
        std::size_t dimension = 0;
        std::size_t chunk_count = 0;
        std::size_t document_count = 0;
        std::string created_at;
        std::string corpus_digest;
    };

    struct BuildReport {
        std::string index_id;
        std::size_t documents_processed = 0;
        std::size_t chunks_created = 0;
        std::size_t dimension = 0;
        double elapsed_seconds = 0.0;
    };

}
