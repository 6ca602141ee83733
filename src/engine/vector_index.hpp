#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "semsearch/types.hpp"
#include "embedder.hpp"

namespace semsearch::engine {

    enum class IndexBackend {
        Memory, // exact scan, never persisted
        Sqlite, // exact scan, persisted in SQLite
        Hnsw    // hnswlib candidates + exact re-scoring, persisted
    };

    /**
     * @brief Case-insensitive; also accepts "faiss" (hnsw) and "chroma" (sqlite).
     */
    std::optional<IndexBackend> parse_backend(const std::string& name);

    /**
     * @throws Error(InvalidConfiguration) for unknown backend names.
     */
    IndexBackend require_backend(const std::string& name);

    const char* to_string(IndexBackend backend);
    bool is_persistent(IndexBackend backend);

    /**
     * @brief Index identifier: "<backend>_<model short name>".
     */
    std::string make_index_id(IndexBackend backend, EmbeddingModel model);

    struct Neighbor {
        Chunk chunk;
        float score = 0.0f;   // cosine similarity in [-1, 1]
        size_t position = 0;  // insertion order
    };

    struct IndexOptions {
        std::filesystem::path store_dir;
        size_t hnsw_m = 16;
        size_t hnsw_ef_construction = 200;
        size_t hnsw_ef_search = 64;
    };

    /**
     * @brief Abstract nearest-neighbour index over one model's embeddings.
     *
     * Instances are mutated only by build() and load(); after that, search() is
     * const and may be called from any number of threads.
     */
    class VectorIndex {
    public:
        virtual ~VectorIndex() = default;

        /**
         * @brief Bulk-loads the index, replacing prior content.
         * @throws Error(EmptyInput) if chunks is empty.
         * @throws Error(DimensionMismatch) if vectors are ragged or do not match chunks.
         */
        virtual void build(std::vector<Chunk> chunks, std::vector<std::vector<float>> vectors) = 0;

        /**
         * @brief Returns up to k neighbours by descending similarity, ties in insertion order.
         * @throws Error(DimensionMismatch) if the query length differs from dimension().
         */
        virtual std::vector<Neighbor> search(const std::vector<float>& query, size_t k) const = 0;

        virtual bool persistent() const = 0;

        /**
         * @brief Durably writes the index under its identifier. No-op for in-memory indices.
         */
        virtual void persist() = 0;

        /**
         * @brief Restores state written by persist().
         * @return false if nothing was persisted under this identifier.
         */
        virtual bool load() = 0;

        virtual size_t size() const = 0;
        virtual size_t dimension() const = 0;
        virtual IndexBackend backend() const = 0;

        const IndexInfo& info() const { return m_info; }

    protected:
        explicit VectorIndex(IndexInfo info) : m_info(std::move(info)) {}

        IndexInfo m_info;
    };

    std::unique_ptr<VectorIndex> create_vector_index(IndexBackend backend, IndexInfo info, const IndexOptions& options);

    /**
     * @brief Scales v to unit length in place; zero vectors are left as they are.
     */
    void normalize(std::vector<float>& v);
    float dot(const float* a, const float* b, size_t dim);

    /**
     * @brief Row-major table of unit-length vectors with their chunks.
     */
    class FlatTable {
    public:
        void assign(std::vector<Chunk> chunks, std::vector<std::vector<float>> vectors);
        void append(Chunk chunk, const float* normalized, size_t dim);
        void clear();

        /**
         * @brief Checks the query's dimension and returns its normalized copy.
         */
        std::vector<float> prepare_query(const std::vector<float>& query, const std::string& index_id) const;

        std::vector<Neighbor> scan(const std::vector<float>& normalized_query, size_t k) const;
        Neighbor neighbor(size_t position, float score) const;

        const float* row(size_t position) const { return m_data.data() + position * m_dim; }
        const Chunk& chunk(size_t position) const { return m_chunks[position]; }
        size_t size() const { return m_chunks.size(); }
        size_t dimension() const { return m_dim; }

    private:
        std::vector<Chunk> m_chunks;
        std::vector<float> m_data;
        size_t m_dim = 0;
    };

    /**
     * @brief Sorts by descending score, then ascending position, and keeps k.
     */
    void rank_neighbors(std::vector<Neighbor>& neighbors, size_t k);

}
