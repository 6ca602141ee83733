#pragma once

#include <memory>
#include "sqlite_index.hpp"

namespace semsearch::engine {

    /**
     * @brief Approximate index: an HNSW graph over the normalized vectors
     * proposes candidates, which are then re-scored exactly.
     *
     * Chunks and vectors persist through the SQLite layout; the graph is saved
     * next to them as graph.hnsw and rebuilt from the vectors if unreadable.
     */
    class HnswIndex : public SqliteIndex {
    public:
        HnswIndex(IndexInfo info, IndexOptions options);
        ~HnswIndex() override;

        void build(std::vector<Chunk> chunks, std::vector<std::vector<float>> vectors) override;
        std::vector<Neighbor> search(const std::vector<float>& query, size_t k) const override;

        IndexBackend backend() const override { return IndexBackend::Hnsw; }

    protected:
        void write_extra(const std::filesystem::path& dir) override;
        void load_extra(const std::filesystem::path& dir) override;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;

        void build_graph();
    };

}
