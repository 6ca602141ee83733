#include "hnsw_index.hpp"
#include "semsearch/error.hpp"
#include <hnswlib/hnswlib.h>
#include <algorithm>
#include <iostream>

namespace semsearch::engine {

    namespace {
        const char* const kGraphFile = "graph.hnsw";
        constexpr size_t kRandomSeed = 100;
    }

    struct HnswIndex::Impl {
        hnswlib::InnerProductSpace space;
        std::unique_ptr<hnswlib::HierarchicalNSW<float>> graph;

        explicit Impl(size_t dim) : space(dim) {}
    };

    HnswIndex::HnswIndex(IndexInfo info, IndexOptions options)
        : SqliteIndex(std::move(info), std::move(options)) {
        m_info.backend_id = to_string(IndexBackend::Hnsw);
    }

    HnswIndex::~HnswIndex() = default;

    void HnswIndex::build(std::vector<Chunk> chunks, std::vector<std::vector<float>> vectors) {
        SqliteIndex::build(std::move(chunks), std::move(vectors));
        build_graph();
    }

    std::vector<Neighbor> HnswIndex::search(const std::vector<float>& query, size_t k) const {
        auto q = m_table.prepare_query(query, m_info.id);
        if (k == 0) return {};
        if (!m_impl) return m_table.scan(q, k);

        size_t candidates = std::min(m_table.size(), std::max(k, m_options.hnsw_ef_search));
        std::vector<Neighbor> results;
        try {
            auto pq = m_impl->graph->searchKnn(q.data(), candidates);
            results.reserve(pq.size());
            while (!pq.empty()) {
                size_t position = static_cast<size_t>(pq.top().second);
                pq.pop();
                results.push_back(m_table.neighbor(position, dot(q.data(), m_table.row(position), m_table.dimension())));
            }
        } catch (const std::exception& e) {
            std::cerr << "[HnswIndex] Search error, falling back to exact scan: " << e.what() << "\n";
            return m_table.scan(q, k);
        }

        rank_neighbors(results, k);
        return results;
    }

    void HnswIndex::write_extra(const std::filesystem::path& dir) {
        try {
            m_impl->graph->saveIndex((dir / kGraphFile).string());
        } catch (const std::exception& e) {
            throw Error(ErrorKind::BackendIOError, std::string("failed to save HNSW graph: ") + e.what());
        }
    }

    void HnswIndex::load_extra(const std::filesystem::path& dir) {
        const auto path = dir / kGraphFile;
        if (std::filesystem::exists(path)) {
            try {
                auto impl = std::make_unique<Impl>(m_table.dimension());
                impl->graph = std::make_unique<hnswlib::HierarchicalNSW<float>>(&impl->space, path.string(), false, m_table.size());
                if (impl->graph->cur_element_count == m_table.size()) {
                    impl->graph->setEf(m_options.hnsw_ef_search);
                    m_impl = std::move(impl);
                    return;
                }
                std::cerr << "[HnswIndex] Graph of " << m_info.id << " does not match stored vectors.\n";
            } catch (const std::exception& e) {
                std::cerr << "[HnswIndex] Load error: " << e.what() << "\n";
            }
        }
        std::cout << "[HnswIndex] Rebuilding graph for " << m_info.id << " from stored vectors.\n";
        build_graph();
    }

    void HnswIndex::build_graph() {
        auto impl = std::make_unique<Impl>(m_table.dimension());
        try {
            impl->graph = std::make_unique<hnswlib::HierarchicalNSW<float>>(
                &impl->space, m_table.size(), m_options.hnsw_m, m_options.hnsw_ef_construction, kRandomSeed);
            for (size_t i = 0; i < m_table.size(); ++i) {
                impl->graph->addPoint(m_table.row(i), static_cast<hnswlib::labeltype>(i));
            }
            impl->graph->setEf(m_options.hnsw_ef_search);
        } catch (const std::exception& e) {
            throw Error(ErrorKind::BackendIOError, std::string("HNSW graph construction failed: ") + e.what());
        }
        m_impl = std::move(impl);
    }

}
