#include "vector_index.hpp"
#include "sqlite_index.hpp"
#include "hnsw_index.hpp"
#include "semsearch/error.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace semsearch::engine {

    namespace {

        Error dimension_error(const std::string& message) {
            std::cerr << "[VectorIndex] " << message << "\n";
            return Error(ErrorKind::DimensionMismatch, message);
        }

        class MemoryIndex : public VectorIndex {
        public:
            explicit MemoryIndex(IndexInfo info) : VectorIndex(std::move(info)) {
                m_info.backend_id = to_string(IndexBackend::Memory);
            }

            void build(std::vector<Chunk> chunks, std::vector<std::vector<float>> vectors) override {
                m_table.assign(std::move(chunks), std::move(vectors));
                m_info.dimension = m_table.dimension();
                m_info.chunk_count = m_table.size();
            }

            std::vector<Neighbor> search(const std::vector<float>& query, size_t k) const override {
                auto q = m_table.prepare_query(query, m_info.id);
                return m_table.scan(q, k);
            }

            bool persistent() const override { return false; }
            void persist() override {}
            bool load() override { return false; }

            size_t size() const override { return m_table.size(); }
            size_t dimension() const override { return m_table.dimension(); }
            IndexBackend backend() const override { return IndexBackend::Memory; }

        private:
            FlatTable m_table;
        };

    }

    std::optional<IndexBackend> parse_backend(const std::string& name) {
        std::string wanted = name;
        std::transform(wanted.begin(), wanted.end(), wanted.begin(),
            [](unsigned char c) { return std::tolower(c); });
        if (wanted == "memory" || wanted == "exact") return IndexBackend::Memory;
        if (wanted == "sqlite" || wanted == "chroma") return IndexBackend::Sqlite;
        if (wanted == "hnsw" || wanted == "faiss") return IndexBackend::Hnsw;
        return std::nullopt;
    }

    IndexBackend require_backend(const std::string& name) {
        auto backend = parse_backend(name);
        if (!backend) {
            throw Error(ErrorKind::InvalidConfiguration, "unknown index backend '" + name + "' (supported: memory, sqlite, hnsw)");
        }
        return *backend;
    }

    const char* to_string(IndexBackend backend) {
        switch (backend) {
            case IndexBackend::Memory: return "memory";
            case IndexBackend::Sqlite: return "sqlite";
            case IndexBackend::Hnsw: return "hnsw";
        }
        return "unknown";
    }

    bool is_persistent(IndexBackend backend) {
        return backend != IndexBackend::Memory;
    }

    std::string make_index_id(IndexBackend backend, EmbeddingModel model) {
        return std::string(to_string(backend)) + "_" + model_spec(model).short_name;
    }

    std::unique_ptr<VectorIndex> create_vector_index(IndexBackend backend, IndexInfo info, const IndexOptions& options) {
        switch (backend) {
            case IndexBackend::Memory:
                return std::make_unique<MemoryIndex>(std::move(info));
            case IndexBackend::Sqlite:
                return std::make_unique<SqliteIndex>(std::move(info), options);
            case IndexBackend::Hnsw:
                return std::make_unique<HnswIndex>(std::move(info), options);
        }
        throw Error(ErrorKind::InvalidConfiguration, "unsupported index backend");
    }

    void normalize(std::vector<float>& v) {
        double norm = 0.0;
        for (float x : v) norm += double(x) * double(x);
        if (norm <= 0.0) return;
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (float& x : v) x *= inv;
    }

    float dot(const float* a, const float* b, size_t dim) {
        float sum = 0.0f;
        for (size_t i = 0; i < dim; ++i) sum += a[i] * b[i];
        return sum;
    }

    void FlatTable::assign(std::vector<Chunk> chunks, std::vector<std::vector<float>> vectors) {
        if (chunks.empty()) {
            throw Error(ErrorKind::EmptyInput, "cannot build an index from zero chunks");
        }
        if (vectors.size() != chunks.size()) {
            throw dimension_error("got " + std::to_string(vectors.size()) + " vectors for " + std::to_string(chunks.size()) + " chunks");
        }
        const size_t dim = vectors.front().size();
        if (dim == 0) {
            throw dimension_error("vectors must not be empty");
        }

        std::vector<float> data;
        data.reserve(dim * vectors.size());
        for (size_t i = 0; i < vectors.size(); ++i) {
            auto& v = vectors[i];
            if (v.size() != dim) {
                throw dimension_error("vector " + std::to_string(i) + " has " + std::to_string(v.size()) + " dimensions, expected " + std::to_string(dim));
            }
            normalize(v);
            data.insert(data.end(), v.begin(), v.end());
        }

        m_chunks = std::move(chunks);
        m_data = std::move(data);
        m_dim = dim;
    }

    void FlatTable::append(Chunk chunk, const float* normalized, size_t dim) {
        if (m_chunks.empty()) {
            m_dim = dim;
        } else if (dim != m_dim) {
            throw dimension_error("stored vector has " + std::to_string(dim) + " dimensions, expected " + std::to_string(m_dim));
        }
        m_chunks.push_back(std::move(chunk));
        m_data.insert(m_data.end(), normalized, normalized + dim);
    }

    void FlatTable::clear() {
        m_chunks.clear();
        m_data.clear();
        m_dim = 0;
    }

    std::vector<float> FlatTable::prepare_query(const std::vector<float>& query, const std::string& index_id) const {
        if (query.size() != m_dim) {
            throw dimension_error("query has " + std::to_string(query.size()) + " dimensions but index '" + index_id +
                                  "' stores " + std::to_string(m_dim));
        }
        std::vector<float> q = query;
        normalize(q);
        return q;
    }

    std::vector<Neighbor> FlatTable::scan(const std::vector<float>& normalized_query, size_t k) const {
        std::vector<std::pair<float, size_t>> scored;
        scored.reserve(m_chunks.size());
        for (size_t i = 0; i < m_chunks.size(); ++i) {
            scored.emplace_back(dot(normalized_query.data(), row(i), m_dim), i);
        }

        k = std::min(k, scored.size());
        std::partial_sort(scored.begin(), scored.begin() + k, scored.end(),
            [](const auto& a, const auto& b) {
                if (a.first != b.first) return a.first > b.first;
                return a.second < b.second;
            });

        std::vector<Neighbor> results;
        results.reserve(k);
        for (size_t i = 0; i < k; ++i) {
            results.push_back(neighbor(scored[i].second, scored[i].first));
        }
        return results;
    }

    Neighbor FlatTable::neighbor(size_t position, float score) const {
        Neighbor n;
        n.chunk = m_chunks[position];
        n.score = std::max(-1.0f, std::min(1.0f, score));
        n.position = position;
        return n;
    }

    void rank_neighbors(std::vector<Neighbor>& neighbors, size_t k) {
        std::stable_sort(neighbors.begin(), neighbors.end(),
            [](const Neighbor& a, const Neighbor& b) {
                if (a.score != b.score) return a.score > b.score;
                return a.position < b.position;
            });
        if (neighbors.size() > k) neighbors.resize(k);
    }

}
