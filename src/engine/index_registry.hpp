#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include "semsearch/types.hpp"
#include "chunker.hpp"
#include "config.hpp"
#include "document_store.hpp"
#include "model_cache.hpp"
#include "vector_index.hpp"

namespace semsearch::engine {

    struct RegistryOptions {
        ChunkerOptions chunker;
        IndexOptions index;
        EmbeddingRuntime runtime = EmbeddingRuntime::Hashing;
        size_t embed_batch_size = 32;

        /**
         * @throws Error(InvalidConfiguration) for an unknown embedding runtime.
         */
        static RegistryOptions from_config(const Config& config);
    };

    /**
     * @brief Catalog of materialized indices and cache of their live instances.
     *
     * Live instances are immutable and handed out as shared pointers; a rebuild
     * swaps in a new instance while searches holding the old one finish on it.
     */
    class IndexRegistry {
    public:
        IndexRegistry(RegistryOptions options, const DocumentSource& documents, ModelCache& models);

        /**
         * @brief Registers every index persisted in the store directory.
         * Instances are loaded lazily by resolve().
         * @return Number of indices found.
         */
        size_t scan();

        std::vector<IndexInfo> list() const;

        /**
         * @brief Returns the live index, loading persisted state on first use.
         * Concurrent first calls for one id share a single load.
         * @throws Error(IndexNotFound) if the index was never built.
         */
        std::shared_ptr<const VectorIndex> resolve(const std::string& index_id);

        /**
         * @brief Chunks and embeds every current document and replaces the index
         * for (model, backend). On failure the previous index stays in service.
         */
        BuildReport build(const std::string& model_id, const std::string& backend_id);

        /**
         * @throws Error(IndexNotFound) if the index is unknown.
         */
        void remove(const std::string& index_id);

        /**
         * @brief Number of instances loaded from persisted state so far.
         */
        size_t loads() const { return m_loads.load(); }

        const RegistryOptions& options() const { return m_options; }

    private:
        struct Slot {
            std::mutex load_mutex;
            std::shared_ptr<const VectorIndex> live;
            IndexInfo info; // guarded by m_mutex
        };

        RegistryOptions m_options;
        const DocumentSource& m_documents;
        ModelCache& m_models;

        mutable std::shared_mutex m_mutex;
        std::map<std::string, std::shared_ptr<Slot>> m_slots;
        std::mutex m_build_mutex;
        std::atomic<size_t> m_loads{0};

        std::shared_ptr<Slot> find_slot(const std::string& id) const;
        std::vector<std::vector<float>> embed_chunks(Embedder& embedder, const std::vector<Chunk>& chunks) const;
    };

    /**
     * @brief Maps aliases such as "FAISS_all-MiniLM-L6-v2" to the canonical id.
     * Ids that do not parse are returned unchanged.
     */
    std::string canonical_index_id(const std::string& index_id);

    /**
     * @brief True if the documents differ from those the index was built from.
     */
    bool is_stale(const IndexInfo& info, const std::vector<Document>& documents);

}
