#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include "embedder.hpp"

namespace semsearch::engine {

    /**
     * @brief Process-lifetime cache of loaded embedders, one per (model, runtime).
     *
     * The first caller for a key loads it; concurrent callers for the same key
     * block until that load finishes and share the instance. A failed load is
     * not cached.
     */
    class ModelCache {
    public:
        using Factory = std::function<std::unique_ptr<Embedder>(EmbeddingModel, EmbeddingRuntime)>;

        explicit ModelCache(RuntimeOptions options);
        explicit ModelCache(Factory factory);

        std::shared_ptr<Embedder> get(EmbeddingModel model, EmbeddingRuntime runtime);

        /**
         * @brief Number of loads performed so far.
         */
        size_t loads() const { return m_loads.load(); }

    private:
        struct Slot {
            std::mutex load_mutex;
            std::shared_ptr<Embedder> embedder;
        };

        Factory m_factory;
        std::mutex m_mutex;
        std::map<std::pair<EmbeddingModel, EmbeddingRuntime>, std::shared_ptr<Slot>> m_slots;
        std::atomic<size_t> m_loads{0};
    };

}
