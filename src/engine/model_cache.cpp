#include "model_cache.hpp"
#include <iostream>

namespace semsearch::engine {

    ModelCache::ModelCache(RuntimeOptions options)
        : m_factory([options](EmbeddingModel model, EmbeddingRuntime runtime) {
              return create_embedder(model, runtime, options);
          }) {}

    ModelCache::ModelCache(Factory factory) : m_factory(std::move(factory)) {}

    std::shared_ptr<Embedder> ModelCache::get(EmbeddingModel model, EmbeddingRuntime runtime) {
        std::shared_ptr<Slot> slot;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto& entry = m_slots[{model, runtime}];
            if (!entry) entry = std::make_shared<Slot>();
            slot = entry;
        }

        auto ready = std::atomic_load(&slot->embedder);
        if (ready) return ready;

        std::lock_guard<std::mutex> load_lock(slot->load_mutex);
        ready = std::atomic_load(&slot->embedder);
        if (ready) return ready;

        std::cout << "[ModelCache] Loading " << model_spec(model).short_name << " (" << to_string(runtime) << ")\n";
        std::shared_ptr<Embedder> loaded = m_factory(model, runtime);
        m_loads++;
        std::atomic_store(&slot->embedder, loaded);
        return loaded;
    }

}
