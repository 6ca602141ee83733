#include "index_registry.hpp"
#include "sqlite_index.hpp"
#include "semsearch/error.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace semsearch::engine {

    namespace {

        std::string utc_timestamp() {
            std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm{};
            gmtime_r(&now, &tm);
            std::ostringstream out;
            out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
            return out.str();
        }

        Error not_found(const std::string& index_id) {
            return Error(ErrorKind::IndexNotFound,
                         "index '" + index_id + "' has not been built; build it first");
        }

    }

    RegistryOptions RegistryOptions::from_config(const Config& config) {
        RegistryOptions options;
        options.chunker.chunk_size = config.chunk_size;
        options.chunker.overlap = config.chunk_overlap;
        options.index.store_dir = config.store_dir;
        options.index.hnsw_m = config.hnsw_m;
        options.index.hnsw_ef_construction = config.hnsw_ef_construction;
        options.index.hnsw_ef_search = config.hnsw_ef_search;
        options.embed_batch_size = config.embed_batch_size;

        auto runtime = parse_runtime(config.embedding_runtime);
        if (!runtime) {
            throw Error(ErrorKind::InvalidConfiguration,
                        "unknown embedding runtime '" + config.embedding_runtime + "' (supported: hashing, onnx, ollama)");
        }
        options.runtime = *runtime;
        return options;
    }

    IndexRegistry::IndexRegistry(RegistryOptions options, const DocumentSource& documents, ModelCache& models)
        : m_options(std::move(options)), m_documents(documents), m_models(models) {}

    size_t IndexRegistry::scan() {
        std::lock_guard<std::mutex> build_lock(m_build_mutex);
        const fs::path& store = m_options.index.store_dir;

        size_t found = 0;
        try {
            if (!fs::exists(store)) {
                fs::create_directories(store);
                return 0;
            }
            recover_store(store);

            for (const auto& entry : fs::directory_iterator(store)) {
                if (!entry.is_directory()) continue;
                try {
                    auto info = read_persisted_info(entry.path());
                    if (!info) continue;
                    if (info->id != entry.path().filename().string()) {
                        std::cerr << "[Registry] Skipping " << entry.path() << ": metadata names '" << info->id << "'\n";
                        continue;
                    }

                    std::unique_lock<std::shared_mutex> lock(m_mutex);
                    auto& slot = m_slots[info->id];
                    if (!slot) slot = std::make_shared<Slot>();
                    slot->info = *info;
                    found++;
                } catch (const Error& e) {
                    std::cerr << "[Registry] Skipping unreadable index " << entry.path() << ": " << e.what() << "\n";
                }
            }
        } catch (const fs::filesystem_error& e) {
            throw Error(ErrorKind::BackendIOError, std::string("cannot scan index store: ") + e.what());
        }

        std::cout << "[Registry] Found " << found << " persisted index(es) in " << store << "\n";
        return found;
    }

    std::vector<IndexInfo> IndexRegistry::list() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        std::vector<IndexInfo> infos;
        infos.reserve(m_slots.size());
        for (const auto& [id, slot] : m_slots) {
            infos.push_back(slot->info);
        }
        return infos;
    }

    std::shared_ptr<const VectorIndex> IndexRegistry::resolve(const std::string& index_id) {
        const std::string id = canonical_index_id(index_id);
        auto slot = find_slot(id);
        if (!slot) throw not_found(index_id);

        if (auto live = std::atomic_load(&slot->live)) return live;

        std::lock_guard<std::mutex> load_lock(slot->load_mutex);
        if (auto live = std::atomic_load(&slot->live)) return live;

        IndexInfo info;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            info = slot->info;
        }

        auto index = create_vector_index(require_backend(info.backend_id), info, m_options.index);
        if (!index->load()) {
            throw Error(ErrorKind::IndexNotFound,
                        "persisted state of index '" + id + "' is missing; rebuild it");
        }
        m_loads++;
        std::cout << "[Registry] Loaded " << id << " (" << index->size() << " chunks)\n";

        std::shared_ptr<const VectorIndex> live = std::move(index);
        std::atomic_store(&slot->live, live);
        return live;
    }

    BuildReport IndexRegistry::build(const std::string& model_id, const std::string& backend_id) {
        const auto started = std::chrono::steady_clock::now();

        // Fail fast, before any document or embedding work.
        const EmbeddingModel model = require_model(model_id);
        const IndexBackend backend = require_backend(backend_id);
        const Chunker chunker(m_options.chunker);
        const std::string id = make_index_id(backend, model);

        std::lock_guard<std::mutex> build_lock(m_build_mutex);

        std::vector<Document> documents;
        try {
            documents = m_documents.list_documents();
        } catch (const fs::filesystem_error& e) {
            throw Error(ErrorKind::BackendIOError, std::string("cannot read documents: ") + e.what());
        }
        if (documents.empty()) {
            throw Error(ErrorKind::EmptyInput, "no documents to index; upload documents first");
        }

        std::vector<Chunk> chunks;
        for (const auto& doc : documents) {
            auto doc_chunks = chunker.split(doc);
            chunks.insert(chunks.end(), std::make_move_iterator(doc_chunks.begin()), std::make_move_iterator(doc_chunks.end()));
        }
        if (chunks.empty()) {
            throw Error(ErrorKind::EmptyInput, "documents contain no text to index");
        }
        std::cout << "[Registry] Building " << id << ": " << documents.size() << " documents, " << chunks.size() << " chunks\n";

        auto embedder = m_models.get(model, m_options.runtime);
        auto vectors = embed_chunks(*embedder, chunks);

        IndexInfo info;
        info.id = id;
        info.model_id = model_spec(model).id;
        info.runtime = to_string(m_options.runtime);
        info.backend_id = to_string(backend);
        info.document_count = documents.size();
        info.created_at = utc_timestamp();
        info.corpus_digest = corpus_digest(documents);

        auto index = create_vector_index(backend, info, m_options.index);
        index->build(std::move(chunks), std::move(vectors));

        // Hold the existing slot's load lock so no first-load reads the store mid-swap.
        auto existing = find_slot(id);
        std::unique_lock<std::mutex> load_lock;
        if (existing) load_lock = std::unique_lock<std::mutex>(existing->load_mutex);

        if (index->persistent()) {
            index->persist();
        }

        BuildReport report;
        report.index_id = id;
        report.documents_processed = documents.size();
        report.chunks_created = index->size();
        report.dimension = index->dimension();

        std::shared_ptr<const VectorIndex> live = std::move(index);
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            auto& slot = m_slots[id];
            if (!slot) slot = std::make_shared<Slot>();
            std::atomic_store(&slot->live, live);
            slot->info = live->info();
        }

        report.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        std::cout << "[Registry] Built " << id << " in " << std::fixed << std::setprecision(2) << report.elapsed_seconds << "s\n";
        return report;
    }

    void IndexRegistry::remove(const std::string& index_id) {
        const std::string id = canonical_index_id(index_id);
        std::lock_guard<std::mutex> build_lock(m_build_mutex);

        auto slot = find_slot(id);
        if (!slot) throw not_found(index_id);

        std::string backend_id;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            backend_id = slot->info.backend_id;
        }
        auto backend = parse_backend(backend_id);
        if (backend && is_persistent(*backend)) {
            try {
                remove_persisted(m_options.index.store_dir, id);
            } catch (const fs::filesystem_error& e) {
                throw Error(ErrorKind::BackendIOError, std::string("cannot delete index files: ") + e.what());
            }
        }

        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_slots.erase(id);
        std::cout << "[Registry] Removed " << id << "\n";
    }

    std::shared_ptr<IndexRegistry::Slot> IndexRegistry::find_slot(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_slots.find(id);
        return it != m_slots.end() ? it->second : nullptr;
    }

    std::vector<std::vector<float>> IndexRegistry::embed_chunks(Embedder& embedder, const std::vector<Chunk>& chunks) const {
        std::vector<std::vector<float>> vectors;
        vectors.reserve(chunks.size());

        const size_t batch = std::max<size_t>(1, m_options.embed_batch_size);
        std::vector<std::string> texts;
        for (size_t begin = 0; begin < chunks.size(); begin += batch) {
            const size_t end = std::min(chunks.size(), begin + batch);
            texts.clear();
            for (size_t i = begin; i < end; ++i) texts.push_back(chunks[i].content);

            auto embedded = embedder.embed_many(texts);
            if (embedded.size() != texts.size()) {
                throw Error(ErrorKind::EmbeddingFailed,
                            "embedder returned " + std::to_string(embedded.size()) + " vectors for " + std::to_string(texts.size()) + " chunks");
            }
            for (auto& v : embedded) vectors.push_back(std::move(v));
        }
        return vectors;
    }

    std::string canonical_index_id(const std::string& index_id) {
        auto sep = index_id.find('_');
        if (sep == std::string::npos) return index_id;

        auto backend = parse_backend(index_id.substr(0, sep));
        auto model = parse_model(index_id.substr(sep + 1));
        if (!backend || !model) return index_id;
        return make_index_id(*backend, *model);
    }

    bool is_stale(const IndexInfo& info, const std::vector<Document>& documents) {
        return info.corpus_digest != corpus_digest(documents);
    }

}
