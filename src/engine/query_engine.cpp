#include "query_engine.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace semsearch::engine {

    namespace {

        void check_top_k(int top_k) {
            if (top_k < 1) {
                throw Error(ErrorKind::InvalidTopK, "top_k must be at least 1, got " + std::to_string(top_k));
            }
        }

        void check_deadline(const QueryOptions& options) {
            if (options.deadline && std::chrono::steady_clock::now() > *options.deadline) {
                throw Error(ErrorKind::Timeout, "query deadline exceeded");
            }
        }

        Error empty_query() {
            return Error(ErrorKind::EmptyQuery, "query text is empty");
        }

    }

    bool is_blank(const std::string& text) {
        return std::all_of(text.begin(), text.end(),
            [](unsigned char c) { return std::isspace(c); });
    }

    QueryEngine::QueryEngine(IndexRegistry& registry, ModelCache& models)
        : m_registry(registry), m_models(models) {}

    std::vector<SearchResult> QueryEngine::query(const std::string& text, const std::string& index_id,
                                                 int top_k, const QueryOptions& options) {
        if (is_blank(text)) throw empty_query();
        check_top_k(top_k);
        check_deadline(options);

        auto index = m_registry.resolve(index_id);
        auto embedder = embedder_for(*index);
        auto neighbors = index->search(embedder->embed(text), static_cast<size_t>(top_k));

        check_deadline(options);
        return to_results(neighbors);
    }

    std::vector<QueryOutcome> QueryEngine::batch_query(const std::vector<std::string>& texts, const std::string& index_id,
                                                       int top_k, const QueryOptions& options) {
        check_top_k(top_k);
        check_deadline(options);

        auto index = m_registry.resolve(index_id);

        std::vector<QueryOutcome> outcomes(texts.size());
        std::vector<size_t> pending;
        for (size_t i = 0; i < texts.size(); ++i) {
            if (is_blank(texts[i])) {
                outcomes[i].error = ErrorKind::EmptyQuery;
                outcomes[i].message = empty_query().what();
            } else {
                pending.push_back(i);
            }
        }
        if (pending.empty()) return outcomes;

        auto embedder = embedder_for(*index);

        std::vector<std::string> batch;
        batch.reserve(pending.size());
        for (size_t i : pending) batch.push_back(texts[i]);

        std::vector<std::vector<float>> vectors;
        try {
            vectors = embedder->embed_many(batch);
        } catch (const Error& e) {
            std::cerr << "[QueryEngine] Batch embedding failed, embedding " << batch.size() << " texts one by one: " << e.what() << "\n";
        }
        const bool batched = vectors.size() == batch.size();

        for (size_t n = 0; n < pending.size(); ++n) {
            QueryOutcome& outcome = outcomes[pending[n]];
            try {
                std::vector<float> vector = batched ? std::move(vectors[n]) : embedder->embed(batch[n]);
                outcome.results = to_results(index->search(vector, static_cast<size_t>(top_k)));
            } catch (const Error& e) {
                outcome.error = e.kind();
                outcome.message = e.what();
            }
        }

        check_deadline(options);
        return outcomes;
    }

    std::shared_ptr<Embedder> QueryEngine::embedder_for(const VectorIndex& index) {
        const IndexInfo& info = index.info();
        auto runtime = parse_runtime(info.runtime);
        if (!runtime) {
            throw Error(ErrorKind::ModelUnavailable,
                        "index '" + info.id + "' was built with unknown runtime '" + info.runtime + "'");
        }
        return m_models.get(require_model(info.model_id), *runtime);
    }

    std::vector<SearchResult> QueryEngine::to_results(const std::vector<Neighbor>& neighbors) {
        std::vector<SearchResult> results;
        results.reserve(neighbors.size());
        for (size_t i = 0; i < neighbors.size(); ++i) {
            SearchResult r;
            r.rank = i + 1;
            r.content = neighbors[i].chunk.content;
            r.source_document = neighbors[i].chunk.source;
            r.similarity_score = neighbors[i].score;
            r.chunk_index = neighbors[i].chunk.index;
            results.push_back(std::move(r));
        }
        return results;
    }

}
