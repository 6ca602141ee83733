#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "semsearch/error.hpp"
#include "semsearch/types.hpp"
#include "index_registry.hpp"
#include "model_cache.hpp"

namespace semsearch::engine {

    struct QueryOptions {
        // Results are discarded with Error(Timeout) once this has passed.
        std::optional<std::chrono::steady_clock::time_point> deadline;

        static QueryOptions within(std::chrono::milliseconds timeout) {
            QueryOptions options;
            options.deadline = std::chrono::steady_clock::now() + timeout;
            return options;
        }
    };

    /**
     * @brief One slot of a batch query: results, or the error for that text.
     */
    struct QueryOutcome {
        std::vector<SearchResult> results;
        std::optional<ErrorKind> error;
        std::string message;

        bool ok() const { return !error.has_value(); }
    };

    class QueryEngine {
    public:
        QueryEngine(IndexRegistry& registry, ModelCache& models);

        /**
         * @brief Ranked top-k chunks for one query, ranks starting at 1.
         * @throws Error(EmptyQuery) for blank text, Error(InvalidTopK) for top_k < 1,
         *         both before any embedding. Error(IndexNotFound) and
         *         Error(DimensionMismatch) propagate from the index.
         */
        std::vector<SearchResult> query(const std::string& text, const std::string& index_id,
                                        int top_k, const QueryOptions& options = {});

        /**
         * @brief One outcome per text, in input order. Failures are isolated per slot,
         * except a bad top_k or index id, which fail the whole call.
         */
        std::vector<QueryOutcome> batch_query(const std::vector<std::string>& texts, const std::string& index_id,
                                              int top_k, const QueryOptions& options = {});

    private:
        IndexRegistry& m_registry;
        ModelCache& m_models;

        std::shared_ptr<Embedder> embedder_for(const VectorIndex& index);
        static std::vector<SearchResult> to_results(const std::vector<Neighbor>& neighbors);
    };

    bool is_blank(const std::string& text);

}
