#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "document_store.hpp"
#include "index_registry.hpp"
#include "query_engine.hpp"

namespace semsearch::engine {

    /**
     * @brief JSON request dispatcher behind the daemon's socket.
     *
     * Requests are {"method": ..., "params": {...}}; replies are {"result": ...}
     * or {"error": {"kind": ..., "message": ...}}.
     */
    class Service {
    public:
        using ShutdownCallback = std::function<void()>;

        Service(const Config& config, const DocumentSource& documents, IndexRegistry& registry,
                QueryEngine& queries, ModelCache& models);

        /**
         * @brief Handles one raw request. Never throws; failures become error replies.
         */
        std::string handle(const std::string& request);

        nlohmann::json dispatch(const nlohmann::json& request);

        void set_shutdown_callback(ShutdownCallback callback) { m_on_shutdown = std::move(callback); }

    private:
        const Config& m_config;
        const DocumentSource& m_documents;
        IndexRegistry& m_registry;
        QueryEngine& m_queries;
        ModelCache& m_models;
        ShutdownCallback m_on_shutdown;
        std::chrono::steady_clock::time_point m_started;
        std::atomic<size_t> m_requests{0};

        nlohmann::json list_indices();
        nlohmann::json build(const nlohmann::json& params);
        nlohmann::json query(const nlohmann::json& params);
        nlohmann::json batch_query(const nlohmann::json& params);
        nlohmann::json remove_index(const nlohmann::json& params);
        nlohmann::json models() const;
        nlohmann::json backends() const;
        nlohmann::json status();

        int top_k_param(const nlohmann::json& params) const;
        static QueryOptions query_options(const nlohmann::json& params);
    };

    nlohmann::json to_json(const IndexInfo& info);
    nlohmann::json to_json(const BuildReport& report);
    nlohmann::json to_json(const std::vector<SearchResult>& results);
    nlohmann::json error_json(ErrorKind kind, const std::string& message);

}
