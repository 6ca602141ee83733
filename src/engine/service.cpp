#include "service.hpp"
#include <iostream>
#include <limits>

using json = nlohmann::json;

namespace semsearch::engine {

    namespace {

        std::string required_string(const json& params, const char* key) {
            if (!params.contains(key) || !params[key].is_string()) {
                throw Error(ErrorKind::InvalidConfiguration, std::string("missing string parameter '") + key + "'");
            }
            return params[key].get<std::string>();
        }

    }

    Service::Service(const Config& config, const DocumentSource& documents, IndexRegistry& registry,
                     QueryEngine& queries, ModelCache& models)
        : m_config(config), m_documents(documents), m_registry(registry), m_queries(queries), m_models(models),
          m_started(std::chrono::steady_clock::now()) {}

    std::string Service::handle(const std::string& request) {
        try {
            return dispatch(json::parse(request)).dump(-1, ' ', false, json::error_handler_t::replace);
        } catch (const json::parse_error& e) {
            return error_json(ErrorKind::InvalidConfiguration, std::string("malformed request: ") + e.what())
                .dump(-1, ' ', false, json::error_handler_t::replace);
        } catch (const std::exception& e) {
            std::cerr << "[Service] Internal error: " << e.what() << "\n";
            return error_json(ErrorKind::BackendIOError, std::string("internal error: ") + e.what())
                .dump(-1, ' ', false, json::error_handler_t::replace);
        }
    }

    json Service::dispatch(const json& request) {
        m_requests++;
        std::string method;
        try {
            if (!request.is_object()) {
                throw Error(ErrorKind::InvalidConfiguration, "request must be a JSON object");
            }
            method = required_string(request, "method");
            const json params = request.value("params", json::object());
            if (!params.is_object()) {
                throw Error(ErrorKind::InvalidConfiguration, "'params' must be an object");
            }

            json result;
            if (method == "ping") {
                result = "pong";
            } else if (method == "status") {
                result = status();
            } else if (method == "models") {
                result = models();
            } else if (method == "backends") {
                result = backends();
            } else if (method == "list_indices") {
                result = list_indices();
            } else if (method == "build") {
                result = build(params);
            } else if (method == "query") {
                result = query(params);
            } else if (method == "batch_query") {
                result = batch_query(params);
            } else if (method == "remove_index") {
                result = remove_index(params);
            } else if (method == "shutdown") {
                if (m_on_shutdown) m_on_shutdown();
                result = "shutting down";
            } else {
                throw Error(ErrorKind::InvalidConfiguration, "unknown method '" + method + "'");
            }
            return json{{"result", result}};
        } catch (const Error& e) {
            std::cerr << "[Service] " << (method.empty() ? "request" : method) << " failed: "
                      << to_string(e.kind()) << ": " << e.what() << "\n";
            return error_json(e.kind(), e.what());
        } catch (const json::exception& e) {
            return error_json(ErrorKind::InvalidConfiguration, std::string("invalid parameters: ") + e.what());
        } catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "[Service] " << method << " failed: " << e.what() << "\n";
            return error_json(ErrorKind::BackendIOError, e.what());
        }
    }

    json Service::list_indices() {
        const auto documents = m_documents.list_documents();
        json out = json::array();
        for (const auto& info : m_registry.list()) {
            json entry = to_json(info);
            entry["stale"] = is_stale(info, documents);
            out.push_back(entry);
        }
        return out;
    }

    json Service::build(const json& params) {
        const std::string model_id = params.value("model_id", m_config.default_model);
        const std::string backend_id = params.value("backend_id", m_config.default_backend);
        return to_json(m_registry.build(model_id, backend_id));
    }

    json Service::query(const json& params) {
        const std::string text = required_string(params, "text");
        const std::string index_id = required_string(params, "index_id");
        return to_json(m_queries.query(text, index_id, top_k_param(params), query_options(params)));
    }

    json Service::batch_query(const json& params) {
        if (!params.contains("texts") || !params["texts"].is_array()) {
            throw Error(ErrorKind::InvalidConfiguration, "missing array parameter 'texts'");
        }
        const auto texts = params["texts"].get<std::vector<std::string>>();
        const std::string index_id = required_string(params, "index_id");

        json out = json::array();
        for (const auto& outcome : m_queries.batch_query(texts, index_id, top_k_param(params), query_options(params))) {
            if (outcome.ok()) {
                out.push_back(json{{"results", to_json(outcome.results)}});
            } else {
                out.push_back(error_json(*outcome.error, outcome.message));
            }
        }
        return out;
    }

    json Service::remove_index(const json& params) {
        const std::string index_id = required_string(params, "index_id");
        m_registry.remove(index_id);
        return json{{"removed", canonical_index_id(index_id)}};
    }

    json Service::models() const {
        json out = json::array();
        for (const auto& spec : model_catalog()) {
            out.push_back({
                {"model_id", spec.id},
                {"short_name", spec.short_name},
                {"dimension", spec.dimension}
            });
        }
        return out;
    }

    json Service::backends() const {
        json out = json::array();
        for (IndexBackend backend : {IndexBackend::Memory, IndexBackend::Sqlite, IndexBackend::Hnsw}) {
            out.push_back({
                {"backend_id", to_string(backend)},
                {"persistent", is_persistent(backend)}
            });
        }
        return out;
    }

    json Service::status() {
        const double uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_started).count();
        return {
            {"status", "running"},
            {"indices", m_registry.list().size()},
            {"models_loaded", m_models.loads()},
            {"requests", m_requests.load()},
            {"uptime_seconds", uptime},
            {"data_dir", m_config.data_dir.string()},
            {"store_dir", m_config.store_dir.string()},
            {"embedding_runtime", m_config.embedding_runtime}
        };
    }

    int Service::top_k_param(const json& params) const {
        if (!params.contains("top_k")) return m_config.default_top_k;
        if (!params["top_k"].is_number_integer()) {
            throw Error(ErrorKind::InvalidTopK, "top_k must be an integer");
        }
        const auto value = params["top_k"].get<long long>();
        if (value < 1 || value > std::numeric_limits<int>::max()) {
            throw Error(ErrorKind::InvalidTopK, "top_k must be between 1 and " +
                        std::to_string(std::numeric_limits<int>::max()) + ", got " + params["top_k"].dump());
        }
        return static_cast<int>(value);
    }

    QueryOptions Service::query_options(const json& params) {
        if (!params.contains("timeout_ms")) return {};
        const auto timeout = params["timeout_ms"].get<long long>();
        if (timeout <= 0) {
            throw Error(ErrorKind::InvalidConfiguration, "timeout_ms must be positive");
        }
        return QueryOptions::within(std::chrono::milliseconds(timeout));
    }

    json to_json(const IndexInfo& info) {
        return {
            {"index_id", info.id},
            {"model_id", info.model_id},
            {"runtime", info.runtime},
            {"backend_id", info.backend_id},
            {"dimension", info.dimension},
            {"chunk_count", info.chunk_count},
            {"document_count", info.document_count},
            {"created_at", info.created_at}
        };
    }

    json to_json(const BuildReport& report) {
        return {
            {"index_id", report.index_id},
            {"documents_processed", report.documents_processed},
            {"chunks_created", report.chunks_created},
            {"dimension", report.dimension},
            {"elapsed_seconds", report.elapsed_seconds}
        };
    }

    json to_json(const std::vector<SearchResult>& results) {
        json out = json::array();
        for (const auto& r : results) {
            out.push_back({
                {"rank", r.rank},
                {"content", r.content},
                {"source_document", r.source_document},
                {"similarity_score", r.similarity_score},
                {"chunk_index", r.chunk_index}
            });
        }
        return out;
    }

    json error_json(ErrorKind kind, const std::string& message) {
        return {{"error", {{"kind", to_string(kind)}, {"message", message}}}};
    }

}
