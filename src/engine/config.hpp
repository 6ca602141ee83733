#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "semsearch/error.hpp"

namespace semsearch::engine {

    struct Config {
        std::filesystem::path data_dir;    // documents (.txt/.md)
        std::filesystem::path store_dir;   // one directory per persisted index
        std::filesystem::path models_dir;  // <models_dir>/<short name>/{model.onnx,vocab.txt}

        std::string default_model = "sentence-transformers/all-MiniLM-L6-v2";
        std::string default_backend = "hnsw";
        std::string embedding_runtime = "hashing"; // hashing, onnx, ollama
        std::string ollama_endpoint = "http://localhost:11434/api/embed";

        size_t chunk_size = 500;
        size_t chunk_overlap = 50;
        size_t embed_batch_size = 32;

        size_t hnsw_m = 16;
        size_t hnsw_ef_construction = 200;
        size_t hnsw_ef_search = 64;

        int default_top_k = 5;
        size_t workers = 4;
        std::string socket_name = "semsearch.sock";

        /**
         * @brief Reads config.json. A missing file gives the defaults and
         * malformed JSON is logged and ignored. A count that is negative or
         * not an integer throws InvalidConfiguration.
         */
        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!std::filesystem::exists(path)) return cfg;

            try {
                std::ifstream f(path);
                nlohmann::json j = nlohmann::json::parse(f);

                if (j.contains("data_dir")) cfg.data_dir = j["data_dir"].get<std::string>();
                if (j.contains("store_dir")) cfg.store_dir = j["store_dir"].get<std::string>();
                if (j.contains("models_dir")) cfg.models_dir = j["models_dir"].get<std::string>();
                cfg.default_model = j.value("default_model", cfg.default_model);
                cfg.default_backend = j.value("default_backend", cfg.default_backend);
                cfg.embedding_runtime = j.value("embedding_runtime", cfg.embedding_runtime);
                cfg.ollama_endpoint = j.value("ollama_endpoint", cfg.ollama_endpoint);
                cfg.chunk_size = count_value(j, "chunk_size", cfg.chunk_size);
                cfg.chunk_overlap = count_value(j, "chunk_overlap", cfg.chunk_overlap);
                cfg.embed_batch_size = count_value(j, "embed_batch_size", cfg.embed_batch_size);
                cfg.hnsw_m = count_value(j, "hnsw_m", cfg.hnsw_m);
                cfg.hnsw_ef_construction = count_value(j, "hnsw_ef_construction", cfg.hnsw_ef_construction);
                cfg.hnsw_ef_search = count_value(j, "hnsw_ef_search", cfg.hnsw_ef_search);
                cfg.default_top_k = j.value("default_top_k", cfg.default_top_k);
                cfg.workers = count_value(j, "workers", cfg.workers);
                cfg.socket_name = j.value("socket_name", cfg.socket_name);
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[Config] Ignoring malformed " << path << ": " << e.what() << "\n";
                return Config{};
            }
            return cfg;
        }

        static size_t count_value(const nlohmann::json& j, const char* key, size_t fallback) {
            if (!j.contains(key)) return fallback;
            const auto& v = j[key];
            if (!v.is_number_unsigned()) {
                throw Error(ErrorKind::InvalidConfiguration,
                            std::string("'") + key + "' must be a non-negative integer, got " + v.dump());
            }
            return v.get<size_t>();
        }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["data_dir"] = data_dir.string();
            j["store_dir"] = store_dir.string();
            j["models_dir"] = models_dir.string();
            j["default_model"] = default_model;
            j["default_backend"] = default_backend;
            j["embedding_runtime"] = embedding_runtime;
            j["ollama_endpoint"] = ollama_endpoint;
            j["chunk_size"] = chunk_size;
            j["chunk_overlap"] = chunk_overlap;
            j["embed_batch_size"] = embed_batch_size;
            j["hnsw_m"] = hnsw_m;
            j["hnsw_ef_construction"] = hnsw_ef_construction;
            j["hnsw_ef_search"] = hnsw_ef_search;
            j["default_top_k"] = default_top_k;
            j["workers"] = workers;
            j["socket_name"] = socket_name;

            std::ofstream f(path);
            f << j.dump(4);
        }

        /**
         * @brief Fills empty directories relative to the platform data directory.
         */
        void resolve_paths(const std::filesystem::path& base) {
            if (data_dir.empty()) data_dir = base / "data";
            if (store_dir.empty()) store_dir = base / "vector_store";
            if (models_dir.empty()) models_dir = base / "models";
        }

        void validate() const {
            if (chunk_size == 0) {
                throw Error(ErrorKind::InvalidConfiguration, "chunk_size must be positive");
            }
            if (chunk_overlap >= chunk_size) {
                throw Error(ErrorKind::InvalidConfiguration, "chunk_overlap must be smaller than chunk_size");
            }
            if (embed_batch_size == 0 || workers == 0) {
                throw Error(ErrorKind::InvalidConfiguration, "embed_batch_size and workers must be positive");
            }
            if (hnsw_m < 2 || hnsw_ef_search == 0) {
                throw Error(ErrorKind::InvalidConfiguration, "hnsw_m must be at least 2 and hnsw_ef_search positive");
            }
            if (default_top_k < 1) {
                throw Error(ErrorKind::InvalidConfiguration, "default_top_k must be at least 1");
            }
        }
    };

}
