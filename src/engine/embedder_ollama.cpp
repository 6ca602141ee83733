#include "embedder.hpp"
#include "semsearch/error.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace semsearch::engine {

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(EmbeddingModel model, const std::string& endpoint)
            : m_model(model), m_dim(model_spec(model).dimension), m_tag(model_spec(model).ollama_tag), m_endpoint(endpoint) {
            static std::once_flag curl_init;
            std::call_once(curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
        }

        std::vector<float> embed(const std::string& text) override {
            return std::move(embed_many({text}).front());
        }

        std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) override {
            std::vector<std::vector<float>> embeddings;
            if (texts.empty()) return embeddings;

            std::string json_str;
            try {
                json body = {
                    {"model", m_tag},
                    {"input", texts}
                };
                json_str = body.dump(-1, ' ', false, json::error_handler_t::replace);
            } catch (const json::exception& e) {
                throw Error(ErrorKind::EmbeddingFailed, std::string("request serialization failed: ") + e.what());
            }

            std::string response_string = post(json_str);

            try {
                auto resp_json = json::parse(response_string);
                if (resp_json.contains("error")) {
                    throw Error(ErrorKind::EmbeddingFailed, "Ollama error: " + resp_json["error"].dump());
                }
                embeddings = resp_json.at("embeddings").get<std::vector<std::vector<float>>>();
            } catch (const json::exception& e) {
                std::cerr << "[OllamaEmbedder] JSON parse error: " << e.what() << "\n";
                throw Error(ErrorKind::EmbeddingFailed, std::string("malformed Ollama response: ") + e.what());
            }

            if (embeddings.size() != texts.size()) {
                throw Error(ErrorKind::EmbeddingFailed,
                            "Ollama returned " + std::to_string(embeddings.size()) + " embeddings for " + std::to_string(texts.size()) + " inputs");
            }
            for (const auto& e : embeddings) {
                if (e.size() != m_dim) {
                    throw Error(ErrorKind::DimensionMismatch,
                                "model '" + m_tag + "' returned " + std::to_string(e.size()) + " dimensions, expected " + std::to_string(m_dim));
                }
            }
            return embeddings;
        }

        size_t dimension() const override { return m_dim; }
        EmbeddingModel model() const override { return m_model; }
        EmbeddingRuntime runtime() const override { return EmbeddingRuntime::Ollama; }

    private:
        EmbeddingModel m_model;
        size_t m_dim;
        std::string m_tag;
        std::string m_endpoint;

        std::string post(const std::string& body) const {
            CURL* curl = curl_easy_init();
            if (!curl) {
                throw Error(ErrorKind::EmbeddingFailed, "curl_easy_init() failed");
            }

            struct curl_slist* headers = nullptr;
            headers = curl_slist_append(headers, "Content-Type: application/json");

            std::string response_string;
            long status = 0;
            curl_easy_setopt(curl, CURLOPT_URL, m_endpoint.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);

            CURLcode res = curl_easy_perform(curl);
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);

            if (res != CURLE_OK) {
                std::cerr << "[OllamaEmbedder] curl_easy_perform() failed: " << curl_easy_strerror(res) << "\n";
                throw Error(ErrorKind::EmbeddingFailed, std::string("embedding request failed: ") + curl_easy_strerror(res));
            }
            if (status == 404) {
                throw Error(ErrorKind::ModelUnavailable, "Ollama does not serve model '" + m_tag + "'");
            }
            return response_string;
        }

        static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            ((std::string*)userp)->append((char*)contents, size * nmemb);
            return size * nmemb;
        }
    };

    std::unique_ptr<Embedder> create_ollama_embedder(EmbeddingModel model, const std::string& endpoint) {
        return std::make_unique<OllamaEmbedder>(model, endpoint);
    }

}
