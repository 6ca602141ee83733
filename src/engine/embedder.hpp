#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>

namespace semsearch::engine {

    enum class EmbeddingModel {
        AllMiniLmL6V2,
        AllMpnetBaseV2,
        ParaphraseMiniLmL3V2
    };

    enum class EmbeddingRuntime {
        Hashing, // built-in feature hashing, offline
        Onnx,    // local ONNX Runtime inference
        Ollama   // HTTP embedding server
    };

    struct ModelSpec {
        EmbeddingModel model;
        const char* id;         // e.g. "sentence-transformers/all-MiniLM-L6-v2"
        const char* short_name; // e.g. "all-MiniLM-L6-v2"
        const char* ollama_tag;
        size_t dimension;
    };

    /**
     * @brief Every supported model, in catalog order.
     */
    const std::vector<ModelSpec>& model_catalog();
    const ModelSpec& model_spec(EmbeddingModel model);

    /**
     * @brief Accepts a full model id or its short name.
     */
    std::optional<EmbeddingModel> parse_model(const std::string& name);

    /**
     * @throws Error(ModelUnavailable) for names outside the catalog.
     */
    EmbeddingModel require_model(const std::string& name);

    std::optional<EmbeddingRuntime> parse_runtime(const std::string& name);
    const char* to_string(EmbeddingRuntime runtime);

    /**
     * @brief Abstract base class for embedding generation.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding vector for the given text.
         * @throws Error(EmbeddingFailed) or Error(DimensionMismatch).
         */
        virtual std::vector<float> embed(const std::string& text) = 0;

        /**
         * @brief Embeds a batch; output[i] corresponds to texts[i].
         */
        virtual std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) = 0;

        /**
         * @brief Returns the dimension of the vectors produced by this embedder.
         */
        virtual size_t dimension() const = 0;

        virtual EmbeddingModel model() const = 0;
        virtual EmbeddingRuntime runtime() const = 0;
    };

    struct RuntimeOptions {
        std::filesystem::path models_dir;
        std::string ollama_endpoint = "http://localhost:11434/api/embed";
    };

    std::unique_ptr<Embedder> create_hashing_embedder(EmbeddingModel model);
    std::unique_ptr<Embedder> create_onnx_embedder(EmbeddingModel model, const std::filesystem::path& model_path, const std::filesystem::path& vocab_path);
    std::unique_ptr<Embedder> create_ollama_embedder(EmbeddingModel model, const std::string& endpoint);

    /**
     * @brief Instantiates the given model on the given runtime.
     * @throws Error(ModelUnavailable) if the runtime cannot provide the model.
     */
    std::unique_ptr<Embedder> create_embedder(EmbeddingModel model, EmbeddingRuntime runtime, const RuntimeOptions& options);

}
