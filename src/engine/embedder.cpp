#include "embedder.hpp"
#include "semsearch/error.hpp"
#include <algorithm>
#include <cctype>

namespace semsearch::engine {

    namespace {

        std::string lowercase(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                [](unsigned char c) { return std::tolower(c); });
            return s;
        }

    }

    const std::vector<ModelSpec>& model_catalog() {
        static const std::vector<ModelSpec> catalog = {
            { EmbeddingModel::AllMiniLmL6V2, "sentence-transformers/all-MiniLM-L6-v2", "all-MiniLM-L6-v2", "all-minilm", 384 },
            { EmbeddingModel::AllMpnetBaseV2, "sentence-transformers/all-mpnet-base-v2", "all-mpnet-base-v2", "all-mpnet-base-v2", 768 },
            { EmbeddingModel::ParaphraseMiniLmL3V2, "sentence-transformers/paraphrase-MiniLM-L3-v2", "paraphrase-MiniLM-L3-v2", "paraphrase-minilm-l3-v2", 384 },
        };
        return catalog;
    }

    const ModelSpec& model_spec(EmbeddingModel model) {
        for (const auto& spec : model_catalog()) {
            if (spec.model == model) return spec;
        }
        throw Error(ErrorKind::ModelUnavailable, "model missing from catalog");
    }

    std::optional<EmbeddingModel> parse_model(const std::string& name) {
        std::string wanted = lowercase(name);
        for (const auto& spec : model_catalog()) {
            if (wanted == lowercase(spec.id) || wanted == lowercase(spec.short_name)) {
                return spec.model;
            }
        }
        return std::nullopt;
    }

    EmbeddingModel require_model(const std::string& name) {
        auto model = parse_model(name);
        if (!model) {
            std::string supported;
            for (const auto& spec : model_catalog()) {
                if (!supported.empty()) supported += ", ";
                supported += spec.id;
            }
            throw Error(ErrorKind::ModelUnavailable, "unknown embedding model '" + name + "' (supported: " + supported + ")");
        }
        return *model;
    }

    std::optional<EmbeddingRuntime> parse_runtime(const std::string& name) {
        std::string wanted = lowercase(name);
        if (wanted == "hashing") return EmbeddingRuntime::Hashing;
        if (wanted == "onnx") return EmbeddingRuntime::Onnx;
        if (wanted == "ollama") return EmbeddingRuntime::Ollama;
        return std::nullopt;
    }

    const char* to_string(EmbeddingRuntime runtime) {
        switch (runtime) {
            case EmbeddingRuntime::Hashing: return "hashing";
            case EmbeddingRuntime::Onnx: return "onnx";
            case EmbeddingRuntime::Ollama: return "ollama";
        }
        return "unknown";
    }

    std::unique_ptr<Embedder> create_embedder(EmbeddingModel model, EmbeddingRuntime runtime, const RuntimeOptions& options) {
        switch (runtime) {
            case EmbeddingRuntime::Hashing:
                return create_hashing_embedder(model);
            case EmbeddingRuntime::Onnx: {
                auto dir = options.models_dir / model_spec(model).short_name;
                return create_onnx_embedder(model, dir / "model.onnx", dir / "vocab.txt");
            }
            case EmbeddingRuntime::Ollama:
                return create_ollama_embedder(model, options.ollama_endpoint);
        }
        throw Error(ErrorKind::ModelUnavailable, "unsupported embedding runtime");
    }

}
