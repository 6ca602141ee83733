#include "embedder.hpp"
#include "tokenizer.hpp"
#include "semsearch/error.hpp"
#include <iostream>
#include <vector>
#include <cmath>
#include <filesystem>

#ifdef SEMSEARCH_WITH_ONNX
#include <onnxruntime_cxx_api.h>
#endif

namespace semsearch::engine {

#ifdef SEMSEARCH_WITH_ONNX

    class OnnxEmbedder : public Embedder {
    public:
        OnnxEmbedder(EmbeddingModel model, const std::filesystem::path& model_path, const std::filesystem::path& vocab_path)
            : m_model(model), m_dim(model_spec(model).dimension) {
            if (!std::filesystem::exists(model_path) || !std::filesystem::exists(vocab_path)) {
                throw Error(ErrorKind::ModelUnavailable,
                            "ONNX model or vocabulary not found under " + model_path.parent_path().string());
            }

            try {
                m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "semsearch");

                Ort::SessionOptions session_options;
                session_options.SetIntraOpNumThreads(1);
                session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

                m_session = std::make_unique<Ort::Session>(*m_env, model_path.c_str(), session_options);
                m_tokenizer = std::make_unique<Tokenizer>(vocab_path);

                std::cout << "[OnnxEmbedder] Loaded: " << model_path << "\n";
            } catch (const Ort::Exception& e) {
                throw Error(ErrorKind::ModelUnavailable, std::string("ONNX initialization failed: ") + e.what());
            }
        }

        std::vector<float> embed(const std::string& text) override {
            return std::move(embed_many({text}).front());
        }

        std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) override {
            std::vector<std::vector<float>> embeddings;
            if (texts.empty()) return embeddings;

            // 1. Tokenize and pad to the longest sequence in the batch
            std::vector<std::vector<int64_t>> tokenized;
            tokenized.reserve(texts.size());
            size_t seq_length = 0;
            for (const auto& text : texts) {
                tokenized.push_back(m_tokenizer->encode(text));
                seq_length = std::max(seq_length, tokenized.back().size());
            }

            const size_t batch_size = texts.size();
            std::vector<int64_t> input_ids(batch_size * seq_length, m_tokenizer->pad_id());
            std::vector<int64_t> attention_mask(batch_size * seq_length, 0);
            std::vector<int64_t> token_type_ids(batch_size * seq_length, 0);
            for (size_t b = 0; b < batch_size; ++b) {
                for (size_t i = 0; i < tokenized[b].size(); ++i) {
                    input_ids[b * seq_length + i] = tokenized[b][i];
                    attention_mask[b * seq_length + i] = 1;
                }
            }

            // 2. Prepare Tensors
            std::vector<int64_t> input_shape = { (int64_t)batch_size, (int64_t)seq_length };
            auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

            std::vector<Ort::Value> input_tensors;
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, input_ids.data(), input_ids.size(), input_shape.data(), input_shape.size()));
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, attention_mask.data(), attention_mask.size(), input_shape.data(), input_shape.size()));
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, token_type_ids.data(), token_type_ids.size(), input_shape.data(), input_shape.size()));

            const char* input_names[] = { "input_ids", "attention_mask", "token_type_ids" };
            const char* output_names[] = { "last_hidden_state" };

            // 3. Run
            std::vector<Ort::Value> output_tensors;
            try {
                output_tensors = m_session->Run(Ort::RunOptions{nullptr}, input_names, input_tensors.data(), 3, output_names, 1);
            } catch (const Ort::Exception& e) {
                std::cerr << "[OnnxEmbedder] Inference failed: " << e.what() << "\n";
                throw Error(ErrorKind::EmbeddingFailed, std::string("ONNX inference failed: ") + e.what());
            }

            // 4. Masked mean pooling. Output shape: [batch, seq, hidden]
            const float* float_data = output_tensors[0].GetTensorData<float>();
            auto shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();
            size_t hidden_size = static_cast<size_t>(shape[2]);
            if (hidden_size != m_dim) {
                throw Error(ErrorKind::DimensionMismatch,
                            "model produced " + std::to_string(hidden_size) + "-dimensional output, expected " + std::to_string(m_dim));
            }

            embeddings.assign(batch_size, std::vector<float>(hidden_size, 0.0f));
            for (size_t b = 0; b < batch_size; ++b) {
                auto& embedding = embeddings[b];
                const size_t tokens = tokenized[b].size();
                for (size_t i = 0; i < tokens; ++i) {
                    const float* row = float_data + (b * seq_length + i) * hidden_size;
                    for (size_t j = 0; j < hidden_size; ++j) {
                        embedding[j] += row[j];
                    }
                }

                float norm = 0.0f;
                for (float& val : embedding) {
                    val /= (float)tokens;
                    norm += val * val;
                }
                norm = std::sqrt(norm);
                for (float& val : embedding) val /= (norm + 1e-9f);
            }
            return embeddings;
        }

        size_t dimension() const override { return m_dim; }
        EmbeddingModel model() const override { return m_model; }
        EmbeddingRuntime runtime() const override { return EmbeddingRuntime::Onnx; }

    private:
        EmbeddingModel m_model;
        size_t m_dim;
        std::unique_ptr<Ort::Env> m_env;
        std::unique_ptr<Ort::Session> m_session;
        std::unique_ptr<Tokenizer> m_tokenizer;
    };

    std::unique_ptr<Embedder> create_onnx_embedder(EmbeddingModel model, const std::filesystem::path& model_path, const std::filesystem::path& vocab_path) {
        return std::make_unique<OnnxEmbedder>(model, model_path, vocab_path);
    }

#else

    std::unique_ptr<Embedder> create_onnx_embedder(EmbeddingModel, const std::filesystem::path&, const std::filesystem::path&) {
        throw Error(ErrorKind::ModelUnavailable, "compiled without ONNX Runtime support");
    }

#endif

}
