#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>
#include <vector>
#include "engine/embedder.hpp"
#include "engine/model_cache.hpp"
#include "semsearch/error.hpp"

using namespace semsearch;
using namespace semsearch::engine;

namespace {

    float cosine(const std::vector<float>& a, const std::vector<float>& b) {
        float dot = 0.0f, na = 0.0f, nb = 0.0f;
        for (size_t i = 0; i < a.size(); ++i) {
            dot += a[i] * b[i];
            na += a[i] * a[i];
            nb += b[i] * b[i];
        }
        return dot / (std::sqrt(na) * std::sqrt(nb));
    }

    float norm(const std::vector<float>& v) {
        float sum = 0.0f;
        for (float x : v) sum += x * x;
        return std::sqrt(sum);
    }

}

TEST(ModelCatalogTest, DeclaresDimensions) {
    EXPECT_EQ(model_spec(EmbeddingModel::AllMiniLmL6V2).dimension, 384u);
    EXPECT_EQ(model_spec(EmbeddingModel::AllMpnetBaseV2).dimension, 768u);
    EXPECT_EQ(model_spec(EmbeddingModel::ParaphraseMiniLmL3V2).dimension, 384u);
    EXPECT_EQ(model_catalog().size(), 3u);
}

TEST(ModelCatalogTest, ParsesFullAndShortNames) {
    EXPECT_TRUE(parse_model("sentence-transformers/all-MiniLM-L6-v2") == EmbeddingModel::AllMiniLmL6V2);
    EXPECT_TRUE(parse_model("all-mpnet-base-v2") == EmbeddingModel::AllMpnetBaseV2);
    EXPECT_TRUE(parse_model("PARAPHRASE-MINILM-L3-V2") == EmbeddingModel::ParaphraseMiniLmL3V2);
    EXPECT_FALSE(parse_model("bert-base-uncased").has_value());
}

TEST(ModelCatalogTest, UnknownModelIsUnavailable) {
    try {
        require_model("text-embedding-ada-002");
        FAIL() << "expected ModelUnavailable";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ModelUnavailable);
    }
}

TEST(ModelCatalogTest, ParsesRuntimes) {
    EXPECT_TRUE(parse_runtime("hashing") == EmbeddingRuntime::Hashing);
    EXPECT_TRUE(parse_runtime("ONNX") == EmbeddingRuntime::Onnx);
    EXPECT_TRUE(parse_runtime("ollama") == EmbeddingRuntime::Ollama);
    EXPECT_FALSE(parse_runtime("openai").has_value());
}

TEST(HashingEmbedderTest, ProducesUnitVectorsOfDeclaredDimension) {
    for (const auto& spec : model_catalog()) {
        auto embedder = create_hashing_embedder(spec.model);
        auto v = embedder->embed("Cats are mammals.");
        EXPECT_EQ(v.size(), spec.dimension);
        EXPECT_EQ(embedder->dimension(), spec.dimension);
        EXPECT_NEAR(norm(v), 1.0f, 1e-5f);
        EXPECT_EQ(embedder->runtime(), EmbeddingRuntime::Hashing);
    }
}

TEST(HashingEmbedderTest, IsDeterministicAcrossInstances) {
    auto a = create_hashing_embedder(EmbeddingModel::AllMiniLmL6V2);
    auto b = create_hashing_embedder(EmbeddingModel::AllMiniLmL6V2);
    EXPECT_EQ(a->embed("the quick brown fox"), b->embed("the quick brown fox"));
}

TEST(HashingEmbedderTest, BatchMatchesSingleEmbedding) {
    const std::vector<std::string> texts = {
        "Cats are mammals.", "", "Dogs bark at night.", "caf\xC3\xA9 au lait", "Cats are mammals."
    };
    for (const auto& spec : model_catalog()) {
        auto embedder = create_hashing_embedder(spec.model);
        auto batch = embedder->embed_many(texts);
        ASSERT_EQ(batch.size(), texts.size());
        for (size_t i = 0; i < texts.size(); ++i) {
            EXPECT_EQ(batch[i], embedder->embed(texts[i])) << spec.short_name << " text " << i;
        }
    }
}

TEST(HashingEmbedderTest, EmptyTextIsZeroVector) {
    auto embedder = create_hashing_embedder(EmbeddingModel::AllMiniLmL6V2);
    auto v = embedder->embed("");
    ASSERT_EQ(v.size(), 384u);
    EXPECT_EQ(norm(v), 0.0f);
}

TEST(HashingEmbedderTest, SharedWordsScoreHigherThanUnrelatedText) {
    auto embedder = create_hashing_embedder(EmbeddingModel::AllMiniLmL6V2);
    auto query = embedder->embed("What are mammals?");
    auto related = embedder->embed("Cats are mammals. Dogs are mammals too.");
    auto unrelated = embedder->embed("Quantum chromodynamics describes gluon interactions.");
    EXPECT_GT(cosine(query, related), cosine(query, unrelated));
}

TEST(EmbedderFactoryTest, OnnxWithoutModelFilesIsUnavailable) {
    RuntimeOptions options;
    options.models_dir = "/nonexistent/semsearch/models";
    try {
        create_embedder(EmbeddingModel::AllMiniLmL6V2, EmbeddingRuntime::Onnx, options);
        FAIL() << "expected ModelUnavailable";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ModelUnavailable);
    }
}

TEST(EmbedderFactoryTest, UnreachableOllamaFailsEmbedding) {
    auto embedder = create_ollama_embedder(EmbeddingModel::AllMiniLmL6V2, "http://127.0.0.1:1/api/embed");
    EXPECT_EQ(embedder->dimension(), 384u);
    try {
        embedder->embed("hello");
        FAIL() << "expected EmbeddingFailed";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EmbeddingFailed);
    }
}

TEST(ModelCacheTest, ConcurrentFirstUseLoadsOnce) {
    std::atomic<int> factory_calls{0};
    ModelCache cache([&](EmbeddingModel model, EmbeddingRuntime) {
        factory_calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return create_hashing_embedder(model);
    });

    std::vector<std::shared_ptr<Embedder>> seen(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i]() { seen[i] = cache.get(EmbeddingModel::AllMiniLmL6V2, EmbeddingRuntime::Hashing); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(factory_calls.load(), 1);
    EXPECT_EQ(cache.loads(), 1u);
    for (const auto& e : seen) EXPECT_EQ(e, seen.front());
}

TEST(ModelCacheTest, KeysByModelAndRuntime) {
    ModelCache cache(RuntimeOptions{});
    auto a = cache.get(EmbeddingModel::AllMiniLmL6V2, EmbeddingRuntime::Hashing);
    auto b = cache.get(EmbeddingModel::AllMpnetBaseV2, EmbeddingRuntime::Hashing);
    auto c = cache.get(EmbeddingModel::AllMiniLmL6V2, EmbeddingRuntime::Hashing);

    EXPECT_NE(a, b);
    EXPECT_EQ(a, c);
    EXPECT_EQ(b->dimension(), 768u);
    EXPECT_EQ(cache.loads(), 2u);
}

TEST(ModelCacheTest, FailedLoadIsNotCached) {
    int attempts = 0;
    ModelCache cache([&](EmbeddingModel model, EmbeddingRuntime) -> std::unique_ptr<Embedder> {
        if (++attempts == 1) throw Error(ErrorKind::ModelUnavailable, "first load fails");
        return create_hashing_embedder(model);
    });

    EXPECT_THROW(cache.get(EmbeddingModel::AllMiniLmL6V2, EmbeddingRuntime::Hashing), Error);
    auto embedder = cache.get(EmbeddingModel::AllMiniLmL6V2, EmbeddingRuntime::Hashing);
    ASSERT_NE(embedder, nullptr);
    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(cache.loads(), 1u);
}
