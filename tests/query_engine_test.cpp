#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include "engine/index_registry.hpp"
#include "engine/query_engine.hpp"
#include "semsearch/error.hpp"
#include "test_support.hpp"

using namespace semsearch;
using namespace semsearch::engine;
using semsearch::testutil::MemoryDocumentSource;
using semsearch::testutil::ScratchDir;
using semsearch::testutil::animal_corpus;
using semsearch::testutil::make_document;

namespace {

    const char* const kModel = "sentence-transformers/all-MiniLM-L6-v2";

    // Hashing embedder that fails on any text containing "boom".
    class FailingEmbedder : public Embedder {
    public:
        explicit FailingEmbedder(EmbeddingModel model) : m_inner(create_hashing_embedder(model)) {}

        std::vector<float> embed(const std::string& text) override {
            if (text.find("boom") != std::string::npos) {
                throw Error(ErrorKind::EmbeddingFailed, "cannot embed '" + text + "'");
            }
            return m_inner->embed(text);
        }

        std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) override {
            std::vector<std::vector<float>> out;
            for (const auto& text : texts) out.push_back(embed(text));
            return out;
        }

        size_t dimension() const override { return m_inner->dimension(); }
        EmbeddingModel model() const override { return m_inner->model(); }
        EmbeddingRuntime runtime() const override { return EmbeddingRuntime::Hashing; }

    private:
        std::unique_ptr<Embedder> m_inner;
    };

    class QueryEngineTest : public ::testing::Test {
    protected:
        ScratchDir m_store;
        MemoryDocumentSource m_documents{animal_corpus()};
        ModelCache m_models{[](EmbeddingModel model, EmbeddingRuntime) -> std::unique_ptr<Embedder> {
            return std::make_unique<FailingEmbedder>(model);
        }};
        std::unique_ptr<IndexRegistry> m_registry;
        std::unique_ptr<QueryEngine> m_engine;

        void SetUp() override {
            RegistryOptions options;
            options.index.store_dir = m_store.path();
            options.chunker.chunk_size = 80;
            options.chunker.overlap = 10;
            m_registry = std::make_unique<IndexRegistry>(options, m_documents, m_models);
            m_engine = std::make_unique<QueryEngine>(*m_registry, m_models);
        }

        std::string build(const std::string& backend = "memory") {
            return m_registry->build(kModel, backend).index_id;
        }

        static ErrorKind kind_of(const std::function<void()>& fn) {
            try {
                fn();
            } catch (const Error& e) {
                return e.kind();
            }
            ADD_FAILURE() << "expected an error";
            return ErrorKind::Timeout;
        }
    };

}

TEST_F(QueryEngineTest, SingleDocumentScenario) {
    m_documents.set({ make_document("mammals.txt", "Cats are mammals. Dogs are mammals too.") });
    const auto id = build();

    auto results = m_engine->query("What are mammals?", id, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].rank, 1u);
    EXPECT_EQ(results[0].source_document, "mammals.txt");
    EXPECT_EQ(results[0].content, "Cats are mammals. Dogs are mammals too.");
    EXPECT_EQ(results[0].chunk_index, 0u);
    EXPECT_GT(results[0].similarity_score, 0.0f);
    EXPECT_LE(results[0].similarity_score, 1.0f);
}

TEST_F(QueryEngineTest, RanksStartAtOneWithNonIncreasingScores) {
    for (const char* backend : {"memory", "sqlite", "hnsw"}) {
        SCOPED_TRACE(backend);
        const auto id = build(backend);
        auto results = m_engine->query("Which animals purr and chase mice?", id, 3);

        ASSERT_EQ(results.size(), 3u);
        EXPECT_EQ(results[0].source_document, "cats.txt");
        for (size_t i = 0; i < results.size(); ++i) {
            EXPECT_EQ(results[i].rank, i + 1);
            if (i > 0) EXPECT_LE(results[i].similarity_score, results[i - 1].similarity_score);
        }
    }
}

TEST_F(QueryEngineTest, TopKLargerThanIndexReturnsEverything) {
    const auto id = build();
    const size_t chunks = m_registry->resolve(id)->size();
    EXPECT_EQ(m_engine->query("mammals", id, 1000).size(), chunks);
}

TEST_F(QueryEngineTest, ValidatesBeforeResolvingIndex) {
    EXPECT_EQ(kind_of([&] { m_engine->query("", "never_built", 3); }), ErrorKind::EmptyQuery);
    EXPECT_EQ(kind_of([&] { m_engine->query(" \t\n", "never_built", 3); }), ErrorKind::EmptyQuery);
    EXPECT_EQ(kind_of([&] { m_engine->query("cats", "never_built", 0); }), ErrorKind::InvalidTopK);
    EXPECT_EQ(kind_of([&] { m_engine->query("cats", "never_built", -2); }), ErrorKind::InvalidTopK);
    EXPECT_EQ(m_models.loads(), 0u);
}

TEST_F(QueryEngineTest, NeverBuiltIndexIsNotFound) {
    build("memory");
    const std::string missing = "sqlite_all-MiniLM-L6-v2";
    EXPECT_EQ(kind_of([&] { m_engine->query("cats", missing, 3); }), ErrorKind::IndexNotFound);
    EXPECT_EQ(kind_of([&] { m_engine->batch_query({"cats"}, missing, 3); }), ErrorKind::IndexNotFound);
}

TEST_F(QueryEngineTest, BatchAgainstMissingIndexFailsWhateverTheTexts) {
    const std::string missing = "sqlite_all-MiniLM-L6-v2";
    EXPECT_EQ(kind_of([&] { m_engine->batch_query({""}, missing, 1); }), ErrorKind::IndexNotFound);
    EXPECT_EQ(kind_of([&] { m_engine->batch_query({"", "cats"}, missing, 1); }), ErrorKind::IndexNotFound);
    EXPECT_EQ(kind_of([&] { m_engine->batch_query({}, missing, 1); }), ErrorKind::IndexNotFound);
}

TEST_F(QueryEngineTest, EmbeddingFailurePropagates) {
    const auto id = build();
    EXPECT_EQ(kind_of([&] { m_engine->query("boom", id, 3); }), ErrorKind::EmbeddingFailed);
}

TEST_F(QueryEngineTest, ExpiredDeadlineTimesOut) {
    const auto id = build();
    QueryOptions expired;
    expired.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);

    EXPECT_EQ(kind_of([&] { m_engine->query("cats", id, 3, expired); }), ErrorKind::Timeout);
    EXPECT_EQ(kind_of([&] { m_engine->batch_query({"cats"}, id, 3, expired); }), ErrorKind::Timeout);
    EXPECT_EQ(m_engine->query("cats", id, 3, QueryOptions::within(std::chrono::seconds(30))).size(), 3u);
}

TEST_F(QueryEngineTest, BatchIsolatesBlankQueries) {
    const auto id = build();
    auto outcomes = m_engine->batch_query({"", "cats"}, id, 1);

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_FALSE(outcomes[0].ok());
    EXPECT_EQ(*outcomes[0].error, ErrorKind::EmptyQuery);
    EXPECT_TRUE(outcomes[0].results.empty());

    ASSERT_TRUE(outcomes[1].ok());
    ASSERT_EQ(outcomes[1].results.size(), 1u);
    EXPECT_EQ(outcomes[1].results[0].rank, 1u);
}

TEST_F(QueryEngineTest, BatchIsolatesEmbeddingFailures) {
    const auto id = build();
    auto outcomes = m_engine->batch_query({"cats purr", "boom", "dogs bark"}, id, 2);

    ASSERT_EQ(outcomes.size(), 3u);
    ASSERT_TRUE(outcomes[0].ok());
    EXPECT_EQ(outcomes[0].results.size(), 2u);
    ASSERT_FALSE(outcomes[1].ok());
    EXPECT_EQ(*outcomes[1].error, ErrorKind::EmbeddingFailed);
    EXPECT_FALSE(outcomes[1].message.empty());
    ASSERT_TRUE(outcomes[2].ok());
    EXPECT_EQ(outcomes[2].results.size(), 2u);
}

TEST_F(QueryEngineTest, BatchMatchesSingleQueries) {
    const auto id = build();
    const std::vector<std::string> texts = {"cats", "water and gills", "loyal dogs"};
    auto outcomes = m_engine->batch_query(texts, id, 2);

    ASSERT_EQ(outcomes.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        auto single = m_engine->query(texts[i], id, 2);
        ASSERT_TRUE(outcomes[i].ok());
        ASSERT_EQ(outcomes[i].results.size(), single.size());
        for (size_t r = 0; r < single.size(); ++r) {
            EXPECT_EQ(outcomes[i].results[r].content, single[r].content);
            EXPECT_EQ(outcomes[i].results[r].similarity_score, single[r].similarity_score);
        }
    }
}

TEST_F(QueryEngineTest, BatchRejectsInvalidTopKOutright) {
    const auto id = build();
    EXPECT_EQ(kind_of([&] { m_engine->batch_query({"cats"}, id, 0); }), ErrorKind::InvalidTopK);
    EXPECT_EQ(kind_of([&] { m_engine->batch_query({"", "cats"}, id, 0); }), ErrorKind::InvalidTopK);
    EXPECT_EQ(kind_of([&] { m_engine->batch_query({""}, id, 0); }), ErrorKind::InvalidTopK);
}

TEST_F(QueryEngineTest, EmptyBatchReturnsNothing) {
    const auto id = build();
    EXPECT_TRUE(m_engine->batch_query({}, id, 1).empty());
}

TEST(BlankTextTest, DetectsWhitespaceOnly) {
    EXPECT_TRUE(is_blank(""));
    EXPECT_TRUE(is_blank(" \t\r\n"));
    EXPECT_FALSE(is_blank("  a "));
}
