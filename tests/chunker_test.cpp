#include <gtest/gtest.h>
#include <string>
#include "engine/chunker.hpp"
#include "semsearch/error.hpp"

using namespace semsearch;
using namespace semsearch::engine;

namespace {

    std::string sample_text() {
        return "Semantic search finds passages by meaning rather than by exact words.\n\n"
               "A document is split into overlapping chunks. Each chunk is embedded into a vector! "
               "Queries are embedded the same way? The closest vectors win.\n"
               "Short line.\n"
               "Averyveryverylongwordwithoutanybreakpointsthatforcesahardcutsomewhereinthemiddle "
               "and then some trailing words to finish the document off nicely.";
    }

    // Every chunk is an exact span, the spans cover the text, and each one advances.
    void expect_spans_cover(const std::string& text, const std::vector<Chunk>& chunks, const ChunkerOptions& options) {
        ASSERT_FALSE(chunks.empty());
        EXPECT_EQ(chunks.front().start_offset, 0u);
        EXPECT_EQ(chunks.back().end_offset, text.size());

        for (size_t i = 0; i < chunks.size(); ++i) {
            const auto& c = chunks[i];
            EXPECT_EQ(c.index, i);
            EXPECT_LT(c.start_offset, c.end_offset);
            EXPECT_LE(c.content.size(), options.chunk_size);
            EXPECT_EQ(c.content, text.substr(c.start_offset, c.end_offset - c.start_offset));
            if (i > 0) {
                EXPECT_LE(c.start_offset, chunks[i - 1].end_offset) << "gap before chunk " << i;
                EXPECT_GT(c.start_offset, chunks[i - 1].start_offset) << "no progress at chunk " << i;
            }
        }
    }

}

TEST(ChunkerTest, EmptyTextYieldsNoChunks) {
    Chunker chunker;
    EXPECT_TRUE(chunker.split("", "empty.txt").empty());
}

TEST(ChunkerTest, WhitespaceOnlyTextIsStillChunked) {
    Chunker chunker;
    auto chunks = chunker.split("   \n  ", "blank.txt");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].content, "   \n  ");
}

TEST(ChunkerTest, ShortTextIsASingleChunk) {
    Chunker chunker;
    const std::string text = "Cats are mammals. Dogs are mammals too.";
    auto chunks = chunker.split(text, "mammals.txt");

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].content, text);
    EXPECT_EQ(chunks[0].source, "mammals.txt");
    EXPECT_EQ(chunks[0].index, 0u);
    EXPECT_EQ(chunks[0].start_offset, 0u);
    EXPECT_EQ(chunks[0].end_offset, text.size());
}

TEST(ChunkerTest, SpansReconstructTextForManyOptions) {
    const std::string text = sample_text();
    const ChunkerOptions cases[] = { {500, 50}, {60, 10}, {40, 0}, {25, 24}, {7, 3}, {1, 0} };

    for (const auto& options : cases) {
        SCOPED_TRACE("chunk_size=" + std::to_string(options.chunk_size) + " overlap=" + std::to_string(options.overlap));
        Chunker chunker(options);
        expect_spans_cover(text, chunker.split(text, "sample.txt"), options);
    }
}

TEST(ChunkerTest, PrefersParagraphBreaks) {
    const std::string first(30, 'a');
    const std::string second(30, 'b');
    Chunker chunker({50, 0});

    auto chunks = chunker.split(first + "\n\n" + second, "doc.txt");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].content, first + "\n\n");
    EXPECT_EQ(chunks[1].content, second);
}

TEST(ChunkerTest, PrefersSentenceOverWordBreaks) {
    Chunker chunker({40, 0});
    auto chunks = chunker.split("One two three four five. Six seven eight nine ten eleven.", "doc.txt");
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].content, "One two three four five. ");
}

TEST(ChunkerTest, OverlapStartsOnAWord) {
    Chunker chunker({30, 10});
    const std::string text = "alpha beta gamma delta epsilon zeta eta theta iota kappa lambda";
    auto chunks = chunker.split(text, "greek.txt");

    ASSERT_GE(chunks.size(), 2u);
    for (size_t i = 1; i < chunks.size(); ++i) {
        const size_t start = chunks[i].start_offset;
        EXPECT_LT(start, chunks[i - 1].end_offset) << "chunk " << i << " does not overlap";
        EXPECT_EQ(text[start - 1], ' ') << "chunk " << i << " starts mid-word";
    }
}

TEST(ChunkerTest, HardCutsKeepUtf8SequencesWhole) {
    std::string text;
    for (int i = 0; i < 20; ++i) text += "\xC3\xA9"; // e-acute, two bytes
    Chunker chunker({7, 0});

    auto chunks = chunker.split(text, "utf8.txt");
    expect_spans_cover(text, chunks, chunker.options());
    for (const auto& c : chunks) {
        EXPECT_NE(static_cast<unsigned char>(c.content.front()) & 0xC0, 0x80u);
        EXPECT_EQ(c.content.size() % 2, 0u);
    }
}

TEST(ChunkerTest, DocumentSplitUsesDocumentId) {
    Document doc;
    doc.id = "notes.md";
    doc.text = "Some notes.";
    auto chunks = Chunker().split(doc);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].source, "notes.md");
}

TEST(ChunkerTest, RejectsInvalidOptions) {
    auto expect_invalid = [](ChunkerOptions options) {
        try {
            Chunker chunker(options);
            FAIL() << "expected InvalidConfiguration";
        } catch (const Error& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
        }
    };
    expect_invalid({0, 0});
    expect_invalid({100, 100});
    expect_invalid({100, 150});
}
