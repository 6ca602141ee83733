#include <gtest/gtest.h>
#include <fstream>
#include "engine/document_store.hpp"
#include "test_support.hpp"

using namespace semsearch;
using namespace semsearch::engine;
using semsearch::testutil::ScratchDir;
using semsearch::testutil::make_document;

namespace {

    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::ofstream f(path, std::ios::binary);
        f << content;
    }

}

TEST(DocumentStoreTest, ListsTextFilesSortedById) {
    ScratchDir dir;
    write_file(dir.path() / "b.md", "Second.");
    write_file(dir.path() / "a.txt", "First.");
    write_file(dir.path() / "image.png", "not text");
    std::filesystem::create_directories(dir.path() / "nested.txt");

    auto docs = DirectoryDocumentStore(dir.path()).list_documents();
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0].id, "a.txt");
    EXPECT_EQ(docs[0].text, "First.");
    EXPECT_EQ(docs[0].size, 6u);
    EXPECT_EQ(docs[0].hash, make_document("a.txt", "First.").hash);
    EXPECT_EQ(docs[1].id, "b.md");
}

TEST(DocumentStoreTest, SkipsFilesThatAreNotUtf8) {
    ScratchDir dir;
    write_file(dir.path() / "latin1.txt", "caf\xe9 au lait is a coffee drink");
    write_file(dir.path() / "utf8.txt", "caf\xc3\xa9 au lait is a coffee drink");

    auto docs = DirectoryDocumentStore(dir.path()).list_documents();
    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(docs[0].id, "utf8.txt");
}

TEST(DocumentStoreTest, MissingRootHasNoDocuments) {
    ScratchDir dir;
    EXPECT_TRUE(DirectoryDocumentStore(dir.path() / "absent").list_documents().empty());
}

TEST(Utf8Test, AcceptsWellFormedText) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("\xc3\xa9\xe2\x82\xac\xf0\x9f\x98\x80"));
}

TEST(Utf8Test, RejectsMalformedSequences) {
    EXPECT_FALSE(is_valid_utf8("caf\xe9"));           // lone Latin-1 byte
    EXPECT_FALSE(is_valid_utf8("\xc3"));              // truncated
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));          // overlong
    EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));      // surrogate
    EXPECT_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));  // past U+10FFFF
    EXPECT_FALSE(is_valid_utf8("\x80"));
}
