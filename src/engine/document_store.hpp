#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "semsearch/types.hpp"

namespace semsearch::engine {

    /**
     * @brief Read-only view of the documents to index. The pipeline never mutates it.
     */
    class DocumentSource {
    public:
        virtual ~DocumentSource() = default;

        /**
         * @brief Snapshot of every current document, ordered by id.
         */
        virtual std::vector<Document> list_documents() const = 0;
    };

    /**
     * @brief Documents are the text files directly inside one directory.
     */
    class DirectoryDocumentStore : public DocumentSource {
    public:
        explicit DirectoryDocumentStore(std::filesystem::path root,
                                        std::vector<std::string> extensions = {".txt", ".md"});

        std::vector<Document> list_documents() const override;

        const std::filesystem::path& root() const { return m_root; }

    private:
        std::filesystem::path m_root;
        std::vector<std::string> m_extensions;

        bool accepts(const std::filesystem::path& path) const;
    };

    // Well-formed UTF-8: no overlongs, surrogates or code points past U+10FFFF.
    bool is_valid_utf8(const std::string& text);

    /**
     * @brief Order-independent SHA-256 over document ids and content hashes.
     */
    std::string corpus_digest(const std::vector<Document>& documents);

}
