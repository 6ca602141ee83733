#include "document_store.hpp"
#include "semsearch/sha256.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

namespace semsearch::engine {

    DirectoryDocumentStore::DirectoryDocumentStore(std::filesystem::path root, std::vector<std::string> extensions)
        : m_root(std::move(root)), m_extensions(std::move(extensions)) {}

    std::vector<Document> DirectoryDocumentStore::list_documents() const {
        std::vector<Document> documents;
        if (!std::filesystem::is_directory(m_root)) {
            std::cerr << "[DocumentStore] Invalid root path: " << m_root << "\n";
            return documents;
        }

        for (const auto& entry : std::filesystem::directory_iterator(m_root, std::filesystem::directory_options::skip_permission_denied)) {
            if (!entry.is_regular_file() || !accepts(entry.path())) continue;

            std::ifstream file(entry.path(), std::ios::binary);
            if (!file.is_open()) {
                std::cerr << "[DocumentStore] Skipping unreadable " << entry.path().filename() << "\n";
                continue;
            }
            std::stringstream buffer;
            buffer << file.rdbuf();

            Document doc;
            doc.id = entry.path().filename().string();
            doc.text = buffer.str();
            if (!is_valid_utf8(doc.text)) {
                std::cerr << "[DocumentStore] Skipping " << entry.path().filename() << ": not valid UTF-8\n";
                continue;
            }
            doc.size = doc.text.size();
            doc.hash = crypto::Sha256::hash(doc.text);
            documents.push_back(std::move(doc));
        }

        std::sort(documents.begin(), documents.end(),
            [](const Document& a, const Document& b) { return a.id < b.id; });
        return documents;
    }

    bool DirectoryDocumentStore::accepts(const std::filesystem::path& path) const {
        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
            [](unsigned char c) { return std::tolower(c); });
        return std::find(m_extensions.begin(), m_extensions.end(), ext) != m_extensions.end();
    }

    bool is_valid_utf8(const std::string& text) {
        size_t i = 0;
        const size_t n = text.size();
        while (i < n) {
            const auto c = static_cast<unsigned char>(text[i]);
            size_t len;
            unsigned char lo = 0x80, hi = 0xBF;
            if (c < 0x80) {
                ++i;
                continue;
            } else if (c >= 0xC2 && c <= 0xDF) {
                len = 2;
            } else if (c >= 0xE0 && c <= 0xEF) {
                len = 3;
                if (c == 0xE0) lo = 0xA0;
                if (c == 0xED) hi = 0x9F;
            } else if (c >= 0xF0 && c <= 0xF4) {
                len = 4;
                if (c == 0xF0) lo = 0x90;
                if (c == 0xF4) hi = 0x8F;
            } else {
                return false;
            }
            if (i + len > n) return false;

            const auto second = static_cast<unsigned char>(text[i + 1]);
            if (second < lo || second > hi) return false;
            for (size_t j = 2; j < len; ++j) {
                const auto next = static_cast<unsigned char>(text[i + j]);
                if (next < 0x80 || next > 0xBF) return false;
            }
            i += len;
        }
        return true;
    }

    std::string corpus_digest(const std::vector<Document>& documents) {
        std::vector<std::pair<std::string, std::string>> entries;
        entries.reserve(documents.size());
        for (const auto& doc : documents) {
            entries.emplace_back(doc.id, doc.hash.empty() ? crypto::Sha256::hash(doc.text) : doc.hash);
        }
        std::sort(entries.begin(), entries.end());

        crypto::Sha256 sha;
        for (const auto& [id, hash] : entries) {
            sha.update(id);
            sha.update("\0", 1);
            sha.update(hash);
            sha.update("\n", 1);
        }
        return sha.hex_digest();
    }

}
