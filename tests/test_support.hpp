#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include "engine/document_store.hpp"
#include "semsearch/sha256.h"

namespace semsearch::testutil {

    /**
     * @brief Unique directory under the system temp dir, removed on destruction.
     */
    class ScratchDir {
    public:
        ScratchDir() {
            static std::atomic<unsigned> counter{0};
            std::random_device rd;
            m_path = std::filesystem::temp_directory_path() /
                     ("semsearch_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
            std::filesystem::create_directories(m_path);
        }

        ~ScratchDir() {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
        }

        ScratchDir(const ScratchDir&) = delete;
        ScratchDir& operator=(const ScratchDir&) = delete;

        const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

    inline engine::Document make_document(const std::string& id, const std::string& text) {
        engine::Document doc;
        doc.id = id;
        doc.text = text;
        doc.size = text.size();
        doc.hash = crypto::Sha256::hash(text);
        return doc;
    }

    /**
     * @brief Document source whose contents tests can swap at any time.
     */
    class MemoryDocumentSource : public engine::DocumentSource {
    public:
        MemoryDocumentSource() = default;
        explicit MemoryDocumentSource(std::vector<engine::Document> documents) : m_documents(std::move(documents)) {}

        std::vector<engine::Document> list_documents() const override {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_documents;
        }

        void set(std::vector<engine::Document> documents) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_documents = std::move(documents);
        }

    private:
        mutable std::mutex m_mutex;
        std::vector<engine::Document> m_documents;
    };

    inline std::vector<engine::Document> animal_corpus() {
        return {
            make_document("cats.txt", "Cats are small carnivorous mammals. Cats purr and chase mice."),
            make_document("dogs.txt", "Dogs are loyal mammals. Dogs bark and fetch sticks in the park."),
            make_document("fish.txt", "Fish live in water and breathe through gills. Salmon swim upstream."),
        };
    }

}
