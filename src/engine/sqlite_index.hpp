#pragma once

#include <filesystem>
#include <optional>
#include "vector_index.hpp"

namespace semsearch::engine {

    /**
     * @brief Exact-scan index persisted as <store_dir>/<id>/index.db.
     *
     * persist() writes into <id>.staging and then swaps it over the live
     * directory, so readers of the store never see a half-written index.
     */
    class SqliteIndex : public VectorIndex {
    public:
        SqliteIndex(IndexInfo info, IndexOptions options);

        void build(std::vector<Chunk> chunks, std::vector<std::vector<float>> vectors) override;
        std::vector<Neighbor> search(const std::vector<float>& query, size_t k) const override;

        bool persistent() const override { return true; }
        void persist() override;
        bool load() override;

        size_t size() const override { return m_table.size(); }
        size_t dimension() const override { return m_table.dimension(); }
        IndexBackend backend() const override { return IndexBackend::Sqlite; }

        std::filesystem::path directory() const { return m_options.store_dir / m_info.id; }

    protected:
        FlatTable m_table;
        IndexOptions m_options;

        /**
         * @brief Hooks for backends that keep extra files next to index.db.
         */
        virtual void write_extra(const std::filesystem::path&) {}
        virtual void load_extra(const std::filesystem::path&) {}

    private:
        void write_staging(const std::filesystem::path& staging);
        void swap_into_place(const std::filesystem::path& staging) const;
        void read_from(const std::filesystem::path& dir);
    };

    /**
     * @brief Moves staging over live, keeping the previous live directory as
     * old until the swap completes. If the swap fails, live is restored.
     */
    void replace_directory(const std::filesystem::path& staging, const std::filesystem::path& live,
                           const std::filesystem::path& old);

    /**
     * @brief Reads only the metadata record of a persisted index directory.
     * @return nullopt if the directory holds no index.db.
     */
    std::optional<IndexInfo> read_persisted_info(const std::filesystem::path& dir);

    /**
     * @brief Deletes the persisted state of an index, including leftovers.
     */
    void remove_persisted(const std::filesystem::path& store_dir, const std::string& index_id);

    /**
     * @brief Restores <id>.old directories orphaned by an interrupted swap and
     * drops stale staging directories.
     */
    void recover_store(const std::filesystem::path& store_dir);

}
