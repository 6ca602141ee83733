#pragma once

#include <string>
#include <filesystem>
#include <sqlite3.h>
#include "semsearch/types.hpp"
#include "vector_index.hpp"

namespace semsearch::engine {

    /**
     * @brief SQLite file holding one index: metadata record plus chunk rows with
     * their normalized vectors. Every failure raises Error(BackendIOError).
     */
    class Database {
    public:
        enum class Mode {
            Create,   // create or truncate for writing
            ReadOnly
        };

        Database();
        ~Database();

        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        void open(const std::filesystem::path& path, Mode mode);
        void close();

        /**
         * @brief Creates the meta and chunks tables if they don't exist.
         */
        void initialize_schema();

        void begin();
        void commit();
        void rollback();

        /**
         * @brief Replaces the metadata record.
         */
        void write_info(const IndexInfo& info);
        IndexInfo read_info();

        /**
         * @brief Inserts every row of the table, in position order.
         */
        void write_chunks(const FlatTable& table);

        /**
         * @brief Appends every stored row to the table, in position order.
         */
        void read_chunks(FlatTable& table);

    private:
        sqlite3* m_db = nullptr;
        std::filesystem::path m_path;

        void exec(const char* sql);
        [[noreturn]] void fail(const std::string& what) const;
    };

}
