#include "sqlite_index.hpp"
#include "database.hpp"
#include "semsearch/error.hpp"
#include <iostream>

namespace fs = std::filesystem;

namespace semsearch::engine {

    namespace {

        const char* const kDatabaseFile = "index.db";
        const char* const kStagingSuffix = ".staging";
        const char* const kOldSuffix = ".old";

        bool ends_with(const std::string& s, const std::string& suffix) {
            return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        // Storage errors are retried once; the second failure carries a rebuild hint.
        template <typename Op>
        auto with_retry(const char* what, const std::string& index_id, Op op) -> decltype(op()) {
            try {
                return op();
            } catch (const Error& e) {
                if (e.kind() != ErrorKind::BackendIOError) throw;
                std::cerr << "[SqliteIndex] " << what << " of " << index_id << " failed, retrying: " << e.what() << "\n";
            } catch (const fs::filesystem_error& e) {
                std::cerr << "[SqliteIndex] " << what << " of " << index_id << " failed, retrying: " << e.what() << "\n";
            }

            try {
                return op();
            } catch (const Error& e) {
                if (e.kind() != ErrorKind::BackendIOError) throw;
                throw Error(ErrorKind::BackendIOError, std::string(e.what()) + " (rebuild index '" + index_id + "')");
            } catch (const fs::filesystem_error& e) {
                throw Error(ErrorKind::BackendIOError, std::string(e.what()) + " (rebuild index '" + index_id + "')");
            }
        }

    }

    SqliteIndex::SqliteIndex(IndexInfo info, IndexOptions options)
        : VectorIndex(std::move(info)), m_options(std::move(options)) {
        m_info.backend_id = to_string(IndexBackend::Sqlite);
    }

    void SqliteIndex::build(std::vector<Chunk> chunks, std::vector<std::vector<float>> vectors) {
        m_table.assign(std::move(chunks), std::move(vectors));
        m_info.dimension = m_table.dimension();
        m_info.chunk_count = m_table.size();
    }

    std::vector<Neighbor> SqliteIndex::search(const std::vector<float>& query, size_t k) const {
        auto q = m_table.prepare_query(query, m_info.id);
        return m_table.scan(q, k);
    }

    void SqliteIndex::persist() {
        const fs::path staging = m_options.store_dir / (m_info.id + kStagingSuffix);
        with_retry("persist", m_info.id, [&] {
            write_staging(staging);
            swap_into_place(staging);
        });
        std::cout << "[SqliteIndex] Persisted " << m_info.id << " (" << m_table.size() << " chunks) to " << directory() << "\n";
    }

    bool SqliteIndex::load() {
        const fs::path dir = directory();
        if (!fs::exists(dir / kDatabaseFile)) return false;

        with_retry("load", m_info.id, [&] { read_from(dir); });
        return true;
    }

    void SqliteIndex::write_staging(const fs::path& staging) {
        fs::remove_all(staging);
        fs::create_directories(staging);

        Database db;
        db.open(staging / kDatabaseFile, Database::Mode::Create);
        db.begin();
        try {
            db.write_info(m_info);
            db.write_chunks(m_table);
            db.commit();
        } catch (const Error&) {
            db.rollback();
            throw;
        }
        db.close();

        write_extra(staging);
    }

    void SqliteIndex::swap_into_place(const fs::path& staging) const {
        replace_directory(staging, directory(), m_options.store_dir / (m_info.id + kOldSuffix));
    }

    void SqliteIndex::read_from(const fs::path& dir) {
        Database db;
        db.open(dir / kDatabaseFile, Database::Mode::ReadOnly);

        IndexInfo info = db.read_info();
        FlatTable table;
        db.read_chunks(table);
        db.close();

        if (table.size() != info.chunk_count || table.dimension() != info.dimension) {
            throw Error(ErrorKind::BackendIOError,
                        "index '" + info.id + "' is inconsistent: metadata says " + std::to_string(info.chunk_count) +
                        " chunks of dimension " + std::to_string(info.dimension) + ", found " + std::to_string(table.size()));
        }

        m_table = std::move(table);
        m_info = std::move(info);
        load_extra(dir);
    }

    void replace_directory(const fs::path& staging, const fs::path& live, const fs::path& old) {
        // A previous attempt may have stopped between the two renames.
        if (!fs::exists(live) && fs::exists(old)) fs::rename(old, live);

        if (!fs::exists(live)) {
            fs::rename(staging, live);
            return;
        }

        fs::remove_all(old);
        fs::rename(live, old);
        try {
            fs::rename(staging, live);
        } catch (const fs::filesystem_error&) {
            fs::rename(old, live);
            throw;
        }
        fs::remove_all(old);
    }

    std::optional<IndexInfo> read_persisted_info(const fs::path& dir) {
        if (!fs::exists(dir / kDatabaseFile)) return std::nullopt;

        Database db;
        db.open(dir / kDatabaseFile, Database::Mode::ReadOnly);
        return db.read_info();
    }

    void remove_persisted(const fs::path& store_dir, const std::string& index_id) {
        fs::remove_all(store_dir / index_id);
        fs::remove_all(store_dir / (index_id + kStagingSuffix));
        fs::remove_all(store_dir / (index_id + kOldSuffix));
    }

    void recover_store(const fs::path& store_dir) {
        if (!fs::is_directory(store_dir)) return;

        std::vector<fs::path> entries;
        for (const auto& entry : fs::directory_iterator(store_dir)) {
            if (entry.is_directory()) entries.push_back(entry.path());
        }

        for (const auto& path : entries) {
            std::string name = path.filename().string();
            if (ends_with(name, kStagingSuffix)) {
                std::cout << "[SqliteIndex] Dropping unfinished build " << path << "\n";
                fs::remove_all(path);
            } else if (ends_with(name, kOldSuffix)) {
                fs::path live = store_dir / name.substr(0, name.size() - std::string(kOldSuffix).size());
                if (fs::exists(live)) {
                    fs::remove_all(path);
                } else {
                    std::cout << "[SqliteIndex] Restoring " << live << " from interrupted swap\n";
                    fs::rename(path, live);
                }
            }
        }
    }

}
