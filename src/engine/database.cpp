#include "database.hpp"
#include "semsearch/error.hpp"
#include <cstring>
#include <iostream>
#include <map>
#include <vector>

namespace semsearch::engine {

    namespace {

        struct Statement {
            sqlite3_stmt* stmt = nullptr;
            ~Statement() {
                if (stmt) sqlite3_finalize(stmt);
            }
        };

        std::string column_string(sqlite3_stmt* stmt, int col) {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            int bytes = sqlite3_column_bytes(stmt, col);
            return text ? std::string(reinterpret_cast<const char*>(text), bytes) : std::string();
        }

    }

    Database::Database() = default;
    Database::~Database() { close(); }

    void Database::open(const std::filesystem::path& path, Mode mode) {
        close();
        m_path = path;
        int flags = mode == Mode::ReadOnly ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        if (sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
            std::string message = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            close();
            throw Error(ErrorKind::BackendIOError, "failed to open " + path.string() + ": " + message);
        }
        sqlite3_busy_timeout(m_db, 2000);
        if (mode == Mode::Create) {
            initialize_schema();
        }
    }

    void Database::close() {
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    void Database::initialize_schema() {
        exec("CREATE TABLE IF NOT EXISTS meta ("
             "  key TEXT PRIMARY KEY,"
             "  value TEXT NOT NULL"
             ");"
             "CREATE TABLE IF NOT EXISTS chunks ("
             "  position INTEGER PRIMARY KEY,"
             "  source TEXT NOT NULL,"
             "  chunk_index INTEGER NOT NULL,"
             "  start_offset INTEGER NOT NULL,"
             "  end_offset INTEGER NOT NULL,"
             "  content TEXT NOT NULL,"
             "  embedding BLOB NOT NULL"
             ");");
    }

    void Database::begin() { exec("BEGIN IMMEDIATE;"); }
    void Database::commit() { exec("COMMIT;"); }

    void Database::rollback() {
        if (m_db && !sqlite3_get_autocommit(m_db)) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void Database::write_info(const IndexInfo& info) {
        const std::map<std::string, std::string> values = {
            {"id", info.id},
            {"model_id", info.model_id},
            {"runtime", info.runtime},
            {"backend_id", info.backend_id},
            {"dimension", std::to_string(info.dimension)},
            {"chunk_count", std::to_string(info.chunk_count)},
            {"document_count", std::to_string(info.document_count)},
            {"created_at", info.created_at},
            {"corpus_digest", info.corpus_digest},
        };

        Statement s;
        const char* sql = "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);";
        if (sqlite3_prepare_v2(m_db, sql, -1, &s.stmt, nullptr) != SQLITE_OK) fail("prepare meta insert");

        for (const auto& [key, value] : values) {
            sqlite3_bind_text(s.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(s.stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(s.stmt) != SQLITE_DONE) fail("write metadata");
            sqlite3_reset(s.stmt);
        }
    }

    IndexInfo Database::read_info() {
        std::map<std::string, std::string> values;

        Statement s;
        if (sqlite3_prepare_v2(m_db, "SELECT key, value FROM meta;", -1, &s.stmt, nullptr) != SQLITE_OK) fail("prepare meta select");

        int rc;
        while ((rc = sqlite3_step(s.stmt)) == SQLITE_ROW) {
            values[column_string(s.stmt, 0)] = column_string(s.stmt, 1);
        }
        if (rc != SQLITE_DONE) fail("read metadata");

        IndexInfo info;
        try {
            info.id = values.at("id");
            info.model_id = values.at("model_id");
            info.runtime = values.at("runtime");
            info.backend_id = values.at("backend_id");
            info.dimension = std::stoull(values.at("dimension"));
            info.chunk_count = std::stoull(values.at("chunk_count"));
            info.document_count = std::stoull(values.at("document_count"));
            info.created_at = values.at("created_at");
            info.corpus_digest = values.at("corpus_digest");
        } catch (const std::exception& e) {
            throw Error(ErrorKind::BackendIOError, "corrupt metadata in " + m_path.string() + ": " + e.what());
        }
        return info;
    }

    void Database::write_chunks(const FlatTable& table) {
        Statement s;
        const char* sql = "INSERT INTO chunks (position, source, chunk_index, start_offset, end_offset, content, embedding) "
                          "VALUES (?, ?, ?, ?, ?, ?, ?);";
        if (sqlite3_prepare_v2(m_db, sql, -1, &s.stmt, nullptr) != SQLITE_OK) fail("prepare chunk insert");

        const int blob_bytes = static_cast<int>(table.dimension() * sizeof(float));
        for (size_t pos = 0; pos < table.size(); ++pos) {
            const Chunk& chunk = table.chunk(pos);
            sqlite3_bind_int64(s.stmt, 1, static_cast<sqlite3_int64>(pos));
            sqlite3_bind_text(s.stmt, 2, chunk.source.c_str(), static_cast<int>(chunk.source.size()), SQLITE_STATIC);
            sqlite3_bind_int64(s.stmt, 3, static_cast<sqlite3_int64>(chunk.index));
            sqlite3_bind_int64(s.stmt, 4, static_cast<sqlite3_int64>(chunk.start_offset));
            sqlite3_bind_int64(s.stmt, 5, static_cast<sqlite3_int64>(chunk.end_offset));
            sqlite3_bind_text(s.stmt, 6, chunk.content.c_str(), static_cast<int>(chunk.content.size()), SQLITE_STATIC);
            sqlite3_bind_blob(s.stmt, 7, table.row(pos), blob_bytes, SQLITE_STATIC);

            if (sqlite3_step(s.stmt) != SQLITE_DONE) fail("insert chunk " + std::to_string(pos));
            sqlite3_reset(s.stmt);
        }
    }

    void Database::read_chunks(FlatTable& table) {
        Statement s;
        const char* sql = "SELECT source, chunk_index, start_offset, end_offset, content, embedding FROM chunks ORDER BY position;";
        if (sqlite3_prepare_v2(m_db, sql, -1, &s.stmt, nullptr) != SQLITE_OK) fail("prepare chunk select");

        std::vector<float> vec;
        int rc;
        while ((rc = sqlite3_step(s.stmt)) == SQLITE_ROW) {
            Chunk chunk;
            chunk.source = column_string(s.stmt, 0);
            chunk.index = static_cast<size_t>(sqlite3_column_int64(s.stmt, 1));
            chunk.start_offset = static_cast<size_t>(sqlite3_column_int64(s.stmt, 2));
            chunk.end_offset = static_cast<size_t>(sqlite3_column_int64(s.stmt, 3));
            chunk.content = column_string(s.stmt, 4);

            const void* blob = sqlite3_column_blob(s.stmt, 5);
            int bytes = sqlite3_column_bytes(s.stmt, 5);
            if (!blob || bytes <= 0 || bytes % sizeof(float) != 0) {
                throw Error(ErrorKind::BackendIOError, "corrupt embedding in " + m_path.string());
            }
            vec.resize(bytes / sizeof(float));
            std::memcpy(vec.data(), blob, bytes);
            table.append(std::move(chunk), vec.data(), vec.size());
        }
        if (rc != SQLITE_DONE) fail("read chunks");
    }

    void Database::exec(const char* sql) {
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string message = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            std::cerr << "[Database] " << message << "\n";
            throw Error(ErrorKind::BackendIOError, m_path.string() + ": " + message);
        }
    }

    void Database::fail(const std::string& what) const {
        std::string message = m_db ? sqlite3_errmsg(m_db) : "database not open";
        std::cerr << "[Database] Failed to " << what << ": " << message << "\n";
        throw Error(ErrorKind::BackendIOError, "failed to " + what + " in " + m_path.string() + ": " + message);
    }

}
