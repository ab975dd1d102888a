#include "cache_store.hpp"
#include "reposcope/sha256.h"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>

namespace reposcope::engine {

    namespace {

        constexpr const char* kFormatVersion = "1";

        using DbHandle = std::unique_ptr<sqlite3, decltype(&sqlite3_close)>;
        using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

        const char* kSchema =
            "CREATE TABLE meta ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT NOT NULL"
            ");"
            "CREATE TABLE chunks ("
            "  row INTEGER PRIMARY KEY,"
            "  file_path TEXT NOT NULL,"
            "  start_line INTEGER NOT NULL,"
            "  end_line INTEGER NOT NULL,"
            "  chunk_type TEXT NOT NULL,"
            "  language TEXT NOT NULL,"
            "  size INTEGER NOT NULL,"
            "  content_hash TEXT NOT NULL,"
            "  content BLOB,"
            "  metadata TEXT"
            ");"
            "CREATE TABLE vectors ("
            "  row INTEGER PRIMARY KEY,"
            "  embedding BLOB NOT NULL"
            ");"
            "CREATE TABLE languages ("
            "  language TEXT PRIMARY KEY,"
            "  count INTEGER NOT NULL"
            ");";

        bool valid_identity(const std::string& identity) {
            if (identity.empty() || identity.size() > 128) return false;
            for (char c : identity) {
                bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-' || c == '_';
                if (!ok) return false;
            }
            return true;
        }

        bool exec(sqlite3* db, const char* sql) {
            char* err_msg = nullptr;
            if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
                std::cerr << "[CacheStore] SQL error: " << (err_msg ? err_msg : "unknown") << "\n";
                sqlite3_free(err_msg);
                return false;
            }
            return true;
        }

        Statement prepare(sqlite3* db, const char* sql) {
            sqlite3_stmt* stmt = nullptr;
            if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
                std::cerr << "[CacheStore] Prepare failed: " << sqlite3_errmsg(db) << "\n";
                return Statement(nullptr, &sqlite3_finalize);
            }
            return Statement(stmt, &sqlite3_finalize);
        }

        std::string column_text(sqlite3_stmt* stmt, int col) {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            return text ? std::string(reinterpret_cast<const char*>(text), sqlite3_column_bytes(stmt, col)) : std::string();
        }

        std::string column_blob(sqlite3_stmt* stmt, int col) {
            const void* blob = sqlite3_column_blob(stmt, col);
            int bytes = sqlite3_column_bytes(stmt, col);
            return blob && bytes > 0 ? std::string(static_cast<const char*>(blob), bytes) : std::string();
        }

        bool put_meta(sqlite3* db, const std::string& key, const std::string& value) {
            auto stmt = prepare(db, "INSERT INTO meta (key, value) VALUES (?, ?);");
            if (!stmt) return false;
            sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 2, value.c_str(), -1, SQLITE_TRANSIENT);
            return sqlite3_step(stmt.get()) == SQLITE_DONE;
        }

        bool write_entry(sqlite3* db, const std::string& identity, const std::vector<Chunk>& chunks,
                         const std::vector<std::vector<float>>& vectors, const std::map<std::string, int>& histogram,
                         size_t dim) {
            if (!exec(db, "PRAGMA journal_mode=OFF;") || !exec(db, "BEGIN;") || !exec(db, kSchema)) return false;

            auto created_at = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            if (!put_meta(db, "format_version", kFormatVersion) ||
                !put_meta(db, "identity", identity) ||
                !put_meta(db, "dimension", std::to_string(dim)) ||
                !put_meta(db, "row_count", std::to_string(chunks.size())) ||
                !put_meta(db, "created_at", std::to_string(created_at))) {
                return false;
            }

            auto chunk_stmt = prepare(db,
                "INSERT INTO chunks (row, file_path, start_line, end_line, chunk_type, language, size, content_hash, content, metadata) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
            auto vector_stmt = prepare(db, "INSERT INTO vectors (row, embedding) VALUES (?, ?);");
            if (!chunk_stmt || !vector_stmt) return false;

            for (size_t i = 0; i < chunks.size(); ++i) {
                const Chunk& c = chunks[i];
                std::string metadata = nlohmann::json(c.metadata).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

                sqlite3_stmt* s = chunk_stmt.get();
                sqlite3_reset(s);
                sqlite3_bind_int64(s, 1, static_cast<sqlite3_int64>(i));
                sqlite3_bind_text(s, 2, c.file_path.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int(s, 3, c.start_line);
                sqlite3_bind_int(s, 4, c.end_line);
                sqlite3_bind_text(s, 5, to_string(c.chunk_type), -1, SQLITE_STATIC);
                sqlite3_bind_text(s, 6, c.language.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int64(s, 7, static_cast<sqlite3_int64>(c.size));
                sqlite3_bind_text(s, 8, c.content_hash.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_blob(s, 9, c.content.data(), static_cast<int>(c.content.size()), SQLITE_TRANSIENT);
                sqlite3_bind_text(s, 10, metadata.c_str(), -1, SQLITE_TRANSIENT);
                if (sqlite3_step(s) != SQLITE_DONE) {
                    std::cerr << "[CacheStore] Chunk insert failed: " << sqlite3_errmsg(db) << "\n";
                    return false;
                }

                s = vector_stmt.get();
                sqlite3_reset(s);
                sqlite3_bind_int64(s, 1, static_cast<sqlite3_int64>(i));
                sqlite3_bind_blob(s, 2, vectors[i].data(), static_cast<int>(vectors[i].size() * sizeof(float)), SQLITE_TRANSIENT);
                if (sqlite3_step(s) != SQLITE_DONE) {
                    std::cerr << "[CacheStore] Vector insert failed: " << sqlite3_errmsg(db) << "\n";
                    return false;
                }
            }

            auto lang_stmt = prepare(db, "INSERT INTO languages (language, count) VALUES (?, ?);");
            if (!lang_stmt) return false;
            for (const auto& [language, count] : histogram) {
                sqlite3_reset(lang_stmt.get());
                sqlite3_bind_text(lang_stmt.get(), 1, language.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_int(lang_stmt.get(), 2, count);
                if (sqlite3_step(lang_stmt.get()) != SQLITE_DONE) return false;
            }

            return exec(db, "COMMIT;");
        }

    }

    CacheStore::CacheStore(std::filesystem::path cache_dir) : m_dir(std::move(cache_dir)) {}

    std::string CacheStore::identity_for(const std::string& locator) {
        return crypto::sha256_hex(locator);
    }

    std::filesystem::path CacheStore::entry_path(const std::string& identity) const {
        return m_dir / (identity + ".sqlite");
    }

    bool CacheStore::exists(const std::string& identity) const {
        std::error_code ec;
        return valid_identity(identity) && std::filesystem::is_regular_file(entry_path(identity), ec);
    }

    bool CacheStore::save(const std::string& identity,
                          const std::vector<Chunk>& chunks,
                          const std::vector<std::vector<float>>& vectors,
                          const std::map<std::string, int>& language_histogram) {
        if (!valid_identity(identity)) {
            std::cerr << "[CacheStore] Refusing to save invalid identity '" << identity << "'\n";
            return false;
        }
        if (vectors.size() != chunks.size()) {
            std::cerr << "[CacheStore] Refusing to save " << chunks.size() << " chunks with " << vectors.size() << " vectors\n";
            return false;
        }
        const size_t dim = vectors.empty() ? 0 : vectors.front().size();
        for (const auto& v : vectors) {
            if (v.size() != dim) {
                std::cerr << "[CacheStore] Refusing to save vectors of mixed dimension\n";
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::create_directories(m_dir, ec);
        if (ec) {
            std::cerr << "[CacheStore] Cannot create " << m_dir << ": " << ec.message() << "\n";
            return false;
        }

        const auto final_path = entry_path(identity);
        auto tmp_path = final_path;
        tmp_path += ".tmp";
        std::filesystem::remove(tmp_path, ec);

        bool ok = false;
        {
            sqlite3* raw = nullptr;
            int rc = sqlite3_open_v2(tmp_path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
            DbHandle db(raw, &sqlite3_close);
            if (rc != SQLITE_OK) {
                std::cerr << "[CacheStore] Failed to open " << tmp_path << ": " << (raw ? sqlite3_errmsg(raw) : "out of memory") << "\n";
            } else {
                ok = write_entry(db.get(), identity, chunks, vectors, language_histogram, dim);
            }
        }

        if (ok) {
            std::filesystem::rename(tmp_path, final_path, ec);
            if (ec) {
                std::cerr << "[CacheStore] Failed to move entry into place: " << ec.message() << "\n";
                ok = false;
            }
        }
        if (!ok) std::filesystem::remove(tmp_path, ec);
        return ok;
    }

    std::optional<CacheEntry> CacheStore::load(const std::string& identity) const {
        if (!exists(identity)) return std::nullopt;

        const auto path = entry_path(identity);
        sqlite3* raw = nullptr;
        int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
        DbHandle db(raw, &sqlite3_close);
        if (rc != SQLITE_OK) {
            std::cerr << "[CacheStore] Ignoring unreadable entry " << path << "\n";
            return std::nullopt;
        }

        auto corrupt = [&](const std::string& why) -> std::optional<CacheEntry> {
            std::cerr << "[CacheStore] Ignoring corrupt entry " << path << ": " << why << "\n";
            return std::nullopt;
        };

        try {
            std::map<std::string, std::string> meta;
            {
                auto stmt = prepare(db.get(), "SELECT key, value FROM meta;");
                if (!stmt) return corrupt("no meta table");
                while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
                    meta[column_text(stmt.get(), 0)] = column_text(stmt.get(), 1);
                }
                if (rc != SQLITE_DONE) return corrupt(sqlite3_errmsg(db.get()));
            }

            if (meta["format_version"] != kFormatVersion) return corrupt("unsupported format version");
            if (meta["identity"] != identity) return corrupt("identity mismatch");
            const size_t dim = std::stoul(meta.at("dimension"));
            const size_t row_count = std::stoul(meta.at("row_count"));

            CacheEntry entry;
            entry.identity = identity;
            entry.chunks.reserve(row_count);
            entry.vectors.reserve(row_count);

            {
                auto stmt = prepare(db.get(),
                    "SELECT row, file_path, start_line, end_line, chunk_type, language, size, content_hash, content, metadata "
                    "FROM chunks ORDER BY row;");
                if (!stmt) return corrupt("no chunks table");
                while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
                    sqlite3_stmt* s = stmt.get();
                    if (static_cast<size_t>(sqlite3_column_int64(s, 0)) != entry.chunks.size()) return corrupt("chunk rows not contiguous");

                    Chunk c;
                    c.file_path = column_text(s, 1);
                    c.start_line = sqlite3_column_int(s, 2);
                    c.end_line = sqlite3_column_int(s, 3);
                    c.chunk_type = chunk_type_from_string(column_text(s, 4));
                    c.language = column_text(s, 5);
                    c.size = static_cast<size_t>(sqlite3_column_int64(s, 6));
                    c.content_hash = column_text(s, 7);
                    c.content = column_blob(s, 8);
                    c.metadata = nlohmann::json::parse(column_text(s, 9)).get<std::map<std::string, std::string>>();

                    if (c.size != c.content.size() || c.end_line < c.start_line) return corrupt("chunk record inconsistent");
                    if (c.content_hash != crypto::sha256_hex(c.content)) return corrupt("content hash mismatch");
                    entry.chunks.push_back(std::move(c));
                }
                if (rc != SQLITE_DONE) return corrupt(sqlite3_errmsg(db.get()));
            }

            {
                auto stmt = prepare(db.get(), "SELECT row, embedding FROM vectors ORDER BY row;");
                if (!stmt) return corrupt("no vectors table");
                while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
                    if (static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0)) != entry.vectors.size()) return corrupt("vector rows not contiguous");
                    const void* blob = sqlite3_column_blob(stmt.get(), 1);
                    size_t bytes = static_cast<size_t>(sqlite3_column_bytes(stmt.get(), 1));
                    if (!blob || bytes != dim * sizeof(float)) return corrupt("vector blob has wrong size");

                    std::vector<float> vec(dim);
                    std::memcpy(vec.data(), blob, bytes);
                    entry.vectors.push_back(std::move(vec));
                }
                if (rc != SQLITE_DONE) return corrupt(sqlite3_errmsg(db.get()));
            }

            if (entry.chunks.size() != row_count || entry.vectors.size() != row_count) return corrupt("row count mismatch");

            {
                auto stmt = prepare(db.get(), "SELECT language, count FROM languages;");
                if (!stmt) return corrupt("no languages table");
                while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
                    entry.language_histogram[column_text(stmt.get(), 0)] = sqlite3_column_int(stmt.get(), 1);
                }
                if (rc != SQLITE_DONE) return corrupt(sqlite3_errmsg(db.get()));
            }

            return entry;
        } catch (const std::exception& e) {
            return corrupt(e.what());
        }
    }

    bool CacheStore::invalidate(const std::string& identity) {
        if (!valid_identity(identity)) return false;
        std::error_code ec;
        auto path = entry_path(identity);
        auto tmp_path = path;
        tmp_path += ".tmp";
        std::filesystem::remove(tmp_path, ec);
        bool removed = std::filesystem::remove(path, ec);
        if (ec) std::cerr << "[CacheStore] Failed to remove " << path << ": " << ec.message() << "\n";
        return removed;
    }

}
