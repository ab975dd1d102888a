#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "reposcope/types.hpp"

namespace reposcope::engine {

    /**
     * @brief One persisted repository index: chunks without embeddings, vectors in chunk order, histogram.
     */
    struct CacheEntry {
        std::string identity;
        std::vector<Chunk> chunks;
        std::vector<std::vector<float>> vectors;
        std::map<std::string, int> language_histogram;
    };

    /**
     * @brief SQLite-backed store with one database file per repository identity.
     *
     * Entries live at <cache_dir>/<identity>.sqlite. save() writes a temporary file and
     * renames it over the entry, so load() only ever sees a complete entry or none.
     */
    class CacheStore {
    public:
        explicit CacheStore(std::filesystem::path cache_dir);

        /**
         * @brief Stable key for a repository locator (URL or root path): SHA-256 hex digest.
         */
        static std::string identity_for(const std::string& locator);

        /**
         * @brief Atomically replaces the entry for identity.
         * @return false on any failure; the previous entry, if any, is left intact.
         */
        bool save(const std::string& identity,
                  const std::vector<Chunk>& chunks,
                  const std::vector<std::vector<float>>& vectors,
                  const std::map<std::string, int>& language_histogram);

        /**
         * @brief Reads the entry for identity.
         * @return std::nullopt if the entry is missing or fails any validation.
         */
        std::optional<CacheEntry> load(const std::string& identity) const;

        /**
         * @brief Removes the entry. Returns true if an entry existed.
         */
        bool invalidate(const std::string& identity);

        bool exists(const std::string& identity) const;

        std::filesystem::path entry_path(const std::string& identity) const;
        const std::filesystem::path& directory() const { return m_dir; }

    private:
        std::filesystem::path m_dir;
    };

}
