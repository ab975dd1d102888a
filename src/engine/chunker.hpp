#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "parser_registry.hpp"
#include "reposcope/types.hpp"

namespace reposcope::engine {

    class Chunker {
    public:
        /**
         * @param parsers Structural grammars; must outlive the Chunker.
         * @param config Supplies max_chunk_size, overlap_size and min_chunk_size.
         */
        Chunker(const ParserRegistry& parsers, const IndexConfig& config);
        ~Chunker();

        /**
         * @brief Splits one file into chunks. Never throws.
         *
         * Uses syntax-tree extraction when a grammar is registered for the language and it
         * yields at least one definition; otherwise scans lines against language markers.
         * Output is deterministic for identical input, configuration and grammars.
         */
        std::vector<Chunk> chunk_file(const std::string& path, const std::string& content, const std::string& language) const;

        /**
         * @brief Syntax-tree extraction only. Empty when no grammar is registered or nothing was found.
         */
        std::vector<Chunk> chunk_structural(const std::string& path, const std::string& content, const std::string& language) const;

        /**
         * @brief Marker/size based line scanning only.
         */
        std::vector<Chunk> chunk_patterns(const std::string& path, const std::string& content, const std::string& language) const;

    private:
        struct Markers;
        struct Lines;

        const ParserRegistry& m_parsers;
        std::size_t m_max_chunk_size;
        std::size_t m_overlap_size;
        std::size_t m_min_chunk_size;
        std::map<std::string, std::shared_ptr<const Markers>> m_markers;
        std::shared_ptr<const Markers> m_default_markers;

        const Markers& markers_for(const std::string& language) const;

        void scan_lines(const Lines& lines, std::size_t first, std::size_t last, const std::string& path,
                        const std::string& language, std::vector<Chunk>& out) const;

        std::vector<Chunk> chunk_window(const std::string& path, const std::string& content, const std::string& language) const;
    };

}
