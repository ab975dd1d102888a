#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "reposcope/types.hpp"

namespace reposcope::engine {

    /**
     * @brief A top-level function or class found by a syntax-tree parser.
     */
    struct Definition {
        ChunkType type = ChunkType::Function;
        std::string name;
        int start_line = 0;     // 1-based, inclusive
        int end_line = 0;
        std::string doc;        // leading comment block or docstring, may be empty
        int doc_start_line = 0; // first line of the leading comment block, 0 if none
    };

    /**
     * @brief Owns the structural (tree-sitter) grammars available to one pipeline.
     *
     * Constructed once and passed by reference to the Chunker. Grammars are registered
     * only for the languages compiled in; every other language uses the pattern path.
     * extract() is safe to call concurrently: each call uses its own parser.
     */
    class ParserRegistry {
    public:
        ParserRegistry();
        ~ParserRegistry();

        ParserRegistry(const ParserRegistry&) = delete;
        ParserRegistry& operator=(const ParserRegistry&) = delete;

        bool has(const std::string& language) const;

        /**
         * @brief Language tags with a structural grammar, sorted.
         */
        std::vector<std::string> languages() const;

        /**
         * @brief Parses source and returns its top-level definitions in source order.
         * @return std::nullopt if no grammar is registered or the parser produced no tree.
         */
        std::optional<std::vector<Definition>> extract(const std::string& language, const std::string& source) const;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

}
