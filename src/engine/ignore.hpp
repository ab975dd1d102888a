#pragma once

#include <filesystem>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace reposcope::engine {

    class Ignore {
    public:
        /**
         * @brief Loads glob patterns from a .reposcopeignore file.
         * @param ignore_file Path to the ignore file. Missing files are ignored.
         */
        void load(const std::filesystem::path& ignore_file);

        /**
         * @brief Registers path fragments that exclude any path containing them.
         * A fragment without '/' must equal a whole path component; one with '/' matches as a substring.
         */
        void add_fragments(const std::set<std::string>& fragments);

        /**
         * @brief Adds the default binary and artifact globs (*.png, *.so, ...).
         */
        void add_defaults();

        /**
         * @brief Checks if a path relative to the repository root should be skipped.
         */
        bool check(const std::filesystem::path& relative_path) const;

    private:
        struct Pattern {
            std::regex regex;
            std::string original;
        };
        std::vector<Pattern> m_patterns;
        std::set<std::string> m_components;
        std::vector<std::string> m_substrings;

        void add_glob(const std::string& glob);
        static std::string glob_to_regex(const std::string& glob);
    };

}
