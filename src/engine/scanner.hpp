#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "config.hpp"
#include "ignore.hpp"
#include "reposcope/types.hpp"

namespace reposcope::engine {

    enum class ReadStatus {
        Ok,
        TooLarge,
        Unreadable,
        Binary
    };

    const char* to_string(ReadStatus status);

    class Scanner {
    public:
        using FileCallback = std::function<bool(const SourceFile&)>;
        using SkipCallback = std::function<void(const std::string& relative_path, ReadStatus status)>;

        explicit Scanner(const IndexConfig& config);

        /**
         * @brief Lists candidate files under root in lexical order of their relative paths.
         * Applies exclude fragments, ignore globs and the extension filter. Does not read contents.
         */
        std::vector<std::string> list(const std::filesystem::path& root);

        /**
         * @brief Walks root in list() order and hands every readable text file to the callback, one at a time.
         * The walk stops early when the callback returns false.
         * @param on_skip Optional; called for files that are too large, unreadable or binary.
         */
        void scan(const std::filesystem::path& root, FileCallback callback, SkipCallback on_skip = {});

        /**
         * @brief Reads one file relative to root, enforcing the size limit and the text check.
         */
        ReadStatus read_text(const std::filesystem::path& root, const std::string& relative_path, std::string& out) const;

        /**
         * @brief True if data has no NUL bytes and is valid UTF-8.
         */
        static bool is_text(const std::string& data);

    private:
        IndexConfig m_config;
        Ignore m_ignore;

        bool extension_allowed(const std::filesystem::path& path) const;
    };

}
