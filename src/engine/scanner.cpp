#include "scanner.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>

namespace reposcope::engine {

    const char* to_string(ReadStatus status) {
        switch (status) {
            case ReadStatus::Ok: return "ok";
            case ReadStatus::TooLarge: return "too large";
            case ReadStatus::Unreadable: return "unreadable";
            case ReadStatus::Binary: return "not text";
        }
        return "unknown";
    }

    Scanner::Scanner(const IndexConfig& config) : m_config(config) {
        m_ignore.add_defaults();
        m_ignore.add_fragments(m_config.exclude_name_fragments);
    }

    std::vector<std::string> Scanner::list(const std::filesystem::path& root) {
        namespace fs = std::filesystem;
        std::vector<std::string> files;

        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            std::cerr << "[Scanner] Invalid root path: " << root << "\n";
            return files;
        }
        m_ignore.load(root / ".reposcopeignore");

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            fs::path rel = it->path().lexically_relative(root);

            std::error_code entry_ec;
            if (m_ignore.check(rel)) {
                if (it->is_directory(entry_ec)) it.disable_recursion_pending();
                continue;
            }
            if (it->is_symlink(entry_ec) || !it->is_regular_file(entry_ec)) continue;
            if (!extension_allowed(rel)) continue;

            files.push_back(rel.generic_string());
        }
        if (ec) {
            std::cerr << "[Scanner] Walk stopped early under " << root << ": " << ec.message() << "\n";
        }

        std::sort(files.begin(), files.end());
        return files;
    }

    void Scanner::scan(const std::filesystem::path& root, FileCallback callback, SkipCallback on_skip) {
        for (const auto& rel : list(root)) {
            SourceFile file;
            file.relative_path = rel;
            ReadStatus status = read_text(root, rel, file.content);
            if (status != ReadStatus::Ok) {
                std::cerr << "[Scanner] Skipping " << rel << " (" << to_string(status) << ")\n";
                if (on_skip) on_skip(rel, status);
                continue;
            }
            if (!callback(file)) return;
        }
    }

    ReadStatus Scanner::read_text(const std::filesystem::path& root, const std::string& relative_path, std::string& out) const {
        const std::filesystem::path path = root / relative_path;

        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec) return ReadStatus::Unreadable;
        if (size > m_config.max_file_size_bytes) return ReadStatus::TooLarge;

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) return ReadStatus::Unreadable;
        out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (file.bad()) return ReadStatus::Unreadable;

        if (!is_text(out)) {
            out.clear();
            return ReadStatus::Binary;
        }
        return ReadStatus::Ok;
    }

    bool Scanner::is_text(const std::string& data) {
        std::size_t i = 0;
        const std::size_t n = data.size();
        while (i < n) {
            auto c = static_cast<unsigned char>(data[i]);
            if (c == 0) return false;
            if (c < 0x80) { ++i; continue; }

            std::size_t extra;
            if ((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
            else if ((c & 0xF0) == 0xE0) extra = 2;
            else if ((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
            else return false;

            if (i + extra >= n) return false;
            for (std::size_t k = 1; k <= extra; ++k) {
                if ((static_cast<unsigned char>(data[i + k]) & 0xC0) != 0x80) return false;
            }
            i += extra + 1;
        }
        return true;
    }

    bool Scanner::extension_allowed(const std::filesystem::path& path) const {
        if (!m_config.include_extensions) return true;

        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext.empty()) return false;

        const auto& allowed = *m_config.include_extensions;
        return allowed.count(ext) > 0 || allowed.count(ext.substr(1)) > 0;
    }

}
