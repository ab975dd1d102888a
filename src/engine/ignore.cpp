#include "ignore.hpp"
#include <fstream>
#include <iostream>

namespace reposcope::engine {

    void Ignore::load(const std::filesystem::path& ignore_file) {
        std::error_code ec;
        if (!std::filesystem::exists(ignore_file, ec)) return;

        std::ifstream file(ignore_file);
        std::string line;
        while (std::getline(file, line)) {
            line.erase(0, line.find_first_not_of(" \t\r"));
            line.erase(line.find_last_not_of(" \t\r") + 1);

            if (line.empty() || line[0] == '#') continue;
            if (line.back() == '/') line.pop_back();
            if (line.empty()) continue;

            if (line.find('/') != std::string::npos) m_substrings.push_back(line);
            else add_glob(line);
        }
    }

    void Ignore::add_fragments(const std::set<std::string>& fragments) {
        for (const auto& f : fragments) {
            if (f.empty()) continue;
            if (f.find('/') != std::string::npos) m_substrings.push_back(f);
            else m_components.insert(f);
        }
    }

    void Ignore::add_defaults() {
        static const char* defaults[] = {
            "*.o", "*.obj", "*.a", "*.lib", "*.exe", "*.dll", "*.so", "*.dylib", "*.class", "*.pyc",
            "*.png", "*.jpg", "*.jpeg", "*.gif", "*.bmp", "*.ico", "*.pdf", "*.zip", "*.gz", "*.tar",
            "*.7z", "*.jar", "*.mp3", "*.mp4", "*.wav", "*.mov", "*.woff", "*.woff2", "*.ttf",
            ".DS_Store", "Thumbs.db", "*.sqlite", "*.sqlite.tmp", "*.min.js", "*.lock", ".reposcopeignore"
        };
        for (const char* p : defaults) add_glob(p);
    }

    bool Ignore::check(const std::filesystem::path& relative_path) const {
        const std::string generic = relative_path.generic_string();
        for (const auto& s : m_substrings) {
            if (generic.find(s) != std::string::npos) return true;
        }

        for (const auto& component : relative_path) {
            std::string name = component.string();
            if (m_components.count(name)) return true;
            for (const auto& p : m_patterns) {
                if (std::regex_match(name, p.regex)) return true;
            }
        }
        return false;
    }

    void Ignore::add_glob(const std::string& glob) {
        try {
            m_patterns.push_back({std::regex(glob_to_regex(glob)), glob});
        } catch (const std::regex_error& e) {
            std::cerr << "[Ignore] Skipping bad pattern '" << glob << "': " << e.what() << "\n";
        }
    }

    std::string Ignore::glob_to_regex(const std::string& glob) {
        std::string regex_str = "^";
        for (char c : glob) {
            switch (c) {
                case '*': regex_str += ".*"; break;
                case '?': regex_str += "."; break;
                case '.': case '+': case '(': case ')': case '[': case ']':
                case '{': case '}': case '^': case '$': case '|': case '\\':
                    regex_str += '\\';
                    regex_str += c;
                    break;
                default: regex_str += c;
            }
        }
        regex_str += "$";
        return regex_str;
    }

}
