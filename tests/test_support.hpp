#pragma once

#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <string>
#include <vector>
#include "engine/embedder.hpp"

namespace reposcope::test {

    /**
     * @brief Scratch directory under the system temp dir, removed on destruction.
     */
    class TempDir {
    public:
        TempDir() {
            std::random_device rd;
            const auto base = std::filesystem::temp_directory_path();
            for (;;) {
                m_path = base / ("reposcope-test-" + std::to_string(rd()));
                if (std::filesystem::create_directory(m_path)) break;
            }
        }

        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::filesystem::path& path() const { return m_path; }

        std::filesystem::path write(const std::string& relative, const std::string& content) const {
            auto file = m_path / relative;
            std::filesystem::create_directories(file.parent_path());
            std::ofstream out(file, std::ios::binary);
            out << content;
            return file;
        }

    private:
        std::filesystem::path m_path;
    };

    /**
     * @brief Deterministic stand-in for an embedding model: hashed bag of lower-cased word tokens.
     */
    inline std::vector<float> bag_of_words(const std::string& text, size_t dim = 1024) {
        std::vector<float> v(dim, 0.0f);
        std::string token;
        auto flush = [&]() {
            if (token.empty()) return;
            v[std::hash<std::string>{}(token) % dim] += 1.0f;
            token.clear();
        };
        for (char c : text) {
            auto u = static_cast<unsigned char>(c);
            if (std::isalnum(u) || c == '_') token += static_cast<char>(std::tolower(u));
            else flush();
        }
        flush();
        return v;
    }

    inline engine::EmbedFunction bag_of_words_fn(std::atomic<int>* calls = nullptr) {
        return [calls](const std::vector<std::string>& texts) {
            if (calls) ++*calls;
            std::vector<std::vector<float>> out;
            out.reserve(texts.size());
            for (const auto& t : texts) out.push_back(bag_of_words(t));
            return out;
        };
    }

}
