#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace reposcope::engine {

    /**
     * @brief Options recognized by a single build of a repository index.
     */
    struct IndexConfig {
        std::size_t max_file_size_bytes = 1024 * 1024;
        std::set<std::string> exclude_name_fragments = {
            ".git", ".svn", ".hg", "node_modules", "__pycache__", ".venv", "venv",
            "build", "dist", "target", ".idea", ".vscode", ".mypy_cache", ".pytest_cache"
        };
        std::optional<std::set<std::string>> include_extensions; // e.g. {".py", ".cpp"}; unset = all text files
        std::size_t max_chunk_size = 1000;
        std::size_t overlap_size = 100;
        std::size_t min_chunk_size = 50;
        std::size_t batch_size = 32;
        bool force_rebuild = false;

        std::size_t workers = std::max(1u, std::thread::hardware_concurrency());
        std::size_t embedding_concurrency = 1;
        long embedding_timeout_ms = 30000;

        void from_json(const nlohmann::json& j) {
            if (j.contains("max_file_size_bytes")) max_file_size_bytes = j["max_file_size_bytes"];
            if (j.contains("exclude_name_fragments")) exclude_name_fragments = j["exclude_name_fragments"].get<std::set<std::string>>();
            if (j.contains("include_extensions") && !j["include_extensions"].is_null()) {
                include_extensions = j["include_extensions"].get<std::set<std::string>>();
            }
            if (j.contains("max_chunk_size")) max_chunk_size = j["max_chunk_size"];
            if (j.contains("overlap_size")) overlap_size = j["overlap_size"];
            if (j.contains("min_chunk_size")) min_chunk_size = j["min_chunk_size"];
            if (j.contains("batch_size")) batch_size = j["batch_size"];
            if (j.contains("force_rebuild")) force_rebuild = j["force_rebuild"];
            if (j.contains("workers")) workers = j["workers"];
            if (j.contains("embedding_concurrency")) embedding_concurrency = j["embedding_concurrency"];
            if (j.contains("embedding_timeout_ms")) embedding_timeout_ms = j["embedding_timeout_ms"];
        }

        nlohmann::json to_json() const {
            nlohmann::json j;
            j["max_file_size_bytes"] = max_file_size_bytes;
            j["exclude_name_fragments"] = exclude_name_fragments;
            j["include_extensions"] = include_extensions ? nlohmann::json(*include_extensions) : nlohmann::json(nullptr);
            j["max_chunk_size"] = max_chunk_size;
            j["overlap_size"] = overlap_size;
            j["min_chunk_size"] = min_chunk_size;
            j["batch_size"] = batch_size;
            j["workers"] = workers;
            j["embedding_concurrency"] = embedding_concurrency;
            j["embedding_timeout_ms"] = embedding_timeout_ms;
            return j;
        }
    };

    struct Config {
        std::string embedding_backend = "ollama"; // ollama, openai
        std::string embedding_model = "nomic-embed-text";
        std::string embedding_endpoint = "http://localhost:11434/api/embed";
        std::string openai_key = "";
        std::filesystem::path cache_dir; // empty = platform cache dir
        IndexConfig index;

        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (std::filesystem::exists(path)) {
                try {
                    std::ifstream f(path);
                    nlohmann::json j = nlohmann::json::parse(f);

                    if (j.contains("embedding_backend")) cfg.embedding_backend = j["embedding_backend"].get<std::string>();
                    if (j.contains("embedding_model")) cfg.embedding_model = j["embedding_model"].get<std::string>();
                    if (j.contains("embedding_endpoint")) cfg.embedding_endpoint = j["embedding_endpoint"].get<std::string>();
                    if (j.contains("openai_key")) cfg.openai_key = j["openai_key"].get<std::string>();
                    if (j.contains("cache_dir")) cfg.cache_dir = j["cache_dir"].get<std::string>();
                    if (j.contains("index")) cfg.index.from_json(j["index"]);
                } catch (const nlohmann::json::exception& e) {
                    std::cerr << "[Config] Ignoring malformed " << path << ": " << e.what() << "\n";
                    cfg = Config{};
                }
            }

            if (const char* key = std::getenv("OPENAI_API_KEY")) cfg.openai_key = key;
            return cfg;
        }

        bool save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["embedding_backend"] = embedding_backend;
            j["embedding_model"] = embedding_model;
            j["embedding_endpoint"] = embedding_endpoint;
            if (!openai_key.empty()) j["openai_key"] = openai_key;
            if (!cache_dir.empty()) j["cache_dir"] = cache_dir.string();
            j["index"] = index.to_json();

            std::ofstream f(path);
            if (!f) return false;
            f << j.dump(4);
            return static_cast<bool>(f);
        }
    };

}
