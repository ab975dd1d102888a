#include <iostream>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "platform.hpp"
#include "engine/cache_store.hpp"
#include "engine/config.hpp"
#include "engine/embedder.hpp"
#include "engine/embedding_adapter.hpp"
#include "engine/pipeline.hpp"
#include "engine/query_engine.hpp"
#include <nlohmann/json.hpp>

namespace engine = reposcope::engine;

namespace {

    constexpr int kExitCancelled = 130;

    std::atomic<engine::Pipeline*> g_pipeline{nullptr};

    void signal_handler(int) {
        if (auto* pipeline = g_pipeline.load()) pipeline->cancel();
    }

    void print_usage() {
        std::cerr <<
            "Usage:\n"
            "  reposcope index <root> [--locator L] [--force] [--chunk-size N] [--overlap-size N] [--output FILE]\n"
            "  reposcope query <root> <text> [--locator L] [-k N] [--json]\n"
            "  reposcope invalidate <root> [--locator L]\n"
            "  reposcope status\n";
    }

    struct Options {
        std::string command;
        std::vector<std::string> positional;
        std::string locator;
        std::string output;
        bool force = false;
        bool json = false;
        size_t top_k = 5;
        std::optional<size_t> chunk_size;
        std::optional<size_t> overlap_size;
    };

    bool parse_args(int argc, char* argv[], Options& opts) {
        if (argc < 2) return false;
        opts.command = argv[1];

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&](std::string& out) {
                if (i + 1 >= argc) {
                    std::cerr << "[reposcope] Missing value for " << arg << "\n";
                    return false;
                }
                out = argv[++i];
                return true;
            };
            auto number = [&](size_t& out) {
                std::string text;
                if (!value(text)) return false;
                try {
                    out = std::stoul(text);
                } catch (const std::exception&) {
                    std::cerr << "[reposcope] Invalid number for " << arg << ": " << text << "\n";
                    return false;
                }
                return true;
            };

            if (arg == "--locator") {
                if (!value(opts.locator)) return false;
            } else if (arg == "--output") {
                if (!value(opts.output)) return false;
            } else if (arg == "--force") {
                opts.force = true;
            } else if (arg == "--json") {
                opts.json = true;
            } else if (arg == "-k" || arg == "--top-k") {
                if (!number(opts.top_k)) return false;
            } else if (arg == "--chunk-size") {
                size_t n = 0;
                if (!number(n)) return false;
                opts.chunk_size = n;
            } else if (arg == "--overlap-size") {
                size_t n = 0;
                if (!number(n)) return false;
                opts.overlap_size = n;
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "[reposcope] Unknown option " << arg << "\n";
                return false;
            } else {
                opts.positional.push_back(arg);
            }
        }
        return true;
    }

    std::filesystem::path config_path() {
        auto config_dir = reposcope::platform::system::get_config_dir();
        return config_dir.empty() ? std::filesystem::path("config.json") : config_dir / "config.json";
    }

    std::filesystem::path resolve_cache_dir(const engine::Config& config) {
        if (!config.cache_dir.empty()) return config.cache_dir;
        auto dir = reposcope::platform::system::get_cache_dir();
        return dir.empty() ? std::filesystem::current_path() / ".reposcope-cache" : dir;
    }

    void print_report(const engine::BuildReport& report) {
        std::cout << "[reposcope] Repository identity: " << report.identity << "\n"
                  << "[reposcope] From cache:        " << (report.from_cache ? "yes" : "no") << "\n"
                  << "[reposcope] Files scanned:     " << report.files_scanned << " (" << report.files_skipped << " skipped)\n"
                  << "[reposcope] Chunks created:    " << report.chunks_created << "\n"
                  << "[reposcope] Chunks embedded:   " << report.chunks_embedded << "\n"
                  << "[reposcope] Chunks failed:     " << report.chunks_failed << "\n"
                  << "[reposcope] Cache written:     " << (report.cache_written ? "yes" : "no") << "\n"
                  << "[reposcope] Elapsed:           " << report.elapsed_seconds << "s\n";
        for (const auto& warning : report.warnings) std::cerr << "[reposcope] Warning: " << warning << "\n";
    }

    int run_status(const engine::Config& config) {
        engine::ParserRegistry parsers;
        std::cout << "[reposcope] Config path:       " << config_path() << "\n"
                  << "[reposcope] Cache dir:         " << resolve_cache_dir(config) << "\n"
                  << "[reposcope] Data dir:          " << reposcope::platform::system::get_data_dir() << "\n"
                  << "[reposcope] Embedding backend: " << config.embedding_backend << " (" << config.embedding_model << ")\n"
                  << "[reposcope] Structural parsers:";
        auto languages = parsers.languages();
        if (languages.empty()) std::cout << " none";
        for (const auto& language : languages) std::cout << " " << language;
        std::cout << "\n";
        return 0;
    }

}

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 1;
    }

    auto config = engine::Config::load(config_path());
    if (opts.chunk_size) config.index.max_chunk_size = *opts.chunk_size;
    if (opts.overlap_size) config.index.overlap_size = *opts.overlap_size;
    config.index.force_rebuild = opts.force;

    if (opts.command == "status") return run_status(config);

    const size_t wanted = opts.command == "query" ? 2 : 1;
    if ((opts.command != "index" && opts.command != "query" && opts.command != "invalidate") || opts.positional.size() != wanted) {
        print_usage();
        return 1;
    }

    engine::RepositorySource source{opts.positional[0], opts.locator};
    engine::CacheStore cache(resolve_cache_dir(config));

    if (opts.command == "invalidate") {
        const auto identity = engine::Pipeline::identity_of(source);
        bool removed = cache.invalidate(identity);
        std::cout << "[reposcope] " << (removed ? "Removed" : "No") << " cache entry for " << identity << "\n";
        return 0;
    }

    auto embedder = engine::create_embedder(config);
    if (!embedder) {
        std::cerr << "[reposcope] No embedding provider available.\n";
        return 1;
    }

    engine::Pipeline pipeline(*embedder, cache);
    g_pipeline = &pipeline;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    engine::BuildReport report;
    try {
        report = pipeline.build_or_load(source, config.index);
    } catch (const std::exception& e) {
        g_pipeline = nullptr;
        std::cerr << "[reposcope] Build failed: " << e.what() << "\n";
        return 1;
    }
    g_pipeline = nullptr;

    if (report.cancelled) {
        std::cerr << "[reposcope] Cancelled.\n";
        return kExitCancelled;
    }

    if (opts.command == "index") {
        print_report(report);
        if (!opts.output.empty()) {
            std::ofstream out(opts.output);
            out << engine::to_json(report).dump(2) << "\n";
            if (!out) {
                std::cerr << "[reposcope] Failed to write " << opts.output << "\n";
                return 1;
            }
            std::cout << "[reposcope] Report saved to " << opts.output << "\n";
        }
        return 0;
    }

    engine::EmbeddingAdapter adapter(*embedder, config.index);
    engine::QueryEngine query_engine(adapter, pipeline.published());
    std::vector<engine::RankedResult> results;
    try {
        results = query_engine.query(opts.positional[1], opts.top_k);
    } catch (const std::exception& e) {
        std::cerr << "[reposcope] Query failed: " << e.what() << "\n";
        return 1;
    }

    if (opts.json) {
        std::cout << engine::to_json(results).dump(2) << "\n";
        return 0;
    }
    if (results.empty()) {
        std::cout << "No results.\n";
        return 0;
    }
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& c = results[i].chunk;
        std::cout << "#" << (i + 1) << "  " << c.file_path << ":" << c.start_line << "-" << c.end_line
                  << "  [" << engine::to_string(c.chunk_type);
        auto name = c.metadata.find("name");
        if (name != c.metadata.end()) std::cout << " " << name->second;
        std::cout << "]  score=" << results[i].score << "\n" << c.content << "\n\n";
    }
    return 0;
}
