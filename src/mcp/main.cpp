#include <iostream>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../platform.hpp"
#include "../engine/cache_store.hpp"
#include "../engine/config.hpp"
#include "../engine/embedder.hpp"
#include "../engine/embedding_adapter.hpp"
#include "../engine/pipeline.hpp"
#include "../engine/query_engine.hpp"

using json = nlohmann::json;
namespace engine = reposcope::engine;

namespace {

    // JSON-RPC goes to the real stdout; std::cout is redirected to stderr so engine logs
    // cannot corrupt the transport.
    std::ostream* g_rpc_out = nullptr;

    void send_response(const json& id, const json& result) {
        json response = {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"result", result}
        };
        *g_rpc_out << response.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
    }

    void send_error(const json& id, int code, const std::string& message) {
        json response = {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"error", {{"code", code}, {"message", message}}}
        };
        *g_rpc_out << response.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
    }

    json text_content(const std::string& text) {
        return {{"content", json::array({{{"type", "text"}, {"text", text}}})}};
    }

    json tool_list() {
        return {
            {"tools", json::array({
                {
                    {"name", "search_repository"},
                    {"description", "Semantic search over the indexed repository. Returns the most relevant code passages."},
                    {"inputSchema", {
                        {"type", "object"},
                        {"properties", {
                            {"query", {{"type", "string"}, {"description", "Natural-language search query."}}},
                            {"top_k", {{"type", "integer"}, {"description", "Number of passages to return (default 5)."}}}
                        }},
                        {"required", json::array({"query"})}
                    }}
                },
                {
                    {"name", "index_status"},
                    {"description", "Reports the state of the repository index and the last build report."},
                    {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}
                }
            })}
        };
    }

}

int main(int argc, char* argv[]) {
    std::ostream rpc_out(std::cout.rdbuf());
    g_rpc_out = &rpc_out;
    std::cout.rdbuf(std::cerr.rdbuf());

    if (argc < 2) {
        std::cerr << "Usage: reposcope-mcp <root> [--locator L]\n";
        return 1;
    }
    engine::RepositorySource source{argv[1], ""};
    for (int i = 2; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--locator") source.locator = argv[++i];
    }

    auto config_dir = reposcope::platform::system::get_config_dir();
    auto config = engine::Config::load(config_dir.empty() ? std::filesystem::path("config.json") : config_dir / "config.json");
    auto cache_dir = config.cache_dir.empty() ? reposcope::platform::system::get_cache_dir() : config.cache_dir;
    if (cache_dir.empty()) cache_dir = std::filesystem::current_path() / ".reposcope-cache";

    auto embedder = engine::create_embedder(config);
    if (!embedder) {
        std::cerr << "[reposcope-mcp] No embedding provider available.\n";
        return 1;
    }

    engine::CacheStore cache(cache_dir);
    engine::Pipeline pipeline(*embedder, cache);
    engine::BuildReport report;
    try {
        report = pipeline.build_or_load(source, config.index);
    } catch (const std::exception& e) {
        std::cerr << "[reposcope-mcp] Index build failed: " << e.what() << "\n";
    }

    engine::EmbeddingAdapter adapter(*embedder, config.index);
    engine::QueryEngine query_engine(adapter, pipeline.published());

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        json id = nullptr;
        try {
            auto req = json::parse(line);
            id = req.value("id", json(nullptr));
            std::string method = req.value("method", "");

            if (method == "initialize") {
                json result = {
                    {"protocolVersion", "2024-11-05"},
                    {"capabilities", {{"tools", json::object()}}},
                    {"serverInfo", {
                        {"name", "reposcope-mcp"},
                        {"version", "0.1.0"}
                    }}
                };
                send_response(id, result);
                continue;
            }

            if (method == "notifications/initialized") continue;

            if (method == "tools/list") {
                send_response(id, tool_list());
                continue;
            }

            if (method == "tools/call") {
                auto params = req.value("params", json::object());
                std::string name = params.value("name", "");
                auto args = params.value("arguments", json::object());

                if (name == "search_repository") {
                    std::string q = args.value("query", "");
                    if (q.empty()) {
                        send_error(id, -32602, "query must be a non-empty string");
                        continue;
                    }
                    size_t top_k = args.value("top_k", size_t{5});
                    auto results = query_engine.query(q, top_k);
                    send_response(id, text_content(engine::format_context(results)));
                } else if (name == "index_status") {
                    json status = {
                        {"state", engine::to_string(pipeline.state())},
                        {"failure_reason", pipeline.failure_reason()},
                        {"report", engine::to_json(report)}
                    };
                    send_response(id, text_content(status.dump(2)));
                } else {
                    send_error(id, -32601, "Tool not found");
                }
                continue;
            }

            // Notifications get no reply.
            if (!req.contains("id")) continue;

            send_error(id, -32601, "Method not found");

        } catch (const json::parse_error& e) {
            send_error(nullptr, -32700, std::string("Parse error: ") + e.what());
        } catch (const std::exception& e) {
            std::cerr << "[reposcope-mcp] Error: " << e.what() << "\n";
            if (!id.is_null()) send_error(id, -32603, e.what());
        }
    }

    return 0;
}
