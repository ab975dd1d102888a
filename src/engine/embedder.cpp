#include "embedder.hpp"
#include <iostream>
#include <stdexcept>

namespace reposcope::engine {

    FunctionEmbedder::FunctionEmbedder(EmbedFunction fn, size_t dimension)
        : m_fn(std::move(fn)), m_dimension(dimension) {}

    std::vector<std::vector<float>> FunctionEmbedder::embed_batch(const std::vector<std::string>& texts) {
        if (!m_fn) throw std::runtime_error("no embedding function configured");
        return m_fn(texts);
    }

    std::unique_ptr<Embedder> create_embedder(const Config& config) {
        const long timeout_ms = config.index.embedding_timeout_ms;
        if (config.embedding_backend == "openai") {
            if (config.openai_key.empty()) {
                std::cerr << "[Embedder] OpenAI backend selected but no API key is configured (set OPENAI_API_KEY).\n";
                return nullptr;
            }
            std::string endpoint = config.embedding_endpoint.find("/v1/embeddings") != std::string::npos
                ? config.embedding_endpoint : "https://api.openai.com/v1/embeddings";
            return create_openai_embedder(config.openai_key, config.embedding_model, endpoint, timeout_ms);
        }
        if (config.embedding_backend == "ollama") {
            return create_ollama_embedder(config.embedding_model, config.embedding_endpoint, timeout_ms);
        }
        std::cerr << "[Embedder] Unknown embedding backend '" << config.embedding_backend << "'\n";
        return nullptr;
    }

}
