#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"

namespace reposcope::engine {

    /**
     * @brief Abstract base class for embedding providers.
     *
     * A provider is an external collaborator: it may block on I/O, fail, or throw.
     * Callers (EmbeddingAdapter) treat any throw or malformed result as a batch failure.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates one embedding per input text.
         * @param texts Input texts.
         * @return Vectors in the same order as the input. A result of different length is a failure.
         */
        virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) = 0;

        /**
         * @brief Dimension of the vectors produced so far, 0 if unknown.
         */
        virtual size_t dimension() const = 0;
    };

    using EmbedFunction = std::function<std::vector<std::vector<float>>(const std::vector<std::string>&)>;

    /**
     * @brief Adapts an injected embedding function to the Embedder interface.
     */
    class FunctionEmbedder : public Embedder {
    public:
        explicit FunctionEmbedder(EmbedFunction fn, size_t dimension = 0);

        std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;
        size_t dimension() const override { return m_dimension; }

    private:
        EmbedFunction m_fn;
        size_t m_dimension;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model,
                                                     const std::string& endpoint = "http://localhost:11434/api/embed",
                                                     long timeout_ms = 30000);
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key,
                                                     const std::string& model = "text-embedding-3-small",
                                                     const std::string& endpoint = "https://api.openai.com/v1/embeddings",
                                                     long timeout_ms = 30000);

    /**
     * @brief Creates the provider named by config.embedding_backend. Null if it cannot be configured.
     */
    std::unique_ptr<Embedder> create_embedder(const Config& config);

}
