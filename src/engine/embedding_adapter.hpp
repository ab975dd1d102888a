#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "embedder.hpp"
#include "reposcope/types.hpp"

namespace reposcope::engine {

    struct EmbeddingOutcome {
        std::vector<std::optional<std::vector<float>>> vectors; // one slot per input chunk
        std::vector<size_t> failed;                             // slots of failed batches, ascending
        std::vector<std::string> warnings;
        size_t dimension = 0;
        bool cancelled = false;
    };

    /**
     * @brief Turns chunks into vectors through an injected Embedder.
     *
     * Batches of at most batch_size texts are sent to the provider, with at most
     * embedding_concurrency batches in flight. Results are written back by slot, so
     * batch completion order never affects alignment. A failing batch is retried once
     * and then recorded as failed; the remaining batches still run.
     */
    class EmbeddingAdapter {
    public:
        EmbeddingAdapter(Embedder& embedder, const IndexConfig& config);

        /**
         * @brief Text sent to the provider: contextual header lines, a blank line, then the content.
         */
        static std::string compose_text(const std::string& identity, const Chunk& chunk);

        /**
         * @param cancel Checked before every batch; may be null.
         */
        EmbeddingOutcome embed_chunks(const std::string& identity, const std::vector<Chunk>& chunks,
                                      const std::atomic<bool>* cancel = nullptr);

        /**
         * @brief Embeds a single query text. std::nullopt if the provider fails twice.
         */
        std::optional<std::vector<float>> embed_query(const std::string& text);

    private:
        Embedder& m_embedder;
        size_t m_batch_size;
        size_t m_concurrency;

        bool run_batch(const std::vector<std::string>& texts, std::vector<std::vector<float>>& out, std::string& error);
    };

}
