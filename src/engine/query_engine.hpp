#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "embedding_adapter.hpp"
#include "pipeline.hpp"
#include "reposcope/types.hpp"

namespace reposcope::engine {

    /**
     * @brief Read-only semantic search over one published index.
     */
    class QueryEngine {
    public:
        QueryEngine(EmbeddingAdapter& adapter, std::shared_ptr<const PublishedIndex> index);

        /**
         * @brief Top-k chunks for text, best first. Empty if there is no index, the index is
         * empty, or the query could not be embedded.
         */
        std::vector<RankedResult> query(const std::string& text, size_t top_k) const;

    private:
        EmbeddingAdapter& m_adapter;
        std::shared_ptr<const PublishedIndex> m_index;
    };

    /**
     * @brief Renders results as numbered context blocks for a text-generation prompt.
     */
    std::string format_context(const std::vector<RankedResult>& results);

    nlohmann::json to_json(const std::vector<RankedResult>& results);

}
