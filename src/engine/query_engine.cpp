#include "query_engine.hpp"

namespace reposcope::engine {

    QueryEngine::QueryEngine(EmbeddingAdapter& adapter, std::shared_ptr<const PublishedIndex> index)
        : m_adapter(adapter), m_index(std::move(index)) {}

    std::vector<RankedResult> QueryEngine::query(const std::string& text, size_t top_k) const {
        std::vector<RankedResult> results;
        if (!m_index || m_index->index.row_count() == 0 || top_k == 0) return results;

        auto vector = m_adapter.embed_query(text);
        if (!vector) return results;

        const auto& chunks = m_index->snapshot.chunks;
        for (const auto& hit : m_index->index.search(*vector, top_k)) {
            if (hit.row >= chunks.size()) {
                throw IndexIntegrityError("search returned row " + std::to_string(hit.row) + " beyond " +
                                          std::to_string(chunks.size()) + " chunks");
            }
            results.push_back({chunks[hit.row], hit.score});
        }
        return results;
    }

    std::string format_context(const std::vector<RankedResult>& results) {
        if (results.empty()) return "No relevant repository information found.";

        std::string out;
        for (size_t i = 0; i < results.size(); ++i) {
            const Chunk& c = results[i].chunk;
            if (i > 0) out += "\n\n";
            out += "Document " + std::to_string(i + 1) + ":";
            out += std::string(" (Type: ") + to_string(c.chunk_type) + ")";
            auto name = c.metadata.find("name");
            if (name != c.metadata.end() && !name->second.empty()) out += " (Symbol: " + name->second + ")";
            out += " (Path: " + c.file_path + ":" + std::to_string(c.start_line) + "-" + std::to_string(c.end_line) + ")";
            out += "\n" + c.content;
        }
        return out;
    }

    nlohmann::json to_json(const std::vector<RankedResult>& results) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& r : results) {
            const Chunk& c = r.chunk;
            arr.push_back({
                {"file_path", c.file_path},
                {"start_line", c.start_line},
                {"end_line", c.end_line},
                {"chunk_type", to_string(c.chunk_type)},
                {"language", c.language},
                {"score", r.score},
                {"content", c.content},
                {"metadata", c.metadata}
            });
        }
        return arr;
    }

}
