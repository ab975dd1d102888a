#include "embedding_adapter.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <thread>

namespace reposcope::engine {

    namespace {

        constexpr int kAttemptsPerBatch = 2;

        bool rows_valid(const std::vector<std::vector<float>>& rows, std::string& error) {
            if (rows.empty()) return true;
            const size_t dim = rows.front().size();
            for (const auto& row : rows) {
                if (row.empty()) {
                    error = "empty vector";
                    return false;
                }
                if (row.size() != dim) {
                    error = "mixed dimensions within batch";
                    return false;
                }
                for (float v : row) {
                    if (!std::isfinite(v)) {
                        error = "non-finite component";
                        return false;
                    }
                }
            }
            return true;
        }

    }

    EmbeddingAdapter::EmbeddingAdapter(Embedder& embedder, const IndexConfig& config)
        : m_embedder(embedder),
          m_batch_size(std::max<size_t>(1, config.batch_size)),
          m_concurrency(std::max<size_t>(1, config.embedding_concurrency)) {}

    std::string EmbeddingAdapter::compose_text(const std::string& identity, const Chunk& chunk) {
        std::string text;
        text.reserve(chunk.content.size() + 160);
        text += "Repository: " + identity + "\n";
        text += "File: " + chunk.file_path + "\n";
        text += std::string("Type: ") + to_string(chunk.chunk_type) + "\n";
        text += "Language: " + chunk.language + "\n";
        auto name = chunk.metadata.find("name");
        if (name != chunk.metadata.end() && !name->second.empty()) {
            text += "Symbol: " + name->second + "\n";
        }
        text += "\n";
        text += chunk.content;
        return text;
    }

    bool EmbeddingAdapter::run_batch(const std::vector<std::string>& texts, std::vector<std::vector<float>>& out, std::string& error) {
        try {
            out = m_embedder.embed_batch(texts);
        } catch (const std::exception& e) {
            error = e.what();
            return false;
        } catch (...) {
            error = "provider threw a non-standard exception";
            return false;
        }
        if (out.size() != texts.size()) {
            error = "provider returned " + std::to_string(out.size()) + " vectors for " + std::to_string(texts.size()) + " texts";
            return false;
        }
        return rows_valid(out, error);
    }

    EmbeddingOutcome EmbeddingAdapter::embed_chunks(const std::string& identity, const std::vector<Chunk>& chunks,
                                                    const std::atomic<bool>* cancel) {
        EmbeddingOutcome outcome;
        outcome.vectors.resize(chunks.size());
        if (chunks.empty()) return outcome;

        const size_t batch_count = (chunks.size() + m_batch_size - 1) / m_batch_size;
        std::atomic<size_t> next_batch{0};
        std::atomic<bool> cancelled{false};
        std::mutex mutex; // guards outcome.failed, outcome.warnings, outcome.dimension
        size_t dimension = 0;

        auto worker = [&]() {
            for (;;) {
                if (cancel && cancel->load()) {
                    cancelled = true;
                    return;
                }
                const size_t batch = next_batch.fetch_add(1);
                if (batch >= batch_count) return;

                const size_t first = batch * m_batch_size;
                const size_t last = std::min(first + m_batch_size, chunks.size());

                std::vector<std::string> texts;
                texts.reserve(last - first);
                for (size_t i = first; i < last; ++i) texts.push_back(compose_text(identity, chunks[i]));

                std::vector<std::vector<float>> rows;
                std::string error;
                bool ok = false;
                for (int attempt = 0; attempt < kAttemptsPerBatch && !ok; ++attempt) {
                    ok = run_batch(texts, rows, error);
                    if (ok) {
                        std::lock_guard<std::mutex> lock(mutex);
                        if (dimension == 0) dimension = rows.front().size();
                        if (rows.front().size() != dimension) {
                            error = "dimension " + std::to_string(rows.front().size()) + " differs from " + std::to_string(dimension);
                            ok = false;
                        }
                    }
                    if (!ok && attempt + 1 < kAttemptsPerBatch) {
                        std::cerr << "[Embedder] Batch " << batch << " failed (" << error << "), retrying\n";
                    }
                }

                if (ok) {
                    for (size_t i = first; i < last; ++i) outcome.vectors[i] = std::move(rows[i - first]);
                    continue;
                }

                std::string warning = "embedding batch " + std::to_string(batch) + " (chunks " + std::to_string(first) +
                                      "-" + std::to_string(last - 1) + ") failed: " + error;
                std::cerr << "[Embedder] " << warning << "\n";
                std::lock_guard<std::mutex> lock(mutex);
                for (size_t i = first; i < last; ++i) outcome.failed.push_back(i);
                outcome.warnings.push_back(std::move(warning));
            }
        };

        const size_t thread_count = std::min(m_concurrency, batch_count);
        if (thread_count <= 1) {
            worker();
        } else {
            std::vector<std::thread> threads;
            threads.reserve(thread_count);
            for (size_t t = 0; t < thread_count; ++t) threads.emplace_back(worker);
            for (auto& t : threads) t.join();
        }

        std::sort(outcome.failed.begin(), outcome.failed.end());
        std::sort(outcome.warnings.begin(), outcome.warnings.end());
        outcome.dimension = dimension;
        outcome.cancelled = cancelled.load();
        return outcome;
    }

    std::optional<std::vector<float>> EmbeddingAdapter::embed_query(const std::string& text) {
        std::vector<std::vector<float>> rows;
        std::string error;
        for (int attempt = 0; attempt < kAttemptsPerBatch; ++attempt) {
            if (run_batch({text}, rows, error)) return std::move(rows.front());
        }
        std::cerr << "[Embedder] Query embedding failed: " << error << "\n";
        return std::nullopt;
    }

}
