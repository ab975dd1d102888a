#include "pipeline.hpp"
#include "chunker.hpp"
#include "embedding_adapter.hpp"
#include "job_queue.hpp"
#include "language.hpp"
#include "scanner.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace reposcope::engine {

    const char* to_string(PipelineState state) {
        switch (state) {
            case PipelineState::Uninitialized: return "uninitialized";
            case PipelineState::Loading: return "loading";
            case PipelineState::Scanning: return "scanning";
            case PipelineState::Chunking: return "chunking";
            case PipelineState::Embedding: return "embedding";
            case PipelineState::Indexing: return "indexing";
            case PipelineState::Persisting: return "persisting";
            case PipelineState::Ready: return "ready";
            case PipelineState::Failed: return "failed";
        }
        return "unknown";
    }

    nlohmann::json to_json(const BuildReport& report) {
        return {
            {"identity", report.identity},
            {"chunks_created", report.chunks_created},
            {"chunks_embedded", report.chunks_embedded},
            {"chunks_failed", report.chunks_failed},
            {"from_cache", report.from_cache},
            {"files_scanned", report.files_scanned},
            {"files_skipped", report.files_skipped},
            {"failed_chunks", report.failed_chunks},
            {"warnings", report.warnings},
            {"cache_written", report.cache_written},
            {"cancelled", report.cancelled},
            {"elapsed_seconds", report.elapsed_seconds}
        };
    }

    std::shared_ptr<std::mutex> IdentityLocks::get(const std::string& identity) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& slot = m_locks[identity];
        if (!slot) slot = std::make_shared<std::mutex>();
        return slot;
    }

    Pipeline::Pipeline(Embedder& embedder, CacheStore& cache, std::shared_ptr<IdentityLocks> locks)
        : m_embedder(embedder), m_cache(cache), m_locks(locks ? std::move(locks) : std::make_shared<IdentityLocks>()) {}

    Pipeline::~Pipeline() = default;

    std::string Pipeline::identity_of(const RepositorySource& source) {
        if (!source.locator.empty()) return CacheStore::identity_for(source.locator);
        std::error_code ec;
        auto canonical = std::filesystem::weakly_canonical(source.root, ec);
        return CacheStore::identity_for(ec ? source.root.generic_string() : canonical.generic_string());
    }

    void Pipeline::cancel() {
        m_cancel = true;
    }

    PipelineState Pipeline::state() const {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        return m_state;
    }

    std::string Pipeline::failure_reason() const {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        return m_failure_reason;
    }

    std::shared_ptr<const PublishedIndex> Pipeline::published() const {
        std::lock_guard<std::mutex> lock(m_publish_mutex);
        return m_published;
    }

    void Pipeline::set_state(PipelineState state) {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        m_state = state;
        if (state != PipelineState::Failed) m_failure_reason.clear();
    }

    void Pipeline::fail(const std::string& reason) {
        std::cerr << "[Pipeline] Failed: " << reason << "\n";
        std::lock_guard<std::mutex> lock(m_state_mutex);
        m_state = PipelineState::Failed;
        m_failure_reason = reason;
    }

    void Pipeline::publish(std::shared_ptr<const PublishedIndex> index) {
        std::lock_guard<std::mutex> lock(m_publish_mutex);
        m_published = std::move(index);
    }

    void Pipeline::finish_cancelled(BuildReport& report) {
        report.cancelled = true;
        fail("cancelled");
    }

    BuildReport Pipeline::build_or_load(const RepositorySource& source, const IndexConfig& config) {
        const auto started = std::chrono::steady_clock::now();
        BuildReport report;
        report.identity = identity_of(source);

        if (state() == PipelineState::Failed && !config.force_rebuild) {
            throw PipelineError("pipeline is in failed state (" + failure_reason() + "); a forced rebuild is required");
        }

        // Cleared before waiting so a cancel() that arrives while another build holds the lock is kept.
        m_cancel = false;
        auto identity_mutex = m_locks->get(report.identity);
        std::lock_guard<std::mutex> identity_lock(*identity_mutex);

        try {
            if (config.force_rebuild || !load_cached(report.identity, report)) {
                build(source, config, report);
            }
        } catch (const IndexIntegrityError& e) {
            fail(e.what());
            throw;
        } catch (const PipelineError& e) {
            fail(e.what());
            throw;
        } catch (const std::exception& e) {
            fail(e.what());
            throw PipelineError(e.what());
        }

        report.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        return report;
    }

    bool Pipeline::load_cached(const std::string& identity, BuildReport& report) {
        if (!m_cache.exists(identity)) return false;
        set_state(PipelineState::Loading);
        auto entry = m_cache.load(identity);
        if (!entry) return false;

        auto published = std::make_shared<PublishedIndex>();
        try {
            published->index.build(entry->vectors);
        } catch (const IndexIntegrityError& e) {
            std::cerr << "[Pipeline] Cached index unusable, rebuilding: " << e.what() << "\n";
            return false;
        }
        if (published->index.row_count() != entry->chunks.size()) {
            std::cerr << "[Pipeline] Cached index misaligned, rebuilding\n";
            return false;
        }

        for (size_t i = 0; i < entry->chunks.size(); ++i) {
            entry->chunks[i].embedding = std::move(entry->vectors[i]);
        }
        published->snapshot.identity = identity;
        published->snapshot.chunks = std::move(entry->chunks);
        published->snapshot.language_histogram = std::move(entry->language_histogram);

        report.from_cache = true;
        report.chunks_created = published->snapshot.chunks.size();
        report.chunks_embedded = report.chunks_created;

        std::cout << "[Pipeline] Loaded " << report.chunks_created << " chunks from cache\n";
        publish(std::move(published));
        set_state(PipelineState::Ready);
        return true;
    }

    void Pipeline::build(const RepositorySource& source, const IndexConfig& config, BuildReport& report) {
        // Scanning
        set_state(PipelineState::Scanning);
        std::error_code ec;
        if (!std::filesystem::is_directory(source.root, ec)) {
            throw PipelineError("repository root is not a directory: " + source.root.string());
        }
        if (m_cancel) return finish_cancelled(report);

        // Scanning and chunking overlap: the walk reads files and feeds the queue while workers chunk.
        Scanner scanner(config);
        Chunker chunker(m_parsers, config);

        struct FileResult {
            std::vector<Chunk> chunks;
            std::string language;
            std::string warning;
        };
        std::mutex results_mutex;
        std::vector<FileResult> results; // indexed by discovery slot

        JobQueue queue;
        auto worker = [&]() {
            FileJob job;
            while (queue.pop(job)) {
                if (m_cancel) {
                    queue.clear();
                    continue;
                }
                FileResult result;
                result.language = classify_language(job.relative_path);
                try {
                    result.chunks = chunker.chunk_file(job.relative_path, job.content, result.language);
                } catch (const std::exception& e) {
                    result.warning = job.relative_path + ": chunking failed (" + e.what() + ")";
                    std::cerr << "[Pipeline] " << result.warning << "\n";
                }
                std::lock_guard<std::mutex> lock(results_mutex);
                results[job.slot] = std::move(result);
            }
        };

        std::vector<std::thread> threads;
        const size_t worker_count = std::max<size_t>(1, config.workers);
        threads.reserve(worker_count);
        for (size_t t = 0; t < worker_count; ++t) threads.emplace_back(worker);
        auto join_workers = [&]() {
            queue.stop();
            for (auto& t : threads) {
                if (t.joinable()) t.join();
            }
        };

        try {
            scanner.scan(source.root,
                [&](const SourceFile& file) {
                    if (m_cancel) return false;
                    size_t slot = 0;
                    {
                        std::lock_guard<std::mutex> lock(results_mutex);
                        slot = results.size();
                        results.emplace_back();
                    }
                    queue.push({slot, file.relative_path, file.content});
                    return true;
                },
                [&](const std::string& relative_path, ReadStatus status) {
                    FileResult skipped;
                    skipped.warning = relative_path + ": skipped (" + to_string(status) + ")";
                    std::lock_guard<std::mutex> lock(results_mutex);
                    results.push_back(std::move(skipped));
                });
        } catch (...) {
            join_workers();
            throw;
        }
        set_state(PipelineState::Chunking);
        join_workers();
        if (m_cancel) return finish_cancelled(report);

        report.files_scanned = results.size();
        std::vector<Chunk> chunks;
        std::map<std::string, int> histogram;
        for (auto& result : results) {
            if (!result.warning.empty()) {
                report.warnings.push_back(std::move(result.warning));
                report.files_skipped++;
                continue;
            }
            histogram[result.language]++;
            for (auto& chunk : result.chunks) chunks.push_back(std::move(chunk));
        }
        report.chunks_created = chunks.size();
        std::cout << "[Pipeline] Created " << chunks.size() << " chunks from " << (report.files_scanned - report.files_skipped)
                  << " of " << report.files_scanned << " files\n";

        // Embedding
        set_state(PipelineState::Embedding);
        EmbeddingAdapter adapter(m_embedder, config);
        EmbeddingOutcome outcome = adapter.embed_chunks(report.identity, chunks, &m_cancel);
        if (outcome.cancelled || m_cancel) return finish_cancelled(report);
        for (auto& w : outcome.warnings) report.warnings.push_back(std::move(w));

        auto published = std::make_shared<PublishedIndex>();
        published->snapshot.identity = report.identity;
        published->snapshot.language_histogram = histogram;

        std::vector<std::vector<float>> vectors;
        vectors.reserve(chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            if (!outcome.vectors[i]) {
                const Chunk& c = chunks[i];
                report.failed_chunks.push_back(c.file_path + ":" + std::to_string(c.start_line) + "-" + std::to_string(c.end_line));
                continue;
            }
            vectors.push_back(*outcome.vectors[i]);
            chunks[i].embedding = std::move(outcome.vectors[i]);
            published->snapshot.chunks.push_back(std::move(chunks[i]));
        }
        report.chunks_embedded = published->snapshot.chunks.size();
        report.chunks_failed = report.failed_chunks.size();

        // Indexing
        set_state(PipelineState::Indexing);
        published->index.build(vectors);
        if (published->index.row_count() != published->snapshot.chunks.size()) {
            throw IndexIntegrityError("index has " + std::to_string(published->index.row_count()) + " rows for " +
                                      std::to_string(published->snapshot.chunks.size()) + " chunks");
        }
        if (m_cancel) return finish_cancelled(report);

        // Persisting. Only complete builds are cached, so a later build retries the failed chunks.
        set_state(PipelineState::Persisting);
        if (report.chunks_failed > 0) {
            if (m_cache.invalidate(report.identity)) {
                std::cerr << "[Pipeline] Dropped the older cache entry for " << report.identity << "\n";
            }
            std::string warning = "cache not written: " + std::to_string(report.chunks_failed) +
                                  " chunks failed to embed and will be retried by the next build";
            std::cerr << "[Pipeline] " << warning << "\n";
            report.warnings.push_back(std::move(warning));
        } else {
            report.cache_written = m_cache.save(report.identity, published->snapshot.chunks, published->index.rows(),
                                                published->snapshot.language_histogram);
            if (!report.cache_written) {
                std::string warning = "cache write failed; index is available in memory only";
                std::cerr << "[Pipeline] " << warning << "\n";
                report.warnings.push_back(std::move(warning));
            }
        }

        publish(std::move(published));
        set_state(PipelineState::Ready);
        std::cout << "[Pipeline] Ready: " << report.chunks_embedded << " chunks indexed, " << report.chunks_failed << " failed\n";
    }

}
