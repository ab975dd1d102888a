#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "cache_store.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "parser_registry.hpp"
#include "vector_index.hpp"
#include "reposcope/types.hpp"

namespace reposcope::engine {

    enum class PipelineState {
        Uninitialized,
        Loading,
        Scanning,
        Chunking,
        Embedding,
        Indexing,
        Persisting,
        Ready,
        Failed
    };

    const char* to_string(PipelineState state);

    nlohmann::json to_json(const BuildReport& report);

    /**
     * @brief A repository that is already materialized on local disk.
     * locator names where it came from (URL or path); empty means the canonical root path.
     */
    struct RepositorySource {
        std::filesystem::path root;
        std::string locator;
    };

    /**
     * @brief Immutable result of a successful build: row i of index is snapshot.chunks[i].
     */
    struct PublishedIndex {
        RepositorySnapshot snapshot;
        VectorIndex index;
    };

    /**
     * @brief Hands out one mutex per repository identity.
     * Share one instance between pipelines so builds of the same repository are serialized.
     */
    class IdentityLocks {
    public:
        std::shared_ptr<std::mutex> get(const std::string& identity);

    private:
        std::mutex m_mutex;
        std::map<std::string, std::shared_ptr<std::mutex>> m_locks;
    };

    /**
     * @brief Builds or loads the searchable index for one repository.
     *
     * Cache hit:  Uninitialized -> Loading -> Ready.
     * Cache miss: Uninitialized -> Scanning -> Chunking -> Embedding -> Indexing -> Persisting -> Ready.
     * Any fatal error, or cancellation, ends in Failed. From Failed only a build with
     * force_rebuild is accepted.
     *
     * The published index is replaced only after a build has fully succeeded, so readers
     * holding published() never see a partial build.
     */
    class Pipeline {
    public:
        Pipeline(Embedder& embedder, CacheStore& cache, std::shared_ptr<IdentityLocks> locks = {});
        ~Pipeline();

        Pipeline(const Pipeline&) = delete;
        Pipeline& operator=(const Pipeline&) = delete;

        /**
         * @brief Loads the cached index for source, or builds it.
         *
         * Per-file and per-batch failures are reported in the BuildReport, never thrown.
         * @throws PipelineError if the pipeline is Failed and config.force_rebuild is false,
         *         or if a stage fails outright (e.g. the root is not a directory).
         * @throws IndexIntegrityError if vectors and chunks cannot be aligned.
         */
        BuildReport build_or_load(const RepositorySource& source, const IndexConfig& config);

        /**
         * @brief Requests cooperative cancellation of the running build. Safe from any thread.
         */
        void cancel();

        PipelineState state() const;
        std::string failure_reason() const;

        /**
         * @brief The last successfully built or loaded index, or null.
         */
        std::shared_ptr<const PublishedIndex> published() const;

        const ParserRegistry& parsers() const { return m_parsers; }

        static std::string identity_of(const RepositorySource& source);

    private:
        Embedder& m_embedder;
        CacheStore& m_cache;
        std::shared_ptr<IdentityLocks> m_locks;
        ParserRegistry m_parsers;

        std::atomic<bool> m_cancel{false};

        mutable std::mutex m_state_mutex;
        PipelineState m_state = PipelineState::Uninitialized;
        std::string m_failure_reason;

        mutable std::mutex m_publish_mutex;
        std::shared_ptr<const PublishedIndex> m_published;

        void set_state(PipelineState state);
        void fail(const std::string& reason);
        void publish(std::shared_ptr<const PublishedIndex> index);

        bool load_cached(const std::string& identity, BuildReport& report);
        void build(const RepositorySource& source, const IndexConfig& config, BuildReport& report);
        void finish_cancelled(BuildReport& report);
    };

}
