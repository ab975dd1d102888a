#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace reposcope::engine {

    enum class ChunkType {
        Function,
        Class,
        Module,
        Comment,
        Mixed
    };

    const char* to_string(ChunkType type);

    /**
     * @brief Parses a chunk type name. Unknown names map to Mixed.
     */
    ChunkType chunk_type_from_string(const std::string& name);

    struct Chunk {
        std::string content;
        std::string file_path;      // relative to the repository root
        int start_line = 0;         // 1-based, inclusive
        int end_line = 0;
        ChunkType chunk_type = ChunkType::Module;
        std::string language = "text";
        std::size_t size = 0;       // byte length of content
        std::string content_hash;
        std::map<std::string, std::string> metadata;
        std::optional<std::vector<float>> embedding;
    };

    struct SourceFile {
        std::string relative_path;
        std::string content;
    };

    struct RepositorySnapshot {
        std::string identity;
        std::vector<Chunk> chunks;
        std::map<std::string, int> language_histogram;
    };

    struct RankedResult {
        Chunk chunk;
        float score = 0.0f;
    };

    struct BuildReport {
        std::string identity;
        std::size_t chunks_created = 0;
        std::size_t chunks_embedded = 0;
        std::size_t chunks_failed = 0;
        bool from_cache = false;

        std::size_t files_scanned = 0;
        std::size_t files_skipped = 0;
        std::vector<std::string> failed_chunks;   // "path:start-end"
        std::vector<std::string> warnings;
        bool cache_written = false;
        bool cancelled = false;
        double elapsed_seconds = 0.0;
    };

    /**
     * @brief Row/chunk or dimension mismatch inside the vector index. Fatal to the current build.
     */
    class IndexIntegrityError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Raised when a build is requested on a pipeline that needs a forced rebuild first.
     */
    class PipelineError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

}
