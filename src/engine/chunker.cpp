#include "chunker.hpp"
#include "reposcope/sha256.h"
#include <algorithm>
#include <iostream>
#include <optional>
#include <regex>

namespace reposcope::engine {

    namespace {

        enum class LineKind { Blank, Plain, Function, Class, Import, Comment };

        // libstdc++ regex recurses per character; very long (minified) lines are never markers anyway.
        constexpr std::size_t kMaxMarkerLineLength = 512;

        bool is_blank(const std::string& text) {
            return text.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
        }

        Chunk make_chunk(const std::string& path, const std::string& language, std::string content,
                         std::size_t first, std::size_t last, ChunkType type,
                         std::map<std::string, std::string> metadata) {
            Chunk chunk;
            chunk.size = content.size();
            chunk.content_hash = crypto::sha256_hex(content);
            chunk.content = std::move(content);
            chunk.file_path = path;
            chunk.start_line = static_cast<int>(first) + 1;
            chunk.end_line = static_cast<int>(last) + 1;
            chunk.chunk_type = type;
            chunk.language = language;
            chunk.metadata = std::move(metadata);
            return chunk;
        }

    }

    struct Chunker::Markers {
        std::optional<std::regex> function;
        std::optional<std::regex> klass;
        std::optional<std::regex> import;
        std::optional<std::regex> comment;
    };

    struct Chunker::Lines {
        const std::string& content;
        std::vector<std::size_t> starts; // one entry per line plus the end sentinel

        explicit Lines(const std::string& text) : content(text) {
            if (!text.empty()) {
                starts.push_back(0);
                for (std::size_t i = 0; i < text.size(); ++i) {
                    if (text[i] == '\n' && i + 1 < text.size()) starts.push_back(i + 1);
                }
            }
            starts.push_back(text.size());
        }

        std::size_t count() const { return starts.size() - 1; }
        std::size_t bytes(std::size_t i) const { return starts[i + 1] - starts[i]; }

        std::string text(std::size_t first, std::size_t last) const {
            return content.substr(starts[first], starts[last + 1] - starts[first]);
        }

        std::string line(std::size_t i) const {
            std::string s = content.substr(starts[i], bytes(i));
            while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
            return s;
        }
    };

    namespace {

        std::optional<std::regex> compile(const char* pattern) {
            if (!pattern || !*pattern) return std::nullopt;
            return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
        }

        std::string first_capture(const std::smatch& m) {
            for (std::size_t g = 1; g < m.size(); ++g) {
                if (m[g].matched && m[g].length() > 0) return m[g].str();
            }
            return "";
        }

    }

    Chunker::Chunker(const ParserRegistry& parsers, const IndexConfig& config)
        : m_parsers(parsers),
          m_max_chunk_size(std::max<std::size_t>(1, config.max_chunk_size)),
          m_overlap_size(std::min(config.overlap_size, std::max<std::size_t>(1, config.max_chunk_size))),
          m_min_chunk_size(config.min_chunk_size) {

        auto make = [](const char* fn, const char* cls, const char* imp, const char* cmt) {
            auto m = std::make_shared<Markers>();
            m->function = compile(fn);
            m->klass = compile(cls);
            m->import = compile(imp);
            m->comment = compile(cmt);
            return std::shared_ptr<const Markers>(m);
        };

        const char* c_comment = R"(^\s*(//|/\*|\*))";
        const char* c_function =
            R"(^\s*(?!(?:return|else|if|for|while|switch|case|throw|new|delete|goto|co_return)\b))"
            R"((?:[\w:<>,*&~\[\]]+\s+)+[*&]*((?!(?:if|for|while|switch|return|catch|sizeof)\b)[A-Za-z_~][\w:~]*)\s*\([^;]*$)";

        auto python = make(R"(^\s*(?:async\s+)?def\s+([A-Za-z_]\w*))",
                           R"(^\s*class\s+([A-Za-z_]\w*))",
                           R"(^\s*(?:import|from)\s+\S+)",
                           R"(^\s*#)");
        auto ecmascript = make(
            R"(^\s*(?:export\s+)?(?:default\s+)?(?:async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*)|^\s*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*=\s*(?:async\s+)?(?:\([^)]*\)|[A-Za-z_$][\w$]*)\s*=>)",
            R"(^\s*(?:export\s+)?(?:default\s+)?(?:abstract\s+)?(?:class|interface|enum)\s+([A-Za-z_$][\w$]*))",
            R"(^\s*(?:import\b|export\s+\*\s+from\b)|\brequire\s*\()",
            c_comment);
        auto c_family = make(
            c_function,
            R"(^\s*(?:template\s*<[^>]*>\s*)?(?:class|struct|union|enum(?:\s+class)?)\s+(?:\w+\s+)?([A-Za-z_]\w*)[^;]*$)",
            R"(^\s*#\s*(?:include|import)\b)",
            c_comment);
        auto jvm_like = make(
            R"(^\s*(?:(?:public|private|protected|internal|static|final|abstract|synchronized|override|virtual|async|open|suspend|inline|operator)\s+)*(?:fun|func|def)\s+(?:<[^>]*>\s*)?([A-Za-z_]\w*)|^\s*(?:(?:public|private|protected|internal|static|final|abstract|synchronized|override|virtual|async)\s+)+[\w<>\[\],.?]+\s+([A-Za-z_]\w*)\s*\([^;]*$)",
            R"(^\s*(?:(?:public|private|protected|internal|static|final|abstract|sealed|data|open|partial)\s+)*(?:class|interface|enum|record|struct|object|trait)\s+([A-Za-z_]\w*))",
            R"(^\s*(?:import|using|package)\b)",
            c_comment);
        auto go = make(R"(^func\s+(?:\([^)]*\)\s*)?([A-Za-z_]\w*))",
                       R"(^type\s+([A-Za-z_]\w*)\s+(?:struct|interface)\b)",
                       R"(^\s*import\b)",
                       R"(^\s*//)");
        auto rust = make(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:const\s+)?(?:async\s+)?(?:unsafe\s+)?(?:extern\s+"[^"]*"\s+)?fn\s+([A-Za-z_]\w*))",
                         R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:struct|enum|trait|union|impl(?:<[^>]*>)?)\s+([A-Za-z_]\w*))",
                         R"(^\s*(?:pub\s+)?use\s+)",
                         R"(^\s*//)");
        auto ruby = make(R"(^\s*def\s+(?:self\.)?([A-Za-z_]\w*[?!=]?))",
                         R"(^\s*(?:class|module)\s+([A-Z]\w*))",
                         R"(^\s*(?:require|require_relative|load)\b)",
                         R"(^\s*#)");
        auto php = make(R"(^\s*(?:(?:public|private|protected|static|abstract|final)\s+)*function\s+&?([A-Za-z_]\w*))",
                        R"(^\s*(?:abstract\s+|final\s+)?(?:class|interface|trait)\s+([A-Za-z_]\w*))",
                        R"(^\s*(?:use|require|require_once|include|include_once)\b)",
                        R"(^\s*(//|#|/\*|\*))");
        auto shell = make(R"(^\s*(?:function\s+)?([A-Za-z_][\w-]*)\s*\(\)\s*\{?\s*$)",
                          nullptr,
                          R"(^\s*(?:source|\.)\s+\S+)",
                          R"(^\s*#)");

        m_markers["python"] = python;
        m_markers["javascript"] = ecmascript;
        m_markers["typescript"] = ecmascript;
        m_markers["c"] = c_family;
        m_markers["cpp"] = c_family;
        m_markers["java"] = jvm_like;
        m_markers["csharp"] = jvm_like;
        m_markers["kotlin"] = jvm_like;
        m_markers["scala"] = jvm_like;
        m_markers["swift"] = jvm_like;
        m_markers["go"] = go;
        m_markers["rust"] = rust;
        m_markers["ruby"] = ruby;
        m_markers["php"] = php;
        m_markers["shell"] = shell;
        m_default_markers = make(nullptr, nullptr, nullptr, nullptr);
    }

    Chunker::~Chunker() = default;

    const Chunker::Markers& Chunker::markers_for(const std::string& language) const {
        auto it = m_markers.find(language);
        return it != m_markers.end() ? *it->second : *m_default_markers;
    }

    std::vector<Chunk> Chunker::chunk_file(const std::string& path, const std::string& content, const std::string& language) const {
        try {
            if (m_parsers.has(language)) {
                auto chunks = chunk_structural(path, content, language);
                if (!chunks.empty()) return chunks;
            }
            return chunk_patterns(path, content, language);
        } catch (const std::exception& e) {
            std::cerr << "[Chunker] " << path << ": " << e.what() << ", falling back to plain windows\n";
        }

        try {
            return chunk_window(path, content, language);
        } catch (const std::exception& e) {
            std::cerr << "[Chunker] " << path << ": giving up: " << e.what() << "\n";
        }
        return {};
    }

    std::vector<Chunk> Chunker::chunk_structural(const std::string& path, const std::string& content, const std::string& language) const {
        std::vector<Chunk> out;
        auto defs = m_parsers.extract(language, content);
        if (!defs || defs->empty()) return out;

        Lines lines(content);
        const std::size_t n = lines.count();
        if (n == 0) return out;

        auto emit_gap = [&](std::size_t first, std::size_t last) {
            while (first <= last && is_blank(lines.line(first))) ++first;
            while (last > first && is_blank(lines.line(last))) --last;
            if (first > last || is_blank(lines.line(first))) return;

            std::string text = lines.text(first, last);
            if (text.size() < m_min_chunk_size) return;
            if (text.size() > m_max_chunk_size) {
                scan_lines(lines, first, last, path, language, out);
                return;
            }
            out.push_back(make_chunk(path, language, std::move(text), first, last, ChunkType::Module,
                                     {{"method", "structural"}}));
        };

        std::size_t cursor = 0;
        for (const auto& def : *defs) {
            if (def.start_line < 1) continue;
            std::size_t first = static_cast<std::size_t>(def.start_line) - 1;
            if (first < cursor || first >= n) continue; // nested or overlapping
            std::size_t last = std::min(static_cast<std::size_t>(std::max(def.end_line, def.start_line)) - 1, n - 1);

            std::size_t covered = first;
            if (def.doc_start_line > 0) {
                std::size_t doc_first = static_cast<std::size_t>(def.doc_start_line) - 1;
                if (doc_first >= cursor && doc_first <= first) covered = doc_first;
            }
            if (covered > cursor) emit_gap(cursor, covered - 1);

            std::map<std::string, std::string> meta{{"method", "structural"}};
            if (!def.name.empty()) meta["name"] = def.name;
            if (!def.doc.empty()) meta["doc"] = def.doc;
            out.push_back(make_chunk(path, language, lines.text(first, last), first, last, def.type, std::move(meta)));

            cursor = last + 1;
        }
        if (cursor < n) emit_gap(cursor, n - 1);

        return out;
    }

    std::vector<Chunk> Chunker::chunk_patterns(const std::string& path, const std::string& content, const std::string& language) const {
        std::vector<Chunk> out;
        Lines lines(content);
        if (lines.count() == 0) return out;
        scan_lines(lines, 0, lines.count() - 1, path, language, out);
        return out;
    }

    void Chunker::scan_lines(const Lines& lines, std::size_t first, std::size_t last, const std::string& path,
                             const std::string& language, std::vector<Chunk>& out) const {
        const Markers& markers = markers_for(language);

        struct Buffer {
            std::size_t first = 0;
            std::size_t count = 0;
            std::size_t bytes = 0;
            std::size_t fresh = 0; // lines not carried over from the previous chunk
            ChunkType type = ChunkType::Module;
            std::string name;
            bool only_comments = true;
        };

        auto classify = [&](std::size_t i, std::string& name) {
            std::string text = lines.line(i);
            if (is_blank(text)) return LineKind::Blank;
            if (text.size() > kMaxMarkerLineLength) return LineKind::Plain;

            std::smatch m;
            if (markers.klass && std::regex_search(text, m, *markers.klass)) {
                name = first_capture(m);
                return LineKind::Class;
            }
            if (markers.function && std::regex_search(text, m, *markers.function)) {
                name = first_capture(m);
                return LineKind::Function;
            }
            if (markers.comment && std::regex_search(text, markers.comment.value())) return LineKind::Comment;
            if (markers.import && std::regex_search(text, markers.import.value())) return LineKind::Import;
            return LineKind::Plain;
        };

        auto flush = [&](const Buffer& b) {
            if (b.fresh == 0 || b.count == 0) return;
            std::size_t end = b.first + b.count - 1;
            std::string text = lines.text(b.first, end);
            if (is_blank(text)) return;

            ChunkType type = b.type;
            if (type == ChunkType::Module && b.only_comments) type = ChunkType::Comment;

            std::map<std::string, std::string> meta{{"method", "pattern"}};
            if (!b.name.empty()) meta["name"] = b.name;
            out.push_back(make_chunk(path, language, std::move(text), b.first, end, type, std::move(meta)));
        };

        // Tail of the emitted buffer carried into the next one: a share of its lines proportional to
        // overlap_size / max_chunk_size, at least one, within overlap_size bytes. Lines are atomic, so
        // when even the last line is longer than overlap_size that single line is carried instead.
        // Nothing is carried when overlap_size is 0 or the carried line would push the next chunk
        // past max_chunk_size.
        auto carry_overlap = [&](const Buffer& prev, std::size_t incoming) {
            Buffer next;
            next.type = ChunkType::Mixed;
            next.only_comments = false;

            const std::size_t prev_last = prev.first + prev.count - 1;
            std::size_t wanted = (prev.count * m_overlap_size + m_max_chunk_size - 1) / m_max_chunk_size;
            wanted = std::min(std::max<std::size_t>(wanted, 1), prev.count);

            std::size_t n = 0, bytes = 0;
            while (n < wanted) {
                std::size_t len = lines.bytes(prev_last - n);
                if (bytes + len > m_overlap_size) break;
                bytes += len;
                ++n;
            }
            if (n == 0 && m_overlap_size > 0) {
                bytes = lines.bytes(prev_last);
                n = 1;
            }
            while (n > 0 && bytes + incoming > m_max_chunk_size) {
                bytes -= lines.bytes(prev_last + 1 - n);
                --n;
            }

            next.first = prev_last + 1 - n;
            next.count = n;
            next.bytes = bytes;
            return next;
        };

        Buffer buf;
        for (std::size_t i = first; i <= last; ++i) {
            std::string name;
            LineKind kind = classify(i, name);
            const std::size_t len = lines.bytes(i);
            const bool marker = kind == LineKind::Function || kind == LineKind::Class;

            if (marker && buf.count > 0) {
                flush(buf);
                buf = Buffer{};
            } else if (buf.count > 0 && buf.bytes + len > m_max_chunk_size) {
                flush(buf);
                buf = carry_overlap(buf, len);
            }

            if (buf.count == 0) buf.first = i;
            buf.count++;
            buf.bytes += len;
            buf.fresh++;

            if (marker) {
                buf.type = kind == LineKind::Class ? ChunkType::Class : ChunkType::Function;
                buf.name = name;
            }
            if (kind != LineKind::Blank && kind != LineKind::Comment) buf.only_comments = false;
        }

        if (buf.fresh > 0 && buf.bytes >= m_min_chunk_size) flush(buf);
    }

    std::vector<Chunk> Chunker::chunk_window(const std::string& path, const std::string& content, const std::string& language) const {
        std::vector<Chunk> out;
        Lines lines(content);
        const std::size_t n = lines.count();

        std::size_t first = 0, bytes = 0;
        for (std::size_t i = 0; i < n; ++i) {
            if (i > first && bytes + lines.bytes(i) > m_max_chunk_size) {
                std::string text = lines.text(first, i - 1);
                if (!is_blank(text)) {
                    out.push_back(make_chunk(path, language, std::move(text), first, i - 1, ChunkType::Mixed, {{"method", "pattern"}}));
                }
                first = i;
                bytes = 0;
            }
            bytes += lines.bytes(i);
        }
        if (n > 0 && bytes >= m_min_chunk_size) {
            std::string text = lines.text(first, n - 1);
            if (!is_blank(text)) {
                out.push_back(make_chunk(path, language, std::move(text), first, n - 1, ChunkType::Mixed, {{"method", "pattern"}}));
            }
        }
        return out;
    }

}
