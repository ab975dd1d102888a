#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <sstream>
#include "engine/chunker.hpp"
#include "reposcope/sha256.h"

using namespace reposcope::engine;

namespace {

    IndexConfig small_config(size_t max_chunk, size_t overlap, size_t min_chunk) {
        IndexConfig config;
        config.max_chunk_size = max_chunk;
        config.overlap_size = overlap;
        config.min_chunk_size = min_chunk;
        return config;
    }

    std::vector<std::string> split_lines(const std::string& content) {
        std::vector<std::string> lines;
        std::istringstream in(content);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line + "\n");
        return lines;
    }

    void expect_well_formed(const std::vector<Chunk>& chunks, const std::string& path, const std::string& language) {
        for (const auto& c : chunks) {
            EXPECT_EQ(c.file_path, path);
            EXPECT_EQ(c.language, language);
            EXPECT_GE(c.start_line, 1);
            EXPECT_GE(c.end_line, c.start_line);
            EXPECT_EQ(c.size, c.content.size());
            EXPECT_EQ(c.content_hash, reposcope::crypto::sha256_hex(c.content));
            EXPECT_FALSE(c.embedding.has_value());
            EXPECT_TRUE(c.metadata.count("method"));
        }
    }

    // Largest run of consecutive uncovered lines, counting only non-blank bytes.
    size_t largest_uncovered_run(const std::string& content, const std::vector<Chunk>& chunks) {
        auto lines = split_lines(content);
        std::vector<bool> covered(lines.size(), false);
        for (const auto& c : chunks) {
            for (int l = c.start_line; l <= c.end_line && l <= static_cast<int>(lines.size()); ++l) covered[l - 1] = true;
        }
        size_t largest = 0, run = 0;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (covered[i]) {
                run = 0;
                continue;
            }
            if (lines[i].find_first_not_of(" \t\r\n") != std::string::npos) run += lines[i].size();
            largest = std::max(largest, run);
        }
        return largest;
    }

}

TEST(Chunker, SplitsOnFunctionMarkers) {
    ParserRegistry parsers;
    Chunker chunker(parsers, small_config(1000, 100, 1));

    const std::string content =
        "import os\n"
        "\n"
        "def alpha():\n"
        "    return 1\n"
        "\n"
        "def beta():\n"
        "    return 2\n";
    auto chunks = chunker.chunk_patterns("m.py", content, "python");
    expect_well_formed(chunks, "m.py", "python");

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].chunk_type, ChunkType::Module);
    EXPECT_EQ(chunks[0].start_line, 1);
    EXPECT_EQ(chunks[0].end_line, 2);

    EXPECT_EQ(chunks[1].chunk_type, ChunkType::Function);
    EXPECT_EQ(chunks[1].metadata.at("name"), "alpha");
    EXPECT_EQ(chunks[1].start_line, 3);
    EXPECT_EQ(chunks[1].end_line, 5);

    EXPECT_EQ(chunks[2].chunk_type, ChunkType::Function);
    EXPECT_EQ(chunks[2].metadata.at("name"), "beta");
    EXPECT_EQ(chunks[2].start_line, 6);
    EXPECT_EQ(chunks[2].end_line, 7);
    EXPECT_EQ(chunks[2].content, "def beta():\n    return 2\n");
    EXPECT_EQ(chunks[2].metadata.at("method"), "pattern");
}

TEST(Chunker, ClassMarkerAndCommentOnlyBuffer) {
    ParserRegistry parsers;
    Chunker chunker(parsers, small_config(1000, 100, 1));

    const std::string content =
        "// Shared helpers.\n"
        "// Nothing else here.\n"
        "class Widget {\n"
        "  int size;\n"
        "};\n";
    auto chunks = chunker.chunk_patterns("w.java", content, "java");
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].chunk_type, ChunkType::Comment);
    EXPECT_EQ(chunks[1].chunk_type, ChunkType::Class);
    EXPECT_EQ(chunks[1].metadata.at("name"), "Widget");
}

TEST(Chunker, OverlapScenarioSmallWindow) {
    ParserRegistry parsers;
    Chunker chunker(parsers, small_config(100, 20, 20));

    std::string content = "def compute_total\n";
    for (int i = 1; i <= 30; ++i) {
        char line[32];
        std::snprintf(line, sizeof(line), "  v%02d = v%02d + 1\n", i, i - 1);
        content += line;
    }
    ASSERT_GE(content.size(), 480u);

    // Ruby never has a structural grammar, so this exercises the pattern path through chunk_file.
    auto chunks = chunker.chunk_file("calc.rb", content, "ruby");
    expect_well_formed(chunks, "calc.rb", "ruby");

    ASSERT_GT(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].chunk_type, ChunkType::Function);
    EXPECT_EQ(chunks[0].metadata.at("name"), "compute_total");

    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_LE(chunks[i].size, 100u) << "chunk " << i;
        if (i == 0) continue;

        EXPECT_EQ(chunks[i].chunk_type, ChunkType::Mixed);
        const std::string& prev = chunks[i - 1].content;
        const std::string& cur = chunks[i].content;
        std::string first_line = cur.substr(0, cur.find('\n') + 1);
        ASSERT_FALSE(first_line.empty());
        ASSERT_LE(first_line.size(), 20u);
        ASSERT_GE(prev.size(), first_line.size());
        EXPECT_EQ(prev.substr(prev.size() - first_line.size()), first_line) << "chunk " << i;
        EXPECT_LE(chunks[i].start_line, chunks[i - 1].end_line);
    }
    EXPECT_EQ(chunks.back().end_line, 31);
}

TEST(Chunker, OverlapCarriesWholeLineLongerThanOverlapSize) {
    ParserRegistry parsers;
    Chunker chunker(parsers, small_config(100, 20, 20));

    std::string content = "def accumulate(values)\n  total = 0\n";
    for (int i = 0; i < 16; ++i) content += "    total = total + values[" + std::to_string(i) + "]\n";
    content += "  total\nend\n";
    ASSERT_GT(content.size(), 500u);

    auto chunks = chunker.chunk_file("sum.rb", content, "ruby");
    expect_well_formed(chunks, "sum.rb", "ruby");
    ASSERT_GT(chunks.size(), 3u);

    for (size_t i = 1; i < chunks.size(); ++i) {
        const std::string& prev = chunks[i - 1].content;
        const std::string& cur = chunks[i].content;
        std::string first_line = cur.substr(0, cur.find('\n') + 1);

        EXPECT_LE(cur.size(), 100u) << "chunk " << i;
        EXPECT_EQ(chunks[i].chunk_type, ChunkType::Mixed);
        EXPECT_EQ(chunks[i].start_line, chunks[i - 1].end_line) << "chunk " << i;
        ASSERT_GT(first_line.size(), 20u);
        ASSERT_GE(prev.size(), first_line.size());
        EXPECT_EQ(prev.substr(prev.size() - first_line.size()), first_line) << "chunk " << i;
    }
    EXPECT_EQ(chunks.back().end_line, 20);
}

TEST(Chunker, ZeroOverlapCarriesNothing) {
    ParserRegistry parsers;
    Chunker chunker(parsers, small_config(100, 0, 20));

    std::string content = "def accumulate(values)\n";
    for (int i = 0; i < 12; ++i) content += "    total = total + values[" + std::to_string(i) + "]\n";

    auto chunks = chunker.chunk_file("sum.rb", content, "ruby");
    ASSERT_GT(chunks.size(), 1u);
    for (size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].start_line, chunks[i - 1].end_line + 1) << "chunk " << i;
    }
}

TEST(Chunker, OversizedSingleLineIsAtomic) {
    ParserRegistry parsers;
    Chunker chunker(parsers, small_config(100, 20, 10));

    std::string content = "short line one\n" + std::string(300, 'z') + "\nshort line three\n";
    auto chunks = chunker.chunk_patterns("long.txt", content, "text");
    expect_well_formed(chunks, "long.txt", "text");

    bool saw_long = false;
    for (const auto& c : chunks) {
        if (c.size > 100) {
            saw_long = true;
            EXPECT_EQ(c.start_line, c.end_line);
        }
    }
    EXPECT_TRUE(saw_long);
}

TEST(Chunker, TrailingRemnantBelowMinimumIsDropped) {
    ParserRegistry parsers;
    Chunker chunker(parsers, small_config(1000, 100, 50));

    auto chunks = chunker.chunk_patterns("tiny.txt", "x = 1\n", "text");
    EXPECT_TRUE(chunks.empty());
}

TEST(Chunker, EmptyAndBlankInput) {
    ParserRegistry parsers;
    Chunker chunker(parsers, small_config(100, 20, 1));
    EXPECT_TRUE(chunker.chunk_file("e.py", "", "python").empty());
    EXPECT_TRUE(chunker.chunk_file("b.py", "\n\n   \n", "python").empty());
}

TEST(Chunker, DeterministicAcrossCalls) {
    ParserRegistry parsers;
    Chunker chunker(parsers, small_config(120, 30, 10));

    std::string content;
    for (int i = 0; i < 40; ++i) {
        content += "function f" + std::to_string(i) + "(a, b) {\n  return a * " + std::to_string(i) + " + b;\n}\n";
        if (i % 3 == 0) content += "// separator comment " + std::to_string(i) + "\n";
    }

    auto first = chunker.chunk_file("lib.js", content, "javascript");
    auto second = chunker.chunk_file("lib.js", content, "javascript");
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].content, second[i].content);
        EXPECT_EQ(first[i].start_line, second[i].start_line);
        EXPECT_EQ(first[i].end_line, second[i].end_line);
        EXPECT_EQ(first[i].chunk_type, second[i].chunk_type);
        EXPECT_EQ(first[i].content_hash, second[i].content_hash);
        EXPECT_EQ(first[i].metadata, second[i].metadata);
    }
}

TEST(Chunker, CoverageLeavesOnlySmallGaps) {
    ParserRegistry parsers;
    const size_t min_chunk = 40;
    Chunker chunker(parsers, small_config(150, 30, min_chunk));

    std::string content = "#!/bin/sh\n# build helper\n\n";
    for (int i = 0; i < 12; ++i) {
        content += "step_" + std::to_string(i) + "() {\n  echo \"running step " + std::to_string(i) + "\"\n  make target_" +
                   std::to_string(i) + "\n}\n\n";
    }
    content += "step_0\n";

    for (const char* language : {"shell", "text", "python"}) {
        auto chunks = chunker.chunk_file("build.sh", content, language);
        EXPECT_LT(largest_uncovered_run(content, chunks), min_chunk) << language;
    }
}

TEST(Chunker, MalformedInputNeverThrows) {
    ParserRegistry parsers;
    Chunker chunker(parsers, small_config(50, 10, 1));

    std::string garbage;
    for (int i = 0; i < 2000; ++i) garbage += static_cast<char>((i * 37) % 256);
    for (const char* language : {"python", "cpp", "javascript", "go", "rust", "text", "unknown"}) {
        EXPECT_NO_THROW({
            auto chunks = chunker.chunk_file("junk", garbage, language);
            for (const auto& c : chunks) EXPECT_EQ(c.size, c.content.size());
        }) << language;
    }
}

TEST(Chunker, StructuralExtractionWhenGrammarAvailable) {
    ParserRegistry parsers;
    if (!parsers.has("python")) GTEST_SKIP() << "built without the python grammar";

    Chunker chunker(parsers, small_config(1000, 100, 20));
    const std::string content =
        "import os\n"
        "\n"
        "# Adds things.\n"
        "def add(a, b):\n"
        "    return a + b\n"
        "\n"
        "class Box:\n"
        "    \"\"\"Holds one value.\"\"\"\n"
        "    def get(self):\n"
        "        return self.value\n";

    auto chunks = chunker.chunk_file("box.py", content, "python");
    expect_well_formed(chunks, "box.py", "python");

    const Chunk* fn = nullptr;
    const Chunk* cls = nullptr;
    for (const auto& c : chunks) {
        auto name = c.metadata.find("name");
        if (name == c.metadata.end()) continue;
        if (name->second == "add") fn = &c;
        if (name->second == "Box") cls = &c;
    }
    ASSERT_NE(fn, nullptr);
    ASSERT_NE(cls, nullptr);

    EXPECT_EQ(fn->chunk_type, ChunkType::Function);
    EXPECT_EQ(fn->start_line, 4);
    EXPECT_EQ(fn->end_line, 5);
    EXPECT_EQ(fn->metadata.at("method"), "structural");
    EXPECT_NE(fn->metadata.at("doc").find("Adds things."), std::string::npos);

    EXPECT_EQ(cls->chunk_type, ChunkType::Class);
    EXPECT_EQ(cls->start_line, 7);
    EXPECT_EQ(cls->end_line, 10);
    EXPECT_NE(cls->metadata.at("doc").find("Holds one value."), std::string::npos);
}

TEST(ChunkType, NamesRoundTrip) {
    for (auto type : {ChunkType::Function, ChunkType::Class, ChunkType::Module, ChunkType::Comment, ChunkType::Mixed}) {
        EXPECT_EQ(chunk_type_from_string(to_string(type)), type);
    }
    EXPECT_EQ(chunk_type_from_string("bogus"), ChunkType::Mixed);
}
