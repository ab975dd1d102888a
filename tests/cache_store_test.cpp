#include <gtest/gtest.h>
#include "engine/cache_store.hpp"
#include "reposcope/sha256.h"
#include "test_support.hpp"

using namespace reposcope::engine;
using reposcope::test::TempDir;

namespace {

    Chunk make_chunk(const std::string& path, int start, int end, const std::string& content, ChunkType type) {
        Chunk c;
        c.file_path = path;
        c.start_line = start;
        c.end_line = end;
        c.content = content;
        c.chunk_type = type;
        c.language = "python";
        c.size = content.size();
        c.content_hash = reposcope::crypto::sha256_hex(content);
        c.metadata = {{"method", "pattern"}, {"name", "fn_" + std::to_string(start)}};
        return c;
    }

    struct Fixture {
        std::vector<Chunk> chunks;
        std::vector<std::vector<float>> vectors;
        std::map<std::string, int> histogram;

        Fixture() {
            chunks.push_back(make_chunk("a.py", 1, 3, "def a():\n    return 1\n\n", ChunkType::Function));
            chunks.push_back(make_chunk("b/c.py", 10, 12, "class C:\n    pass\n", ChunkType::Class));
            chunks.push_back(make_chunk("b/c.py", 13, 13, "x = \"caf\xc3\xa9\"\n", ChunkType::Mixed));
            vectors = {{0.6f, 0.8f, 0.0f}, {0.0f, 1.0f, 0.0f}, {0.0f, 0.0f, 1.0f}};
            histogram = {{"python", 2}, {"markdown", 1}};
        }
    };

    void expect_same_chunk(const Chunk& a, const Chunk& b) {
        EXPECT_EQ(a.content, b.content);
        EXPECT_EQ(a.file_path, b.file_path);
        EXPECT_EQ(a.start_line, b.start_line);
        EXPECT_EQ(a.end_line, b.end_line);
        EXPECT_EQ(a.chunk_type, b.chunk_type);
        EXPECT_EQ(a.language, b.language);
        EXPECT_EQ(a.size, b.size);
        EXPECT_EQ(a.content_hash, b.content_hash);
        EXPECT_EQ(a.metadata, b.metadata);
    }

}

TEST(CacheStore, IdentityIsStableAndDistinct) {
    EXPECT_EQ(CacheStore::identity_for("https://example.com/org/repo"), CacheStore::identity_for("https://example.com/org/repo"));
    EXPECT_NE(CacheStore::identity_for("https://example.com/org/repo"), CacheStore::identity_for("https://example.com/org/repo2"));
    EXPECT_EQ(CacheStore::identity_for("x").size(), 64u);
}

TEST(CacheStore, RoundTrip) {
    TempDir dir;
    CacheStore store(dir.path() / "cache");
    Fixture f;
    const auto id = CacheStore::identity_for("repo-one");

    ASSERT_TRUE(store.save(id, f.chunks, f.vectors, f.histogram));
    EXPECT_TRUE(store.exists(id));

    auto tmp = store.entry_path(id);
    tmp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(tmp));

    auto entry = store.load(id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->identity, id);
    ASSERT_EQ(entry->chunks.size(), f.chunks.size());
    for (size_t i = 0; i < f.chunks.size(); ++i) expect_same_chunk(entry->chunks[i], f.chunks[i]);
    EXPECT_EQ(entry->vectors, f.vectors);
    EXPECT_EQ(entry->language_histogram, f.histogram);
}

TEST(CacheStore, EmptyEntryRoundTrips) {
    TempDir dir;
    CacheStore store(dir.path());
    const auto id = CacheStore::identity_for("empty");
    ASSERT_TRUE(store.save(id, {}, {}, {}));
    auto entry = store.load(id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->chunks.empty());
    EXPECT_TRUE(entry->vectors.empty());
}

TEST(CacheStore, MissingEntryIsNone) {
    TempDir dir;
    CacheStore store(dir.path());
    EXPECT_FALSE(store.load(CacheStore::identity_for("never-saved")).has_value());
    EXPECT_FALSE(store.exists(CacheStore::identity_for("never-saved")));
}

TEST(CacheStore, SaveOverwritesPreviousEntry) {
    TempDir dir;
    CacheStore store(dir.path());
    Fixture f;
    const auto id = CacheStore::identity_for("repo");

    ASSERT_TRUE(store.save(id, f.chunks, f.vectors, f.histogram));
    ASSERT_TRUE(store.save(id, {f.chunks[0]}, {f.vectors[0]}, {{"python", 1}}));

    auto entry = store.load(id);
    ASSERT_TRUE(entry.has_value());
    ASSERT_EQ(entry->chunks.size(), 1u);
    expect_same_chunk(entry->chunks[0], f.chunks[0]);
    EXPECT_EQ(entry->language_histogram.size(), 1u);
}

TEST(CacheStore, CorruptEntryIsTreatedAsMiss) {
    TempDir dir;
    CacheStore store(dir.path());
    const auto id = CacheStore::identity_for("corrupt");

    std::ofstream(store.entry_path(id), std::ios::binary) << "this is not a sqlite database at all";
    EXPECT_TRUE(store.exists(id));
    EXPECT_FALSE(store.load(id).has_value());
}

TEST(CacheStore, TruncatedEntryIsTreatedAsMiss) {
    TempDir dir;
    CacheStore store(dir.path());
    Fixture f;
    const auto id = CacheStore::identity_for("truncated");
    ASSERT_TRUE(store.save(id, f.chunks, f.vectors, f.histogram));

    auto path = store.entry_path(id);
    std::filesystem::resize_file(path, std::filesystem::file_size(path) / 2);
    EXPECT_FALSE(store.load(id).has_value());
}

TEST(CacheStore, EntryForAnotherIdentityIsRejected) {
    TempDir dir;
    CacheStore store(dir.path());
    Fixture f;
    const auto a = CacheStore::identity_for("a");
    const auto b = CacheStore::identity_for("b");
    ASSERT_TRUE(store.save(a, f.chunks, f.vectors, f.histogram));

    std::filesystem::copy_file(store.entry_path(a), store.entry_path(b));
    EXPECT_FALSE(store.load(b).has_value());
}

TEST(CacheStore, RejectsMisalignedInput) {
    TempDir dir;
    CacheStore store(dir.path());
    Fixture f;
    const auto id = CacheStore::identity_for("bad");

    f.vectors.pop_back();
    EXPECT_FALSE(store.save(id, f.chunks, f.vectors, f.histogram));
    EXPECT_FALSE(store.exists(id));

    Fixture g;
    g.vectors[1] = {1.0f, 0.0f};
    EXPECT_FALSE(store.save(id, g.chunks, g.vectors, g.histogram));
    EXPECT_FALSE(store.save("../escape", g.chunks, g.vectors, g.histogram));
}

TEST(CacheStore, InvalidateRemovesEntry) {
    TempDir dir;
    CacheStore store(dir.path());
    Fixture f;
    const auto id = CacheStore::identity_for("gone");
    ASSERT_TRUE(store.save(id, f.chunks, f.vectors, f.histogram));

    EXPECT_TRUE(store.invalidate(id));
    EXPECT_FALSE(store.exists(id));
    EXPECT_FALSE(store.load(id).has_value());
    EXPECT_FALSE(store.invalidate(id));
}

TEST(CacheStore, UnwritableDirectoryFailsCleanly) {
    TempDir dir;
    auto blocker = dir.write("not-a-dir", "file in the way");
    CacheStore store(blocker / "cache");
    Fixture f;
    EXPECT_FALSE(store.save(CacheStore::identity_for("x"), f.chunks, f.vectors, f.histogram));
}
