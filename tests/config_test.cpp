#include <gtest/gtest.h>
#include <cstdlib>
#include "engine/config.hpp"
#include "platform.hpp"
#include "test_support.hpp"

using reposcope::engine::Config;
using reposcope::test::TempDir;

namespace {

    // Restores an environment variable when the test ends.
    class EnvGuard {
    public:
        explicit EnvGuard(const char* name) : m_name(name) {
            if (const char* v = std::getenv(name)) m_saved = v;
        }
        ~EnvGuard() {
            if (m_saved) setenv(m_name, m_saved->c_str(), 1);
            else unsetenv(m_name);
        }

    private:
        const char* m_name;
        std::optional<std::string> m_saved;
    };

}

TEST(Config, DefaultsWhenFileIsMissing) {
    EnvGuard key("OPENAI_API_KEY");
    unsetenv("OPENAI_API_KEY");
    TempDir dir;

    Config cfg = Config::load(dir.path() / "config.json");
    EXPECT_EQ(cfg.embedding_backend, "ollama");
    EXPECT_TRUE(cfg.openai_key.empty());
    EXPECT_TRUE(cfg.cache_dir.empty());
    EXPECT_EQ(cfg.index.max_chunk_size, 1000u);
    EXPECT_EQ(cfg.index.overlap_size, 100u);
    EXPECT_EQ(cfg.index.min_chunk_size, 50u);
    EXPECT_EQ(cfg.index.batch_size, 32u);
    EXPECT_EQ(cfg.index.max_file_size_bytes, 1024u * 1024u);
    EXPECT_FALSE(cfg.index.include_extensions.has_value());
    EXPECT_EQ(cfg.index.exclude_name_fragments.count("node_modules"), 1u);
    EXPECT_GE(cfg.index.workers, 1u);
}

TEST(Config, ReadsValuesFromFile) {
    EnvGuard key("OPENAI_API_KEY");
    unsetenv("OPENAI_API_KEY");
    TempDir dir;
    auto path = dir.write("config.json", R"({
        "embedding_backend": "openai",
        "embedding_model": "text-embedding-3-large",
        "openai_key": "from-file",
        "cache_dir": "/var/cache/reposcope",
        "index": {
            "max_chunk_size": 400,
            "overlap_size": 40,
            "batch_size": 8,
            "include_extensions": [".py", ".rb"],
            "embedding_concurrency": 3
        }
    })");

    Config cfg = Config::load(path);
    EXPECT_EQ(cfg.embedding_backend, "openai");
    EXPECT_EQ(cfg.embedding_model, "text-embedding-3-large");
    EXPECT_EQ(cfg.openai_key, "from-file");
    EXPECT_EQ(cfg.cache_dir, std::filesystem::path("/var/cache/reposcope"));
    EXPECT_EQ(cfg.index.max_chunk_size, 400u);
    EXPECT_EQ(cfg.index.overlap_size, 40u);
    EXPECT_EQ(cfg.index.batch_size, 8u);
    EXPECT_EQ(cfg.index.embedding_concurrency, 3u);
    ASSERT_TRUE(cfg.index.include_extensions.has_value());
    EXPECT_EQ(cfg.index.include_extensions->size(), 2u);
    EXPECT_EQ(cfg.index.min_chunk_size, 50u);
}

TEST(Config, MalformedFileFallsBackToDefaults) {
    EnvGuard key("OPENAI_API_KEY");
    unsetenv("OPENAI_API_KEY");
    TempDir dir;
    auto path = dir.write("config.json", "{ \"embedding_backend\": \"openai\", ");

    Config cfg = Config::load(path);
    EXPECT_EQ(cfg.embedding_backend, "ollama");
    EXPECT_EQ(cfg.index.max_chunk_size, 1000u);
}

TEST(Config, EnvironmentKeyOverridesFile) {
    EnvGuard key("OPENAI_API_KEY");
    setenv("OPENAI_API_KEY", "from-env", 1);
    TempDir dir;
    auto path = dir.write("config.json", R"({"openai_key": "from-file"})");

    EXPECT_EQ(Config::load(path).openai_key, "from-env");
}

TEST(Config, SaveThenLoad) {
    EnvGuard key("OPENAI_API_KEY");
    unsetenv("OPENAI_API_KEY");
    TempDir dir;
    auto path = dir.path() / "config.json";

    Config cfg;
    cfg.embedding_backend = "openai";
    cfg.cache_dir = dir.path() / "cache";
    cfg.index.max_chunk_size = 321;
    cfg.index.include_extensions = std::set<std::string>{".go"};
    ASSERT_TRUE(cfg.save(path));

    Config loaded = Config::load(path);
    EXPECT_EQ(loaded.embedding_backend, "openai");
    EXPECT_EQ(loaded.cache_dir, cfg.cache_dir);
    EXPECT_EQ(loaded.index.max_chunk_size, 321u);
    EXPECT_EQ(loaded.index.include_extensions, cfg.index.include_extensions);

    EXPECT_FALSE(cfg.save(dir.path() / "missing" / "config.json"));
}

TEST(Platform, DirectoriesFollowXdgVariables) {
    EnvGuard config("XDG_CONFIG_HOME");
    EnvGuard cache("XDG_CACHE_HOME");
    setenv("XDG_CONFIG_HOME", "/tmp/xdg-config", 1);
    setenv("XDG_CACHE_HOME", "/tmp/xdg-cache", 1);

    EXPECT_EQ(reposcope::platform::system::get_config_dir(), std::filesystem::path("/tmp/xdg-config/reposcope"));
    EXPECT_EQ(reposcope::platform::system::get_cache_dir(), std::filesystem::path("/tmp/xdg-cache/reposcope"));

    EnvGuard home("HOME");
    unsetenv("XDG_CACHE_HOME");
    setenv("HOME", "/home/someone", 1);
    EXPECT_EQ(reposcope::platform::system::get_cache_dir(), std::filesystem::path("/home/someone/.cache/reposcope"));
}
