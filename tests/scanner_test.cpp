#include <gtest/gtest.h>
#include <algorithm>
#include "engine/scanner.hpp"
#include "test_support.hpp"

using namespace reposcope::engine;
using reposcope::test::TempDir;

namespace {

    void make_repo(const TempDir& dir) {
        dir.write("main.py", "print('hello')\n");
        dir.write("src/util.cpp", "int util() { return 1; }\n");
        dir.write("docs/guide.md", "# Guide\n");
        dir.write("node_modules/pkg/index.js", "module.exports = 1;\n");
        dir.write(".git/config", "[core]\n");
        dir.write("assets/logo.png", "not really a png");
        dir.write("logs/app.log", "log line\n");
        dir.write("generated/schema.py", "x = 1\n");
        dir.write(".reposcopeignore", "# comment\n*.log\ngenerated/\n");
        dir.write("big.txt", std::string(300, 'x'));
        dir.write("blob.dat", std::string("ab\0cd", 5));
        dir.write("latin1.txt", std::string("caf\xe9\n"));
    }

}

TEST(Scanner, ListAppliesExclusionsAndSortsLexically) {
    TempDir dir;
    make_repo(dir);

    IndexConfig config;
    Scanner scanner(config);
    auto files = scanner.list(dir.path());

    std::vector<std::string> expected = {"big.txt", "blob.dat", "docs/guide.md", "latin1.txt", "main.py", "src/util.cpp"};
    EXPECT_EQ(files, expected);
}

TEST(Scanner, ScanSkipsOversizedAndBinaryFiles) {
    TempDir dir;
    make_repo(dir);

    IndexConfig config;
    config.max_file_size_bytes = 200;
    Scanner scanner(config);

    std::vector<std::string> seen;
    std::vector<std::pair<std::string, ReadStatus>> skipped;
    scanner.scan(dir.path(),
                 [&](const SourceFile& f) {
                     seen.push_back(f.relative_path);
                     return true;
                 },
                 [&](const std::string& rel, ReadStatus status) { skipped.emplace_back(rel, status); });

    std::vector<std::string> expected_seen = {"docs/guide.md", "main.py", "src/util.cpp"};
    EXPECT_EQ(seen, expected_seen);

    ASSERT_EQ(skipped.size(), 3u);
    EXPECT_EQ(skipped[0], std::make_pair(std::string("big.txt"), ReadStatus::TooLarge));
    EXPECT_EQ(skipped[1], std::make_pair(std::string("blob.dat"), ReadStatus::Binary));
    EXPECT_EQ(skipped[2], std::make_pair(std::string("latin1.txt"), ReadStatus::Binary));
}

TEST(Scanner, ScanStopsWhenCallbackDeclines) {
    TempDir dir;
    make_repo(dir);

    Scanner scanner(IndexConfig{});
    std::vector<std::string> seen;
    scanner.scan(dir.path(), [&](const SourceFile& f) {
        seen.push_back(f.relative_path);
        return seen.size() < 2;
    });
    EXPECT_EQ(seen.size(), 2u);
}

TEST(Scanner, IncludeExtensionsFilter) {
    TempDir dir;
    make_repo(dir);

    IndexConfig config;
    config.include_extensions = std::set<std::string>{".py", "md"};
    Scanner scanner(config);

    std::vector<std::string> expected = {"docs/guide.md", "main.py"};
    EXPECT_EQ(scanner.list(dir.path()), expected);
}

TEST(Scanner, SlashFragmentMatchesAsSubstring) {
    TempDir dir;
    dir.write("a/vendor/x.py", "x = 1\n");
    dir.write("b/vendor.py", "y = 2\n");

    IndexConfig config;
    config.exclude_name_fragments = {"a/vendor"};
    Scanner scanner(config);

    std::vector<std::string> expected = {"b/vendor.py"};
    EXPECT_EQ(scanner.list(dir.path()), expected);
}

TEST(Scanner, ReadTextReportsMissingFile) {
    TempDir dir;
    IndexConfig config;
    Scanner scanner(config);
    std::string out;
    EXPECT_EQ(scanner.read_text(dir.path(), "nope.txt", out), ReadStatus::Unreadable);
}

TEST(Scanner, InvalidRootYieldsNothing) {
    IndexConfig config;
    Scanner scanner(config);
    EXPECT_TRUE(scanner.list("/definitely/not/a/real/path").empty());
}

TEST(Scanner, IsText) {
    EXPECT_TRUE(Scanner::is_text(""));
    EXPECT_TRUE(Scanner::is_text("plain ascii\n"));
    EXPECT_TRUE(Scanner::is_text("caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80"));
    EXPECT_FALSE(Scanner::is_text(std::string("a\0b", 3)));
    EXPECT_FALSE(Scanner::is_text("caf\xe9"));
    EXPECT_FALSE(Scanner::is_text("\xc3"));
    EXPECT_FALSE(Scanner::is_text("\xc0\xaf"));
}
