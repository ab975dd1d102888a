#include "language.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace reposcope::engine {

    namespace {

        const std::unordered_map<std::string, std::string>& extension_table() {
            static const std::unordered_map<std::string, std::string> table = {
                {".py", "python"}, {".pyw", "python"}, {".pyi", "python"},
                {".js", "javascript"}, {".jsx", "javascript"}, {".mjs", "javascript"}, {".cjs", "javascript"},
                {".ts", "typescript"}, {".tsx", "typescript"},
                {".java", "java"},
                {".cpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"}, {".hpp", "cpp"}, {".hh", "cpp"}, {".hxx", "cpp"},
                {".c", "c"}, {".h", "c"},
                {".go", "go"},
                {".rs", "rust"},
                {".rb", "ruby"},
                {".cs", "csharp"},
                {".php", "php"},
                {".kt", "kotlin"}, {".kts", "kotlin"},
                {".swift", "swift"},
                {".scala", "scala"},
                {".sh", "shell"}, {".bash", "shell"}, {".zsh", "shell"},
                {".md", "markdown"}, {".markdown", "markdown"}, {".rst", "markdown"},
                {".json", "json"},
                {".yml", "yaml"}, {".yaml", "yaml"},
                {".toml", "toml"},
                {".html", "html"}, {".htm", "html"},
                {".css", "css"}, {".scss", "css"},
                {".sql", "sql"},
                {".cmake", "cmake"},
                {".mk", "make"},
            };
            return table;
        }

        const std::unordered_map<std::string, std::string>& filename_table() {
            static const std::unordered_map<std::string, std::string> table = {
                {"makefile", "make"},
                {"gnumakefile", "make"},
                {"dockerfile", "dockerfile"},
                {"cmakelists.txt", "cmake"},
            };
            return table;
        }

        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

    }

    std::string classify_language(const std::string& path) {
        const std::filesystem::path p(path);

        const auto& names = filename_table();
        auto by_name = names.find(lower(p.filename().string()));
        if (by_name != names.end()) return by_name->second;

        const auto& exts = extension_table();
        auto by_ext = exts.find(lower(p.extension().string()));
        if (by_ext != exts.end()) return by_ext->second;

        return "text";
    }

}
