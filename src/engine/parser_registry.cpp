#include "parser_registry.hpp"
#include <algorithm>
#include <cstring>
#include <map>

#ifdef REPOSCOPE_WITH_TREE_SITTER
#include <tree_sitter/api.h>

extern "C" {
#ifdef REPOSCOPE_TS_PYTHON
    const TSLanguage* tree_sitter_python();
#endif
#ifdef REPOSCOPE_TS_JAVASCRIPT
    const TSLanguage* tree_sitter_javascript();
#endif
#ifdef REPOSCOPE_TS_TYPESCRIPT
    const TSLanguage* tree_sitter_typescript();
#endif
#ifdef REPOSCOPE_TS_JAVA
    const TSLanguage* tree_sitter_java();
#endif
#ifdef REPOSCOPE_TS_CPP
    const TSLanguage* tree_sitter_cpp();
#endif
#ifdef REPOSCOPE_TS_GO
    const TSLanguage* tree_sitter_go();
#endif
#ifdef REPOSCOPE_TS_RUST
    const TSLanguage* tree_sitter_rust();
#endif
}
#endif

namespace reposcope::engine {

#ifdef REPOSCOPE_WITH_TREE_SITTER

    namespace {

        struct Grammar {
            const TSLanguage* language = nullptr;
            std::vector<const char*> function_types;
            std::vector<const char*> class_types;
            std::vector<const char*> wrapper_types;    // hold one definition, e.g. decorators, export, template
            std::vector<const char*> container_types;  // searched for nested top-level definitions
            std::vector<const char*> comment_types;
            bool class_needs_body = false;             // skip forward declarations
            bool python_docstrings = false;
        };

        bool is_one_of(const char* type, const std::vector<const char*>& types) {
            for (const char* t : types) {
                if (std::strcmp(type, t) == 0) return true;
            }
            return false;
        }

        std::string node_text(TSNode node, const std::string& source) {
            uint32_t start = ts_node_start_byte(node);
            uint32_t end = ts_node_end_byte(node);
            if (start >= source.size() || end <= start) return "";
            return source.substr(start, std::min<std::size_t>(end, source.size()) - start);
        }

        TSNode field(TSNode node, const char* name) {
            return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
        }

        bool is_identifier(const char* type) {
            return std::strcmp(type, "identifier") == 0 || std::strcmp(type, "type_identifier") == 0 ||
                   std::strcmp(type, "field_identifier") == 0 || std::strcmp(type, "property_identifier") == 0 ||
                   std::strcmp(type, "qualified_identifier") == 0 || std::strcmp(type, "destructor_name") == 0 ||
                   std::strcmp(type, "operator_name") == 0;
        }

        std::string definition_name(TSNode node, const std::string& source) {
            TSNode name = field(node, "name");
            if (!ts_node_is_null(name)) return node_text(name, source);

            // C/C++ declarator chains: function_definition -> function_declarator -> identifier
            TSNode declarator = field(node, "declarator");
            for (int depth = 0; !ts_node_is_null(declarator) && depth < 8; ++depth) {
                if (is_identifier(ts_node_type(declarator))) return node_text(declarator, source);
                TSNode next = field(declarator, "declarator");
                if (ts_node_is_null(next)) break;
                declarator = next;
            }
            if (!ts_node_is_null(declarator)) {
                TSNode inner = field(declarator, "name");
                if (!ts_node_is_null(inner)) return node_text(inner, source);
            }

            // Rust impl blocks, Go type declarations
            TSNode type = field(node, "type");
            if (!ts_node_is_null(type)) return node_text(type, source);

            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                TSNode child_name = field(child, "name");
                if (!ts_node_is_null(child_name)) return node_text(child_name, source);
                if (is_identifier(ts_node_type(child))) return node_text(child, source);
            }
            return "";
        }

        int end_line_of(TSNode node) {
            TSPoint start = ts_node_start_point(node);
            TSPoint end = ts_node_end_point(node);
            if (end.column == 0 && end.row > start.row) return static_cast<int>(end.row);
            return static_cast<int>(end.row) + 1;
        }

        void attach_leading_comments(TSNode anchor, const Grammar& g, const std::string& source, Definition& def) {
            std::vector<TSNode> comments;
            int expected_row = static_cast<int>(ts_node_start_point(anchor).row) - 1;
            for (TSNode prev = ts_node_prev_named_sibling(anchor); !ts_node_is_null(prev);
                 prev = ts_node_prev_named_sibling(prev)) {
                if (!is_one_of(ts_node_type(prev), g.comment_types)) break;
                if (static_cast<int>(ts_node_end_point(prev).row) != expected_row) break;
                comments.push_back(prev);
                expected_row = static_cast<int>(ts_node_start_point(prev).row) - 1;
            }
            if (comments.empty()) return;

            std::reverse(comments.begin(), comments.end());
            std::string doc;
            for (TSNode c : comments) {
                if (!doc.empty()) doc += "\n";
                doc += node_text(c, source);
            }
            def.doc = doc;
            def.doc_start_line = static_cast<int>(ts_node_start_point(comments.front()).row) + 1;
        }

        void attach_docstring(TSNode def_node, const std::string& source, Definition& def) {
            TSNode body = field(def_node, "body");
            if (ts_node_is_null(body) || ts_node_named_child_count(body) == 0) return;
            TSNode first = ts_node_named_child(body, 0);
            if (std::strcmp(ts_node_type(first), "expression_statement") != 0) return;
            if (ts_node_named_child_count(first) == 0) return;
            TSNode str = ts_node_named_child(first, 0);
            if (std::strcmp(ts_node_type(str), "string") != 0) return;
            def.doc = node_text(str, source);
        }

        class Walker {
        public:
            Walker(const Grammar& g, const std::string& source) : m_grammar(g), m_source(source) {}

            std::vector<Definition> run(TSNode root) {
                walk(root);
                return std::move(m_defs);
            }

        private:
            const Grammar& m_grammar;
            const std::string& m_source;
            std::vector<Definition> m_defs;

            bool is_definition(TSNode node) const {
                const char* type = ts_node_type(node);
                if (is_one_of(type, m_grammar.function_types)) return true;
                if (is_one_of(type, m_grammar.class_types)) {
                    return !m_grammar.class_needs_body || !ts_node_is_null(field(node, "body"));
                }
                return false;
            }

            void emit(TSNode outer, TSNode def_node) {
                Definition def;
                def.type = is_one_of(ts_node_type(def_node), m_grammar.class_types) ? ChunkType::Class : ChunkType::Function;
                def.name = definition_name(def_node, m_source);
                def.start_line = static_cast<int>(ts_node_start_point(outer).row) + 1;
                def.end_line = std::max(def.start_line, end_line_of(outer));
                if (m_grammar.python_docstrings) attach_docstring(def_node, m_source, def);
                if (def.doc.empty()) attach_leading_comments(outer, m_grammar, m_source, def);
                m_defs.push_back(std::move(def));
            }

            void walk(TSNode node) {
                uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    TSNode child = ts_node_named_child(node, i);
                    const char* type = ts_node_type(child);

                    if (is_definition(child)) {
                        emit(child, child);
                    } else if (is_one_of(type, m_grammar.wrapper_types)) {
                        TSNode inner = find_wrapped(child);
                        if (!ts_node_is_null(inner)) emit(child, inner);
                    } else if (is_one_of(type, m_grammar.container_types)) {
                        walk(child);
                    }
                }
            }

            TSNode find_wrapped(TSNode wrapper) const {
                uint32_t count = ts_node_named_child_count(wrapper);
                for (uint32_t i = 0; i < count; ++i) {
                    TSNode child = ts_node_named_child(wrapper, i);
                    if (is_definition(child)) return child;
                    if (is_one_of(ts_node_type(child), m_grammar.wrapper_types)) {
                        TSNode nested = find_wrapped(child);
                        if (!ts_node_is_null(nested)) return nested;
                    }
                }
                return TSNode{};
            }
        };

        std::map<std::string, Grammar> builtin_grammars() {
            std::map<std::string, Grammar> grammars;
#ifdef REPOSCOPE_TS_PYTHON
            {
                Grammar g;
                g.language = tree_sitter_python();
                g.function_types = {"function_definition"};
                g.class_types = {"class_definition"};
                g.wrapper_types = {"decorated_definition"};
                g.comment_types = {"comment"};
                g.python_docstrings = true;
                grammars["python"] = g;
            }
#endif
#ifdef REPOSCOPE_TS_JAVASCRIPT
            {
                Grammar g;
                g.language = tree_sitter_javascript();
                g.function_types = {"function_declaration", "generator_function_declaration"};
                g.class_types = {"class_declaration"};
                g.wrapper_types = {"export_statement"};
                g.comment_types = {"comment"};
                grammars["javascript"] = g;
            }
#endif
#ifdef REPOSCOPE_TS_TYPESCRIPT
            {
                Grammar g;
                g.language = tree_sitter_typescript();
                g.function_types = {"function_declaration", "generator_function_declaration"};
                g.class_types = {"class_declaration", "abstract_class_declaration", "interface_declaration", "enum_declaration"};
                g.wrapper_types = {"export_statement"};
                g.container_types = {"internal_module", "module", "statement_block", "expression_statement"};
                g.comment_types = {"comment"};
                grammars["typescript"] = g;
            }
#endif
#ifdef REPOSCOPE_TS_JAVA
            {
                Grammar g;
                g.language = tree_sitter_java();
                g.function_types = {"method_declaration", "constructor_declaration"};
                g.class_types = {"class_declaration", "interface_declaration", "enum_declaration", "record_declaration"};
                g.comment_types = {"line_comment", "block_comment"};
                grammars["java"] = g;
            }
#endif
#ifdef REPOSCOPE_TS_CPP
            {
                Grammar g;
                g.language = tree_sitter_cpp();
                g.function_types = {"function_definition"};
                g.class_types = {"class_specifier", "struct_specifier", "union_specifier", "enum_specifier"};
                g.wrapper_types = {"template_declaration", "declaration", "type_definition"};
                g.container_types = {"namespace_definition", "declaration_list", "linkage_specification",
                                     "preproc_ifdef", "preproc_if", "preproc_else", "preproc_elif"};
                g.comment_types = {"comment"};
                g.class_needs_body = true;
                grammars["cpp"] = g;
                grammars["c"] = g;
            }
#endif
#ifdef REPOSCOPE_TS_GO
            {
                Grammar g;
                g.language = tree_sitter_go();
                g.function_types = {"function_declaration", "method_declaration"};
                g.class_types = {"type_declaration"};
                g.comment_types = {"comment"};
                grammars["go"] = g;
            }
#endif
#ifdef REPOSCOPE_TS_RUST
            {
                Grammar g;
                g.language = tree_sitter_rust();
                g.function_types = {"function_item"};
                g.class_types = {"struct_item", "enum_item", "trait_item", "impl_item", "union_item"};
                g.container_types = {"mod_item", "declaration_list"};
                g.comment_types = {"line_comment", "block_comment"};
                grammars["rust"] = g;
            }
#endif
            return grammars;
        }

    }

    struct ParserRegistry::Impl {
        std::map<std::string, Grammar> grammars = builtin_grammars();
    };

    std::optional<std::vector<Definition>> ParserRegistry::extract(const std::string& language, const std::string& source) const {
        auto it = m_impl->grammars.find(language);
        if (it == m_impl->grammars.end()) return std::nullopt;

        TSParser* parser = ts_parser_new();
        if (!ts_parser_set_language(parser, it->second.language)) {
            ts_parser_delete(parser);
            return std::nullopt;
        }

        TSTree* tree = ts_parser_parse_string(parser, nullptr, source.c_str(), static_cast<uint32_t>(source.size()));
        if (!tree) {
            ts_parser_delete(parser);
            return std::nullopt;
        }

        std::vector<Definition> defs = Walker(it->second, source).run(ts_tree_root_node(tree));

        ts_tree_delete(tree);
        ts_parser_delete(parser);
        return defs;
    }

#else

    struct ParserRegistry::Impl {
        std::map<std::string, int> grammars;
    };

    std::optional<std::vector<Definition>> ParserRegistry::extract(const std::string&, const std::string&) const {
        return std::nullopt;
    }

#endif

    ParserRegistry::ParserRegistry() : m_impl(std::make_unique<Impl>()) {}

    ParserRegistry::~ParserRegistry() = default;

    bool ParserRegistry::has(const std::string& language) const {
        return m_impl->grammars.count(language) > 0;
    }

    std::vector<std::string> ParserRegistry::languages() const {
        std::vector<std::string> out;
        for (const auto& entry : m_impl->grammars) out.push_back(entry.first);
        return out;
    }

}
