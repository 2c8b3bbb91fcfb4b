#include "ckscan/syntax/tree_sitter_parser.hpp"
#include "ckscan/syntax/tree_builder.hpp"
#include "ckscan/utils/file_utils.hpp"

#include <tree_sitter/api.h>
#include <spdlog/spdlog.h>

#include <limits>
#include <memory>

extern "C" {
    const TSLanguage* tree_sitter_java(void);
    const TSLanguage* tree_sitter_c_sharp(void);
    const TSLanguage* tree_sitter_cpp(void);
    const TSLanguage* tree_sitter_python(void);
    const TSLanguage* tree_sitter_javascript(void);
    const TSLanguage* tree_sitter_typescript(void);
    const TSLanguage* tree_sitter_tsx(void);
    const TSLanguage* tree_sitter_ruby(void);
    const TSLanguage* tree_sitter_php(void);
}

namespace ckscan::syntax {

    namespace {

        const TSLanguage* grammar_for(const Language language) noexcept {
            switch (language) {
                case Language::Java:       return tree_sitter_java();
                case Language::CSharp:     return tree_sitter_c_sharp();
                case Language::Cpp:        return tree_sitter_cpp();
                case Language::Python:     return tree_sitter_python();
                case Language::JavaScript: return tree_sitter_javascript();
                case Language::TypeScript: return tree_sitter_typescript();
                case Language::Tsx:        return tree_sitter_tsx();
                case Language::Ruby:       return tree_sitter_ruby();
                case Language::Php:        return tree_sitter_php();
                default:                   return nullptr;
            }
        }

        struct ParserDeleter {
            void operator()(TSParser* p) const noexcept { ts_parser_delete(p); }
        };

        struct TreeDeleter {
            void operator()(TSTree* t) const noexcept { ts_tree_delete(t); }
        };

        class CursorGuard {
        public:
            explicit CursorGuard(const TSNode root) : cursor_(ts_tree_cursor_new(root)) {}
            ~CursorGuard() { ts_tree_cursor_delete(&cursor_); }

            CursorGuard(const CursorGuard&) = delete;
            CursorGuard& operator=(const CursorGuard&) = delete;

            TSTreeCursor* get() noexcept { return &cursor_; }

        private:
            TSTreeCursor cursor_;
        };

        Point to_point(const TSPoint p) noexcept {
            return {p.row, p.column};
        }

        /**
         * Copies a tree-sitter tree into a syntax::Tree, iteratively.
         */
        Result<std::shared_ptr<const Tree>, Error> convert(const TSTree* ts_tree, std::string source) {
            TreeBuilder builder(std::move(source));
            CursorGuard guard(ts_tree_root_node(ts_tree));
            TSTreeCursor* cursor = guard.get();

            auto open_current = [&]() {
                const TSNode node = ts_tree_cursor_current_node(cursor);
                const char* field = ts_tree_cursor_current_field_name(cursor);
                builder.open(ts_node_type(node), field ? field : "", ts_node_is_named(node),
                             ts_node_start_byte(node), to_point(ts_node_start_point(node)));
            };

            auto close_current = [&]() {
                const TSNode node = ts_tree_cursor_current_node(cursor);
                builder.close(ts_node_end_byte(node), to_point(ts_node_end_point(node)));
            };

            open_current();
            while (true) {
                if (ts_tree_cursor_goto_first_child(cursor)) {
                    open_current();
                    continue;
                }

                close_current();

                bool finished = false;
                while (!ts_tree_cursor_goto_next_sibling(cursor)) {
                    if (!ts_tree_cursor_goto_parent(cursor)) {
                        finished = true;
                        break;
                    }
                    close_current();
                }
                if (finished) {
                    break;
                }
                open_current();
            }

            return builder.finish();
        }

    }  // namespace

    bool TreeSitterParser::supports(const Language language) const noexcept {
        return grammar_for(language) != nullptr;
    }

    Result<ParsedFile, Error> TreeSitterParser::parse_file(const fs::path& path) const {
        const Language language = detect_language(path);
        if (!supports(language)) {
            return Result<ParsedFile, Error>::failure(Error::unsupported_language(
                "No grammar for language '" + std::string(to_string(language)) + "'", path.string()
            ));
        }

        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<ParsedFile, Error>::failure(content.error());
        }

        return parse_source(path, language, std::move(content).value());
    }

    Result<ParsedFile, Error> TreeSitterParser::parse_source(
        const fs::path& path,
        const Language language,
        std::string source
    ) const {
        const TSLanguage* grammar = grammar_for(language);
        if (grammar == nullptr) {
            return Result<ParsedFile, Error>::failure(Error::unsupported_language(
                "No grammar for language '" + std::string(to_string(language)) + "'", path.string()
            ));
        }

        if (source.size() > std::numeric_limits<std::uint32_t>::max()) {
            return Result<ParsedFile, Error>::failure(
                Error::limit_exceeded("Source exceeds 4 GiB", path.string())
            );
        }

        // TSParser is not thread-safe; one per call keeps the parser shareable.
        const std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
        if (!parser || !ts_parser_set_language(parser.get(), grammar)) {
            return Result<ParsedFile, Error>::failure(
                Error::internal_error("Incompatible tree-sitter grammar version", path.string())
            );
        }

        const std::unique_ptr<TSTree, TreeDeleter> ts_tree(ts_parser_parse_string(
            parser.get(), nullptr, source.data(), static_cast<std::uint32_t>(source.size())
        ));
        if (!ts_tree) {
            return Result<ParsedFile, Error>::failure(
                Error::parse_error("Parser returned no tree", path.string())
            );
        }

        if (ts_node_has_error(ts_tree_root_node(ts_tree.get()))) {
            spdlog::debug("{}: syntax errors present, continuing with partial tree", path.string());
        }

        auto tree = convert(ts_tree.get(), std::move(source));
        if (tree.is_err()) {
            return Result<ParsedFile, Error>::failure(
                Error::parse_error(tree.error().message(), path.string())
            );
        }

        return Result<ParsedFile, Error>::success(ParsedFile{path, language, std::move(tree).value()});
    }

}  // namespace ckscan::syntax
