#ifndef CKSCAN_SYNTAX_SOURCE_PARSER_HPP
#define CKSCAN_SYNTAX_SOURCE_PARSER_HPP

/**
 * @file source_parser.hpp
 * @brief Parser front-end interface.
 *
 * The analysis code depends only on ISourceParser; the tree-sitter backend
 * lives in a separate target so that the engine can be built and tested
 * against any front end that produces syntax::Tree values.
 */

#include "ckscan/result.hpp"
#include "ckscan/error.hpp"
#include "ckscan/syntax/language.hpp"
#include "ckscan/syntax/tree.hpp"

#include <filesystem>
#include <memory>

namespace ckscan::syntax {

    namespace fs = std::filesystem;

    /**
     * One parsed source file.
     */
    struct ParsedFile {
        fs::path path;
        Language language = Language::Unknown;
        std::shared_ptr<const Tree> tree;

        [[nodiscard]] Node root() const noexcept {
            return tree ? tree->root() : Node{};
        }
    };

    /**
     * Turns a source file into a syntax tree.
     *
     * Implementations must be safe to call from several threads at once;
     * the analyzer shares one parser across its worker pool.
     */
    class ISourceParser {
    public:
        virtual ~ISourceParser() = default;

        /**
         * Parses a file.
         *
         * @param path File to parse. The language is detected from its extension.
         * @return The parsed file, or NotFound/IoError when the file cannot be
         *         read, UnsupportedLanguage when no grammar is available and
         *         ParseError when the parser produced no tree.
         */
        [[nodiscard]] virtual Result<ParsedFile, Error> parse_file(const fs::path& path) const = 0;

        /**
         * Returns true if parse_file() can handle this language.
         */
        [[nodiscard]] virtual bool supports(Language language) const noexcept = 0;
    };

}  // namespace ckscan::syntax

#endif //CKSCAN_SYNTAX_SOURCE_PARSER_HPP
