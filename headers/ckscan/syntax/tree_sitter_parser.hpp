#ifndef CKSCAN_SYNTAX_TREE_SITTER_PARSER_HPP
#define CKSCAN_SYNTAX_TREE_SITTER_PARSER_HPP

/**
 * @file tree_sitter_parser.hpp
 * @brief ISourceParser backed by tree-sitter grammars.
 *
 * Grammars linked in: Java, C#, C++, Python, JavaScript, TypeScript, TSX,
 * Ruby and PHP. The tree-sitter tree is converted into a syntax::Tree
 * (named and anonymous nodes, field names) so that nothing outside this
 * target sees tree-sitter types.
 */

#include "ckscan/syntax/source_parser.hpp"

namespace ckscan::syntax {

    class TreeSitterParser final : public ISourceParser {
    public:
        TreeSitterParser() = default;

        [[nodiscard]] Result<ParsedFile, Error> parse_file(const fs::path& path) const override;

        /**
         * Parses source text that did not come from disk.
         */
        [[nodiscard]] Result<ParsedFile, Error> parse_source(
            const fs::path& path,
            Language language,
            std::string source
        ) const;

        [[nodiscard]] bool supports(Language language) const noexcept override;
    };

}  // namespace ckscan::syntax

#endif //CKSCAN_SYNTAX_TREE_SITTER_PARSER_HPP
