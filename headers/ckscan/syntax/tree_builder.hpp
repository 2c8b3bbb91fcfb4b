#ifndef CKSCAN_SYNTAX_TREE_BUILDER_HPP
#define CKSCAN_SYNTAX_TREE_BUILDER_HPP

/**
 * @file tree_builder.hpp
 * @brief Incremental construction of a syntax::Tree.
 *
 * Nodes are added in pre-order with balanced open()/close() calls. The end
 * of a node's span is only known once its last child has been emitted, so
 * it is supplied to close().
 *
 * @code
 *     TreeBuilder builder(source);
 *     builder.open("program", "", true, 0, {0, 0});
 *     builder.open("identifier", "name", true, 0, {0, 0});
 *     builder.close(3, {0, 3});
 *     builder.close(3, {0, 3});
 *     auto tree = builder.finish();
 * @endcode
 */

#include "ckscan/result.hpp"
#include "ckscan/error.hpp"
#include "ckscan/syntax/tree.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ckscan::syntax {

    class TreeBuilder {
    public:
        explicit TreeBuilder(std::string source);

        /**
         * Starts a node as a child of the currently open node.
         *
         * The first node opened becomes the root. Opening a second root after
         * the first one was closed is reported by finish().
         */
        void open(std::string_view type, std::string_view field, bool named,
                  std::uint32_t start_byte, Point start_point);

        /**
         * Ends the most recently opened node.
         */
        void close(std::uint32_t end_byte, Point end_point);

        /**
         * Number of nodes that are open and not yet closed.
         */
        [[nodiscard]] std::size_t depth() const noexcept { return open_.size(); }

        /**
         * Returns the finished tree.
         *
         * Fails with InvalidArgument if no node was added, a node is still
         * open, a close() had no matching open(), or more than one root was
         * opened. The builder is left empty afterwards.
         */
        [[nodiscard]] Result<std::shared_ptr<const Tree>, Error> finish();

    private:
        std::shared_ptr<Tree> tree_;
        std::vector<std::uint32_t> open_;
        bool unbalanced_ = false;
        bool multiple_roots_ = false;
    };

}  // namespace ckscan::syntax

#endif //CKSCAN_SYNTAX_TREE_BUILDER_HPP
