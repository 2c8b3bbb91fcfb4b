#ifndef CKSCAN_SYNTAX_TREE_HPP
#define CKSCAN_SYNTAX_TREE_HPP

/**
 * @file tree.hpp
 * @brief Immutable concrete syntax tree shared by all front ends.
 *
 * A Tree owns the source bytes of one file and a flat arena of nodes. The
 * shape mirrors tree-sitter's concrete syntax trees: every node has a
 * grammar type, a named/anonymous flag, an optional field name under its
 * parent, a byte span and a start/end point. Node is a small value handle
 * into the arena; it stays valid for as long as the owning Tree lives.
 *
 * Trees are read-only after construction and may be traversed from any
 * number of threads at once.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ckscan::syntax {

    /**
     * Zero-based row/column position in the source.
     */
    struct Point {
        std::uint32_t row = 0;
        std::uint32_t column = 0;

        bool operator==(const Point&) const = default;
    };

    class Tree;

    /**
     * Lightweight handle to a node of a Tree.
     *
     * A default-constructed Node is null; accessors on a null node return
     * empty values rather than failing, so lookups like
     * `node.child_by_field_name("name").text()` can be chained safely.
     */
    class Node {
    public:
        Node() = default;
        Node(const Tree* tree, std::uint32_t index) noexcept
            : tree_(tree), index_(index) {}

        [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }
        explicit operator bool() const noexcept { return tree_ != nullptr; }

        [[nodiscard]] std::string_view type() const noexcept;
        [[nodiscard]] bool is_named() const noexcept;

        /// Field name under the parent ("name", "body", ...), empty if none.
        [[nodiscard]] std::string_view field_name() const noexcept;

        [[nodiscard]] std::size_t child_count() const noexcept;
        [[nodiscard]] Node child(std::size_t i) const noexcept;

        /// First child carrying the given field name, or a null node.
        [[nodiscard]] Node child_by_field_name(std::string_view field) const noexcept;

        /// All children carrying the given field name, in source order.
        [[nodiscard]] std::vector<Node> children_by_field_name(std::string_view field) const;

        [[nodiscard]] Node parent() const noexcept;

        [[nodiscard]] std::uint32_t start_byte() const noexcept;
        [[nodiscard]] std::uint32_t end_byte() const noexcept;
        [[nodiscard]] Point start_point() const noexcept;
        [[nodiscard]] Point end_point() const noexcept;

        /// Source text covered by this node.
        [[nodiscard]] std::string_view text() const noexcept;

        bool operator==(const Node& other) const noexcept {
            return tree_ == other.tree_ && index_ == other.index_;
        }

    private:
        const Tree* tree_ = nullptr;
        std::uint32_t index_ = 0;
    };

    /**
     * Node arena plus the source it was parsed from.
     *
     * Built through TreeBuilder; the root is always node 0.
     */
    class Tree {
    public:
        Tree(const Tree&) = delete;
        Tree& operator=(const Tree&) = delete;

        [[nodiscard]] Node root() const noexcept {
            return nodes_.empty() ? Node{} : Node{this, 0};
        }

        [[nodiscard]] const std::string& source() const noexcept { return source_; }
        [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }

    private:
        friend class Node;
        friend class TreeBuilder;

        static constexpr std::uint32_t no_parent = UINT32_MAX;

        struct NodeData {
            std::string type;
            std::string field;
            bool named = true;
            std::uint32_t parent = no_parent;
            std::uint32_t start_byte = 0;
            std::uint32_t end_byte = 0;
            Point start_point;
            Point end_point;
            std::vector<std::uint32_t> children;
        };

        explicit Tree(std::string source) : source_(std::move(source)) {}

        std::string source_;
        std::vector<NodeData> nodes_;
    };

    /**
     * Pre-order traversal starting at (and including) node.
     *
     * The visitor returns false to skip the children of the node it was
     * given; traversal continues with that node's next sibling.
     * Implemented iteratively, so deeply nested sources cannot overflow
     * the call stack.
     */
    void walk(Node node, const std::function<bool(Node)>& visitor);

}  // namespace ckscan::syntax

#endif //CKSCAN_SYNTAX_TREE_HPP
