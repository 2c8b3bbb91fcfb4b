#include "ckscan/syntax/tree.hpp"

#include <algorithm>

namespace ckscan::syntax {

    std::string_view Node::type() const noexcept {
        if (!tree_) {
            return {};
        }
        return tree_->nodes_[index_].type;
    }

    bool Node::is_named() const noexcept {
        return tree_ && tree_->nodes_[index_].named;
    }

    std::string_view Node::field_name() const noexcept {
        if (!tree_) {
            return {};
        }
        return tree_->nodes_[index_].field;
    }

    std::size_t Node::child_count() const noexcept {
        if (!tree_) {
            return 0;
        }
        return tree_->nodes_[index_].children.size();
    }

    Node Node::child(const std::size_t i) const noexcept {
        if (!tree_) {
            return {};
        }
        const auto& children = tree_->nodes_[index_].children;
        if (i >= children.size()) {
            return {};
        }
        return {tree_, children[i]};
    }

    Node Node::child_by_field_name(const std::string_view field) const noexcept {
        if (!tree_) {
            return {};
        }
        for (const auto child_index : tree_->nodes_[index_].children) {
            if (tree_->nodes_[child_index].field == field) {
                return {tree_, child_index};
            }
        }
        return {};
    }

    std::vector<Node> Node::children_by_field_name(const std::string_view field) const {
        std::vector<Node> result;
        if (!tree_) {
            return result;
        }
        for (const auto child_index : tree_->nodes_[index_].children) {
            if (tree_->nodes_[child_index].field == field) {
                result.emplace_back(tree_, child_index);
            }
        }
        return result;
    }

    Node Node::parent() const noexcept {
        if (!tree_) {
            return {};
        }
        const auto parent_index = tree_->nodes_[index_].parent;
        if (parent_index == Tree::no_parent) {
            return {};
        }
        return {tree_, parent_index};
    }

    std::uint32_t Node::start_byte() const noexcept {
        return tree_ ? tree_->nodes_[index_].start_byte : 0;
    }

    std::uint32_t Node::end_byte() const noexcept {
        return tree_ ? tree_->nodes_[index_].end_byte : 0;
    }

    Point Node::start_point() const noexcept {
        return tree_ ? tree_->nodes_[index_].start_point : Point{};
    }

    Point Node::end_point() const noexcept {
        return tree_ ? tree_->nodes_[index_].end_point : Point{};
    }

    std::string_view Node::text() const noexcept {
        if (!tree_) {
            return {};
        }
        const auto& data = tree_->nodes_[index_];
        const std::string_view source = tree_->source_;
        if (data.start_byte >= source.size() || data.end_byte <= data.start_byte) {
            return {};
        }
        const auto end = std::min<std::size_t>(data.end_byte, source.size());
        return source.substr(data.start_byte, end - data.start_byte);
    }

    void walk(const Node node, const std::function<bool(Node)>& visitor) {
        if (node.is_null()) {
            return;
        }

        std::vector<Node> stack;
        stack.push_back(node);

        while (!stack.empty()) {
            const Node current = stack.back();
            stack.pop_back();

            if (!visitor(current)) {
                continue;
            }

            // Push in reverse so children are visited in source order.
            for (std::size_t i = current.child_count(); i > 0; --i) {
                stack.push_back(current.child(i - 1));
            }
        }
    }

}  // namespace ckscan::syntax
