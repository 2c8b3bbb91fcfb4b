#include "ckscan/syntax/tree_builder.hpp"

namespace ckscan::syntax {

    TreeBuilder::TreeBuilder(std::string source)
        : tree_(new Tree(std::move(source))) {}

    void TreeBuilder::open(const std::string_view type, const std::string_view field, const bool named,
                           const std::uint32_t start_byte, const Point start_point) {
        if (!tree_) {
            unbalanced_ = true;
            return;
        }

        auto& nodes = tree_->nodes_;
        if (open_.empty() && !nodes.empty()) {
            multiple_roots_ = true;
            return;
        }

        const auto index = static_cast<std::uint32_t>(nodes.size());

        Tree::NodeData data;
        data.type = std::string(type);
        data.field = std::string(field);
        data.named = named;
        data.start_byte = start_byte;
        data.end_byte = start_byte;
        data.start_point = start_point;
        data.end_point = start_point;

        if (!open_.empty()) {
            data.parent = open_.back();
            nodes[open_.back()].children.push_back(index);
        }

        nodes.push_back(std::move(data));
        open_.push_back(index);
    }

    void TreeBuilder::close(const std::uint32_t end_byte, const Point end_point) {
        if (!tree_ || open_.empty()) {
            unbalanced_ = true;
            return;
        }

        auto& data = tree_->nodes_[open_.back()];
        data.end_byte = end_byte;
        data.end_point = end_point;
        open_.pop_back();
    }

    Result<std::shared_ptr<const Tree>, Error> TreeBuilder::finish() {
        using R = Result<std::shared_ptr<const Tree>, Error>;

        if (!tree_) {
            return R::failure(Error::invalid_argument("Tree already finished"));
        }
        if (tree_->nodes_.empty()) {
            return R::failure(Error::invalid_argument("Tree has no root node"));
        }
        if (unbalanced_ || !open_.empty()) {
            return R::failure(Error::invalid_argument("Unbalanced open/close sequence"));
        }
        if (multiple_roots_) {
            return R::failure(Error::invalid_argument("Tree has more than one root node"));
        }

        std::shared_ptr<const Tree> tree = std::move(tree_);
        tree_.reset();
        open_.clear();
        return R::success(std::move(tree));
    }

}  // namespace ckscan::syntax
