#ifndef CKSCAN_ANALYSIS_INHERITANCE_GRAPH_HPP
#define CKSCAN_ANALYSIS_INHERITANCE_GRAPH_HPP

/**
 * @file inheritance_graph.hpp
 * @brief Project-wide class hierarchy used for DIT and NOC.
 *
 * Built in two steps: extract_class_facts() runs per file (in parallel),
 * then InheritanceGraph::build() folds all facts on one thread. The graph is
 * never modified afterwards, so any number of threads may query it.
 *
 * Classes are keyed by their simple name. Two classes with the same name in
 * different files or packages are treated as one; for parents the last fact
 * wins.
 */

#include "ckscan/syntax/source_parser.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ckscan::analysis {

    namespace fs = std::filesystem;

    /**
     * One class declaration and the names it inherits from.
     */
    struct ClassFact {
        std::string class_name;
        std::vector<std::string> parents;
        fs::path file;
    };

    /**
     * Strips generic/template arguments and surrounding whitespace.
     *
     * "List<String>" -> "List", "Generic[T]" -> "Generic", " Base " -> "Base".
     */
    [[nodiscard]] std::string clean_type_name(std::string_view name);

    /**
     * True for builtin type names and keywords that never denote a
     * user-defined class (int, string, bool, void, null, self, this, ...).
     */
    [[nodiscard]] bool is_primitive_type(std::string_view name) noexcept;

    /**
     * Returns the cleaned parent names declared on a class node.
     *
     * Primitives and empty names are dropped; order of appearance is kept.
     */
    [[nodiscard]] std::vector<std::string> extract_parent_names(syntax::Node class_node, Language language);

    /**
     * Returns one fact per named class-like node in the file, nested
     * declarations included. Non-OO languages yield no facts.
     */
    [[nodiscard]] std::vector<ClassFact> extract_class_facts(const syntax::ParsedFile& file);

    class InheritanceGraph {
    public:
        InheritanceGraph() = default;

        /**
         * Folds facts into a graph.
         *
         * parents_of is last-write-wins per class name. children_of lists
         * each child once per parent, in first-seen order, even if the same
         * edge is declared in several files.
         */
        [[nodiscard]] static InheritanceGraph build(const std::vector<ClassFact>& facts);

        /**
         * Depth of inheritance: 0 for a root, otherwise 1 + the deepest parent.
         *
         * A parent already on the current path ends that branch, so cyclic
         * input terminates. A class with no branch leading out of its cycle
         * counts as a root: members of a cycle get 0, and a class extending
         * a cycle member gets 1. Parents that were never declared count as
         * roots.
         */
        [[nodiscard]] int dit(std::string_view class_name) const;

        /**
         * Number of direct children.
         */
        [[nodiscard]] int noc(std::string_view class_name) const;

        [[nodiscard]] const std::vector<std::string>& parents_of(std::string_view class_name) const;
        [[nodiscard]] const std::vector<std::string>& children_of(std::string_view class_name) const;

        /// True if the class was declared in any file.
        [[nodiscard]] bool contains(std::string_view class_name) const;

        /// Number of declared classes.
        [[nodiscard]] std::size_t size() const noexcept { return parents_.size(); }

    private:
        using AdjacencyMap = std::unordered_map<std::string, std::vector<std::string>>;

        struct DepthQuery {
            std::vector<std::string> path;
            std::unordered_map<std::string, int> finished;  // cycle-free results
        };

        struct Depth {
            int value = 0;
            bool valid = true;
            std::size_t cycle_head = 0;  // lowest path index a cycle ran into
            bool touched_cycle = false;
        };

        Depth depth(const std::string& class_name, DepthQuery& query) const;

        AdjacencyMap parents_;
        AdjacencyMap children_;
    };

}  // namespace ckscan::analysis

#endif //CKSCAN_ANALYSIS_INHERITANCE_GRAPH_HPP
