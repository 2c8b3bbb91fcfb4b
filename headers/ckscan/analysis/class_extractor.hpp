#ifndef CKSCAN_ANALYSIS_CLASS_EXTRACTOR_HPP
#define CKSCAN_ANALYSIS_CLASS_EXTRACTOR_HPP

/**
 * @file class_extractor.hpp
 * @brief Per-class metric extraction from a syntax tree.
 *
 * Everything here is purely syntactic. Called names and referenced types
 * are collected by node shape, without resolving symbols, so CBO and RFC
 * are upper bounds: a local variable's type counts as coupling and a call
 * to an unrelated method with the same name counts as a response.
 *
 * Language differences come exclusively from languages::capabilities_for().
 */

#include "ckscan/analysis/inheritance_graph.hpp"
#include "ckscan/analysis/lcom.hpp"
#include "ckscan/languages/capabilities.hpp"
#include "ckscan/syntax/source_parser.hpp"
#include "ckscan/types.hpp"

#include <string>
#include <vector>

namespace ckscan::analysis {

    /**
     * A class found by the top-level scan.
     */
    struct ClassNode {
        std::string name;
        /// 1-based, inclusive.
        std::size_t start_line = 0;
        std::size_t end_line = 0;
        syntax::Node node;
    };

    /**
     * Finds the named classes of a file.
     *
     * The scan does not descend into a class it has matched, so nested and
     * inner classes are part of their enclosing class. Nameless class nodes
     * are skipped (their bodies are still scanned).
     */
    [[nodiscard]] std::vector<ClassNode> find_classes(const syntax::ParsedFile& file);

    /**
     * Cyclomatic complexity of a subtree: 1 + number of decision points.
     *
     * Statement and keyword kinds (if, for, while, switch, case, catch,
     * except, ternary) are matched on named nodes; the short-circuit
     * operators &&, ||, and, or are matched on operator tokens.
     */
    [[nodiscard]] int cyclomatic_complexity(syntax::Node node);

    [[nodiscard]] bool is_method_node(syntax::Node node, const languages::LanguageCapabilities& caps);
    [[nodiscard]] bool is_field_node(syntax::Node node, const languages::LanguageCapabilities& caps);

    /**
     * Name of a declaration: its `name` or `property` field, otherwise the
     * innermost identifier of its declarator chain.
     */
    [[nodiscard]] std::string declared_name(syntax::Node node);

    /**
     * Methods of a class, in source order.
     *
     * Traversal stops at a matched method, so local functions and lambdas
     * inside a method belong to that method.
     */
    [[nodiscard]] std::vector<MethodFacts> extract_methods(syntax::Node class_node, Language language);

    /**
     * Field names of a class, one entry per declaration or occurrence.
     */
    [[nodiscard]] std::vector<std::string> extract_fields(syntax::Node class_node, Language language);

    /**
     * Fields of the own instance referenced inside a method body.
     */
    [[nodiscard]] std::set<std::string> extract_used_fields(syntax::Node method_node, Language language);

    /**
     * Distinct callee texts of all call-like nodes below the class, sorted.
     */
    [[nodiscard]] std::vector<std::string> extract_called_methods(syntax::Node class_node);

    /**
     * Distinct type-like identifiers below the class, sorted.
     *
     * Primitive type names and single-character names are dropped.
     */
    [[nodiscard]] std::vector<std::string> extract_coupled_classes(syntax::Node class_node);

    /**
     * Computes all metrics of one class. DIT and NOC come from the graph.
     */
    [[nodiscard]] ClassMetrics extract_class_metrics(
        const ClassNode& cls,
        const syntax::ParsedFile& file,
        const InheritanceGraph& graph
    );

    /**
     * Runs find_classes() and extract_class_metrics() over a whole file.
     */
    [[nodiscard]] std::vector<ClassMetrics> analyze_file(
        const syntax::ParsedFile& file,
        const InheritanceGraph& graph
    );

}  // namespace ckscan::analysis

#endif //CKSCAN_ANALYSIS_CLASS_EXTRACTOR_HPP
