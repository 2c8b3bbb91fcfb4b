#include "ckscan/analysis/inheritance_graph.hpp"
#include "ckscan/languages/capabilities.hpp"
#include "ckscan/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <unordered_set>

namespace ckscan::analysis {

    namespace {

        constexpr std::array<std::string_view, 39> kPrimitiveTypes = {
            "int", "int8", "int16", "int32", "int64",
            "uint", "uint8", "uint16", "uint32", "uint64",
            "float", "float32", "float64", "double",
            "bool", "boolean", "Boolean",
            "string", "String", "str",
            "void", "None", "null", "nil",
            "byte", "char", "short", "long",
            "any", "object", "Object",
            "number", "Number",
            "true", "false",
            "self", "this", "super",
            "",
        };

        const std::vector<std::string> kNoNames;

        /**
         * Heritage nodes of a class: children selected by field name or type,
         * each node at most once.
         */
        std::vector<syntax::Node> heritage_nodes(const syntax::Node class_node,
                                                 const languages::HeritageRule& rule) {
            std::vector<syntax::Node> nodes;
            for (std::size_t i = 0; i < class_node.child_count(); ++i) {
                const auto child = class_node.child(i);
                const bool by_field = !child.field_name().empty() &&
                                      languages::contains(rule.fields, child.field_name());
                const bool by_type = languages::contains(rule.child_types, child.type());
                if ((by_field || by_type) && std::ranges::find(nodes, child) == nodes.end()) {
                    nodes.push_back(child);
                }
            }
            return nodes;
        }

    }  // namespace

    std::string clean_type_name(const std::string_view name) {
        std::string_view result = name;
        if (const auto cut = result.find_first_of("<["); cut != std::string_view::npos) {
            result = result.substr(0, cut);
        }
        return std::string(string_utils::trim(result));
    }

    bool is_primitive_type(const std::string_view name) noexcept {
        return std::ranges::find(kPrimitiveTypes, name) != kPrimitiveTypes.end();
    }

    std::vector<std::string> extract_parent_names(const syntax::Node class_node, const Language language) {
        const auto& caps = languages::capabilities_for(language);
        std::vector<std::string> parents;
        if (!caps.object_oriented || class_node.is_null()) {
            return parents;
        }

        for (const auto heritage : heritage_nodes(class_node, caps.heritage)) {
            syntax::walk(heritage, [&](const syntax::Node node) {
                if (node == heritage) {
                    return true;
                }
                if (languages::contains(caps.heritage.skip_types, node.type())) {
                    return false;
                }
                if (node.is_named() && languages::contains(caps.heritage.name_types, node.type())) {
                    auto name = clean_type_name(node.text());
                    if (!is_primitive_type(name)) {
                        parents.push_back(std::move(name));
                    }
                    return false;
                }
                return true;
            });
        }

        return parents;
    }

    std::vector<ClassFact> extract_class_facts(const syntax::ParsedFile& file) {
        std::vector<ClassFact> facts;
        const auto& caps = languages::capabilities_for(file.language);
        if (!caps.object_oriented) {
            return facts;
        }

        syntax::walk(file.root(), [&](const syntax::Node node) {
            if (!languages::is_class_node(node, caps)) {
                return true;
            }

            const auto name = node.child_by_field_name("name").text();
            if (!name.empty()) {
                facts.push_back(ClassFact{
                    std::string(name),
                    extract_parent_names(node, file.language),
                    file.path
                });
            }
            return true;
        });

        return facts;
    }

    InheritanceGraph InheritanceGraph::build(const std::vector<ClassFact>& facts) {
        InheritanceGraph graph;
        std::unordered_map<std::string, std::unordered_set<std::string>> seen_children;

        for (const auto& fact : facts) {
            graph.parents_[fact.class_name] = fact.parents;

            for (const auto& parent : fact.parents) {
                if (seen_children[parent].insert(fact.class_name).second) {
                    graph.children_[parent].push_back(fact.class_name);
                }
            }
        }

        return graph;
    }

    int InheritanceGraph::dit(const std::string_view class_name) const {
        DepthQuery query;
        const auto result = depth(std::string(class_name), query);
        return result.valid ? result.value : 0;
    }

    // An invalid Depth means every branch ran back into the path; cycle_head
    // names the path entry where that cycle closes. The class at that entry
    // sits on the cycle and becomes a root for whatever extends it.
    InheritanceGraph::Depth InheritanceGraph::depth(const std::string& class_name, DepthQuery& query) const {
        if (const auto on_path = std::ranges::find(query.path, class_name); on_path != query.path.end()) {
            return {0, false, static_cast<std::size_t>(on_path - query.path.begin()), true};
        }
        if (const auto done = query.finished.find(class_name); done != query.finished.end()) {
            return {done->second};
        }

        const auto it = parents_.find(class_name);
        if (it == parents_.end() || it->second.empty()) {
            return {0};
        }

        const std::size_t index = query.path.size();
        query.path.push_back(class_name);

        std::optional<int> deepest;
        std::optional<std::size_t> head;
        bool touched_cycle = false;
        for (const auto& parent : it->second) {
            const auto branch = depth(parent, query);
            touched_cycle = touched_cycle || branch.touched_cycle;
            if (branch.valid) {
                deepest = std::max(deepest.value_or(0), branch.value);
            } else {
                head = std::min(head.value_or(branch.cycle_head), branch.cycle_head);
            }
        }
        query.path.pop_back();

        if (deepest) {
            if (!touched_cycle) {
                query.finished.emplace(class_name, *deepest + 1);
            }
            return {*deepest + 1, true, 0, touched_cycle};
        }
        if (*head < index) {
            return {0, false, *head, true};
        }
        return {0, true, 0, true};
    }

    int InheritanceGraph::noc(const std::string_view class_name) const {
        return static_cast<int>(children_of(class_name).size());
    }

    const std::vector<std::string>& InheritanceGraph::parents_of(const std::string_view class_name) const {
        const auto it = parents_.find(std::string(class_name));
        return it == parents_.end() ? kNoNames : it->second;
    }

    const std::vector<std::string>& InheritanceGraph::children_of(const std::string_view class_name) const {
        const auto it = children_.find(std::string(class_name));
        return it == children_.end() ? kNoNames : it->second;
    }

    bool InheritanceGraph::contains(const std::string_view class_name) const {
        return parents_.contains(std::string(class_name));
    }

}  // namespace ckscan::analysis
