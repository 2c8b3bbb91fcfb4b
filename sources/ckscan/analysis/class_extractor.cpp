#include "ckscan/analysis/class_extractor.hpp"
#include "ckscan/utils/string_utils.hpp"

#include <array>
#include <numeric>
#include <set>

namespace ckscan::analysis {

    namespace {

        using languages::contains;
        using languages::FieldNameRule;
        using languages::LanguageCapabilities;

        // Statement and keyword kinds, matched on named nodes only. Several
        // grammars also emit an anonymous keyword token with the same
        // spelling ("if", "for", ...) inside the statement, which must not
        // count a second time.
        constexpr std::array<std::string_view, 17> kDecisionNodeTypes = {
            "if_statement", "if_expression", "if",
            "for_statement", "for_expression", "for",
            "while_statement", "while_expression", "while",
            "switch_statement", "match_expression",
            "case_clause", "case_statement",
            "catch_clause", "except_clause",
            "conditional_expression", "ternary_expression",
        };

        // Short-circuit operators, matched on anonymous tokens only.
        constexpr std::array<std::string_view, 4> kDecisionOperators = {
            "&&", "||", "and", "or",
        };

        constexpr std::array<std::string_view, 7> kCallNodeTypes = {
            "call_expression", "call", "method_invocation", "invocation_expression",
            "function_call_expression", "member_call_expression", "method_call",
        };

        constexpr std::array<std::string_view, 3> kCalleeFields = {"function", "name", "method"};

        constexpr std::array<std::string_view, 6> kTypeNodeTypes = {
            "type_identifier", "class_type", "simple_type",
            "named_type", "type_name", "identifier",
        };

        // Leaves that end a declarator chain.
        constexpr std::array<std::string_view, 10> kIdentifierTypes = {
            "identifier", "field_identifier", "property_identifier",
            "private_property_identifier", "type_identifier", "destructor_name",
            "operator_name", "name", "constant", "variable_name",
        };

        template<std::size_t N>
        bool one_of(const std::array<std::string_view, N>& set, const std::string_view value) noexcept {
            return std::ranges::find(set, value) != set.end();
        }

        syntax::Node first_named_child(const syntax::Node node) {
            for (std::size_t i = 0; i < node.child_count(); ++i) {
                if (const auto child = node.child(i); child.is_named()) {
                    return child;
                }
            }
            return {};
        }

        /**
         * Follows name/declarator links down to the declared identifier.
         */
        std::string declarator_name(syntax::Node node) {
            while (node) {
                if (one_of(kIdentifierTypes, node.type())) {
                    return std::string(node.text());
                }
                if (const auto name = node.child_by_field_name("name")) {
                    node = name;
                    continue;
                }
                if (const auto inner = node.child_by_field_name("declarator")) {
                    node = inner;
                    continue;
                }
                const auto next = first_named_child(node);
                if (!next) {
                    return std::string(node.text());
                }
                node = next;
            }
            return {};
        }

        syntax::Node last_named_child(const syntax::Node node) {
            for (std::size_t i = node.child_count(); i > 0; --i) {
                if (const auto child = node.child(i - 1); child.is_named()) {
                    return child;
                }
            }
            return {};
        }

        /**
         * True when the declaration declares a member function.
         *
         * Pointer and reference declarators around the function declarator
         * belong to the return type. A parenthesized declarator inside it,
         * as in `void (*callback)(int);`, makes the member a function
         * pointer, which is a field.
         */
        bool has_function_declarator(const syntax::Node node) {
            for (auto declarator : node.children_by_field_name("declarator")) {
                while (declarator.type() == "pointer_declarator" || declarator.type() == "reference_declarator") {
                    const auto inner = declarator.child_by_field_name("declarator");
                    declarator = inner ? inner : last_named_child(declarator);
                }
                if (declarator.type() == "function_declarator") {
                    const auto target = declarator.child_by_field_name("declarator");
                    if (target && target.type() != "parenthesized_declarator") {
                        return true;
                    }
                }
            }
            return false;
        }

        std::vector<std::string> declarator_field_names(const syntax::Node node) {
            std::vector<std::string> names;

            if (const auto name = node.child_by_field_name("name")) {
                names.emplace_back(name.text());
                return names;
            }
            if (const auto property = node.child_by_field_name("property")) {
                names.emplace_back(property.text());
                return names;
            }

            for (const auto declarator : node.children_by_field_name("declarator")) {
                if (auto name = declarator_name(declarator); !name.empty()) {
                    names.push_back(std::move(name));
                }
            }
            if (!names.empty()) {
                return names;
            }

            // C#: field_declaration > variable_declaration > variable_declarator
            syntax::walk(node, [&](const syntax::Node n) {
                if (n.type() != "variable_declarator") {
                    return true;
                }
                if (auto name = declarator_name(n); !name.empty()) {
                    names.push_back(std::move(name));
                }
                return false;
            });
            return names;
        }

        std::string self_assignment_name(const syntax::Node assignment, const LanguageCapabilities& caps) {
            const auto left = assignment.child_by_field_name("left");
            if (!left || !contains(caps.member_access.node_types, left.type())) {
                return {};
            }
            const auto receiver = left.child_by_field_name(caps.member_access.receiver_field);
            if (!receiver || !contains(caps.member_access.receivers, receiver.text())) {
                return {};
            }
            return std::string(left.child_by_field_name(caps.member_access.member_field).text());
        }

        std::size_t line_of(const syntax::Point point) noexcept {
            return static_cast<std::size_t>(point.row) + 1;
        }

    }  // namespace

    std::vector<ClassNode> find_classes(const syntax::ParsedFile& file) {
        std::vector<ClassNode> classes;
        const auto& caps = languages::capabilities_for(file.language);
        if (!caps.object_oriented) {
            return classes;
        }

        syntax::walk(file.root(), [&](const syntax::Node node) {
            if (!languages::is_class_node(node, caps)) {
                return true;
            }

            const auto name = node.child_by_field_name("name").text();
            if (name.empty()) {
                return true;
            }

            classes.push_back(ClassNode{
                std::string(name),
                line_of(node.start_point()),
                line_of(node.end_point()),
                node
            });
            return false;
        });

        return classes;
    }

    int cyclomatic_complexity(const syntax::Node node) {
        int complexity = 1;
        syntax::walk(node, [&](const syntax::Node n) {
            const auto type = n.type();
            if (n.is_named() ? one_of(kDecisionNodeTypes, type) : one_of(kDecisionOperators, type)) {
                ++complexity;
            }
            return true;
        });
        return complexity;
    }

    bool is_method_node(const syntax::Node node, const LanguageCapabilities& caps) {
        if (!node.is_named()) {
            return false;
        }
        const auto type = node.type();
        if (contains(caps.method_types, type)) {
            return true;
        }
        if (contains(caps.prototype_types, type)) {
            return has_function_declarator(node);
        }
        if (contains(caps.callable_field_types, type)) {
            const auto value = node.child_by_field_name("value");
            return value && contains(caps.function_value_types, value.type());
        }
        return false;
    }

    bool is_field_node(const syntax::Node node, const LanguageCapabilities& caps) {
        return node.is_named() && contains(caps.field_types, node.type()) && !is_method_node(node, caps);
    }

    std::string declared_name(const syntax::Node node) {
        if (const auto name = node.child_by_field_name("name")) {
            return declarator_name(name);
        }
        if (const auto property = node.child_by_field_name("property")) {
            return std::string(property.text());
        }
        return declarator_name(node.child_by_field_name("declarator"));
    }

    std::vector<MethodFacts> extract_methods(const syntax::Node class_node, const Language language) {
        std::vector<MethodFacts> methods;
        const auto& caps = languages::capabilities_for(language);
        if (!caps.object_oriented || class_node.is_null()) {
            return methods;
        }

        syntax::walk(class_node, [&](const syntax::Node node) {
            if (node == class_node || !is_method_node(node, caps)) {
                return true;
            }

            MethodFacts method;
            method.name = declared_name(node);
            method.complexity = cyclomatic_complexity(node);
            method.used_fields = extract_used_fields(node, language);
            methods.push_back(std::move(method));
            return false;
        });

        return methods;
    }

    std::vector<std::string> extract_fields(const syntax::Node class_node, const Language language) {
        std::vector<std::string> fields;
        const auto& caps = languages::capabilities_for(language);
        if (!caps.object_oriented || class_node.is_null()) {
            return fields;
        }

        syntax::walk(class_node, [&](const syntax::Node node) {
            if (!is_field_node(node, caps)) {
                return true;
            }

            switch (caps.field_rule) {
                case FieldNameRule::SelfAssignment:
                    if (auto name = self_assignment_name(node, caps); !name.empty()) {
                        fields.push_back(std::move(name));
                    }
                    // Chained assignments nest further assignment nodes.
                    return true;

                case FieldNameRule::InstanceVariable:
                    fields.emplace_back(node.text());
                    return false;

                case FieldNameRule::PropertyElement:
                    syntax::walk(node, [&](const syntax::Node n) {
                        if (n.type() != "variable_name") {
                            return true;
                        }
                        fields.emplace_back(string_utils::strip_leading(n.text(), '$'));
                        return false;
                    });
                    return false;

                case FieldNameRule::Declarator:
                    for (auto& name : declarator_field_names(node)) {
                        fields.push_back(std::move(name));
                    }
                    return false;
            }
            return true;
        });

        return fields;
    }

    std::set<std::string> extract_used_fields(const syntax::Node method_node, const Language language) {
        std::set<std::string> used;
        const auto& access = languages::capabilities_for(language).member_access;

        if (access.instance_variables) {
            syntax::walk(method_node, [&](const syntax::Node node) {
                if (node.type() == access.instance_variable_type) {
                    used.emplace(node.text());
                }
                return true;
            });
            return used;
        }

        if (access.node_types.empty()) {
            return used;
        }

        syntax::walk(method_node, [&](const syntax::Node node) {
            if (!node.is_named() || !contains(access.node_types, node.type())) {
                return true;
            }
            const auto receiver = node.child_by_field_name(access.receiver_field);
            if (receiver && contains(access.receivers, receiver.text())) {
                if (const auto member = node.child_by_field_name(access.member_field)) {
                    used.emplace(member.text());
                }
            }
            return true;
        });

        return used;
    }

    std::vector<std::string> extract_called_methods(const syntax::Node class_node) {
        std::set<std::string> called;

        syntax::walk(class_node, [&](const syntax::Node node) {
            if (!node.is_named() || !one_of(kCallNodeTypes, node.type())) {
                return true;
            }
            for (const auto field : kCalleeFields) {
                if (const auto callee = node.child_by_field_name(field)) {
                    if (!callee.text().empty()) {
                        called.emplace(callee.text());
                    }
                    break;
                }
            }
            return true;
        });

        return {called.begin(), called.end()};
    }

    std::vector<std::string> extract_coupled_classes(const syntax::Node class_node) {
        std::set<std::string> coupled;

        syntax::walk(class_node, [&](const syntax::Node node) {
            if (node.is_named() && one_of(kTypeNodeTypes, node.type())) {
                const auto name = node.text();
                if (name.size() > 1 && !is_primitive_type(name)) {
                    coupled.emplace(name);
                }
            }
            return true;
        });

        return {coupled.begin(), coupled.end()};
    }

    ClassMetrics extract_class_metrics(
        const ClassNode& cls,
        const syntax::ParsedFile& file,
        const InheritanceGraph& graph
    ) {
        ClassMetrics metrics;
        metrics.path = file.path;
        metrics.class_name = cls.name;
        metrics.language = file.language;
        metrics.start_line = cls.start_line;
        metrics.end_line = cls.end_line;
        metrics.loc = cls.end_line >= cls.start_line ? cls.end_line - cls.start_line + 1 : 0;

        const auto methods = extract_methods(cls.node, file.language);
        const auto called = extract_called_methods(cls.node);

        metrics.fields = extract_fields(cls.node, file.language);
        metrics.coupled_classes = extract_coupled_classes(cls.node);

        metrics.methods.reserve(methods.size());
        for (const auto& method : methods) {
            metrics.methods.push_back(method.name);
        }

        metrics.wmc = std::accumulate(methods.begin(), methods.end(), 0,
                                      [](const int sum, const MethodFacts& m) { return sum + m.complexity; });
        metrics.cbo = static_cast<int>(metrics.coupled_classes.size());
        metrics.rfc = static_cast<int>(methods.size() + called.size());
        metrics.lcom = calculate_lcom4(methods, metrics.fields.size());
        metrics.dit = graph.dit(cls.name);
        metrics.noc = graph.noc(cls.name);
        metrics.nom = static_cast<int>(methods.size());
        metrics.nof = static_cast<int>(metrics.fields.size());

        return metrics;
    }

    std::vector<ClassMetrics> analyze_file(const syntax::ParsedFile& file, const InheritanceGraph& graph) {
        std::vector<ClassMetrics> result;
        for (const auto& cls : find_classes(file)) {
            result.push_back(extract_class_metrics(cls, file, graph));
        }
        return result;
    }

}  // namespace ckscan::analysis
