#ifndef CKSCAN_LANGUAGES_CAPABILITIES_HPP
#define CKSCAN_LANGUAGES_CAPABILITIES_HPP

/**
 * @file capabilities.hpp
 * @brief Per-language description of how OO constructs appear in the grammar.
 *
 * Every grammar spells "class", "method", "field" and "inherits from"
 * differently. Instead of switching on the language in every extraction
 * routine, each language has one immutable LanguageCapabilities record and
 * the extractors are written once against that record.
 *
 * A language without a class system gets an empty record with
 * object_oriented == false; every extractor treats that as "nothing to do".
 */

#include "ckscan/syntax/language.hpp"
#include "ckscan/syntax/tree.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

namespace ckscan::languages {

    using NodeTypes = std::vector<std::string_view>;

    [[nodiscard]] inline bool contains(const NodeTypes& types, const std::string_view type) noexcept {
        return std::ranges::find(types, type) != types.end();
    }

    /**
     * How parent type names are found below a class node.
     *
     * Heritage nodes are the class node's children that either carry one of
     * `fields` as field name or have one of `child_types` as type. Inside
     * each heritage node, the first nodes (in pre-order) whose type is in
     * `name_types` are parent names; the search does not descend into a
     * matched name nor into `skip_types` subtrees (generic arguments,
     * keyword arguments).
     */
    struct HeritageRule {
        NodeTypes fields;
        NodeTypes child_types;
        NodeTypes name_types;
        NodeTypes skip_types;
    };

    /**
     * How the name of a field declaration is read.
     */
    enum class FieldNameRule {
        /// `name`/`property` field, else the declarator chain (Java, C#, C++, JS/TS).
        Declarator,
        /// `self.x = ...` assignments (Python).
        SelfAssignment,
        /// Text of an `@x` node (Ruby).
        InstanceVariable,
        /// `$x` variable names inside a property declaration, without the `$` (PHP).
        PropertyElement
    };

    /**
     * How a method body refers to a field of its own instance.
     *
     * A node of one of `node_types` whose `receiver_field` child reads as
     * one of `receivers` refers to the field named by its `member_field`
     * child. When `instance_variables` is set, every node of type
     * `instance_variable_type` refers to the field spelled by its text.
     */
    struct MemberAccessRule {
        NodeTypes node_types;
        std::string_view receiver_field;
        std::string_view member_field;
        NodeTypes receivers;
        bool instance_variables = false;
        std::string_view instance_variable_type;
    };

    struct LanguageCapabilities {
        Language language = Language::Unknown;
        bool object_oriented = false;

        /// Class-like declarations (classes, interfaces, structs, traits, modules).
        NodeTypes class_types;

        /// When set, a class node only counts if it has a child under this
        /// field. Keeps C++ forward declarations and elaborated type
        /// specifiers (`struct stat st;`) out of the class list.
        std::string_view required_body_field;

        /// Method-like declarations.
        NodeTypes method_types;

        /// Declarations that are methods only when their declarator chain
        /// contains a function declarator (C++ member prototypes).
        NodeTypes prototype_types;

        /// Field definitions that are methods when their value is a function
        /// (JS/TS `handler = () => {}`).
        NodeTypes callable_field_types;
        NodeTypes function_value_types;

        /// Field-like declarations.
        NodeTypes field_types;
        FieldNameRule field_rule = FieldNameRule::Declarator;

        HeritageRule heritage;
        MemberAccessRule member_access;
    };

    /**
     * Returns the record for a language.
     *
     * Never fails: unknown and non-OO languages get an empty record.
     * The returned reference stays valid for the lifetime of the program.
     */
    [[nodiscard]] const LanguageCapabilities& capabilities_for(Language language) noexcept;

    [[nodiscard]] bool is_object_oriented(Language language) noexcept;

    /**
     * True if the node is a class-like declaration of the language.
     */
    [[nodiscard]] inline bool is_class_node(const syntax::Node node, const LanguageCapabilities& caps) noexcept {
        if (!node.is_named() || !contains(caps.class_types, node.type())) {
            return false;
        }
        return caps.required_body_field.empty() ||
               !node.child_by_field_name(caps.required_body_field).is_null();
    }

}  // namespace ckscan::languages

#endif //CKSCAN_LANGUAGES_CAPABILITIES_HPP
