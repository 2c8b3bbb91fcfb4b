#include "ckscan/languages/capabilities.hpp"

#include <array>

namespace ckscan::languages {

    namespace {

        LanguageCapabilities java() {
            LanguageCapabilities caps;
            caps.language = Language::Java;
            caps.object_oriented = true;
            caps.class_types = {"class_declaration", "interface_declaration"};
            caps.method_types = {"method_declaration", "constructor_declaration"};
            caps.field_types = {"field_declaration"};
            caps.field_rule = FieldNameRule::Declarator;
            caps.heritage.fields = {"superclass", "interfaces"};
            caps.heritage.child_types = {"super_interfaces", "extends_interfaces"};
            caps.heritage.name_types = {"type_identifier", "scoped_type_identifier"};
            caps.heritage.skip_types = {"type_arguments"};
            caps.member_access.node_types = {"field_access"};
            caps.member_access.receiver_field = "object";
            caps.member_access.member_field = "field";
            caps.member_access.receivers = {"this"};
            return caps;
        }

        LanguageCapabilities csharp() {
            LanguageCapabilities caps;
            caps.language = Language::CSharp;
            caps.object_oriented = true;
            caps.class_types = {"class_declaration", "interface_declaration", "struct_declaration"};
            caps.method_types = {"method_declaration", "constructor_declaration"};
            caps.field_types = {"field_declaration", "property_declaration"};
            caps.field_rule = FieldNameRule::Declarator;
            caps.heritage.fields = {"bases"};
            caps.heritage.child_types = {"base_list"};
            caps.heritage.name_types = {"identifier", "qualified_name", "generic_name"};
            caps.heritage.skip_types = {"type_argument_list", "argument_list"};
            caps.member_access.node_types = {"member_access_expression"};
            caps.member_access.receiver_field = "expression";
            caps.member_access.member_field = "name";
            caps.member_access.receivers = {"this"};
            return caps;
        }

        LanguageCapabilities cpp() {
            LanguageCapabilities caps;
            caps.language = Language::Cpp;
            caps.object_oriented = true;
            caps.class_types = {"class_specifier", "struct_specifier"};
            caps.required_body_field = "body";
            caps.method_types = {"function_definition"};
            caps.prototype_types = {"field_declaration", "declaration"};
            caps.field_types = {"field_declaration"};
            caps.field_rule = FieldNameRule::Declarator;
            caps.heritage.child_types = {"base_class_clause"};
            caps.heritage.name_types = {"type_identifier", "qualified_identifier", "template_type"};
            caps.heritage.skip_types = {"template_argument_list"};
            caps.member_access.node_types = {"field_expression"};
            caps.member_access.receiver_field = "argument";
            caps.member_access.member_field = "field";
            caps.member_access.receivers = {"this"};
            return caps;
        }

        LanguageCapabilities python() {
            LanguageCapabilities caps;
            caps.language = Language::Python;
            caps.object_oriented = true;
            caps.class_types = {"class_definition"};
            caps.method_types = {"function_definition"};
            caps.field_types = {"assignment"};
            caps.field_rule = FieldNameRule::SelfAssignment;
            // The superclasses field and the argument_list child are the same node.
            caps.heritage.fields = {"superclasses"};
            caps.heritage.child_types = {"argument_list"};
            caps.heritage.name_types = {"identifier", "attribute", "subscript"};
            caps.heritage.skip_types = {"keyword_argument"};
            caps.member_access.node_types = {"attribute"};
            caps.member_access.receiver_field = "object";
            caps.member_access.member_field = "attribute";
            caps.member_access.receivers = {"self"};
            return caps;
        }

        LanguageCapabilities ecmascript(const Language language) {
            LanguageCapabilities caps;
            caps.language = language;
            caps.object_oriented = true;
            caps.class_types = {"class_declaration", "class"};
            if (language != Language::JavaScript) {
                caps.class_types.push_back("abstract_class_declaration");
            }
            caps.method_types = {"method_definition"};
            caps.callable_field_types = {"public_field_definition", "field_definition"};
            caps.function_value_types = {"arrow_function", "function", "function_expression"};
            caps.field_types = {"public_field_definition", "field_definition"};
            caps.field_rule = FieldNameRule::Declarator;
            caps.heritage.child_types = {"class_heritage"};
            caps.heritage.name_types = {
                "identifier", "type_identifier", "member_expression",
                "nested_type_identifier", "generic_type"
            };
            caps.heritage.skip_types = {"type_arguments", "arguments"};
            caps.member_access.node_types = {"member_expression"};
            caps.member_access.receiver_field = "object";
            caps.member_access.member_field = "property";
            caps.member_access.receivers = {"this"};
            return caps;
        }

        LanguageCapabilities ruby() {
            LanguageCapabilities caps;
            caps.language = Language::Ruby;
            caps.object_oriented = true;
            caps.class_types = {"class", "module"};
            caps.method_types = {"method", "singleton_method"};
            caps.field_types = {"instance_variable"};
            caps.field_rule = FieldNameRule::InstanceVariable;
            caps.heritage.fields = {"superclass"};
            caps.heritage.name_types = {"constant", "scope_resolution"};
            caps.member_access.instance_variables = true;
            caps.member_access.instance_variable_type = "instance_variable";
            return caps;
        }

        LanguageCapabilities php() {
            LanguageCapabilities caps;
            caps.language = Language::Php;
            caps.object_oriented = true;
            caps.class_types = {"class_declaration", "interface_declaration", "trait_declaration"};
            caps.method_types = {"method_declaration"};
            caps.field_types = {"property_declaration"};
            caps.field_rule = FieldNameRule::PropertyElement;
            caps.heritage.child_types = {"base_clause", "class_interface_clause"};
            caps.heritage.name_types = {"qualified_name", "name"};
            caps.member_access.node_types = {"member_access_expression"};
            caps.member_access.receiver_field = "object";
            caps.member_access.member_field = "name";
            caps.member_access.receivers = {"$this"};
            return caps;
        }

        LanguageCapabilities not_applicable(const Language language) {
            LanguageCapabilities caps;
            caps.language = language;
            return caps;
        }

        struct CapabilityTable {
            std::array<LanguageCapabilities, 10> entries;
            LanguageCapabilities fallback;
        };

        const CapabilityTable& table() {
            static const CapabilityTable instance{
                {
                    java(),
                    csharp(),
                    cpp(),
                    python(),
                    ecmascript(Language::JavaScript),
                    ecmascript(Language::TypeScript),
                    ecmascript(Language::Tsx),
                    ruby(),
                    php(),
                    // C has structs but no methods or inheritance.
                    not_applicable(Language::C),
                },
                not_applicable(Language::Unknown)
            };
            return instance;
        }

    }  // namespace

    const LanguageCapabilities& capabilities_for(const Language language) noexcept {
        const auto& t = table();
        for (const auto& caps : t.entries) {
            if (caps.language == language) {
                return caps;
            }
        }
        return t.fallback;
    }

    bool is_object_oriented(const Language language) noexcept {
        return capabilities_for(language).object_oriented;
    }

}  // namespace ckscan::languages
