#include "ckscan/analysis/class_extractor.hpp"
#include "support/syntax_fixture.hpp"

#include <gtest/gtest.h>

namespace ckscan::analysis
{
    using test::L;
    using test::N;
    using test::NodeSpec;
    using test::T;

    namespace java = test::java;

    namespace {

        NodeSpec java_assign_this(const std::string& field) {
            return java::statement(N("assignment_expression", {
                java::this_field(field).as("left"),
                T("="),
                L("decimal_integer_literal", "1").as("right")
            }));
        }

        /**
         * class Account extends Entity {
         *     int balance;
         *     Owner owner;
         *     void deposit() { this.balance = 1; notifyObservers(); }
         *     void rename() { this.owner = 1; }
         * }
         */
        NodeSpec account_class(std::vector<NodeSpec> extra_members = {}) {
            std::vector<NodeSpec> members = {
                java::field("int", "balance"),
                java::field("Owner", "owner"),
                java::method("deposit", {java_assign_this("balance"), java::statement(java::call("notifyObservers"))}),
                java::method("rename", {java_assign_this("owner")}),
            };
            for (auto& m : extra_members) {
                members.push_back(std::move(m));
            }
            return java::class_decl("Account", std::move(members), "Entity");
        }

        NodeSpec python_self(const std::string& attribute) {
            return N("attribute", {
                L("identifier", "self").as("object"),
                T("."),
                L("identifier", attribute).as("attribute")
            });
        }

        NodeSpec python_method(const std::string& name, std::vector<NodeSpec> statements) {
            return N("function_definition", {
                T("def"),
                L("identifier", name).as("name"),
                N("parameters", {T("("), L("identifier", "self"), T(")")}).as("parameters"),
                T(":"),
                N("block", std::move(statements)).as("body")
            });
        }

        NodeSpec python_assign(NodeSpec left, NodeSpec right) {
            return N("expression_statement", {
                N("assignment", {std::move(left).as("left"), T("="), std::move(right).as("right")})
            });
        }

        NodeSpec ruby_method(const std::string& name, std::vector<NodeSpec> statements) {
            std::vector<NodeSpec> children{T("def"), L("identifier", name).as("name")};
            for (auto& s : statements) {
                children.push_back(std::move(s));
            }
            children.push_back(T("end"));
            return N("method", std::move(children));
        }

        NodeSpec ruby_class(const std::string& name, std::vector<NodeSpec> methods) {
            return N("program", {
                N("class", {
                    T("class"),
                    L("constant", name).as("name"),
                    N("body_statement", std::move(methods)).lines(),
                    T("end")
                }).lines()
            });
        }

        std::vector<std::string> method_names(const std::vector<MethodFacts>& methods) {
            std::vector<std::string> names;
            for (const auto& m : methods) {
                names.push_back(m.name);
            }
            return names;
        }

    }  // namespace

    class ClassExtractorTest : public ::testing::Test {
    protected:
        static ClassMetrics measure_single(const syntax::ParsedFile& file) {
            const auto graph = InheritanceGraph::build(extract_class_facts(file));
            auto classes = analyze_file(file, graph);
            EXPECT_EQ(classes.size(), 1u);
            return classes.empty() ? ClassMetrics{} : classes.front();
        }
    };

    // =========================================================================
    // Complexity
    // =========================================================================

    TEST_F(ClassExtractorTest, ComplexityOfEmptyMethodIsOne) {
        const auto tree = test::build_tree(java::method("noop"));
        EXPECT_EQ(cyclomatic_complexity(tree->root()), 1);
    }

    TEST_F(ClassExtractorTest, ComplexityCountsDecisionsOnce) {
        // if (a && b) {} for (;;) {} try {} catch (E e) {} x = c ? 1 : 2;
        const auto tree = test::build_tree(N("block", {
            N("if_statement", {
                T("if"),
                N("parenthesized_expression", {
                    T("("),
                    N("binary_expression", {
                        L("identifier", "a").as("left"),
                        T("&&").as("operator"),
                        L("identifier", "b").as("right")
                    }),
                    T(")")
                }).as("condition"),
                N("block", {T("{"), T("}")}).as("consequence")
            }),
            N("for_statement", {T("for"), T("("), T(";"), T(";"), T(")"), N("block", {T("{"), T("}")}).as("body")}),
            N("try_statement", {
                T("try"),
                N("block", {T("{"), T("}")}).as("body"),
                N("catch_clause", {T("catch"), N("block", {T("{"), T("}")}).as("body")})
            }),
            N("ternary_expression", {
                L("identifier", "c").as("condition"),
                T("?"),
                L("decimal_integer_literal", "1"),
                T(":"),
                L("decimal_integer_literal", "2")
            })
        }));

        // 1 + if + && + for + catch + ternary
        EXPECT_EQ(cyclomatic_complexity(tree->root()), 6);
    }

    TEST_F(ClassExtractorTest, ComplexityCountsWordOperators) {
        // if a and b or c: pass
        const auto tree = test::build_tree(N("if_statement", {
            T("if"),
            N("boolean_operator", {
                N("boolean_operator", {L("identifier", "a"), T("and"), L("identifier", "b")}),
                T("or"),
                L("identifier", "c")
            }).as("condition"),
            T(":"),
            N("block", {L("pass_statement", "pass")}).as("consequence")
        }));

        EXPECT_EQ(cyclomatic_complexity(tree->root()), 4);
    }

    TEST_F(ClassExtractorTest, ComplexityIgnoresNamedOperatorLookalikes) {
        // A named node spelled like an operator is not a decision point.
        const auto tree = test::build_tree(N("block", {L("or", "or"), L("and", "and"), L("&&", "&&")}));
        EXPECT_EQ(cyclomatic_complexity(tree->root()), 1);
    }

    // =========================================================================
    // Java
    // =========================================================================

    TEST_F(ClassExtractorTest, JavaDisjointMethodsGiveLcomTwo) {
        const auto file = test::make_file("src/Account.java", java::program({account_class()}));
        const auto metrics = measure_single(file);

        EXPECT_EQ(metrics.class_name, "Account");
        EXPECT_EQ(metrics.language, Language::Java);
        EXPECT_EQ(metrics.methods, (std::vector<std::string>{"deposit", "rename"}));
        EXPECT_EQ(metrics.fields, (std::vector<std::string>{"balance", "owner"}));
        EXPECT_EQ(metrics.nom, 2);
        EXPECT_EQ(metrics.nof, 2);
        EXPECT_EQ(metrics.wmc, 2);
        EXPECT_EQ(metrics.lcom, 2);
        EXPECT_EQ(metrics.rfc, 3);
        EXPECT_EQ(metrics.dit, 1);
        EXPECT_EQ(metrics.noc, 0);
    }

    TEST_F(ClassExtractorTest, JavaBridgingMethodGivesLcomOne) {
        const auto audit = java::method("audit", {java_assign_this("balance"), java_assign_this("owner")});
        const auto file = test::make_file("src/Account.java", java::program({account_class({audit})}));

        const auto metrics = measure_single(file);

        EXPECT_EQ(metrics.nom, 3);
        EXPECT_EQ(metrics.lcom, 1);
    }

    TEST_F(ClassExtractorTest, JavaLinesAndLoc) {
        const auto file = test::make_file("src/Account.java", java::program({account_class()}));
        const auto metrics = measure_single(file);

        // "class Account extends Entity {" + 4 members + "}"
        EXPECT_EQ(metrics.start_line, 1u);
        EXPECT_EQ(metrics.end_line, 6u);
        EXPECT_EQ(metrics.loc, 6u);
    }

    TEST_F(ClassExtractorTest, JavaCoupledClassesAreSyntacticUpperBound) {
        const auto file = test::make_file("src/Account.java", java::program({account_class()}));
        const auto metrics = measure_single(file);

        // Every identifier-like name counts; primitives do not.
        EXPECT_EQ(metrics.coupled_classes, (std::vector<std::string>{
            "Account", "Entity", "Owner", "balance", "deposit", "notifyObservers", "owner", "rename"
        }));
        EXPECT_EQ(metrics.cbo, 8);
    }

    TEST_F(ClassExtractorTest, CoupledClassesDropPrimitivesAndSingleLetters) {
        const auto tree = test::build_tree(N("class_body", {
            L("type_identifier", "String"),
            L("type_identifier", "T"),
            L("type_identifier", "Repository"),
            L("type_identifier", "Repository"),
            L("identifier", "x"),
            L("integral_type", "int")
        }));

        EXPECT_EQ(extract_coupled_classes(tree->root()), (std::vector<std::string>{"Repository"}));
    }

    TEST_F(ClassExtractorTest, CalledMethodsAreDistinctAndSorted) {
        const auto tree = test::build_tree(N("block", {
            java::statement(java::call("save")),
            java::statement(java::call("load")),
            java::statement(java::call("save")),
            java::statement(N("call_expression", {
                L("identifier", "render").as("function"),
                N("arguments", {T("("), T(")")}).as("arguments")
            }))
        }));

        EXPECT_EQ(extract_called_methods(tree->root()), (std::vector<std::string>{"load", "render", "save"}));
    }

    TEST_F(ClassExtractorTest, NestedClassesBelongToEnclosingClass) {
        const auto file = test::make_file("src/Outer.java", java::program({
            java::class_decl("Outer", {
                java::method("a"),
                java::class_decl("Inner", {java::method("b")})
            })
        }));

        const auto classes = find_classes(file);
        ASSERT_EQ(classes.size(), 1u);
        EXPECT_EQ(classes[0].name, "Outer");

        const auto methods = extract_methods(classes[0].node, Language::Java);
        EXPECT_EQ(method_names(methods), (std::vector<std::string>{"a", "b"}));
    }

    TEST_F(ClassExtractorTest, SeveralTopLevelClassesInOneFile) {
        const auto file = test::make_file("src/Shapes.java", java::program({
            java::class_decl("Shape", {java::method("area")}),
            java::class_decl("Circle", {java::method("area")}, "Shape"),
        }));

        const auto graph = InheritanceGraph::build(extract_class_facts(file));
        const auto classes = analyze_file(file, graph);

        ASSERT_EQ(classes.size(), 2u);
        EXPECT_EQ(classes[0].class_name, "Shape");
        EXPECT_EQ(classes[0].noc, 1);
        EXPECT_EQ(classes[1].class_name, "Circle");
        EXPECT_EQ(classes[1].dit, 1);
        // Shape spans lines 1-3.
        EXPECT_EQ(classes[1].start_line, 4u);
    }

    TEST_F(ClassExtractorTest, MethodWithoutFieldsStillCounts) {
        // No fields: every method is its own component.
        const auto file = test::make_file("src/Util.java", java::program({
            java::class_decl("Util", {java::method("a"), java::method("b"), java::method("c")})
        }));

        const auto metrics = measure_single(file);
        EXPECT_EQ(metrics.nof, 0);
        EXPECT_EQ(metrics.lcom, 3);
    }

    TEST_F(ClassExtractorTest, EmptyClass) {
        const auto file = test::make_file("src/Marker.java", java::program({java::class_decl("Marker", {})}));

        const auto metrics = measure_single(file);
        EXPECT_EQ(metrics.nom, 0);
        EXPECT_EQ(metrics.wmc, 0);
        EXPECT_EQ(metrics.rfc, 0);
        EXPECT_EQ(metrics.lcom, 0);
    }

    // =========================================================================
    // Python
    // =========================================================================

    TEST_F(ClassExtractorTest, PythonSelfAttributes) {
        // class Counter(Base):
        //     limit = 10
        //     def __init__(self): self.count = 0; self.label = ""
        //     def increment(self): self.count += 1
        //     def describe(self): return self.label
        const auto file = test::make_file("app/counter.py", N("module", {
            N("class_definition", {
                T("class"),
                L("identifier", "Counter").as("name"),
                N("argument_list", {T("("), L("identifier", "Base"), T(")")}).as("superclasses"),
                T(":"),
                N("block", {
                    python_assign(L("identifier", "limit"), L("integer", "10")),
                    python_method("__init__", {
                        python_assign(python_self("count"), L("integer", "0")),
                        python_assign(python_self("label"), L("string", "\"\""))
                    }),
                    python_method("increment", {
                        N("expression_statement", {
                            N("augmented_assignment", {python_self("count").as("left"), T("+="), L("integer", "1").as("right")})
                        })
                    }),
                    python_method("describe", {
                        N("return_statement", {T("return"), python_self("label")})
                    })
                }).as("body").lines()
            }).lines()
        }));

        const auto metrics = measure_single(file);

        EXPECT_EQ(metrics.methods, (std::vector<std::string>{"__init__", "increment", "describe"}));
        EXPECT_EQ(metrics.fields, (std::vector<std::string>{"count", "label"}));
        EXPECT_EQ(metrics.lcom, 1);
        EXPECT_EQ(metrics.dit, 1);
    }

    TEST_F(ClassExtractorTest, PythonChainedSelfAssignment) {
        // self.a = self.b = 0
        const auto tree = test::build_tree(N("class_definition", {
            T("class"),
            L("identifier", "Pair").as("name"),
            T(":"),
            N("block", {
                python_method("reset", {
                    N("expression_statement", {
                        N("assignment", {
                            python_self("a").as("left"),
                            T("="),
                            N("assignment", {python_self("b").as("left"), T("="), L("integer", "0").as("right")}).as("right")
                        })
                    })
                })
            }).as("body")
        }));

        EXPECT_EQ(extract_fields(tree->root(), Language::Python), (std::vector<std::string>{"a", "b"}));
    }

    TEST_F(ClassExtractorTest, PythonOtherReceiverIsNotAField) {
        const auto tree = test::build_tree(python_method("copy", {
            python_assign(N("attribute", {
                L("identifier", "other").as("object"),
                T("."),
                L("identifier", "value").as("attribute")
            }), L("integer", "1"))
        }));

        EXPECT_TRUE(extract_used_fields(tree->root(), Language::Python).empty());
    }

    // =========================================================================
    // Ruby
    // =========================================================================

    TEST_F(ClassExtractorTest, RubyInstanceVariables) {
        const auto file = test::make_file("lib/stack.rb", ruby_class("Stack", {
            ruby_method("push", {
                N("call", {
                    L("instance_variable", "@items").as("receiver"),
                    T("."),
                    L("identifier", "push").as("method")
                })
            }),
            ruby_method("label", {L("instance_variable", "@name")})
        }));

        const auto metrics = measure_single(file);

        EXPECT_EQ(metrics.methods, (std::vector<std::string>{"push", "label"}));
        EXPECT_EQ(metrics.fields, (std::vector<std::string>{"@items", "@name"}));
        EXPECT_EQ(metrics.lcom, 2);
        EXPECT_EQ(metrics.rfc, 3);
    }

    TEST_F(ClassExtractorTest, RubyFieldsCountEveryOccurrence) {
        const auto file = test::make_file("lib/stack.rb", ruby_class("Stack", {
            ruby_method("initialize", {
                N("assignment", {L("instance_variable", "@items").as("left"), T("="), L("array", "[]").as("right")}),
                N("assignment", {L("instance_variable", "@name").as("left"), T("="), L("string", "''").as("right")})
            }),
            ruby_method("label", {L("instance_variable", "@name")})
        }));

        const auto metrics = measure_single(file);

        EXPECT_EQ(metrics.fields, (std::vector<std::string>{"@items", "@name", "@name"}));
        EXPECT_EQ(metrics.nof, 3);
        EXPECT_EQ(metrics.lcom, 1);
    }

    // =========================================================================
    // TypeScript
    // =========================================================================

    TEST_F(ClassExtractorTest, TypeScriptCallableFieldIsMethod) {
        // class Widget { onClick = () => this.count++; count = 0; render() { return this.count; } }
        const auto this_count = N("member_expression", {
            L("this", "this").as("object"),
            T("."),
            L("property_identifier", "count").as("property")
        });
        const auto file = test::make_file("web/Widget.ts", N("program", {
            N("class_declaration", {
                T("class"),
                L("type_identifier", "Widget").as("name"),
                N("class_body", {
                    T("{"),
                    N("public_field_definition", {
                        L("property_identifier", "onClick").as("name"),
                        T("="),
                        N("arrow_function", {
                            N("formal_parameters", {T("("), T(")")}).as("parameters"),
                            T("=>"),
                            N("update_expression", {this_count.as("argument"), T("++")}).as("body")
                        }).as("value")
                    }),
                    T(";"),
                    N("public_field_definition", {
                        L("property_identifier", "count").as("name"),
                        T("="),
                        L("number", "0").as("value")
                    }),
                    T(";"),
                    N("method_definition", {
                        L("property_identifier", "render").as("name"),
                        N("formal_parameters", {T("("), T(")")}).as("parameters"),
                        N("statement_block", {T("{"), N("return_statement", {T("return"), this_count, T(";")}), T("}")})
                            .as("body")
                    }),
                    T("}")
                }).as("body").lines()
            })
        }));

        const auto metrics = measure_single(file);

        EXPECT_EQ(metrics.methods, (std::vector<std::string>{"onClick", "render"}));
        EXPECT_EQ(metrics.fields, (std::vector<std::string>{"count"}));
        EXPECT_EQ(metrics.lcom, 1);
    }

    TEST_F(ClassExtractorTest, NamelessClassIsSkippedButScanned) {
        // const X = class { m() { class Helper {} } }
        const auto file = test::make_file("web/index.js", N("program", {
            N("lexical_declaration", {
                T("const"),
                N("variable_declarator", {
                    L("identifier", "X").as("name"),
                    T("="),
                    N("class", {
                        T("class"),
                        N("class_body", {
                            T("{"),
                            N("method_definition", {
                                L("property_identifier", "m").as("name"),
                                N("formal_parameters", {T("("), T(")")}).as("parameters"),
                                N("statement_block", {
                                    T("{"),
                                    N("class_declaration", {
                                        T("class"),
                                        L("identifier", "Helper").as("name"),
                                        N("class_body", {T("{"), T("}")}).as("body")
                                    }),
                                    T("}")
                                }).as("body")
                            }),
                            T("}")
                        }).as("body")
                    }).as("value")
                })
            })
        }));

        const auto classes = find_classes(file);
        ASSERT_EQ(classes.size(), 1u);
        EXPECT_EQ(classes[0].name, "Helper");
    }

    // =========================================================================
    // C++
    // =========================================================================

    TEST_F(ClassExtractorTest, CppPrototypesAreMethods) {
        // class Shape; class Shape { double area(); double width_; double width() { return this->width_; } };
        const auto file = test::make_file("engine/shape.hpp", N("translation_unit", {
            N("class_specifier", {T("class"), L("type_identifier", "Shape").as("name")}),
            T(";"),
            N("class_specifier", {
                T("class"),
                L("type_identifier", "Shape").as("name"),
                N("field_declaration_list", {
                    T("{"),
                    N("field_declaration", {
                        L("primitive_type", "double").as("type"),
                        N("function_declarator", {
                            L("field_identifier", "area").as("declarator"),
                            N("parameter_list", {T("("), T(")")}).as("parameters")
                        }).as("declarator"),
                        T(";")
                    }),
                    N("field_declaration", {
                        L("primitive_type", "double").as("type"),
                        L("field_identifier", "width_").as("declarator"),
                        T(";")
                    }),
                    N("function_definition", {
                        L("primitive_type", "double").as("type"),
                        N("function_declarator", {
                            L("field_identifier", "width").as("declarator"),
                            N("parameter_list", {T("("), T(")")}).as("parameters")
                        }).as("declarator"),
                        N("compound_statement", {
                            T("{"),
                            N("return_statement", {
                                T("return"),
                                N("field_expression", {
                                    L("this", "this").as("argument"),
                                    T("->").as("operator"),
                                    L("field_identifier", "width_").as("field")
                                }),
                                T(";")
                            }),
                            T("}")
                        }).as("body")
                    }),
                    T("}")
                }).as("body").lines(),
                T(";")
            })
        }).lines());

        const auto metrics = measure_single(file);

        EXPECT_EQ(metrics.methods, (std::vector<std::string>{"area", "width"}));
        EXPECT_EQ(metrics.fields, (std::vector<std::string>{"width_"}));
        EXPECT_EQ(metrics.lcom, 2);
        EXPECT_EQ(metrics.start_line, 3u);
    }

    TEST_F(ClassExtractorTest, CppFunctionPointerMemberIsAField) {
        // class Widget { void (*callback)(int); int* data(); };
        const auto file = test::make_file("ui/widget.hpp", N("translation_unit", {
            N("class_specifier", {
                T("class"),
                L("type_identifier", "Widget").as("name"),
                N("field_declaration_list", {
                    T("{"),
                    N("field_declaration", {
                        L("primitive_type", "void").as("type"),
                        N("function_declarator", {
                            N("parenthesized_declarator", {
                                T("("),
                                N("pointer_declarator", {
                                    T("*"),
                                    L("field_identifier", "callback").as("declarator")
                                }),
                                T(")")
                            }).as("declarator"),
                            N("parameter_list", {T("("), L("primitive_type", "int"), T(")")}).as("parameters")
                        }).as("declarator"),
                        T(";")
                    }),
                    N("field_declaration", {
                        L("primitive_type", "int").as("type"),
                        N("pointer_declarator", {
                            T("*"),
                            N("function_declarator", {
                                L("field_identifier", "data").as("declarator"),
                                N("parameter_list", {T("("), T(")")}).as("parameters")
                            }).as("declarator")
                        }).as("declarator"),
                        T(";")
                    }),
                    T("}")
                }).as("body").lines(),
                T(";")
            })
        }).lines());

        const auto metrics = measure_single(file);

        EXPECT_EQ(metrics.methods, (std::vector<std::string>{"data"}));
        EXPECT_EQ(metrics.fields, (std::vector<std::string>{"callback"}));
        EXPECT_EQ(metrics.nom, 1);
        EXPECT_EQ(metrics.nof, 1);
        EXPECT_EQ(metrics.wmc, 1);
    }

    // =========================================================================
    // PHP and C#
    // =========================================================================

    TEST_F(ClassExtractorTest, PhpPropertiesAndThisAccess) {
        const auto file = test::make_file("src/Cart.php", N("program", {
            N("class_declaration", {
                T("class"),
                L("name", "Cart").as("name"),
                N("declaration_list", {
                    T("{"),
                    N("property_declaration", {
                        L("visibility_modifier", "private"),
                        N("property_element", {L("variable_name", "$items")}),
                        T(";")
                    }),
                    N("method_declaration", {
                        L("visibility_modifier", "public"),
                        T("function"),
                        L("name", "add").as("name"),
                        N("formal_parameters", {T("("), T(")")}).as("parameters"),
                        N("compound_statement", {
                            T("{"),
                            N("expression_statement", {
                                N("member_call_expression", {
                                    L("variable_name", "$this").as("object"),
                                    T("->"),
                                    L("name", "save").as("name"),
                                    N("arguments", {T("("), T(")")}).as("arguments")
                                }),
                                T(";")
                            }),
                            N("expression_statement", {
                                N("member_access_expression", {
                                    L("variable_name", "$this").as("object"),
                                    T("->"),
                                    L("name", "items").as("name")
                                }),
                                T(";")
                            }),
                            T("}")
                        }).as("body")
                    }),
                    T("}")
                }).as("body").lines()
            })
        }));

        const auto metrics = measure_single(file);

        EXPECT_EQ(metrics.methods, (std::vector<std::string>{"add"}));
        EXPECT_EQ(metrics.fields, (std::vector<std::string>{"items"}));
        EXPECT_EQ(metrics.lcom, 1);
        EXPECT_EQ(metrics.rfc, 2);
    }

    TEST_F(ClassExtractorTest, CSharpFieldsAndProperties) {
        const auto file = test::make_file("Models/Order.cs", N("compilation_unit", {
            N("class_declaration", {
                L("modifier", "public"),
                T("class"),
                L("identifier", "Order").as("name"),
                N("base_list", {T(":"), L("identifier", "Entity"), T(","), L("identifier", "IAuditable")}).as("bases"),
                N("declaration_list", {
                    T("{"),
                    N("field_declaration", {
                        L("modifier", "private"),
                        N("variable_declaration", {
                            L("predefined_type", "decimal").as("type"),
                            N("variable_declarator", {L("identifier", "total").as("name")})
                        }),
                        T(";")
                    }),
                    N("property_declaration", {
                        L("modifier", "public"),
                        L("predefined_type", "int").as("type"),
                        L("identifier", "Count").as("name"),
                        N("accessor_list", {T("{"), T("get;"), T("}")}).as("accessors")
                    }),
                    N("method_declaration", {
                        L("predefined_type", "void").as("returns"),
                        L("identifier", "Add").as("name"),
                        N("parameter_list", {T("("), T(")")}).as("parameters"),
                        N("block", {
                            T("{"),
                            N("expression_statement", {
                                N("assignment_expression", {
                                    N("member_access_expression", {
                                        L("this", "this").as("expression"),
                                        T("."),
                                        L("identifier", "total").as("name")
                                    }).as("left"),
                                    T("="),
                                    L("integer_literal", "0").as("right")
                                }),
                                T(";")
                            }),
                            T("}")
                        }).as("body")
                    }),
                    T("}")
                }).as("body").lines()
            })
        }));

        const auto graph = InheritanceGraph::build(extract_class_facts(file));
        EXPECT_EQ(graph.parents_of("Order"), (std::vector<std::string>{"Entity", "IAuditable"}));

        const auto metrics = measure_single(file);
        EXPECT_EQ(metrics.fields, (std::vector<std::string>{"total", "Count"}));
        EXPECT_EQ(metrics.methods, (std::vector<std::string>{"Add"}));
        EXPECT_EQ(metrics.lcom, 1);
    }

    // =========================================================================
    // Non-OO input
    // =========================================================================

    TEST_F(ClassExtractorTest, NonObjectOrientedFileHasNoClasses) {
        const auto file = test::make_file("main.go", N("source_file", {
            N("type_declaration", {T("type"), L("type_identifier", "Server"), L("struct_type", "struct{}")})
        }));

        EXPECT_TRUE(find_classes(file).empty());
        EXPECT_TRUE(analyze_file(file, InheritanceGraph{}).empty());
    }

}  // namespace ckscan::analysis
