#include "ckscan/cli/commands/command.hpp"

#include <gtest/gtest.h>

namespace ckscan::cli
{
    namespace {

        std::vector<ArgDef> cohesion_like_defs() {
            return {
                {"top", 't', "N", "Number of classes to show", ""},
                {"sort", 's', "KEY", "Sort key", "lcom"},
                {"include-tests", 0, "", "Include test files", ""},
                {"threads", 'j', "N", "Worker threads", ""},
            };
        }

    }  // namespace

    TEST(ParseArgumentsTest, PositionalsAndLongOptions) {
        const auto result = parse_arguments({"src", "--top", "5", "lib", "--include-tests"}, cohesion_like_defs());

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.positional(), (std::vector<std::string>{"src", "lib"}));
        EXPECT_EQ(result.args.get("top"), "5");
        EXPECT_TRUE(result.args.get_flag("include-tests"));
    }

    TEST(ParseArgumentsTest, EqualsSyntax) {
        const auto result = parse_arguments({"--sort=wmc", "."}, cohesion_like_defs());

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.get("sort"), "wmc");
    }

    TEST(ParseArgumentsTest, DefaultsFillMissingOptions) {
        const auto result = parse_arguments({"."}, cohesion_like_defs());

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.get("sort"), "lcom");
        EXPECT_FALSE(result.args.has("top"));
    }

    TEST(ParseArgumentsTest, ShortOptionsAndClusters) {
        const auto result = parse_arguments({"-t10", "-vq", "-j", "4", "."}, cohesion_like_defs());

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.get("top"), "10");
        EXPECT_EQ(result.args.get("threads"), "4");
        EXPECT_TRUE(result.args.get_flag("verbose"));
        EXPECT_TRUE(result.args.get_flag("quiet"));
    }

    TEST(ParseArgumentsTest, CommonFlagsAreAlwaysAccepted) {
        const auto result = parse_arguments({"--json", "--help", "-h", "."}, {});

        ASSERT_TRUE(result.success);
        EXPECT_TRUE(result.args.get_flag("json"));
        EXPECT_TRUE(result.args.get_flag("help"));
    }

    TEST(ParseArgumentsTest, DoubleDashEndsOptions) {
        const auto result = parse_arguments({"--", "--top", "-weird-dir"}, cohesion_like_defs());

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.positional(), (std::vector<std::string>{"--top", "-weird-dir"}));
        EXPECT_FALSE(result.args.has("top"));
    }

    TEST(ParseArgumentsTest, UnknownOptions) {
        const auto long_opt = parse_arguments({"--bogus"}, cohesion_like_defs());
        EXPECT_FALSE(long_opt.success);
        EXPECT_EQ(long_opt.error, "Unknown option: --bogus");

        const auto short_opt = parse_arguments({"-x"}, cohesion_like_defs());
        EXPECT_FALSE(short_opt.success);
        EXPECT_EQ(short_opt.error, "Unknown option: -x");
    }

    TEST(ParseArgumentsTest, MissingValue) {
        const auto long_opt = parse_arguments({"--top"}, cohesion_like_defs());
        EXPECT_FALSE(long_opt.success);
        EXPECT_EQ(long_opt.error, "Option --top requires a value");

        const auto short_opt = parse_arguments({"-t"}, cohesion_like_defs());
        EXPECT_FALSE(short_opt.success);
        EXPECT_EQ(short_opt.error, "Option -t requires a value");
    }

    TEST(ParsedArgsTest, GetCount) {
        ParsedArgs args;
        args.set("top", "25");
        args.set("threads", "-1");
        args.set("size", "12abc");

        EXPECT_EQ(args.get_count("top"), 25u);
        EXPECT_FALSE(args.get_count("threads").has_value());
        EXPECT_FALSE(args.get_count("size").has_value());
        EXPECT_FALSE(args.get_count("missing").has_value());
    }

    TEST(ParsedArgsTest, GetOr) {
        ParsedArgs args;
        args.set("format", "json");

        EXPECT_EQ(args.get_or("format", "text"), "json");
        EXPECT_EQ(args.get_or("output", "-"), "-");
        EXPECT_FALSE(args.get_flag("format"));
    }

    TEST(CommandRegistryTest, CohesionCommandIsRegistered) {
        auto* by_name = CommandRegistry::instance().find("cohesion");
        ASSERT_NE(by_name, nullptr);
        EXPECT_EQ(by_name->name(), "cohesion");
        EXPECT_EQ(CommandRegistry::instance().find("ck"), by_name);
        EXPECT_EQ(CommandRegistry::instance().find("nonexistent"), nullptr);
    }

    TEST(CommandRegistryTest, CohesionRequiresPaths) {
        auto* command = CommandRegistry::instance().find("cohesion");
        ASSERT_NE(command, nullptr);

        ParsedArgs none;
        EXPECT_FALSE(command->validate(none).empty());

        ParsedArgs some;
        some.add_positional("src");
        EXPECT_TRUE(command->validate(some).empty());
    }

    TEST(CommandRegistryTest, CohesionOptionsParse) {
        auto* command = CommandRegistry::instance().find("cohesion");
        ASSERT_NE(command, nullptr);

        const auto result = parse_arguments(
            {"--top", "0", "--sort", "dit", "--max-file-size", "512KB", "-f", "json", "--no-color", "src"},
            command->arguments());

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.get_count("top"), 0u);
        EXPECT_EQ(result.args.get("sort"), "dit");
        EXPECT_EQ(result.args.get("max-file-size"), "512KB");
        EXPECT_EQ(result.args.get("format"), "json");
        EXPECT_TRUE(result.args.get_flag("no-color"));
    }

}  // namespace ckscan::cli
