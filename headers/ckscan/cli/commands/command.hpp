#ifndef CKSCAN_CLI_COMMANDS_COMMAND_HPP
#define CKSCAN_CLI_COMMANDS_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Base class and registry for ckscan subcommands.
 *
 * Commands register themselves with the CommandRegistry from a static
 * registrar object in their translation unit; main() looks them up by name
 * or alias and hands them the parsed arguments.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ckscan::cli {

    /**
     * One option a command accepts. An option without a value_name is a
     * boolean flag.
     */
    struct ArgDef {
        std::string name;           // --name
        char short_name = 0;        // -n, 0 for none
        std::string value_name;     // shown as --name <VALUE>
        std::string description;
        std::string default_value;

        [[nodiscard]] bool takes_value() const noexcept { return !value_name.empty(); }
    };

    /**
     * Parsed command-line arguments.
     */
    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& default_val) const;

        /// Empty when the option is absent or not a non-negative integer.
        [[nodiscard]] std::optional<std::uint64_t> get_count(const std::string& name) const;

        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::unordered_map<std::string, std::string> args_;
        std::unordered_map<std::string, bool> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,      // Only errors
        Normal,
        Verbose     // Extra details, debug logging
    };

    /**
     * Base class for all CLI commands.
     */
    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Alternative names accepted on the command line.
         */
        [[nodiscard]] virtual std::vector<std::string_view> aliases() const { return {}; }

        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        [[nodiscard]] virtual std::string usage() const;

        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * Executes the command.
         *
         * @param args Parsed command-line arguments.
         * @return Exit code (0 = success).
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * Checks the parsed arguments before execute() runs.
         *
         * @return Problem description, empty when the arguments are usable.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        [[nodiscard]] bool matches(std::string_view command_name) const;

        void print_help() const;

    protected:
        /// Applies -v / -q from the parsed arguments.
        void apply_verbosity(const ParsedArgs& args);

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_verbose(std::string_view msg) const;

        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ >= Verbosity::Verbose; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
    };

    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        /// Looks a command up by name or alias.
        [[nodiscard]] Command* find(std::string_view name) const;
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses command-line arguments for a command.
     *
     * -h/--help, -v/--verbose, -q/--quiet and --json are accepted by every
     * command. Everything after "--" is positional.
     *
     * @param args Command-line arguments (after command name).
     * @param defs Argument definitions.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );

}  // namespace ckscan::cli

#endif //CKSCAN_CLI_COMMANDS_COMMAND_HPP
