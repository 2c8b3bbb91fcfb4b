#include "ckscan/cli/commands/command.hpp"
#include "ckscan/version.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <iterator>

namespace ckscan::cli {

    // ParsedArgs

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        args_[name] = value;
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_[name] = true;
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return args_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        const auto it = args_.find(name);
        return it == args_.end() ? std::nullopt : std::optional<std::string>(it->second);
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& default_val) const {
        return get(name).value_or(default_val);
    }

    std::optional<std::uint64_t> ParsedArgs::get_count(const std::string& name) const {
        const auto text = get(name);
        if (!text || text->empty()) {
            return std::nullopt;
        }

        std::uint64_t count = 0;
        const char* last = text->data() + text->size();
        if (const auto [ptr, ec] = std::from_chars(text->data(), last, count); ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return count;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        return flags_.contains(name);
    }

    // Command

    std::string Command::usage() const {
        return "Usage: " + std::string(PROJECT_SHORT_NAME) + " " + std::string(name()) + " [OPTIONS]";
    }

    std::string Command::validate(const ParsedArgs&) const {
        return {};
    }

    bool Command::matches(const std::string_view command_name) const {
        const auto names = aliases();
        return name() == command_name || std::ranges::find(names, command_name) != names.end();
    }

    void Command::print_help() const {
        std::cout << description() << "\n\n" << usage() << "\n";

        const auto row = [](const std::string& left, const std::string_view text) {
            std::cout << "  " << std::left << std::setw(30) << left << text << "\n";
        };

        if (const auto defs = arguments(); !defs.empty()) {
            std::cout << "\nOptions:\n";
            for (const auto& def : defs) {
                std::string left = def.short_name ? std::string{'-', def.short_name, ',', ' '} : "    ";
                left += "--" + def.name;
                if (def.takes_value()) {
                    left += " <" + def.value_name + ">";
                }
                row(left, def.default_value.empty()
                              ? def.description
                              : def.description + " (default: " + def.default_value + ")");
            }
        }

        std::cout << "\nCommon options:\n";
        row("-h, --help", "Show this help message");
        row("-v, --verbose", "Show skipped files and debug logging");
        row("-q, --quiet", "Only show errors");
        row("    --json", "Shorthand for --format json");
    }

    void Command::apply_verbosity(const ParsedArgs& args) {
        if (args.get_flag("verbose")) {
            verbosity_ = Verbosity::Verbose;
        } else if (args.get_flag("quiet")) {
            verbosity_ = Verbosity::Quiet;
        }
    }

    void Command::print(const std::string_view msg) const {
        if (!is_quiet()) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (is_verbose()) {
            std::cerr << msg << "\n";
        }
    }

    // CommandRegistry

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry registry;
        return registry;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        const auto it = std::ranges::find_if(commands_, [name](const auto& cmd) { return cmd->matches(name); });
        return it == commands_.end() ? nullptr : it->get();
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> commands;
        commands.reserve(commands_.size());
        std::ranges::transform(commands_, std::back_inserter(commands), [](const auto& cmd) { return cmd.get(); });
        return commands;
    }

    // Argument parsing

    namespace {

        bool is_common_flag(const std::string_view name) {
            return name == "help" || name == "verbose" || name == "quiet" || name == "json";
        }

        std::string_view common_short_flag(const char c) {
            switch (c) {
                case 'h': return "help";
                case 'v': return "verbose";
                case 'q': return "quiet";
                default: return {};
            }
        }

        /**
         * Walks the argument list once, consuming option values as it goes.
         */
        class ArgumentScanner {
        public:
            ArgumentScanner(const std::vector<std::string>& args, const std::vector<ArgDef>& defs)
                : args_(args), defs_(defs) {}

            ParseResult run() {
                bool options_ended = false;

                while (next_ < args_.size() && result_.success) {
                    const std::string& arg = args_[next_++];

                    if (arg.empty()) {
                        continue;
                    }
                    if (options_ended || arg.size() == 1 || arg[0] != '-') {
                        result_.args.add_positional(arg);
                    } else if (arg == "--") {
                        options_ended = true;
                    } else if (arg[1] == '-') {
                        long_option(arg.substr(2));
                    } else {
                        short_cluster(arg);
                    }
                }

                if (result_.success) {
                    for (const auto& def : defs_) {
                        if (!def.default_value.empty() && !result_.args.has(def.name)) {
                            result_.args.set(def.name, def.default_value);
                        }
                    }
                }
                return std::move(result_);
            }

        private:
            const ArgDef* by_name(const std::string& name) const {
                const auto it = std::ranges::find(defs_, name, &ArgDef::name);
                return it == defs_.end() ? nullptr : &*it;
            }

            const ArgDef* by_short(const char c) const {
                const auto it = std::ranges::find(defs_, c, &ArgDef::short_name);
                return it == defs_.end() ? nullptr : &*it;
            }

            void reject(std::string message) {
                result_.success = false;
                result_.error = std::move(message);
            }

            void long_option(std::string name) {
                std::optional<std::string> value;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    value = name.substr(eq + 1);
                    name.resize(eq);
                }

                const ArgDef* def = by_name(name);
                if (!def) {
                    if (is_common_flag(name)) {
                        result_.args.set_flag(name);
                    } else {
                        reject("Unknown option: --" + name);
                    }
                    return;
                }
                if (!def->takes_value()) {
                    result_.args.set_flag(name);
                    return;
                }

                if (!value && next_ < args_.size()) {
                    value = args_[next_++];
                }
                if (!value || value->empty()) {
                    reject("Option --" + name + " requires a value");
                    return;
                }
                result_.args.set(name, *value);
            }

            // -vq sets two flags; -t10 and "-t 10" both give top=10.
            void short_cluster(const std::string& arg) {
                for (std::size_t j = 1; j < arg.size(); ++j) {
                    const char c = arg[j];
                    const ArgDef* def = by_short(c);

                    if (!def) {
                        if (const auto common = common_short_flag(c); !common.empty()) {
                            result_.args.set_flag(std::string(common));
                        } else {
                            reject(std::string("Unknown option: -") + c);
                            return;
                        }
                        continue;
                    }
                    if (!def->takes_value()) {
                        result_.args.set_flag(def->name);
                        continue;
                    }

                    std::string value = arg.substr(j + 1);
                    if (value.empty() && next_ < args_.size()) {
                        value = args_[next_++];
                    }
                    if (value.empty()) {
                        reject(std::string("Option -") + c + " requires a value");
                    } else {
                        result_.args.set(def->name, value);
                    }
                    return;
                }
            }

            const std::vector<std::string>& args_;
            const std::vector<ArgDef>& defs_;
            std::size_t next_ = 0;
            ParseResult result_;
        };

    }  // namespace

    ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    ) {
        return ArgumentScanner(args, defs).run();
    }

}  // namespace ckscan::cli
