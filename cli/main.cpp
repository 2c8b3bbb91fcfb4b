#include "ckscan/cli/commands/command.hpp"
#include "ckscan/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage() {
        std::cout << ckscan::PROJECT_NAME << " " << ckscan::VERSION_STRING << "\n\n";
        std::cout << "Usage: " << ckscan::PROJECT_SHORT_NAME << " <command> [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : ckscan::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "  " << std::left << std::setw(12) << "version" << "Print the version\n";
        std::cout << "  " << std::left << std::setw(12) << "help" << "Show help for a command\n";
        std::cout << "\nRun '" << ckscan::PROJECT_SHORT_NAME << " help <command>' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    using ckscan::cli::CommandRegistry;

    const std::vector<std::string> args(argv + 1, argv + argc);

    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string& command_name = args.front();

    if (command_name == "help" || command_name == "-h" || command_name == "--help") {
        if (args.size() > 1) {
            if (const auto* cmd = CommandRegistry::instance().find(args[1])) {
                cmd->print_help();
                return 0;
            }
            std::cerr << "error: Unknown command: " << args[1] << "\n";
            return 1;
        }
        print_usage();
        return 0;
    }

    if (command_name == "version" || command_name == "--version") {
        std::cout << ckscan::PROJECT_SHORT_NAME << " " << ckscan::VERSION_STRING << "\n";
        return 0;
    }

    auto* cmd = CommandRegistry::instance().find(command_name);
    if (!cmd) {
        std::cerr << "error: Unknown command: " << command_name << "\n\n";
        print_usage();
        return 1;
    }

    const std::vector<std::string> command_args(args.begin() + 1, args.end());
    const auto parsed = ckscan::cli::parse_arguments(command_args, cmd->arguments());
    if (!parsed.success) {
        std::cerr << "error: " << parsed.error << "\n";
        return 1;
    }

    if (!parsed.args.get_flag("help")) {
        if (const auto problem = cmd->validate(parsed.args); !problem.empty()) {
            std::cerr << "error: " << problem << "\n";
            return 1;
        }
    }

    try {
        return cmd->execute(parsed.args);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
