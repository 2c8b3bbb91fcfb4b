#include "ckscan/cli/commands/command.hpp"
#include "ckscan/cli/formatter.hpp"
#include "ckscan/cli/progress.hpp"

#include "ckscan/analysis/cohesion_analyzer.hpp"
#include "ckscan/core/config.hpp"
#include "ckscan/exporters/json_exporter.hpp"
#include "ckscan/log.hpp"
#include "ckscan/syntax/tree_sitter_parser.hpp"
#include "ckscan/utils/file_utils.hpp"
#include "ckscan/utils/string_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace ckscan::cli {

    namespace fs = std::filesystem;

    namespace {

        Result<core::Config, Error> load_config(const ParsedArgs& args) {
            if (const auto path = args.get("config")) {
                return core::Config::load_from_file(*path);
            }
            if (const fs::path local(core::Config::kDefaultFileName); fs::exists(local)) {
                return core::Config::load_from_file(local);
            }
            return Result<core::Config, Error>::success(core::Config::default_config());
        }

        /**
         * Applies command-line overrides on top of the file configuration.
         */
        Result<void, Error> apply_overrides(const ParsedArgs& args, core::Config& config) {
            if (args.has("top")) {
                const auto top = args.get_count("top");
                if (!top) {
                    return Result<void, Error>::failure(
                        Error::invalid_argument("--top expects a non-negative integer"));
                }
                config.output.top = static_cast<std::size_t>(*top);
            }

            if (const auto sort = args.get("sort")) {
                const auto key = parse_sort_key(*sort);
                if (!key) {
                    return Result<void, Error>::failure(
                        Error::invalid_argument("--sort must be one of lcom, wmc, cbo, dit", *sort));
                }
                config.output.sort = *key;
            }

            if (const auto format = args.get("format")) {
                const auto parsed = core::parse_output_format(*format);
                if (!parsed) {
                    return Result<void, Error>::failure(
                        Error::invalid_argument("--format must be text or json", *format));
                }
                config.output.format = *parsed;
            }
            if (args.get_flag("json")) {
                config.output.format = core::OutputFormat::Json;
            }

            if (args.get_flag("include-tests")) {
                config.analysis.include_tests = true;
            }

            if (const auto size = args.get("max-file-size")) {
                const auto bytes = string_utils::parse_byte_size(*size);
                if (!bytes) {
                    return Result<void, Error>::failure(
                        Error::invalid_argument("--max-file-size expects a byte count such as 524288 or 512KB", *size));
                }
                config.analysis.max_file_size = *bytes;
            }

            if (args.has("threads")) {
                const auto threads = args.get_count("threads");
                if (!threads) {
                    return Result<void, Error>::failure(
                        Error::invalid_argument("--threads expects a non-negative integer"));
                }
                config.analysis.threads = static_cast<std::size_t>(*threads);
            }

            return config.validate();
        }

        Result<std::vector<fs::path>, Error> collect_files(const std::vector<std::string>& roots) {
            std::vector<fs::path> files;
            for (const auto& root : roots) {
                auto collected = file_utils::collect_source_files(root);
                if (collected.is_err()) {
                    return Result<std::vector<fs::path>, Error>::failure(collected.error());
                }
                auto& found = collected.value();
                files.insert(files.end(), found.begin(), found.end());
            }

            std::ranges::sort(files);
            const auto [first, last] = std::ranges::unique(files);
            files.erase(first, last);
            return Result<std::vector<fs::path>, Error>::success(std::move(files));
        }

    }  // namespace

    /**
     * Cohesion command - CK metrics per class.
     */
    class CohesionCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "cohesion";
        }

        [[nodiscard]] std::vector<std::string_view> aliases() const override {
            return {"ck"};
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Compute CK metrics (WMC, CBO, RFC, LCOM4, DIT, NOC) for object-oriented classes";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: ckscan cohesion [OPTIONS] <paths...>\n"
                   "\n"
                   "Examples:\n"
                   "  ckscan cohesion src/\n"
                   "  ckscan ck --sort wmc --top 50 app/ lib/\n"
                   "  ckscan cohesion --json --output ck.json .";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            // Defaults come from the config file, so none are set here.
            return {
                {"top", 't', "N", "Number of classes to show, 0 = all (default: 20)", ""},
                {"sort", 's', "KEY", "Sort by lcom, wmc, cbo or dit (default: lcom)", ""},
                {"include-tests", 0, "", "Include test files in the analysis", ""},
                {"max-file-size", 0, "SIZE", "Skip files larger than this, e.g. 512KB (default: no limit)", ""},
                {"threads", 'j', "N", "Worker threads, 0 = all cores", ""},
                {"config", 'c', "FILE", "Configuration file (default: ./.ckscan.toml if present)", ""},
                {"output", 'o', "FILE", "Write the report to a file instead of stdout", ""},
                {"format", 'f', "FORMAT", "Output format: text or json (default: text)", ""},
                {"no-color", 0, "", "Disable colored output", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().empty()) {
                return "No paths specified. Use 'ckscan cohesion <paths...>'";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_verbosity(args);

            auto config_result = load_config(args);
            if (config_result.is_err()) {
                print_error(config_result.error().to_string());
                return 1;
            }
            auto config = std::move(config_result).value();

            if (auto applied = apply_overrides(args, config); applied.is_err()) {
                print_error(applied.error().to_string());
                return 1;
            }

            auto level = log::parse_level(config.logging.level).value_or(spdlog::level::warn);
            if (is_verbose()) {
                level = spdlog::level::debug;
            } else if (is_quiet()) {
                level = spdlog::level::err;
            }
            log::init(level);

            const auto output_file = args.get("output");
            const bool json = config.output.format == core::OutputFormat::Json;
            colors::set_enabled(!args.get_flag("no-color") && !output_file);

            auto files_result = collect_files(args.positional());
            if (files_result.is_err()) {
                print_error(files_result.error().to_string());
                return 1;
            }
            const auto& files = files_result.value();

            if (files.empty() && !json) {
                print("No source files found");
                return 0;
            }

            print_verbose("Found " + std::to_string(files.size()) + " source files");

            analysis::CohesionOptions options;
            options.skip_test_files = !config.analysis.include_tests;
            options.max_file_size = config.analysis.max_file_size;
            options.limit_inheritance_scan = config.analysis.limit_inheritance_scan;
            options.threads = config.analysis.threads;

            analysis::CohesionAnalyzer analyzer(std::make_shared<syntax::TreeSitterParser>(), options);

            auto result = [&] {
                const ScopedProgress progress(files.size(), "Analyzing CK metrics", !is_quiet());
                return analyzer.analyze_project_with_progress(files, [&progress] { progress.tick(); });
            }();
            analyzer.close();

            if (result.is_err()) {
                print_error("Cohesion analysis failed: " + result.error().to_string());
                return 1;
            }

            auto analysis = std::move(result).value();
            analysis.sort_by(config.output.sort);

            std::ofstream file;
            if (output_file) {
                file.open(*output_file);
                if (!file) {
                    print_error("Failed to open output file: " + *output_file);
                    return 1;
                }
            }
            std::ostream& out = output_file ? static_cast<std::ostream&>(file) : std::cout;

            if (json) {
                if (auto exported = exporters::export_to_stream(out, analysis); exported.is_err()) {
                    print_error(exported.error().to_string());
                    return 1;
                }
            } else {
                write_text_report(out, analysis, config.output);
            }

            if (output_file) {
                print_verbose("Results written to " + *output_file);
            }
            return 0;
        }

    private:
        void write_text_report(std::ostream& out, const CohesionAnalysis& analysis,
                               const core::OutputConfig& output) const {
            const CohesionReportPrinter printer(out);

            if (analysis.classes.empty()) {
                if (colors::enabled()) out << colors::YELLOW;
                out << "No OO classes found (CK metrics only apply to Java, Python, TypeScript, etc.)";
                if (colors::enabled()) out << colors::RESET;
                out << "\n";
                printer.print_diagnostics(analysis.diagnostics, is_verbose());
                return;
            }

            printer.print_classes(analysis, output.sort, output.top);
            printer.print_summary(analysis.summary);
            printer.print_diagnostics(analysis.diagnostics, is_verbose());
            printer.print_accuracy_note();
        }
    };

    namespace {
        struct CohesionCommandRegistrar {
            CohesionCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<CohesionCommand>()
                );
            }
        } cohesion_registrar;
    }

}  // namespace ckscan::cli
