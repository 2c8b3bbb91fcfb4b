#include "ckscan/core/config.hpp"
#include "ckscan/log.hpp"
#include "ckscan/utils/file_utils.hpp"
#include "ckscan/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <sstream>
#include <vector>

namespace ckscan::core {

    namespace {

        constexpr std::size_t kMaxThreads = 1024;

        using Problems = std::vector<std::string>;

        std::string key_name(const std::string_view section, const std::string_view key) {
            return std::string(section) + "." + std::string(key);
        }

        void read_bool(const toml::table& table, const std::string_view section, const std::string_view key,
                       bool& out, Problems& problems) {
            const auto* node = table.get(key);
            if (!node) {
                return;
            }
            if (const auto value = node->value<bool>()) {
                out = *value;
            } else {
                problems.push_back(key_name(section, key) + " must be a boolean");
            }
        }

        void read_count(const toml::table& table, const std::string_view section, const std::string_view key,
                        std::size_t& out, Problems& problems) {
            const auto* node = table.get(key);
            if (!node) {
                return;
            }
            const auto value = node->value<std::int64_t>();
            if (!value || *value < 0) {
                problems.push_back(key_name(section, key) + " must be a non-negative integer");
                return;
            }
            out = static_cast<std::size_t>(*value);
        }

        void read_string(const toml::table& table, const std::string_view section, const std::string_view key,
                         std::string& out, Problems& problems) {
            const auto* node = table.get(key);
            if (!node) {
                return;
            }
            if (const auto value = node->value<std::string>()) {
                out = *value;
            } else {
                problems.push_back(key_name(section, key) + " must be a string");
            }
        }

        /// Accepts a byte count or a size string such as "512KB".
        void read_byte_size(const toml::table& table, const std::string_view section, const std::string_view key,
                            std::uintmax_t& out, Problems& problems) {
            const auto* node = table.get(key);
            if (!node) {
                return;
            }
            if (node->is_integer()) {
                const auto value = node->value<std::int64_t>();
                if (value && *value >= 0) {
                    out = static_cast<std::uintmax_t>(*value);
                    return;
                }
            } else if (const auto text = node->value<std::string>()) {
                if (const auto bytes = string_utils::parse_byte_size(*text)) {
                    out = *bytes;
                    return;
                }
            }
            problems.push_back(key_name(section, key) + " must be a byte count or a size like \"512KB\"");
        }

        const toml::table* section_of(const toml::table& root, const std::string_view name, Problems& problems) {
            const auto* node = root.get(name);
            if (!node) {
                return nullptr;
            }
            const auto* table = node->as_table();
            if (!table) {
                problems.push_back("[" + std::string(name) + "] must be a table");
            }
            return table;
        }

    }  // namespace

    std::string_view to_string(const OutputFormat format) noexcept {
        switch (format) {
            case OutputFormat::Text: return "text";
            case OutputFormat::Json: return "json";
        }
        return "text";
    }

    std::optional<OutputFormat> parse_output_format(const std::string_view text) noexcept {
        if (text == "text") return OutputFormat::Text;
        if (text == "json") return OutputFormat::Json;
        return std::nullopt;
    }

    Result<Config, Error> Config::load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config, Error>::failure(content.error());
        }
        return load_from_string(content.value(), path.string());
    }

    Result<Config, Error> Config::load_from_string(const std::string_view content, const std::string_view source) {
        toml::table root;
        try {
            root = toml::parse(content, source);
        } catch (const toml::parse_error& err) {
            std::ostringstream message;
            message << "Failed to parse TOML configuration: " << err.description()
                    << " (line " << err.source().begin.line << ", column " << err.source().begin.column << ")";
            return Result<Config, Error>::failure(Error::config_error(message.str(), std::string(source)));
        }

        Config config;
        Problems problems;

        if (const auto* analysis = section_of(root, "analysis", problems)) {
            read_bool(*analysis, "analysis", "include_tests", config.analysis.include_tests, problems);
            read_byte_size(*analysis, "analysis", "max_file_size", config.analysis.max_file_size, problems);
            read_bool(*analysis, "analysis", "limit_inheritance_scan", config.analysis.limit_inheritance_scan, problems);
            read_count(*analysis, "analysis", "threads", config.analysis.threads, problems);
        }

        if (const auto* output = section_of(root, "output", problems)) {
            std::string format(to_string(config.output.format));
            read_string(*output, "output", "format", format, problems);
            if (const auto parsed = parse_output_format(format)) {
                config.output.format = *parsed;
            } else {
                problems.push_back("output.format must be \"text\" or \"json\", got \"" + format + "\"");
            }

            std::string sort(to_string(config.output.sort));
            read_string(*output, "output", "sort", sort, problems);
            if (const auto parsed = parse_sort_key(sort)) {
                config.output.sort = *parsed;
            } else {
                problems.push_back("output.sort must be one of lcom, wmc, cbo, dit, got \"" + sort + "\"");
            }

            read_count(*output, "output", "top", config.output.top, problems);
        }

        if (const auto* logging = section_of(root, "logging", problems)) {
            read_string(*logging, "logging", "level", config.logging.level, problems);
        }

        if (!problems.empty()) {
            return Result<Config, Error>::failure(Error::config_error(
                "Invalid configuration:\n  " + string_utils::join(problems, "\n  "),
                std::string(source)
            ));
        }

        if (auto valid = config.validate(); valid.is_err()) {
            return Result<Config, Error>::failure(valid.error().with_context(std::string(source)));
        }

        return Result<Config, Error>::success(std::move(config));
    }

    Config Config::default_config() {
        return Config{};
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[analysis]\n";
        ss << "include_tests = " << (analysis.include_tests ? "true" : "false") << "\n";
        ss << "max_file_size = " << analysis.max_file_size << "\n";
        ss << "limit_inheritance_scan = " << (analysis.limit_inheritance_scan ? "true" : "false") << "\n";
        ss << "threads = " << analysis.threads << "\n\n";

        ss << "[output]\n";
        ss << "format = \"" << core::to_string(output.format) << "\"\n";
        ss << "sort = \"" << ckscan::to_string(output.sort) << "\"\n";
        ss << "top = " << output.top << "\n\n";

        ss << "[logging]\n";
        ss << "level = \"" << logging.level << "\"\n";

        return ss.str();
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (analysis.threads > kMaxThreads) {
            errors.push_back("analysis.threads must not exceed " + std::to_string(kMaxThreads));
        }

        if (!log::parse_level(logging.level)) {
            errors.push_back("logging.level \"" + logging.level + "\" is not one of trace, debug, info, warn, error, critical, off");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(Error::config_error(
                "Configuration validation failed:\n  " + string_utils::join(errors, "\n  ")
            ));
        }

        return Result<void, Error>::success();
    }

}  // namespace ckscan::core
