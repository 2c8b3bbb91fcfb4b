#ifndef CKSCAN_CORE_CONFIG_HPP
#define CKSCAN_CORE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief TOML configuration file.
 *
 * Example `.ckscan.toml`:
 * @code
 *     [analysis]
 *     include_tests = false
 *     max_file_size = "512KB"    # or a byte count
 *     limit_inheritance_scan = false
 *     threads = 0
 *
 *     [output]
 *     format = "text"            # text | json
 *     sort = "lcom"              # lcom | wmc | cbo | dit
 *     top = 20                   # 0 shows every class
 *
 *     [logging]
 *     level = "warn"
 * @endcode
 */

#include "ckscan/result.hpp"
#include "ckscan/error.hpp"
#include "ckscan/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ckscan::core {

    namespace fs = std::filesystem;

    enum class OutputFormat {
        Text,
        Json
    };

    [[nodiscard]] std::string_view to_string(OutputFormat format) noexcept;
    [[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view text) noexcept;

    struct AnalysisConfig {
        bool include_tests = false;
        std::uintmax_t max_file_size = 0;
        bool limit_inheritance_scan = false;
        std::size_t threads = 0;
    };

    struct OutputConfig {
        OutputFormat format = OutputFormat::Text;
        SortKey sort = SortKey::LCOM;
        std::size_t top = 20;
    };

    struct LoggingConfig {
        std::string level = "warn";
    };

    class Config {
    public:
        static constexpr std::string_view kDefaultFileName = ".ckscan.toml";

        AnalysisConfig analysis;
        OutputConfig output;
        LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @param path Config file.
         * @return The configuration, the read error when the file cannot be
         *         read, or ConfigError for malformed TOML or invalid values.
         */
        static Result<Config, Error> load_from_file(const fs::path& path);

        /**
         * Load configuration from TOML text. Keys that are absent keep their
         * defaults; unknown keys are ignored.
         *
         * @param content TOML document.
         * @param source Name used in error messages.
         */
        static Result<Config, Error> load_from_string(std::string_view content, std::string_view source = "<string>");

        static Config default_config();

        /**
         * Serialize to TOML. load_from_string(to_string()) yields an equal config.
         */
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] Result<void, Error> validate() const;
    };

}  // namespace ckscan::core

#endif //CKSCAN_CORE_CONFIG_HPP
