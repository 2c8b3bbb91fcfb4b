#ifndef CKSCAN_LOG_HPP
#define CKSCAN_LOG_HPP

/**
 * @file log.hpp
 * @brief Process-wide logging setup.
 *
 * Engine code logs through spdlog's default logger (spdlog::debug(...),
 * spdlog::warn(...)). init() replaces that logger with one named "ckscan"
 * writing to stderr, so diagnostics never mix with report output on stdout.
 */

#include <spdlog/spdlog.h>

#include <optional>
#include <string_view>

namespace ckscan::log {

    /**
     * Installs the stderr logger as spdlog's default and sets its level.
     *
     * Safe to call more than once; later calls only change the level.
     */
    void init(spdlog::level::level_enum level);

    /**
     * Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
     */
    [[nodiscard]] std::optional<spdlog::level::level_enum> parse_level(std::string_view text) noexcept;

}  // namespace ckscan::log

#endif //CKSCAN_LOG_HPP
