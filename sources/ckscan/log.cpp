#include "ckscan/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <mutex>
#include <utility>

namespace ckscan::log {

    namespace {
        constexpr auto kLoggerName = "ckscan";

        constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 8> kLevels = {{
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"warning", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"critical", spdlog::level::critical},
            {"off", spdlog::level::off},
        }};

        std::mutex init_mutex;
    }  // namespace

    void init(const spdlog::level::level_enum level) {
        std::lock_guard lock(init_mutex);

        auto logger = spdlog::get(kLoggerName);
        if (!logger) {
            logger = spdlog::stderr_color_mt(kLoggerName);
            logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            spdlog::set_default_logger(logger);
        }

        logger->set_level(level);
    }

    std::optional<spdlog::level::level_enum> parse_level(const std::string_view text) noexcept {
        for (const auto& [name, level] : kLevels) {
            if (name == text) {
                return level;
            }
        }
        return std::nullopt;
    }

}  // namespace ckscan::log
