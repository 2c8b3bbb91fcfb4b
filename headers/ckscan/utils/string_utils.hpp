#ifndef CKSCAN_UTILS_STRING_UTILS_HPP
#define CKSCAN_UTILS_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers shared by the extractors, the config layer and the CLI.
 */

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <sstream>

namespace ckscan::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    /**
     * Trims whitespace from both ends of a string.
     */
    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits a string on a delimiter. Empty parts are kept.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::ostringstream oss;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                oss << delimiter;
            }
            oss << part;
            first = false;
        }
        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.substr(s.size() - suffix.size()) == suffix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * Removes a single leading character if present ("$count" -> "count").
     */
    inline std::string_view strip_leading(const std::string_view s, const char c) noexcept {
        if (!s.empty() && s.front() == c) {
            return s.substr(1);
        }
        return s;
    }

    /**
     * Truncates a string to at most max_width characters, marking the cut
     * with "..." at the start so the tail of a path stays visible.
     */
    inline std::string truncate_left(const std::string_view s, const std::size_t max_width) {
        if (s.size() <= max_width) {
            return std::string(s);
        }
        if (max_width <= 3) {
            return std::string(s.substr(s.size() - max_width));
        }
        return "..." + std::string(s.substr(s.size() - (max_width - 3)));
    }

    /**
     * Parses a byte size such as "4096", "512KB", "2MB" or "1GB".
     *
     * Units are case-insensitive and use powers of 1024.
     *
     * @return The size in bytes, or nullopt if the text is not a size.
     */
    inline std::optional<std::uint64_t> parse_byte_size(std::string_view text) {
        text = trim(text);
        if (text.empty()) {
            return std::nullopt;
        }

        std::uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr == text.data()) {
            return std::nullopt;
        }

        const std::string unit = to_lower(trim(std::string_view(ptr, static_cast<std::size_t>(text.data() + text.size() - ptr))));
        if (unit.empty() || unit == "b") {
            return value;
        }
        if (unit == "kb" || unit == "k") {
            return value * 1024ULL;
        }
        if (unit == "mb" || unit == "m") {
            return value * 1024ULL * 1024ULL;
        }
        if (unit == "gb" || unit == "g") {
            return value * 1024ULL * 1024ULL * 1024ULL;
        }
        return std::nullopt;
    }

    /**
     * Formats a duration given in milliseconds ("840ms", "2.31s").
     */
    inline std::string format_millis(const long long millis) {
        std::ostringstream oss;
        if (millis >= 1000) {
            oss.precision(2);
            oss << std::fixed << static_cast<double>(millis) / 1000.0 << "s";
        } else {
            oss << millis << "ms";
        }
        return oss.str();
    }

}  // namespace ckscan::string_utils

#endif //CKSCAN_UTILS_STRING_UTILS_HPP
