#ifndef CKSCAN_SYNTAX_LANGUAGE_HPP
#define CKSCAN_SYNTAX_LANGUAGE_HPP

/**
 * @file language.hpp
 * @brief Source language tags and extension based detection.
 */

#include <filesystem>
#include <optional>
#include <string_view>

namespace ckscan {

    /**
     * Source languages recognized by the scanner.
     *
     * Only a subset is object-oriented and analyzed for CK metrics; the
     * others are recognized so that they can be filtered out cheaply.
     */
    enum class Language {
        Unknown,
        Java,
        CSharp,
        Cpp,
        C,
        Python,
        JavaScript,
        TypeScript,
        Tsx,
        Ruby,
        Php,
        Go,
        Rust,
        Bash
    };

    /**
     * Returns the lowercase tag used in reports ("java", "csharp", ...).
     */
    [[nodiscard]] std::string_view to_string(Language language) noexcept;

    /**
     * Parses a tag produced by to_string(Language).
     */
    [[nodiscard]] std::optional<Language> parse_language(std::string_view tag) noexcept;

    /**
     * Detects the language of a file from its extension.
     *
     * The comparison is case-insensitive. Files without a known extension
     * map to Language::Unknown.
     */
    [[nodiscard]] Language detect_language(const std::filesystem::path& path);

}  // namespace ckscan

#endif //CKSCAN_SYNTAX_LANGUAGE_HPP
