#ifndef CKSCAN_UTILS_PATH_UTILS_HPP
#define CKSCAN_UTILS_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Path heuristics used to filter the analyzed file set.
 *
 * Both heuristics work on the textual path only; nothing is read from disk.
 * Paths are compared with forward slashes so that Windows style input
 * behaves the same way.
 */

#include "ckscan/utils/string_utils.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace ckscan::path_utils {

    namespace fs = std::filesystem;

    /**
     * Converts a path to use forward slashes.
     */
    inline std::string to_forward_slashes(const fs::path& path) {
        std::string result = path.generic_string();
        std::ranges::replace(result, '\\', '/');
        return result;
    }

    /**
     * Returns true if the path looks like a test source.
     *
     * Recognized conventions:
     * - Go: *_test.go
     * - Python: test_*.py, *_test.py
     * - JS/TS: *.test.{js,jsx,ts,tsx}, *.spec.{js,jsx,ts,tsx}
     * - Ruby: test_*.rb, *_test.rb, *_spec.rb
     * - Java: Test*.java, *Test.java
     * - C#: *Test.cs, *Tests.cs
     * - any file under a tests/, test/, __tests__/ or spec/ directory
     */
    inline bool is_test_file(const fs::path& path) {
        using string_utils::ends_with;
        using string_utils::starts_with;

        const std::string p = to_forward_slashes(path);
        const std::string base = path.filename().string();

        if (ends_with(p, "_test.go") || ends_with(p, "_test.py") ||
            ends_with(p, "_test.rb") || ends_with(p, "_spec.rb")) {
            return true;
        }

        if (starts_with(base, "test_")) {
            return true;
        }

        static constexpr std::array<std::string_view, 8> script_suffixes = {
            ".test.ts", ".test.js", ".spec.ts", ".spec.js",
            ".test.tsx", ".spec.tsx", ".test.jsx", ".spec.jsx"
        };
        for (const auto suffix : script_suffixes) {
            if (ends_with(p, suffix)) {
                return true;
            }
        }

        if (ends_with(p, "Test.java") || (starts_with(base, "Test") && ends_with(p, ".java"))) {
            return true;
        }

        if (ends_with(p, "Tests.cs") || ends_with(p, "Test.cs")) {
            return true;
        }

        // Leading slash so that relative paths like "tests/a.py" match too.
        const std::string rooted = "/" + p;
        static constexpr std::array<std::string_view, 4> test_dirs = {
            "/tests/", "/test/", "/__tests__/", "/spec/"
        };
        for (const auto dir : test_dirs) {
            if (string_utils::contains(rooted, dir)) {
                return true;
            }
        }

        return false;
    }

    inline constexpr std::array<std::string_view, 8> vendor_directory_names = {
        "vendor", "node_modules", "third_party", "external",
        ".cargo", "site-packages", "venv", ".venv"
    };

    /**
     * Returns true if a single directory name denotes vendored code.
     */
    inline bool is_vendor_directory(const std::string_view name) noexcept {
        return std::ranges::find(vendor_directory_names, name) != vendor_directory_names.end();
    }

}  // namespace ckscan::path_utils

#endif //CKSCAN_UTILS_PATH_UTILS_HPP
