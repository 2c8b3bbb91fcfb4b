#include "ckscan/syntax/language.hpp"
#include "ckscan/utils/string_utils.hpp"

#include <array>
#include <utility>

namespace ckscan {

    namespace {

        constexpr std::array<std::pair<std::string_view, Language>, 13> kLanguageTags = {{
            {"java", Language::Java},
            {"csharp", Language::CSharp},
            {"cpp", Language::Cpp},
            {"c", Language::C},
            {"python", Language::Python},
            {"javascript", Language::JavaScript},
            {"typescript", Language::TypeScript},
            {"tsx", Language::Tsx},
            {"ruby", Language::Ruby},
            {"php", Language::Php},
            {"go", Language::Go},
            {"rust", Language::Rust},
            {"bash", Language::Bash},
        }};

        constexpr std::array<std::pair<std::string_view, Language>, 24> kExtensions = {{
            {".java", Language::Java},
            {".cs", Language::CSharp},
            {".cpp", Language::Cpp},
            {".cc", Language::Cpp},
            {".cxx", Language::Cpp},
            {".hpp", Language::Cpp},
            {".hxx", Language::Cpp},
            {".c", Language::C},
            {".h", Language::C},
            {".py", Language::Python},
            {".pyw", Language::Python},
            {".pyi", Language::Python},
            {".js", Language::JavaScript},
            {".mjs", Language::JavaScript},
            {".cjs", Language::JavaScript},
            {".ts", Language::TypeScript},
            {".tsx", Language::Tsx},
            {".jsx", Language::Tsx},
            {".rb", Language::Ruby},
            {".php", Language::Php},
            {".go", Language::Go},
            {".rs", Language::Rust},
            {".sh", Language::Bash},
            {".bash", Language::Bash},
        }};

    }  // namespace

    std::string_view to_string(const Language language) noexcept {
        for (const auto& [tag, lang] : kLanguageTags) {
            if (lang == language) {
                return tag;
            }
        }
        return "unknown";
    }

    std::optional<Language> parse_language(const std::string_view tag) noexcept {
        for (const auto& [name, lang] : kLanguageTags) {
            if (name == tag) {
                return lang;
            }
        }
        return std::nullopt;
    }

    Language detect_language(const std::filesystem::path& path) {
        const std::string ext = string_utils::to_lower(path.extension().string());
        if (ext.empty()) {
            return Language::Unknown;
        }

        for (const auto& [known, lang] : kExtensions) {
            if (known == ext) {
                return lang;
            }
        }
        return Language::Unknown;
    }

}  // namespace ckscan
