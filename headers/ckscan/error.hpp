#ifndef CKSCAN_ERROR_HPP
#define CKSCAN_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error value carried by Result<T, Error>.
 *
 * An Error is a code, a message and an optional context string, which is
 * usually the path of the file being processed. Per-file errors end up as
 * FileDiagnostic entries in the analysis; the rest stop the command.
 *
 * @code
 *     auto parsed = parser.parse_file("src/Foo.java");
 *     if (parsed.is_err()) {
 *         std::cerr << parsed.error() << "\n";
 *         // [ParseError] parser returned no tree (context: src/Foo.java)
 *     }
 * @endcode
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace ckscan {

    enum class ErrorCode {
        None,
        InvalidArgument,      ///< Bad option or config value
        NotFound,             ///< Missing file or directory
        ParseError,           ///< No syntax tree could be produced
        IoError,              ///< Read or write failed
        ConfigError,          ///< Unreadable or invalid configuration
        UnsupportedLanguage,  ///< No grammar or capability record
        AnalysisError,        ///< Metric extraction failed
        LimitExceeded,        ///< Input over a configured limit
        InternalError         ///< Anything unexpected, including worker exceptions
    };

    /**
     * Stable name of an error code, used in reports and logs.
     */
    inline const char* code_name(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:                return "None";
            case ErrorCode::InvalidArgument:     return "InvalidArgument";
            case ErrorCode::NotFound:            return "NotFound";
            case ErrorCode::ParseError:          return "ParseError";
            case ErrorCode::IoError:             return "IoError";
            case ErrorCode::ConfigError:         return "ConfigError";
            case ErrorCode::UnsupportedLanguage: return "UnsupportedLanguage";
            case ErrorCode::AnalysisError:       return "AnalysisError";
            case ErrorCode::LimitExceeded:       return "LimitExceeded";
            case ErrorCode::InternalError:       return "InternalError";
        }
        return "Unknown";
    }

    class Error {
    public:
        using Context = std::optional<std::string>;

        Error(const ErrorCode code, std::string message, Context context = std::nullopt)
            : code_(code), message_(std::move(message)), context_(std::move(context)) {}

        static Error invalid_argument(std::string message, Context context = std::nullopt) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, Context context = std::nullopt) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error unsupported_language(std::string message, Context context = std::nullopt) {
            return {ErrorCode::UnsupportedLanguage, std::move(message), std::move(context)};
        }

        static Error analysis_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::AnalysisError, std::move(message), std::move(context)};
        }

        static Error limit_exceeded(std::string message, Context context = std::nullopt) {
            return {ErrorCode::LimitExceeded, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }
        [[nodiscard]] const std::string& message() const noexcept { return message_; }
        [[nodiscard]] const Context& context() const noexcept { return context_; }
        [[nodiscard]] bool has_context() const noexcept { return context_.has_value(); }

        /**
         * Copy of this error with more context, joined to any existing
         * context by "; ".
         */
        [[nodiscard]] Error with_context(const std::string& more) const {
            return {code_, message_, context_ ? *context_ + "; " + more : more};
        }

        /// "[Code] message" plus " (context: ...)" when there is context.
        [[nodiscard]] std::string to_string() const {
            std::string text = std::string("[") + code_name(code_) + "] " + message_;
            if (context_) {
                text += " (context: " + *context_ + ")";
            }
            return text;
        }

        bool operator==(const Error&) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        Context context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, const ErrorCode code) {
        return os << code_name(code);
    }

}  // namespace ckscan

#endif //CKSCAN_ERROR_HPP
