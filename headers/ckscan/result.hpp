#ifndef CKSCAN_RESULT_HPP
#define CKSCAN_RESULT_HPP

/**
 * @file result.hpp
 * @brief Success-or-error return type used across the engine.
 *
 * Parsing a file, loading the configuration and writing a report all return
 * a Result, so per-file failures stay visible in the type system and never
 * unwind through a worker thread.
 *
 * @code
 *     auto parsed = parser.parse_file(path);
 *     if (parsed.is_err()) {
 *         return Result<std::vector<ClassFacts>, Error>::failure(parsed.error());
 *     }
 *     auto facts = extract_class_facts(parsed.value());
 * @endcode
 */

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace ckscan {

    namespace detail {

        inline void require_state(const bool held, const char* what) {
            if (!held) {
                throw std::logic_error(what);
            }
        }

    }  // namespace detail

    /**
     * Holds exactly one of a T (success) or an E (failure).
     *
     * Reading the wrong alternative throws std::logic_error; callers check
     * is_ok() / is_err() first.
     */
    template<typename T, typename E>
    class Result {
        static constexpr std::size_t kValue = 0;
        static constexpr std::size_t kError = 1;

    public:
        [[nodiscard]] static Result success(T value) {
            return Result(std::in_place_index<kValue>, std::move(value));
        }

        [[nodiscard]] static Result failure(E error) {
            return Result(std::in_place_index<kError>, std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept { return state_.index() == kValue; }
        [[nodiscard]] bool is_err() const noexcept { return state_.index() == kError; }
        explicit operator bool() const noexcept { return is_ok(); }

        T& value() & {
            detail::require_state(is_ok(), "value() read from a failed Result");
            return std::get<kValue>(state_);
        }

        const T& value() const& {
            detail::require_state(is_ok(), "value() read from a failed Result");
            return std::get<kValue>(state_);
        }

        T&& value() && {
            detail::require_state(is_ok(), "value() read from a failed Result");
            return std::get<kValue>(std::move(state_));
        }

        E& error() & {
            detail::require_state(is_err(), "error() read from a successful Result");
            return std::get<kError>(state_);
        }

        const E& error() const& {
            detail::require_state(is_err(), "error() read from a successful Result");
            return std::get<kError>(state_);
        }

        T value_or(T fallback) const& {
            return is_ok() ? std::get<kValue>(state_) : std::move(fallback);
        }

        T value_or(T fallback) && {
            return is_ok() ? std::get<kValue>(std::move(state_)) : std::move(fallback);
        }

        /// Transforms the value; a failure passes through untouched.
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using Mapped = Result<std::invoke_result_t<F, const T&>, E>;
            if (is_err()) {
                return Mapped::failure(std::get<kError>(state_));
            }
            return Mapped::success(std::invoke(std::forward<F>(f), std::get<kValue>(state_)));
        }

        template<typename F>
        auto map(F&& f) && -> Result<std::invoke_result_t<F, T&&>, E> {
            using Mapped = Result<std::invoke_result_t<F, T&&>, E>;
            if (is_err()) {
                return Mapped::failure(std::get<kError>(std::move(state_)));
            }
            return Mapped::success(std::invoke(std::forward<F>(f), std::get<kValue>(std::move(state_))));
        }

        /// Runs the next fallible step only after a success.
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            if (is_err()) {
                return std::invoke_result_t<F, const T&>::failure(std::get<kError>(state_));
            }
            return std::invoke(std::forward<F>(f), std::get<kValue>(state_));
        }

        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            if (is_err()) {
                return std::invoke_result_t<F, T&&>::failure(std::get<kError>(std::move(state_)));
            }
            return std::invoke(std::forward<F>(f), std::get<kValue>(std::move(state_)));
        }

    private:
        template<std::size_t I, typename Arg>
        Result(std::in_place_index_t<I> tag, Arg&& arg) : state_(tag, std::forward<Arg>(arg)) {}

        std::variant<T, E> state_;
    };

    /**
     * Result of an operation that only reports whether it failed.
     */
    template<typename E>
    class Result<void, E> {
    public:
        [[nodiscard]] static Result success() { return Result(std::nullopt); }
        [[nodiscard]] static Result failure(E error) { return Result(std::move(error)); }

        [[nodiscard]] bool is_ok() const noexcept { return !error_; }
        [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }
        explicit operator bool() const noexcept { return is_ok(); }

        const E& error() const& {
            detail::require_state(is_err(), "error() read from a successful Result");
            return *error_;
        }

    private:
        explicit Result(std::optional<E> error) : error_(std::move(error)) {}

        std::optional<E> error_;
    };

}  // namespace ckscan

#endif //CKSCAN_RESULT_HPP
