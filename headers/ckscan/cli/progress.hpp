#ifndef CKSCAN_CLI_PROGRESS_HPP
#define CKSCAN_CLI_PROGRESS_HPP

/**
 * @file progress.hpp
 * @brief Terminal progress bar for the file analysis loop.
 *
 * The bar is drawn on stderr so that stdout can carry a JSON report, and
 * only when stderr is a terminal.
 */

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace ckscan::cli {

    /**
     * Counts processed files out of a known total.
     *
     * tick() is not synchronized; FileProcessor serializes progress
     * callbacks, so worker threads may call it through one.
     */
    class ProgressBar {
    public:
        static constexpr std::size_t kWidth = 40;

        ProgressBar(std::size_t total, std::string_view label);
        ~ProgressBar();

        ProgressBar(const ProgressBar&) = delete;
        ProgressBar& operator=(const ProgressBar&) = delete;

        void tick();

        /// Fills the bar and prints the elapsed time. Idempotent.
        void finish();

        [[nodiscard]] std::size_t current() const noexcept { return current_; }
        [[nodiscard]] std::size_t total() const noexcept { return total_; }

        /// Fraction done, 1.0 for an empty total.
        [[nodiscard]] double fraction() const noexcept;

        /// Renders the bar line without the leading carriage return.
        [[nodiscard]] std::string line() const;

    private:
        void draw() const;

        std::size_t total_;
        std::size_t current_ = 0;
        std::string label_;
        std::chrono::steady_clock::time_point started_;
        bool visible_;
        bool finished_ = false;
    };

    /**
     * Finishes the bar when the scope ends. A disabled ScopedProgress draws
     * nothing and its ticks are no-ops.
     */
    class ScopedProgress {
    public:
        ScopedProgress(std::size_t total, std::string_view label, bool enabled = true);
        ~ScopedProgress();

        void tick() const {
            if (bar_) bar_->tick();
        }

    private:
        std::unique_ptr<ProgressBar> bar_;
    };

    /// True when stderr is a terminal.
    [[nodiscard]] bool is_tty();

    /// True when stdout is a terminal.
    [[nodiscard]] bool stdout_is_tty();

    [[nodiscard]] std::size_t terminal_width();

}  // namespace ckscan::cli

#endif //CKSCAN_CLI_PROGRESS_HPP
