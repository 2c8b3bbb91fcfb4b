#include "ckscan/cli/progress.hpp"
#include "ckscan/utils/string_utils.hpp"

#include <algorithm>
#include <iostream>

#ifdef _WIN32
#include <windows.h>
#include <io.h>
#else
#include <unistd.h>
#include <sys/ioctl.h>
#endif

namespace ckscan::cli {

    bool is_tty() {
#ifdef _WIN32
        return _isatty(_fileno(stderr)) != 0;
#else
        return isatty(STDERR_FILENO) != 0;
#endif
    }

    bool stdout_is_tty() {
#ifdef _WIN32
        return _isatty(_fileno(stdout)) != 0;
#else
        return isatty(STDOUT_FILENO) != 0;
#endif
    }

    std::size_t terminal_width() {
        constexpr std::size_t fallback = 80;
#ifdef _WIN32
        CONSOLE_SCREEN_BUFFER_INFO info;
        if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &info)) {
            return static_cast<std::size_t>(info.srWindow.Right - info.srWindow.Left + 1);
        }
#else
        if (winsize size{}; ioctl(STDERR_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 0) {
            return size.ws_col;
        }
#endif
        return fallback;
    }

    ProgressBar::ProgressBar(const std::size_t total, const std::string_view label)
        : total_(total)
        , label_(label)
        , started_(std::chrono::steady_clock::now())
        , visible_(is_tty())
    {
        draw();
    }

    ProgressBar::~ProgressBar() {
        finish();
    }

    void ProgressBar::tick() {
        if (finished_ || current_ >= total_) {
            return;
        }
        ++current_;
        draw();
    }

    void ProgressBar::finish() {
        if (finished_) {
            return;
        }
        finished_ = true;
        current_ = total_;
        if (visible_) {
            const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started_);
            std::cerr << "\r" << line() << " in " << string_utils::format_millis(took.count()) << "\n" << std::flush;
        }
    }

    double ProgressBar::fraction() const noexcept {
        return total_ == 0 ? 1.0 : static_cast<double>(current_) / static_cast<double>(total_);
    }

    std::string ProgressBar::line() const {
        const auto filled = static_cast<std::size_t>(fraction() * static_cast<double>(kWidth));

        std::string out = label_.empty() ? "" : label_ + " ";
        out += "[";
        for (std::size_t i = 0; i < kWidth; ++i) {
            out += i < filled ? "█" : "░";
        }
        out += "] " + std::to_string(static_cast<int>(fraction() * 100.0)) + "% (" +
               std::to_string(current_) + "/" + std::to_string(total_) + ")";
        return out;
    }

    void ProgressBar::draw() const {
        if (!visible_) {
            return;
        }
        // Pad to the terminal width so a shorter line erases the previous one.
        // Each bar cell is a three-byte UTF-8 sequence.
        auto text = line();
        const auto columns = text.size() - 2 * kWidth;
        if (const auto width = terminal_width(); columns + 1 < width) {
            text.append(width - columns - 1, ' ');
        }
        std::cerr << "\r" << text << std::flush;
    }

    ScopedProgress::ScopedProgress(const std::size_t total, const std::string_view label, const bool enabled) {
        if (enabled) {
            bar_ = std::make_unique<ProgressBar>(total, label);
        }
    }

    ScopedProgress::~ScopedProgress() {
        if (bar_) {
            bar_->finish();
        }
    }

}  // namespace ckscan::cli
