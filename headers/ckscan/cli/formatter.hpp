#ifndef CKSCAN_CLI_FORMATTER_HPP
#define CKSCAN_CLI_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Text rendering of cohesion results.
 */

#include "ckscan/types.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ckscan::cli {

    namespace fs = std::filesystem;

    /**
     * Terminal color codes.
     */
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* YELLOW;

        /**
         * Returns true if colors should be used on stdout.
         */
        bool enabled();

        /**
         * Enable/disable colors globally.
         */
        void set_enabled(bool enable);

    }  // namespace colors

    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
    };

    /**
     * One table cell. The color is applied around the padded text so that
     * escape sequences never count toward the column width.
     */
    struct Cell {
        Cell() = default;
        Cell(std::string text, const char* color = nullptr)
            : text(std::move(text)), color(color) {}
        Cell(const char* text, const char* color = nullptr)
            : text(text), color(color) {}

        std::string text;
        const char* color = nullptr;
    };

    using Row = std::vector<Cell>;

    /**
     * Table formatter for aligned output.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);

        [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }

        [[nodiscard]] std::string render() const;

        void render(std::ostream& out) const;

    private:
        [[nodiscard]] std::vector<std::size_t> column_widths() const;

        std::vector<Column> columns_;
        std::vector<Row> rows_;
    };

    /**
     * Formats a file path for display, truncating from the left.
     */
    [[nodiscard]] std::string format_path(const fs::path& path, std::size_t max_width = 50);

    /**
     * Formats a value with one decimal place.
     */
    [[nodiscard]] std::string format_decimal(double value);

    /**
     * Threshold pair for metric coloring. A value at or above `critical` is
     * red, at or above `warning` yellow, otherwise uncolored.
     */
    struct Thresholds {
        int warning;
        int critical;
    };

    inline constexpr Thresholds kLcomThresholds{2, 4};
    inline constexpr Thresholds kWmcThresholds{16, 31};
    inline constexpr Thresholds kDitThresholds{4, 5};
    inline constexpr Thresholds kNocThresholds{4, 6};

    [[nodiscard]] const char* threshold_color(int value, Thresholds thresholds);

    /**
     * Prints the cohesion report in text form.
     */
    class CohesionReportPrinter {
    public:
        explicit CohesionReportPrinter(std::ostream& out);

        /**
         * Prints the class table.
         *
         * @param analysis Analysis whose classes are already in display order.
         * @param sort Key named in the table title.
         * @param limit Maximum rows (0 = all).
         */
        void print_classes(const CohesionAnalysis& analysis, SortKey sort, std::size_t limit) const;

        void print_summary(const CohesionSummary& summary) const;

        /**
         * Prints the skipped-file count, and the files themselves when
         * `list` is set.
         */
        void print_diagnostics(const std::vector<FileDiagnostic>& diagnostics, bool list) const;

        void print_accuracy_note() const;

    private:
        std::ostream& out_;
    };

}  // namespace ckscan::cli

#endif //CKSCAN_CLI_FORMATTER_HPP
