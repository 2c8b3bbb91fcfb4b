#include "ckscan/cli/formatter.hpp"
#include "ckscan/cli/progress.hpp"
#include "ckscan/exporters/json_exporter.hpp"
#include "ckscan/utils/path_utils.hpp"
#include "ckscan/utils/string_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace ckscan::cli {

    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* YELLOW = "\033[33m";

        bool enabled() {
            return g_colors_enabled && stdout_is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_path(const fs::path& path, const std::size_t max_width) {
        return string_utils::truncate_left(path_utils::to_forward_slashes(path), max_width);
    }

    std::string format_decimal(const double value) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << value;
        return ss.str();
    }

    const char* threshold_color(const int value, const Thresholds thresholds) {
        if (value >= thresholds.critical) return colors::RED;
        if (value >= thresholds.warning) return colors::YELLOW;
        return nullptr;
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        row.resize(columns_.size());
        rows_.push_back(std::move(row));
    }

    std::vector<std::size_t> Table::column_widths() const {
        std::vector<std::size_t> widths;
        widths.reserve(columns_.size());
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width != 0) {
                widths.push_back(columns_[i].width);
                continue;
            }
            std::size_t max_width = columns_[i].header.length();
            for (const auto& row : rows_) {
                max_width = std::max(max_width, row[i].text.length());
            }
            widths.push_back(max_width);
        }
        return widths;
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        const auto widths = column_widths();
        const bool use_color = colors::enabled();

        auto render_row = [&](const Row& row, const bool is_header) {
            for (std::size_t i = 0; i < columns_.size(); ++i) {
                const auto width = widths[i];
                std::string text = row[i].text;

                if (text.length() > width) {
                    text = width > 3 ? text.substr(0, width - 3) + "..." : text.substr(0, width);
                }

                const char* color = is_header ? colors::BOLD : row[i].color;
                if (use_color && color) {
                    out << color;
                }

                if (columns_[i].right_align) {
                    out << std::right << std::setw(static_cast<int>(width)) << text;
                } else {
                    out << std::left << std::setw(static_cast<int>(width)) << text;
                }

                if (use_color && color) {
                    out << colors::RESET;
                }

                if (i < columns_.size() - 1) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        Row header;
        for (const auto& col : columns_) {
            header.emplace_back(col.header);
        }
        render_row(header, true);

        for (std::size_t i = 0; i < columns_.size(); ++i) {
            out << std::string(widths[i], '-');
            if (i < columns_.size() - 1) {
                out << "--";
            }
        }
        out << "\n";

        for (const auto& row : rows_) {
            render_row(row, false);
        }
    }

    // ============================================================================
    // CohesionReportPrinter Implementation
    // ============================================================================

    CohesionReportPrinter::CohesionReportPrinter(std::ostream& out)
        : out_(out)
    {}

    void CohesionReportPrinter::print_classes(
        const CohesionAnalysis& analysis,
        const SortKey sort,
        const std::size_t limit
    ) const {
        const std::size_t shown = limit == 0 ? analysis.classes.size() : std::min(limit, analysis.classes.size());

        out_ << "\n";
        std::ostringstream title;
        title << "CK Metrics (Top " << shown << " by " << to_string(sort) << ")";
        if (colors::enabled()) {
            out_ << colors::BOLD << title.str() << colors::RESET << "\n";
        } else {
            out_ << title.str() << "\n";
        }
        out_ << std::string(60, '=') << "\n\n";

        Table table({
            {"Class", 0, false},
            {"Path", 0, false},
            {"WMC", 0, true},
            {"CBO", 0, true},
            {"RFC", 0, true},
            {"LCOM", 0, true},
            {"DIT", 0, true},
            {"NOC", 0, true},
            {"Methods", 0, true},
        });

        for (std::size_t i = 0; i < shown; ++i) {
            const auto& cls = analysis.classes[i];
            table.add_row({
                Cell(string_utils::truncate_left(cls.class_name, 40)),
                Cell(format_path(cls.path)),
                Cell(std::to_string(cls.wmc), threshold_color(cls.wmc, kWmcThresholds)),
                Cell(std::to_string(cls.cbo)),
                Cell(std::to_string(cls.rfc)),
                Cell(std::to_string(cls.lcom), threshold_color(cls.lcom, kLcomThresholds)),
                Cell(std::to_string(cls.dit), threshold_color(cls.dit, kDitThresholds)),
                Cell(std::to_string(cls.noc), threshold_color(cls.noc, kNocThresholds)),
                Cell(std::to_string(cls.nom)),
            });
        }

        table.render(out_);
    }

    void CohesionReportPrinter::print_summary(const CohesionSummary& summary) const {
        out_ << "\n";
        out_ << "Total Classes:          " << summary.total_classes << "\n";
        out_ << "Files With Classes:     " << summary.total_files << "\n";
        out_ << "Low Cohesion (LCOM>1):  " << summary.low_cohesion_count << "\n";
        out_ << "Avg WMC:                " << format_decimal(summary.avg_wmc) << "\n";
        out_ << "Avg CBO:                " << format_decimal(summary.avg_cbo) << "\n";
        out_ << "Avg RFC:                " << format_decimal(summary.avg_rfc) << "\n";
        out_ << "Avg LCOM:               " << format_decimal(summary.avg_lcom) << "\n";
        out_ << "Max WMC:                " << summary.max_wmc << "\n";
        out_ << "Max DIT:                " << summary.max_dit << "\n";
    }

    void CohesionReportPrinter::print_diagnostics(const std::vector<FileDiagnostic>& diagnostics, const bool list) const {
        if (diagnostics.empty()) {
            return;
        }

        out_ << "\n";
        if (colors::enabled()) out_ << colors::YELLOW;
        out_ << "Skipped files: " << diagnostics.size();
        if (colors::enabled()) out_ << colors::RESET;
        if (!list) {
            out_ << " (use -v to list them)";
        }
        out_ << "\n";

        if (!list) {
            return;
        }

        for (const auto& [path, phase, error] : diagnostics) {
            out_ << "  " << path_utils::to_forward_slashes(path)
                 << " [" << to_string(phase) << "] "
                 << code_name(error.code()) << ": " << error.message() << "\n";
        }
    }

    void CohesionReportPrinter::print_accuracy_note() const {
        out_ << "\n";
        if (colors::enabled()) out_ << colors::DIM;
        out_ << "Note: " << exporters::accuracy_note();
        if (colors::enabled()) out_ << colors::RESET;
        out_ << "\n";
    }

}  // namespace ckscan::cli
