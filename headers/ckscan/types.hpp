#ifndef CKSCAN_TYPES_HPP
#define CKSCAN_TYPES_HPP

/**
 * @file types.hpp
 * @brief Result data model of a cohesion analysis run.
 *
 * - ClassMetrics: the CK numbers for one discovered class
 * - CohesionSummary: project-wide maxima, averages and counts
 * - FileDiagnostic: a file that was skipped or failed, and why
 * - CohesionAnalysis: everything returned by CohesionAnalyzer
 *
 * All types are plain values. Once an analysis has been returned nothing
 * in it is mutated except through the explicit sort_by_* reorderings.
 */

#include "ckscan/error.hpp"
#include "ckscan/syntax/language.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ckscan {

    namespace fs = std::filesystem;

    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * Chidamber-Kemerer metrics for a single class.
     */
    struct ClassMetrics {
        fs::path path;
        std::string class_name;
        Language language = Language::Unknown;

        /// 1-based, inclusive.
        std::size_t start_line = 0;
        std::size_t end_line = 0;
        std::size_t loc = 0;

        std::vector<std::string> methods;

        /// One entry per declaration/occurrence; duplicates are possible.
        std::vector<std::string> fields;

        /// Sorted, distinct.
        std::vector<std::string> coupled_classes;

        /// Weighted Methods per Class: sum of method cyclomatic complexities.
        int wmc = 0;
        /// Coupling Between Objects: distinct referenced type-like names.
        int cbo = 0;
        /// Response For a Class: local methods + distinct called names.
        int rfc = 0;
        /// LCOM4: connected components of the method/field usage graph.
        int lcom = 0;
        /// Depth of Inheritance Tree.
        int dit = 0;
        /// Number of direct children.
        int noc = 0;
        /// Number of methods.
        int nom = 0;
        /// Number of fields.
        int nof = 0;

        bool operator==(const ClassMetrics&) const = default;
    };

    struct CohesionSummary {
        int total_classes = 0;
        int total_files = 0;

        int max_wmc = 0;
        int max_cbo = 0;
        int max_rfc = 0;
        int max_lcom = 0;
        int max_dit = 0;

        double avg_wmc = 0.0;
        double avg_cbo = 0.0;
        double avg_rfc = 0.0;
        double avg_lcom = 0.0;

        /// Classes with LCOM > 1.
        int low_cohesion_count = 0;

        bool operator==(const CohesionSummary&) const = default;
    };

    /**
     * Which pass of the analysis produced a diagnostic.
     */
    enum class AnalysisPhase {
        Inheritance,
        Metrics
    };

    [[nodiscard]] std::string_view to_string(AnalysisPhase phase) noexcept;

    /**
     * A file that did not contribute (fully) to the result.
     */
    struct FileDiagnostic {
        fs::path path;
        AnalysisPhase phase = AnalysisPhase::Metrics;
        Error error;
    };

    /**
     * Orderings offered for the class list.
     */
    enum class SortKey {
        LCOM,
        WMC,
        CBO,
        DIT
    };

    [[nodiscard]] std::string_view to_string(SortKey key) noexcept;
    [[nodiscard]] std::optional<SortKey> parse_sort_key(std::string_view text) noexcept;

    struct CohesionAnalysis {
        Timestamp generated_at;
        std::vector<ClassMetrics> classes;
        CohesionSummary summary;

        /// Skipped or failed files, one entry per path, sorted by path.
        std::vector<FileDiagnostic> diagnostics;

        /// Least cohesive first. Stable: ties keep their current order.
        void sort_by_lcom();
        /// Most complex first.
        void sort_by_wmc();
        /// Most coupled first.
        void sort_by_cbo();
        /// Deepest inheritance first.
        void sort_by_dit();

        void sort_by(SortKey key);
    };

    /**
     * Computes the summary of a class list.
     *
     * An empty list yields an all-zero summary.
     */
    [[nodiscard]] CohesionSummary calculate_summary(const std::vector<ClassMetrics>& classes);

}  // namespace ckscan

#endif //CKSCAN_TYPES_HPP
