#include "ckscan/types.hpp"

#include <algorithm>
#include <unordered_set>

namespace ckscan {

    namespace {
        template<typename Projection>
        void stable_sort_descending(std::vector<ClassMetrics>& classes, Projection proj) {
            std::ranges::stable_sort(classes, std::ranges::greater{}, proj);
        }
    }  // namespace

    std::string_view to_string(const AnalysisPhase phase) noexcept {
        switch (phase) {
            case AnalysisPhase::Inheritance: return "inheritance";
            case AnalysisPhase::Metrics:     return "metrics";
        }
        return "unknown";
    }

    std::string_view to_string(const SortKey key) noexcept {
        switch (key) {
            case SortKey::LCOM: return "lcom";
            case SortKey::WMC:  return "wmc";
            case SortKey::CBO:  return "cbo";
            case SortKey::DIT:  return "dit";
        }
        return "lcom";
    }

    std::optional<SortKey> parse_sort_key(const std::string_view text) noexcept {
        if (text == "lcom") return SortKey::LCOM;
        if (text == "wmc") return SortKey::WMC;
        if (text == "cbo") return SortKey::CBO;
        if (text == "dit") return SortKey::DIT;
        return std::nullopt;
    }

    void CohesionAnalysis::sort_by_lcom() {
        stable_sort_descending(classes, &ClassMetrics::lcom);
    }

    void CohesionAnalysis::sort_by_wmc() {
        stable_sort_descending(classes, &ClassMetrics::wmc);
    }

    void CohesionAnalysis::sort_by_cbo() {
        stable_sort_descending(classes, &ClassMetrics::cbo);
    }

    void CohesionAnalysis::sort_by_dit() {
        stable_sort_descending(classes, &ClassMetrics::dit);
    }

    void CohesionAnalysis::sort_by(const SortKey key) {
        switch (key) {
            case SortKey::LCOM: sort_by_lcom(); break;
            case SortKey::WMC:  sort_by_wmc(); break;
            case SortKey::CBO:  sort_by_cbo(); break;
            case SortKey::DIT:  sort_by_dit(); break;
        }
    }

    CohesionSummary calculate_summary(const std::vector<ClassMetrics>& classes) {
        CohesionSummary summary;
        if (classes.empty()) {
            return summary;
        }

        std::unordered_set<std::string> files;
        long long total_wmc = 0;
        long long total_cbo = 0;
        long long total_rfc = 0;
        long long total_lcom = 0;

        for (const auto& cls : classes) {
            files.insert(cls.path.string());
            total_wmc += cls.wmc;
            total_cbo += cls.cbo;
            total_rfc += cls.rfc;
            total_lcom += cls.lcom;

            summary.max_wmc = std::max(summary.max_wmc, cls.wmc);
            summary.max_cbo = std::max(summary.max_cbo, cls.cbo);
            summary.max_rfc = std::max(summary.max_rfc, cls.rfc);
            summary.max_lcom = std::max(summary.max_lcom, cls.lcom);
            summary.max_dit = std::max(summary.max_dit, cls.dit);

            if (cls.lcom > 1) {
                ++summary.low_cohesion_count;
            }
        }

        const auto n = static_cast<double>(classes.size());
        summary.total_classes = static_cast<int>(classes.size());
        summary.total_files = static_cast<int>(files.size());
        summary.avg_wmc = static_cast<double>(total_wmc) / n;
        summary.avg_cbo = static_cast<double>(total_cbo) / n;
        summary.avg_rfc = static_cast<double>(total_rfc) / n;
        summary.avg_lcom = static_cast<double>(total_lcom) / n;

        return summary;
    }

}  // namespace ckscan
