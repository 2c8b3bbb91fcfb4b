#include "ckscan/analysis/cohesion_analyzer.hpp"
#include "ckscan/analysis/class_extractor.hpp"
#include "ckscan/languages/capabilities.hpp"
#include "ckscan/utils/path_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iterator>
#include <map>

namespace ckscan::analysis {

    namespace {

        using Clock = std::chrono::steady_clock;

        long long elapsed_ms(const Clock::time_point start) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
        }

        /**
         * Keeps the first diagnostic per path. A missing grammar is not a
         * failure: the file simply has no classes.
         */
        void record_failure(
            std::map<fs::path, FileDiagnostic>& diagnostics,
            const fs::path& path,
            const AnalysisPhase phase,
            const Error& error
        ) {
            if (error.code() == ErrorCode::UnsupportedLanguage) {
                return;
            }

            if (error.code() == ErrorCode::InternalError) {
                spdlog::warn("{} ({}): {}", path.string(), to_string(phase), error.message());
            } else {
                spdlog::debug("Skipping {} ({}): {}", path.string(), to_string(phase), error.message());
            }
            diagnostics.try_emplace(path, FileDiagnostic{path, phase, error});
        }

    }  // namespace

    CohesionAnalyzer::CohesionAnalyzer(std::shared_ptr<const syntax::ISourceParser> parser, CohesionOptions options)
        : parser_(std::move(parser))
        , options_(options) {}

    Result<CohesionAnalysis, Error> CohesionAnalyzer::analyze_project(const std::vector<fs::path>& files) const {
        return analyze_project_with_progress(files, {});
    }

    Result<CohesionAnalysis, Error> CohesionAnalyzer::analyze_project_with_progress(
        const std::vector<fs::path>& files,
        const fileproc::ProgressFn& on_progress
    ) const {
        const auto parser = acquire_parser();
        if (!parser) {
            return Result<CohesionAnalysis, Error>::failure(
                Error::internal_error("Cohesion analyzer used after close()")
            );
        }

        CohesionAnalysis analysis;
        analysis.generated_at = std::chrono::system_clock::now();

        std::vector<fs::path> candidates;
        candidates.reserve(files.size());
        std::size_t filtered = 0;
        for (const auto& path : files) {
            if (options_.skip_test_files && path_utils::is_test_file(path)) {
                ++filtered;
                continue;
            }
            if (!languages::is_object_oriented(detect_language(path))) {
                ++filtered;
                continue;
            }
            candidates.push_back(path);
        }

        spdlog::debug("Cohesion analysis of {} files ({} filtered out)", candidates.size(), filtered);

        parallel::ThreadPool pool(static_cast<unsigned int>(options_.threads));
        std::map<fs::path, FileDiagnostic> diagnostics;

        // Phase 1: inheritance graph
        auto phase_start = Clock::now();

        fileproc::MapOptions scan_options;
        if (options_.limit_inheritance_scan) {
            scan_options.max_file_size = options_.max_file_size;
        }

        auto fact_results = fileproc::map_files(
            candidates,
            [&parser](const fs::path& path) -> Result<std::vector<ClassFact>, Error> {
                auto parsed = parser->parse_file(path);
                if (parsed.is_err()) {
                    return Result<std::vector<ClassFact>, Error>::failure(parsed.error());
                }
                return Result<std::vector<ClassFact>, Error>::success(extract_class_facts(parsed.value()));
            },
            scan_options,
            pool
        );

        std::vector<ClassFact> facts;
        for (auto& [path, result] : fact_results) {
            if (result.is_err()) {
                record_failure(diagnostics, path, AnalysisPhase::Inheritance, result.error());
                continue;
            }
            auto& file_facts = result.value();
            facts.insert(facts.end(),
                         std::make_move_iterator(file_facts.begin()),
                         std::make_move_iterator(file_facts.end()));
        }

        const auto graph = InheritanceGraph::build(facts);
        spdlog::debug("Inheritance graph: {} classes in {}ms", graph.size(), elapsed_ms(phase_start));

        // Phase 2: per-class metrics against the finished graph
        phase_start = Clock::now();

        // Filtered files count as processed so progress totals match the input.
        if (on_progress) {
            for (std::size_t i = 0; i < filtered; ++i) {
                on_progress();
            }
        }

        fileproc::MapOptions metric_options;
        metric_options.max_file_size = options_.max_file_size;
        metric_options.on_progress = on_progress;

        auto metric_results = fileproc::map_files(
            candidates,
            [&parser, &graph](const fs::path& path) -> Result<std::vector<ClassMetrics>, Error> {
                auto parsed = parser->parse_file(path);
                if (parsed.is_err()) {
                    return Result<std::vector<ClassMetrics>, Error>::failure(parsed.error());
                }
                return Result<std::vector<ClassMetrics>, Error>::success(analyze_file(parsed.value(), graph));
            },
            metric_options,
            pool
        );

        for (auto& [path, result] : metric_results) {
            if (result.is_err()) {
                record_failure(diagnostics, path, AnalysisPhase::Metrics, result.error());
                continue;
            }
            auto& file_classes = result.value();
            analysis.classes.insert(analysis.classes.end(),
                                    std::make_move_iterator(file_classes.begin()),
                                    std::make_move_iterator(file_classes.end()));
        }

        spdlog::debug("Measured {} classes in {}ms", analysis.classes.size(), elapsed_ms(phase_start));

        analysis.diagnostics.reserve(diagnostics.size());
        for (auto& [path, diagnostic] : diagnostics) {
            analysis.diagnostics.push_back(std::move(diagnostic));
        }

        analysis.sort_by_lcom();
        analysis.summary = calculate_summary(analysis.classes);

        return Result<CohesionAnalysis, Error>::success(std::move(analysis));
    }

    void CohesionAnalyzer::close() noexcept {
        std::lock_guard lock(mutex_);
        parser_.reset();
    }

    bool CohesionAnalyzer::is_closed() const noexcept {
        std::lock_guard lock(mutex_);
        return parser_ == nullptr;
    }

    std::shared_ptr<const syntax::ISourceParser> CohesionAnalyzer::acquire_parser() const {
        std::lock_guard lock(mutex_);
        return parser_;
    }

}  // namespace ckscan::analysis
