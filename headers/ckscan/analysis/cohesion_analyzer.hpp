#ifndef CKSCAN_ANALYSIS_COHESION_ANALYZER_HPP
#define CKSCAN_ANALYSIS_COHESION_ANALYZER_HPP

/**
 * @file cohesion_analyzer.hpp
 * @brief Project-wide CK metric computation.
 *
 * The analyzer runs in two phases over the same file list:
 *
 *  1. Every file is parsed in parallel and its class facts (name and
 *     direct parents) are collected; a single-threaded reduce turns them
 *     into the InheritanceGraph.
 *  2. Every file is parsed again in parallel and each class is measured
 *     against the now read-only graph.
 *
 * DIT and NOC are only correct once the whole project has been seen, which
 * is why the graph has to be complete before the first class is measured.
 */

#include "ckscan/analysis/inheritance_graph.hpp"
#include "ckscan/syntax/source_parser.hpp"
#include "ckscan/types.hpp"
#include "ckscan/utils/file_processor.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace ckscan::analysis {

    namespace fs = std::filesystem;

    struct CohesionOptions {
        /// Leave test files out of both phases.
        bool skip_test_files = true;

        /// Files larger than this many bytes are not measured (0 = no limit).
        std::uintmax_t max_file_size = 0;

        /// Also leave oversized files out of the inheritance graph. Off by
        /// default so that a large base class still counts for DIT/NOC of
        /// the classes that extend it.
        bool limit_inheritance_scan = false;

        /// Worker threads (0 = hardware concurrency).
        std::size_t threads = 0;
    };

    class CohesionAnalyzer {
    public:
        CohesionAnalyzer(std::shared_ptr<const syntax::ISourceParser> parser, CohesionOptions options = {});

        /**
         * Computes CK metrics for every class in the given files.
         *
         * Files in languages without a class system contribute nothing.
         * Files that cannot be read or parsed, or that exceed the size limit,
         * are listed in CohesionAnalysis::diagnostics and do not stop the run.
         *
         * @return The analysis with classes sorted by LCOM descending, or an
         *         InternalError when the analyzer has been closed.
         */
        [[nodiscard]] Result<CohesionAnalysis, Error> analyze_project(const std::vector<fs::path>& files) const;

        /**
         * Same as analyze_project(), calling on_progress once per input file
         * while classes are measured.
         */
        [[nodiscard]] Result<CohesionAnalysis, Error> analyze_project_with_progress(
            const std::vector<fs::path>& files,
            const fileproc::ProgressFn& on_progress
        ) const;

        /**
         * Releases the parser. Further analysis calls fail.
         */
        void close() noexcept;

        [[nodiscard]] bool is_closed() const noexcept;

        [[nodiscard]] const CohesionOptions& options() const noexcept { return options_; }

    private:
        [[nodiscard]] std::shared_ptr<const syntax::ISourceParser> acquire_parser() const;

        mutable std::mutex mutex_;
        std::shared_ptr<const syntax::ISourceParser> parser_;
        CohesionOptions options_;
    };

}  // namespace ckscan::analysis

#endif //CKSCAN_ANALYSIS_COHESION_ANALYZER_HPP
