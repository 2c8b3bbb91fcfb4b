#ifndef CKSCAN_EXPORTERS_JSON_EXPORTER_HPP
#define CKSCAN_EXPORTERS_JSON_EXPORTER_HPP

/**
 * @file json_exporter.hpp
 * @brief Machine-readable cohesion report.
 *
 * Document layout (schema_version 1):
 * @code
 *     {
 *       "schema_version": 1,
 *       "ckscan_version": "0.4.1",
 *       "generated_at": "2026-01-01T12:00:00Z",
 *       "summary": { "total_classes": ..., "avg_wmc": ..., ... },
 *       "classes": [ { "path": ..., "class_name": ..., "wmc": ..., ... } ],
 *       "diagnostics": [ { "path": ..., "phase": "metrics", "code": ..., "message": ... } ],
 *       "accuracy": { "cbo": "upper_bound", "rfc": "upper_bound", "note": ... }
 *     }
 * @endcode
 */

#include "ckscan/result.hpp"
#include "ckscan/error.hpp"
#include "ckscan/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iosfwd>
#include <string>

namespace ckscan::exporters {

    namespace fs = std::filesystem;

    struct ExportOptions {
        bool pretty_print = true;
        /// Include the method, field and coupled class name lists.
        bool include_member_lists = true;
    };

    /**
     * Text of the accuracy note shared by the JSON report and the text footer.
     */
    [[nodiscard]] std::string_view accuracy_note() noexcept;

    /**
     * Formats a timestamp as ISO 8601 UTC ("2026-01-01T12:00:00Z").
     */
    [[nodiscard]] std::string format_timestamp(Timestamp ts);

    [[nodiscard]] nlohmann::json to_json(const ClassMetrics& metrics, const ExportOptions& options = {});
    [[nodiscard]] nlohmann::json to_json(const CohesionSummary& summary);
    [[nodiscard]] nlohmann::json to_json(const CohesionAnalysis& analysis, const ExportOptions& options = {});

    [[nodiscard]] Result<void, Error> export_to_stream(
        std::ostream& stream,
        const CohesionAnalysis& analysis,
        const ExportOptions& options = {}
    );

    [[nodiscard]] Result<void, Error> export_to_file(
        const fs::path& path,
        const CohesionAnalysis& analysis,
        const ExportOptions& options = {}
    );

    [[nodiscard]] Result<std::string, Error> export_to_string(
        const CohesionAnalysis& analysis,
        const ExportOptions& options = {}
    );

}  // namespace ckscan::exporters

#endif //CKSCAN_EXPORTERS_JSON_EXPORTER_HPP
