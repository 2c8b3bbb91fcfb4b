#include "ckscan/exporters/json_exporter.hpp"
#include "ckscan/utils/path_utils.hpp"
#include "ckscan/version.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace ckscan::exporters {

    using json = nlohmann::json;

    std::string_view accuracy_note() noexcept {
        return "CBO and RFC are syntactic upper bounds: type references and call "
               "targets are matched by name without symbol resolution.";
    }

    std::string format_timestamp(const Timestamp ts) {
        const auto time_t_val = std::chrono::system_clock::to_time_t(ts);
        std::tm time_info{};
        gmtime_r(&time_t_val, &time_info);

        std::ostringstream ss;
        ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    json to_json(const ClassMetrics& metrics, const ExportOptions& options) {
        json entry;
        entry["path"] = path_utils::to_forward_slashes(metrics.path);
        entry["class_name"] = metrics.class_name;
        entry["language"] = std::string(to_string(metrics.language));
        entry["start_line"] = metrics.start_line;
        entry["end_line"] = metrics.end_line;
        entry["wmc"] = metrics.wmc;
        entry["cbo"] = metrics.cbo;
        entry["rfc"] = metrics.rfc;
        entry["lcom"] = metrics.lcom;
        entry["dit"] = metrics.dit;
        entry["noc"] = metrics.noc;
        entry["nom"] = metrics.nom;
        entry["nof"] = metrics.nof;
        entry["loc"] = metrics.loc;

        // Empty lists are left out.
        if (options.include_member_lists) {
            if (!metrics.methods.empty()) entry["methods"] = metrics.methods;
            if (!metrics.fields.empty()) entry["fields"] = metrics.fields;
            if (!metrics.coupled_classes.empty()) entry["coupled_classes"] = metrics.coupled_classes;
        }
        return entry;
    }

    json to_json(const CohesionSummary& summary) {
        return json{
            {"total_classes", summary.total_classes},
            {"total_files", summary.total_files},
            {"avg_wmc", summary.avg_wmc},
            {"avg_cbo", summary.avg_cbo},
            {"avg_rfc", summary.avg_rfc},
            {"avg_lcom", summary.avg_lcom},
            {"max_wmc", summary.max_wmc},
            {"max_cbo", summary.max_cbo},
            {"max_rfc", summary.max_rfc},
            {"max_lcom", summary.max_lcom},
            {"max_dit", summary.max_dit},
            {"low_cohesion_count", summary.low_cohesion_count},
        };
    }

    json to_json(const CohesionAnalysis& analysis, const ExportOptions& options) {
        json output;
        output["schema_version"] = REPORT_SCHEMA_VERSION;
        output["ckscan_version"] = VERSION_STRING;
        output["generated_at"] = format_timestamp(analysis.generated_at);
        output["summary"] = to_json(analysis.summary);

        json classes = json::array();
        for (const auto& metrics : analysis.classes) {
            classes.push_back(to_json(metrics, options));
        }
        output["classes"] = std::move(classes);

        json diagnostics = json::array();
        for (const auto& [path, phase, error] : analysis.diagnostics) {
            diagnostics.push_back({
                {"path", path_utils::to_forward_slashes(path)},
                {"phase", std::string(to_string(phase))},
                {"code", code_name(error.code())},
                {"message", error.message()},
            });
        }
        output["diagnostics"] = std::move(diagnostics);

        output["accuracy"] = {
            {"cbo", "upper_bound"},
            {"rfc", "upper_bound"},
            {"note", std::string(accuracy_note())},
        };

        return output;
    }

    Result<void, Error> export_to_stream(
        std::ostream& stream,
        const CohesionAnalysis& analysis,
        const ExportOptions& options
    ) {
        // Names and paths come straight from source files and may not be
        // valid UTF-8; invalid bytes become U+FFFD instead of failing the report.
        std::string text;
        try {
            text = to_json(analysis, options).dump(options.pretty_print ? 2 : -1, ' ', false,
                                                   json::error_handler_t::replace);
        } catch (const json::exception& e) {
            return Result<void, Error>::failure(Error::io_error("Failed to serialize JSON report", e.what()));
        }

        stream << text << std::endl;

        if (!stream) {
            return Result<void, Error>::failure(Error::io_error("Failed to write JSON report"));
        }
        return Result<void, Error>::success();
    }

    Result<void, Error> export_to_file(
        const fs::path& path,
        const CohesionAnalysis& analysis,
        const ExportOptions& options
    ) {
        std::ofstream file(path);
        if (!file.is_open()) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }
        if (auto result = export_to_stream(file, analysis, options); result.is_err()) {
            return Result<void, Error>::failure(result.error().with_context(path.string()));
        }
        return Result<void, Error>::success();
    }

    Result<std::string, Error> export_to_string(const CohesionAnalysis& analysis, const ExportOptions& options) {
        std::ostringstream ss;
        if (auto result = export_to_stream(ss, analysis, options); result.is_err()) {
            return Result<std::string, Error>::failure(result.error());
        }
        return Result<std::string, Error>::success(ss.str());
    }

}  // namespace ckscan::exporters
