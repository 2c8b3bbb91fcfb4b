#include "ckscan/exporters/json_exporter.hpp"
#include "ckscan/version.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

namespace ckscan::exporters
{
    using json = nlohmann::json;

    class JsonExporterTest : public ::testing::Test {
    protected:
        void SetUp() override {
            ClassMetrics account;
            account.path = "src/Account.java";
            account.class_name = "Account";
            account.language = Language::Java;
            account.start_line = 3;
            account.end_line = 40;
            account.loc = 38;
            account.methods = {"deposit", "rename"};
            account.fields = {"balance", "owner"};
            account.coupled_classes = {"Owner"};
            account.wmc = 4;
            account.cbo = 1;
            account.rfc = 3;
            account.lcom = 2;
            account.dit = 1;
            account.noc = 0;
            account.nom = 2;
            account.nof = 2;

            ClassMetrics marker;
            marker.path = "lib/marker.rb";
            marker.class_name = "Marker";
            marker.language = Language::Ruby;
            marker.start_line = 1;
            marker.end_line = 2;
            marker.loc = 2;

            analysis_.generated_at = std::chrono::system_clock::from_time_t(1767268800);
            analysis_.classes = {account, marker};
            analysis_.summary = calculate_summary(analysis_.classes);
            analysis_.diagnostics.push_back(FileDiagnostic{
                "src/Broken.java",
                AnalysisPhase::Inheritance,
                Error::parse_error("Syntax tree has errors", "src/Broken.java")
            });
        }

        CohesionAnalysis analysis_;
    };

    TEST_F(JsonExporterTest, TimestampIsUtc) {
        EXPECT_EQ(format_timestamp(analysis_.generated_at), "2026-01-01T12:00:00Z");
    }

    TEST_F(JsonExporterTest, DocumentHeader) {
        const auto doc = to_json(analysis_);

        EXPECT_EQ(doc["schema_version"], REPORT_SCHEMA_VERSION);
        EXPECT_EQ(doc["ckscan_version"], VERSION_STRING);
        EXPECT_EQ(doc["generated_at"], "2026-01-01T12:00:00Z");
        EXPECT_EQ(doc["accuracy"]["cbo"], "upper_bound");
        EXPECT_EQ(doc["accuracy"]["rfc"], "upper_bound");
        EXPECT_EQ(doc["accuracy"]["note"], std::string(accuracy_note()));
    }

    TEST_F(JsonExporterTest, ClassEntries) {
        const auto doc = to_json(analysis_);
        ASSERT_EQ(doc["classes"].size(), 2u);

        const auto& account = doc["classes"][0];
        EXPECT_EQ(account["path"], "src/Account.java");
        EXPECT_EQ(account["class_name"], "Account");
        EXPECT_EQ(account["language"], "java");
        EXPECT_EQ(account["start_line"], 3);
        EXPECT_EQ(account["end_line"], 40);
        EXPECT_EQ(account["loc"], 38);
        EXPECT_EQ(account["wmc"], 4);
        EXPECT_EQ(account["cbo"], 1);
        EXPECT_EQ(account["rfc"], 3);
        EXPECT_EQ(account["lcom"], 2);
        EXPECT_EQ(account["dit"], 1);
        EXPECT_EQ(account["noc"], 0);
        EXPECT_EQ(account["nom"], 2);
        EXPECT_EQ(account["nof"], 2);
        EXPECT_EQ(account["methods"], json::array({"deposit", "rename"}));
        EXPECT_EQ(account["fields"], json::array({"balance", "owner"}));
        EXPECT_EQ(account["coupled_classes"], json::array({"Owner"}));
    }

    TEST_F(JsonExporterTest, EmptyMemberListsAreOmitted) {
        const auto doc = to_json(analysis_);
        const auto& marker = doc["classes"][1];

        EXPECT_EQ(marker["language"], "ruby");
        EXPECT_FALSE(marker.contains("methods"));
        EXPECT_FALSE(marker.contains("fields"));
        EXPECT_FALSE(marker.contains("coupled_classes"));
    }

    TEST_F(JsonExporterTest, MemberListsCanBeDisabled) {
        ExportOptions options;
        options.include_member_lists = false;

        const auto doc = to_json(analysis_, options);
        EXPECT_FALSE(doc["classes"][0].contains("methods"));
        EXPECT_EQ(doc["classes"][0]["lcom"], 2);
    }

    TEST_F(JsonExporterTest, Summary) {
        const auto summary = to_json(analysis_.summary);

        EXPECT_EQ(summary["total_classes"], 2);
        EXPECT_EQ(summary["total_files"], 2);
        EXPECT_EQ(summary["max_lcom"], 2);
        EXPECT_EQ(summary["low_cohesion_count"], 1);
        EXPECT_DOUBLE_EQ(summary["avg_wmc"].get<double>(), 2.0);
        EXPECT_DOUBLE_EQ(summary["avg_lcom"].get<double>(), 1.0);
    }

    TEST_F(JsonExporterTest, Diagnostics) {
        const auto doc = to_json(analysis_);
        ASSERT_EQ(doc["diagnostics"].size(), 1u);

        const auto& diagnostic = doc["diagnostics"][0];
        EXPECT_EQ(diagnostic["path"], "src/Broken.java");
        EXPECT_EQ(diagnostic["phase"], "inheritance");
        EXPECT_EQ(diagnostic["code"], "ParseError");
        EXPECT_EQ(diagnostic["message"], "Syntax tree has errors");
    }

    TEST_F(JsonExporterTest, EmptyAnalysisStillHasArrays) {
        const CohesionAnalysis empty;
        const auto doc = to_json(empty);

        EXPECT_TRUE(doc["classes"].is_array());
        EXPECT_TRUE(doc["classes"].empty());
        EXPECT_TRUE(doc["diagnostics"].is_array());
        EXPECT_EQ(doc["summary"]["total_classes"], 0);
    }

    TEST_F(JsonExporterTest, StringOutputParsesBack) {
        auto pretty = export_to_string(analysis_);
        ASSERT_TRUE(pretty.is_ok());
        EXPECT_NE(pretty.value().find("\n  \"classes\""), std::string::npos);
        EXPECT_EQ(json::parse(pretty.value()), to_json(analysis_));

        ExportOptions compact;
        compact.pretty_print = false;
        auto single_line = export_to_string(analysis_, compact);
        ASSERT_TRUE(single_line.is_ok());
        EXPECT_EQ(single_line.value().find('\n'), single_line.value().size() - 1);
    }

    TEST_F(JsonExporterTest, InvalidUtf8IsReplaced) {
        ClassMetrics legacy;
        legacy.path = "src/Caf\xe9.java";
        legacy.class_name = "Caf\xe9";
        legacy.language = Language::Java;
        legacy.fields = {"pr\xe9nom"};
        analysis_.classes.push_back(legacy);

        std::ostringstream out;
        auto result = export_to_stream(out, analysis_);
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();

        const auto doc = json::parse(out.str());
        ASSERT_EQ(doc["classes"].size(), 3u);
        EXPECT_EQ(doc["classes"][2]["path"], "src/Caf\xef\xbf\xbd.java");
        EXPECT_EQ(doc["classes"][2]["class_name"], "Caf\xef\xbf\xbd");
        EXPECT_EQ(doc["classes"][0]["class_name"], "Account");
    }

    TEST_F(JsonExporterTest, ExportToFile) {
        const auto path = fs::temp_directory_path() / "ckscan_json_exporter_unit.json";

        auto result = export_to_file(path, analysis_);
        ASSERT_TRUE(result.is_ok());

        std::ifstream in(path);
        const auto doc = json::parse(in);
        EXPECT_EQ(doc["classes"][0]["class_name"], "Account");

        fs::remove(path);
    }

    TEST_F(JsonExporterTest, ExportToUnwritablePath) {
        auto result = export_to_file(fs::temp_directory_path() / "ckscan_no_such_dir" / "out.json", analysis_);

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::IoError);
    }

}  // namespace ckscan::exporters
