#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "experiment/results_exporter.hpp"
#include "utils/errors.hpp"

using namespace docbench;

namespace fs = std::filesystem;

namespace {

BenchmarkConfig exporter_config() {
    BenchmarkConfig cfg;
    cfg.connection.adapter = "memory";
    cfg.connection.user = "bench";
    cfg.connection.password = "s3cret";
    cfg.connection.uri = "postgresql://bench:s3cret@db/docbench";
    return cfg;
}

RunReport sample_report() {
    MetricsCollector collector;
    collector.record_timing("overhead.total_latency", std::chrono::microseconds(120));
    collector.record_timing("overhead.total_latency", std::chrono::microseconds(80));
    collector.add_counter("memory.commands.succeeded", 2);

    RunReport report;
    report.adapter_id = "memory";
    report.display_name = "In-process document store";
    report.measure_iterations = 2;
    report.measured.succeeded = 2;
    report.summary = collector.summarize();
    return report;
}

} // namespace

TEST(ResultsExporterTest, ParsesOutputFormats) {
    EXPECT_EQ(parse_output_format("json"), OutputFormat::JSON);
    EXPECT_EQ(parse_output_format("text"), OutputFormat::TEXT);
    EXPECT_THROW(parse_output_format("csv"), ConfigurationError);
}

TEST(ResultsExporterTest, ConfigNeverCarriesSecrets) {
    BenchmarkConfig cfg = exporter_config();
    ResultsExporter exporter(cfg);
    const std::string dumped = exporter.config_json().dump();

    EXPECT_EQ(dumped.find("s3cret"), std::string::npos);
    EXPECT_EQ(exporter.config_json().at("connection").at("uri"), "<set>");
    EXPECT_EQ(exporter.config_json().at("connection").at("user"), "bench");
}

TEST(ResultsExporterTest, WritesJsonCreatingDirectories) {
    BenchmarkConfig cfg = exporter_config();
    ResultsExporter exporter(cfg);

    const fs::path dir = fs::path(::testing::TempDir()) / "docbench_export" / "nested";
    const fs::path file = dir / "run.json";
    fs::remove_all(dir.parent_path());

    ASSERT_TRUE(exporter.write_json(sample_report(), file.string()));

    std::ifstream in(file);
    ASSERT_TRUE(in.is_open());
    auto j = nlohmann::json::parse(in);
    EXPECT_TRUE(j.contains("config"));
    EXPECT_EQ(j.at("report").at("summary").at("metrics").at("overhead.total_latency").at("count"), 2);
    EXPECT_EQ(j.at("report").at("summary").at("counters").at("memory.commands.succeeded"), 2);

    fs::remove_all(dir.parent_path());
}

TEST(ResultsExporterTest, UnwritablePathReturnsFalse) {
    BenchmarkConfig cfg = exporter_config();
    ResultsExporter exporter(cfg);

    // A regular file cannot act as a parent directory
    const fs::path blocker = fs::path(::testing::TempDir()) / "docbench_blocker";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    EXPECT_FALSE(exporter.write_json(sample_report(), (blocker / "run.json").string()));
    fs::remove(blocker);
}

TEST(ResultsExporterTest, TextTableListsMetricsAndCounters) {
    BenchmarkConfig cfg = exporter_config();
    ResultsExporter exporter(cfg);
    const std::string text = exporter.render_text(sample_report());

    EXPECT_NE(text.find("overhead.total_latency"), std::string::npos);
    EXPECT_NE(text.find("memory.commands.succeeded"), std::string::npos);
    EXPECT_NE(text.find("p99"), std::string::npos);
}
