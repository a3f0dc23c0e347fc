// =============================================================================
// ResultsExporter -- persist and print the outcome of a benchmark run
//
// JSON: {"config": {...}, "report": RunReport::to_json()} written with
//       indent 2; parent directories are created as needed.
// Text: fixed-width latency table (one row per metric, microseconds) plus
//       counters, the same layout the console summary uses.
// =============================================================================

#pragma once

#include <cstdio>
#include <string>
#include <nlohmann/json.hpp>
#include "benchmark_runner.hpp"
#include "../config.hpp"

namespace docbench {

enum class OutputFormat { JSON, TEXT };

// Throws ConfigurationError for anything but "json" / "text"
OutputFormat parse_output_format(const std::string& s);

class ResultsExporter {
public:
    explicit ResultsExporter(const BenchmarkConfig& config) : config_(config) {}

    // Secrets (password) are never written
    [[nodiscard]] nlohmann::json config_json() const;

    [[nodiscard]] nlohmann::json to_json(const RunReport& report) const;

    // Returns false (and logs) when the file cannot be written
    bool write_json(const RunReport& report, const std::string& path) const;

    [[nodiscard]] std::string render_text(const RunReport& report) const;

    void print(const RunReport& report, OutputFormat format, std::FILE* out = stdout) const;

private:
    const BenchmarkConfig& config_;
};

} // namespace docbench
