#include "results_exporter.hpp"
#include "../utils/errors.hpp"
#include "../utils/logger.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace docbench {

OutputFormat parse_output_format(const std::string& s) {
    if (s == "json") return OutputFormat::JSON;
    if (s == "text") return OutputFormat::TEXT;
    throw ConfigurationError("format", "unknown output format '" + s + "' (valid: json, text)");
}

nlohmann::json ResultsExporter::config_json() const {
    const auto& c = config_.connection;
    nlohmann::json options = nlohmann::json::object();
    for (const auto& [key, value] : c.options) options[key] = value;

    nlohmann::json indexes = nlohmann::json::array();
    for (const auto& idx : config_.environment.indexes) {
        indexes.push_back({{"name", idx.name}, {"fields", idx.fields}});
    }

    return {
        {"connection", {
            {"adapter", c.adapter},
            {"uri", c.uri.empty() ? "" : "<set>"},
            {"host", c.host},
            {"port", c.port},
            {"database", c.database},
            {"user", c.user},
            {"options", options},
        }},
        {"environment", {
            {"collection", config_.environment.collection_name},
            {"drop_existing", config_.environment.drop_existing},
            {"indexes", indexes},
        }},
        {"workload", {
            {"document_count", config_.workload.document_count},
            {"fields_per_level", config_.workload.fields_per_level},
            {"nesting_depth", config_.workload.nesting_depth},
            {"array_length", config_.workload.array_length},
            {"projection_paths", config_.workload.projection_paths},
            {"read_ratio", config_.workload.read_ratio},
            {"seed", config_.workload.seed},
        }},
        {"histogram", {
            {"significant_digits", config_.histogram.significant_digits},
            {"highest_trackable_ns", config_.histogram.highest_trackable_ns},
        }},
        {"warmup_iterations", config_.warmup_iterations},
        {"measure_iterations", config_.measure_iterations},
        {"threads", config_.threads},
        {"correlation_timeout_ms", config_.correlation_timeout_ms},
    };
}

nlohmann::json ResultsExporter::to_json(const RunReport& report) const {
    return {{"config", config_json()}, {"report", report.to_json()}};
}

bool ResultsExporter::write_json(const RunReport& report, const std::string& path) const {
    const fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            LOG_ERR("[exporter] Cannot create %s: %s",
                target.parent_path().string().c_str(), ec.message().c_str());
            return false;
        }
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        LOG_ERR("[exporter] Cannot open %s for writing", path.c_str());
        return false;
    }
    out << to_json(report).dump(2) << '\n';
    if (!out.good()) {
        LOG_ERR("[exporter] Write to %s failed", path.c_str());
        return false;
    }
    LOG_INF("[exporter] Results saved to %s", path.c_str());
    return true;
}

std::string ResultsExporter::render_text(const RunReport& report) const {
    std::string text;
    char line[256];

    std::snprintf(line, sizeof(line), "Adapter: %s (%s, %s)\n",
        report.adapter_id.c_str(), report.display_name.c_str(), report.adapter_version.c_str());
    text += line;
    std::snprintf(line, sizeof(line),
        "Measured: %lld ok, %lld failed, %d thread(s), %.3f s, %.0f ops/s\n",
        static_cast<long long>(report.measured.succeeded), static_cast<long long>(report.measured.failed),
        report.threads, static_cast<double>(report.measured.wall_time.count()) / 1e9,
        report.measured.throughput_ops_per_sec());
    text += line;
    if (report.correlation_evicted > 0) {
        std::snprintf(line, sizeof(line), "Evicted correlations: %lld\n",
            static_cast<long long>(report.correlation_evicted));
        text += line;
    }

    std::snprintf(line, sizeof(line), "\n%-44s %9s %11s %11s %11s %11s %11s\n",
        "Metric", "Count", "Mean(us)", "p50(us)", "p95(us)", "p99(us)", "Max(us)");
    text += line;
    text += std::string(114, '-') + "\n";

    const MetricsSummary& s = report.summary;
    for (const auto& name : s.metric_names()) {
        const HistogramSnapshot& h = s.get(name);
        std::snprintf(line, sizeof(line), "%-44s %9lld %11.1f %11.1f %11.1f %11.1f %11.1f\n",
            name.c_str(), static_cast<long long>(h.count()), h.mean() / 1000.0,
            static_cast<double>(h.percentile(50.0)) / 1000.0,
            static_cast<double>(h.percentile(95.0)) / 1000.0,
            static_cast<double>(h.percentile(99.0)) / 1000.0,
            static_cast<double>(h.max()) / 1000.0);
        text += line;
    }

    const auto counters = s.counter_names();
    if (!counters.empty()) {
        text += "\nCounters:\n";
        for (const auto& name : counters) {
            std::snprintf(line, sizeof(line), "  %-42s %lld\n",
                name.c_str(), static_cast<long long>(s.get_counter(name)));
            text += line;
        }
    }
    return text;
}

void ResultsExporter::print(const RunReport& report, OutputFormat format, std::FILE* out) const {
    if (format == OutputFormat::JSON) {
        std::fprintf(out, "%s\n", to_json(report).dump(2).c_str());
    } else {
        std::fprintf(out, "%s", render_text(report).c_str());
    }
    std::fflush(out);
}

} // namespace docbench
