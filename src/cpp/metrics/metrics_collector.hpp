#pragma once
// Thread-safe aggregation of named timing samples and counters.
//
// One collector per benchmark run (owned by BenchmarkRun, never global), so
// parallel runs do not contaminate each other. Histograms and counters are
// created lazily: lookups take a shared lock, creation an exclusive one, and
// the sample itself is recorded lock-free on the histogram.
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "histogram.hpp"
#include "overhead_breakdown.hpp"
#include "../utils/timer.hpp"

namespace docbench {

// Immutable point-in-time view of a collector
class MetricsSummary {
public:
    MetricsSummary() = default;
    MetricsSummary(std::map<std::string, HistogramSnapshot> metrics,
                   std::map<std::string, int64_t> counters)
        : metrics_(std::move(metrics)), counters_(std::move(counters)) {}

    [[nodiscard]] bool has_metric(const std::string& name) const {
        return metrics_.count(name) != 0;
    }

    // Throws std::out_of_range for an unknown metric
    [[nodiscard]] const HistogramSnapshot& get(const std::string& name) const;

    [[nodiscard]] bool has_counter(const std::string& name) const {
        return counters_.count(name) != 0;
    }

    // 0 for a counter that was never touched
    [[nodiscard]] int64_t get_counter(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> metric_names() const;
    [[nodiscard]] std::vector<std::string> counter_names() const;

    [[nodiscard]] size_t metric_count() const noexcept { return metrics_.size(); }

    [[nodiscard]] nlohmann::json to_json() const;

private:
    std::map<std::string, HistogramSnapshot> metrics_;
    std::map<std::string, int64_t> counters_;
};

class MetricsCollector {
public:
    explicit MetricsCollector(HistogramSettings settings = {})
        : settings_(settings) {}

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    void record_timing(const std::string& name, Duration duration);
    void add_counter(const std::string& name, int64_t delta = 1);

    // One sample per base dimension ("overhead.<dimension>") and one per
    // platform-specific entry ("overhead.platform.<name>")
    void record_overhead_breakdown(const OverheadBreakdown& breakdown);

    [[nodiscard]] MetricsSummary summarize() const;

    // Drops every histogram and counter (warm-up discard)
    void reset();

    [[nodiscard]] const HistogramSettings& settings() const noexcept { return settings_; }

private:
    std::shared_ptr<Histogram> histogram_for(const std::string& name);
    std::shared_ptr<std::atomic<int64_t>> counter_for(const std::string& name);

    HistogramSettings settings_;

    mutable std::shared_mutex histograms_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Histogram>> histograms_;

    mutable std::shared_mutex counters_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::atomic<int64_t>>> counters_;
};

} // namespace docbench
