#include "metrics_collector.hpp"

#include <mutex>
#include <stdexcept>

namespace docbench {

// --- MetricsSummary ---

const HistogramSnapshot& MetricsSummary::get(const std::string& name) const {
    auto it = metrics_.find(name);
    if (it == metrics_.end()) {
        throw std::out_of_range("no metric named '" + name + "'");
    }
    return it->second;
}

int64_t MetricsSummary::get_counter(const std::string& name) const {
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

std::vector<std::string> MetricsSummary::metric_names() const {
    std::vector<std::string> names;
    names.reserve(metrics_.size());
    for (const auto& [name, _] : metrics_) names.push_back(name);
    return names;
}

std::vector<std::string> MetricsSummary::counter_names() const {
    std::vector<std::string> names;
    names.reserve(counters_.size());
    for (const auto& [name, _] : counters_) names.push_back(name);
    return names;
}

nlohmann::json MetricsSummary::to_json() const {
    nlohmann::json metrics = nlohmann::json::object();
    for (const auto& [name, h] : metrics_) {
        metrics[name] = {
            {"count", h.count()},
            {"mean_ns", h.mean()},
            {"min_ns", h.min()},
            {"max_ns", h.max()},
            {"p50_ns", h.percentile(50.0)},
            {"p95_ns", h.percentile(95.0)},
            {"p99_ns", h.percentile(99.0)},
            {"p999_ns", h.percentile(99.9)},
        };
    }
    nlohmann::json counters = nlohmann::json::object();
    for (const auto& [name, v] : counters_) {
        counters[name] = v;
    }
    return {{"metrics", metrics}, {"counters", counters}};
}

// --- MetricsCollector ---

std::shared_ptr<Histogram> MetricsCollector::histogram_for(const std::string& name) {
    {
        std::shared_lock<std::shared_mutex> lock(histograms_mutex_);
        auto it = histograms_.find(name);
        if (it != histograms_.end()) return it->second;
    }
    std::unique_lock<std::shared_mutex> lock(histograms_mutex_);
    auto& slot = histograms_[name];
    if (!slot) slot = std::make_shared<Histogram>(settings_);
    return slot;
}

std::shared_ptr<std::atomic<int64_t>> MetricsCollector::counter_for(const std::string& name) {
    {
        std::shared_lock<std::shared_mutex> lock(counters_mutex_);
        auto it = counters_.find(name);
        if (it != counters_.end()) return it->second;
    }
    std::unique_lock<std::shared_mutex> lock(counters_mutex_);
    auto& slot = counters_[name];
    if (!slot) slot = std::make_shared<std::atomic<int64_t>>(0);
    return slot;
}

void MetricsCollector::record_timing(const std::string& name, Duration duration) {
    // The shared_ptr keeps the histogram alive across a concurrent reset();
    // such a late sample lands in the discarded histogram.
    histogram_for(name)->record(duration.count());
}

void MetricsCollector::add_counter(const std::string& name, int64_t delta) {
    counter_for(name)->fetch_add(delta, std::memory_order_relaxed);
}

void MetricsCollector::record_overhead_breakdown(const OverheadBreakdown& breakdown) {
    for (const auto& [dimension, d] : breakdown.dimensions()) {
        record_timing(std::string("overhead.") + dimension, d);
    }
    for (const auto& [name, d] : breakdown.platform_specific()) {
        record_timing("overhead.platform." + name, d);
    }
}

MetricsSummary MetricsCollector::summarize() const {
    std::map<std::string, HistogramSnapshot> metrics;
    {
        std::shared_lock<std::shared_mutex> lock(histograms_mutex_);
        for (const auto& [name, h] : histograms_) {
            metrics.emplace(name, h->snapshot());
        }
    }
    std::map<std::string, int64_t> counters;
    {
        std::shared_lock<std::shared_mutex> lock(counters_mutex_);
        for (const auto& [name, c] : counters_) {
            counters.emplace(name, c->load(std::memory_order_relaxed));
        }
    }
    return MetricsSummary(std::move(metrics), std::move(counters));
}

void MetricsCollector::reset() {
    {
        std::unique_lock<std::shared_mutex> lock(histograms_mutex_);
        histograms_.clear();
    }
    std::unique_lock<std::shared_mutex> lock(counters_mutex_);
    counters_.clear();
}

} // namespace docbench
