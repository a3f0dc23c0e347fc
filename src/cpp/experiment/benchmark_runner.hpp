#pragma once
// One benchmark run: owns its MetricsCollector and adapter, so two runs in
// the same process never share samples.
//
// Phases:
//   1. connect + set up the test environment (collection/table)
//   2. seed the workload documents
//   3. warm-up iterations; every sample is discarded (collector reset)
//   4. measured iterations across N worker threads, one connection each
//   5. tear down the test environment (also on failure)
// Stale correlation entries are evicted after the warm-up and measured phases.
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "../adapters/connection.hpp"
#include "../adapters/db_adapter.hpp"
#include "../config.hpp"
#include "../metrics/metrics_collector.hpp"
#include "../utils/timer.hpp"

namespace docbench {

struct PhaseStats {
    int64_t succeeded = 0;
    int64_t failed = 0;
    Duration wall_time{0};
    ConnectionTimingMetrics connection_totals;

    [[nodiscard]] int64_t total() const noexcept { return succeeded + failed; }
    [[nodiscard]] double throughput_ops_per_sec() const noexcept {
        if (wall_time.count() <= 0) return 0.0;
        return static_cast<double>(total()) * 1e9 / static_cast<double>(wall_time.count());
    }
};

struct RunReport {
    std::string adapter_id;
    std::string display_name;
    std::string adapter_version;
    int threads = 1;
    int warmup_iterations = 0;
    int measure_iterations = 0;
    int64_t seeded_documents = 0;
    PhaseStats measured;
    int64_t correlation_evicted = 0;
    MetricsSummary summary;

    [[nodiscard]] nlohmann::json to_json() const;
};

class BenchmarkRun {
public:
    explicit BenchmarkRun(BenchmarkConfig config,
                          std::shared_ptr<TimeSource> time_source = SystemTimeSource::instance());

    BenchmarkRun(const BenchmarkRun&) = delete;
    BenchmarkRun& operator=(const BenchmarkRun&) = delete;

    // Throws ConfigurationError / ConnectionError / SetupError; per-operation
    // failures are counted in the report instead
    RunReport run();

    [[nodiscard]] MetricsCollector& collector() noexcept { return collector_; }
    [[nodiscard]] DbAdapter& adapter() noexcept { return *adapter_; }
    [[nodiscard]] const BenchmarkConfig& config() const noexcept { return config_; }

private:
    int64_t seed_documents(Connection& conn);
    PhaseStats run_phase(const char* phase, int iterations);
    int64_t evict_stale_correlations(const char* phase);

    BenchmarkConfig config_;
    std::shared_ptr<TimeSource> time_source_;
    MetricsCollector collector_;            // before adapter_: the adapter keeps a reference
    std::unique_ptr<DbAdapter> adapter_;
};

} // namespace docbench
