#include "benchmark_runner.hpp"
#include "workload_generator.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace docbench {

nlohmann::json RunReport::to_json() const {
    return {
        {"adapter", {{"id", adapter_id}, {"name", display_name}, {"version", adapter_version}}},
        {"threads", threads},
        {"warmup_iterations", warmup_iterations},
        {"measure_iterations", measure_iterations},
        {"seeded_documents", seeded_documents},
        {"succeeded", measured.succeeded},
        {"failed", measured.failed},
        {"wall_time_ns", measured.wall_time.count()},
        {"throughput_ops_per_sec", measured.throughput_ops_per_sec()},
        {"connection_totals", measured.connection_totals.to_json()},
        {"correlation_evicted", correlation_evicted},
        {"summary", summary.to_json()},
    };
}

namespace {

// Tears the environment down on every exit path of a run
class EnvironmentGuard {
public:
    explicit EnvironmentGuard(DbAdapter& adapter) : adapter_(adapter) {}

    ~EnvironmentGuard() {
        try {
            adapter_.teardown_test_environment();
        } catch (const std::exception& e) {
            LOG_ERR("[runner] Teardown failed: %s", e.what());
        }
    }

    EnvironmentGuard(const EnvironmentGuard&) = delete;
    EnvironmentGuard& operator=(const EnvironmentGuard&) = delete;

private:
    DbAdapter& adapter_;
};

} // namespace

BenchmarkRun::BenchmarkRun(BenchmarkConfig config, std::shared_ptr<TimeSource> time_source)
    : config_(std::move(config))
    , time_source_(std::move(time_source))
    , collector_(config_.histogram)
    , adapter_(create_adapter(config_.connection.adapter, collector_, time_source_)) {}

int64_t BenchmarkRun::seed_documents(Connection& conn) {
    WorkloadGenerator generator(config_.workload, config_.workload.seed);
    auto ops = generator.seed_operations("seed");

    BulkResult bulk = adapter_->execute_bulk(conn, ops, collector_);
    LOG_INF("[runner] Seeded %lld/%lld documents in %.3f s (%.0f ops/s)",
        static_cast<long long>(bulk.succeeded), static_cast<long long>(bulk.total),
        std::chrono::duration<double>(bulk.total_duration).count(), bulk.throughput_ops_per_sec());

    if (bulk.total > 0 && bulk.succeeded == 0) {
        const std::string reason = bulk.results.empty() ? "unknown" : bulk.results.front().error();
        throw SetupError("[runner] Seeding failed for every document: " + reason);
    }
    return bulk.succeeded;
}

PhaseStats BenchmarkRun::run_phase(const char* phase, int iterations) {
    PhaseStats stats;
    if (iterations <= 0) return stats;

    const int threads = std::max(1, std::min(config_.threads, iterations));
    std::atomic<int64_t> succeeded{0};
    std::atomic<int64_t> failed{0};
    std::mutex totals_mutex;
    std::vector<std::exception_ptr> errors(static_cast<size_t>(threads));

    LOG_INF("[runner] %s: %d iteration(s) on %d thread(s)", phase, iterations, threads);

    Timer wall(*time_source_);
    wall.start();

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(threads));
    for (int t = 0; t < threads; ++t) {
        const int share = iterations / threads + (t < iterations % threads ? 1 : 0);
        workers.emplace_back([&, t, share] {
            try {
                ScopedConnection conn(adapter_->connect(config_.connection));
                WorkloadGenerator generator(config_.workload,
                                            config_.workload.seed + static_cast<uint64_t>(t) + 1);
                const std::string prefix = std::string(phase) + "-" + std::to_string(t) + "-";

                for (int i = 0; i < share; ++i) {
                    Operation op = generator.next_operation(prefix + std::to_string(i));
                    OperationResult r = adapter_->execute(*conn, op, collector_);
                    if (r.ok()) {
                        succeeded.fetch_add(1, std::memory_order_relaxed);
                    } else {
                        failed.fetch_add(1, std::memory_order_relaxed);
                        LOG_DBG("[runner] %s failed: %s", r.operation_id().c_str(), r.error().c_str());
                    }
                }

                std::lock_guard<std::mutex> lock(totals_mutex);
                stats.connection_totals += conn->timing_metrics();
            } catch (...) {
                errors[static_cast<size_t>(t)] = std::current_exception();
            }
        });
    }
    for (auto& w : workers) w.join();
    wall.stop();

    // Connection or configuration problems abort the run
    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    stats.succeeded = succeeded.load();
    stats.failed = failed.load();
    stats.wall_time = wall.elapsed();
    LOG_INF("[runner] %s done: %lld ok, %lld failed, %.3f s, %.0f ops/s", phase,
        static_cast<long long>(stats.succeeded), static_cast<long long>(stats.failed),
        wall.elapsed_sec(), stats.throughput_ops_per_sec());
    return stats;
}

int64_t BenchmarkRun::evict_stale_correlations(const char* phase) {
    TimingInterceptor* interceptor = adapter_->timing_interceptor();
    if (!interceptor) return 0;
    size_t evicted = interceptor->evict_stale(std::chrono::milliseconds(config_.correlation_timeout_ms));
    if (evicted > 0) {
        LOG_WRN("[runner] %s: %zu correlation entr%s never completed", phase, evicted, evicted == 1 ? "y" : "ies");
    }
    return static_cast<int64_t>(evicted);
}

RunReport BenchmarkRun::run() {
    LOG_INF("[runner] ==================================================");
    LOG_INF("[runner] Adapter:     %s (%s, %s)", adapter_->adapter_id().c_str(),
        adapter_->display_name().c_str(), adapter_->version().c_str());
    LOG_INF("[runner] Collection:  %s", config_.environment.collection_name.c_str());
    LOG_INF("[runner] Documents:   %d (fields/level %d, depth %d, array %d)",
        config_.workload.document_count, config_.workload.fields_per_level,
        config_.workload.nesting_depth, config_.workload.array_length);
    LOG_INF("[runner] Iterations:  %d warm-up, %d measured, %d thread(s)",
        config_.warmup_iterations, config_.measure_iterations, config_.threads);
    LOG_INF("[runner] ==================================================");

    RunReport report;
    report.adapter_id = adapter_->adapter_id();
    report.display_name = adapter_->display_name();
    report.adapter_version = adapter_->version();
    report.threads = config_.threads;
    report.warmup_iterations = config_.warmup_iterations;
    report.measure_iterations = config_.measure_iterations;

    ScopedConnection admin(adapter_->connect(config_.connection));
    adapter_->setup_test_environment(config_.environment);
    EnvironmentGuard guard(*adapter_);

    report.seeded_documents = seed_documents(*admin);

    run_phase("warmup", config_.warmup_iterations);
    evict_stale_correlations("warmup");

    // Warm-up and seeding samples must not reach the measured percentiles
    collector_.reset();
    if (TimingInterceptor* interceptor = adapter_->timing_interceptor()) interceptor->reset();

    report.measured = run_phase("measure", config_.measure_iterations);
    report.correlation_evicted = evict_stale_correlations("measure");

    report.summary = collector_.summarize();
    LOG_INF("[runner] Collected %zu metric(s)", report.summary.metric_count());
    return report;
}

} // namespace docbench
