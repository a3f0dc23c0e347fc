#include <gtest/gtest.h>

#include "adapters/memory_adapter.hpp"
#include "experiment/benchmark_runner.hpp"
#include "utils/errors.hpp"

using namespace docbench;

namespace {

BenchmarkConfig memory_config() {
    BenchmarkConfig cfg;
    cfg.connection.adapter = "memory";
    cfg.environment.collection_name = "runner_docs";
    cfg.workload.document_count = 20;
    cfg.workload.fields_per_level = 5;
    cfg.workload.nesting_depth = 1;
    cfg.workload.array_length = 2;
    cfg.workload.projection_paths = {"field_0", "nested_1.field_4"};
    cfg.warmup_iterations = 15;
    cfg.measure_iterations = 40;
    return cfg;
}

} // namespace

TEST(BenchmarkRunnerTest, WarmupSamplesAreDiscarded) {
    BenchmarkRun run(memory_config());
    RunReport report = run.run();

    EXPECT_EQ(report.adapter_id, "memory");
    EXPECT_EQ(report.seeded_documents, 20);
    EXPECT_EQ(report.measured.succeeded, 40);
    EXPECT_EQ(report.measured.failed, 0);

    // Seeding inserts and warm-up reads are not part of the summary
    ASSERT_TRUE(report.summary.has_metric("overhead.total_latency"));
    EXPECT_EQ(report.summary.get("overhead.total_latency").count(), 40);
    EXPECT_FALSE(report.summary.has_metric("memory.insert.client_round_trip"));
    EXPECT_EQ(report.summary.get("memory.find.client_round_trip").count(), 40);
    EXPECT_EQ(report.correlation_evicted, 0);
    EXPECT_EQ(report.measured.connection_totals.operation_count, 40);
}

TEST(BenchmarkRunnerTest, MultipleThreadsShareTheIterations) {
    BenchmarkConfig cfg = memory_config();
    cfg.threads = 3;
    cfg.workload.read_ratio = 0.5;
    cfg.warmup_iterations = 0;

    BenchmarkRun run(cfg);
    RunReport report = run.run();

    // Deleted targets make later reads/updates fail; all are still counted
    EXPECT_EQ(report.measured.total(), 40);
    EXPECT_EQ(report.threads, 3);
    EXPECT_EQ(report.summary.get_counter("memory.commands.orphaned"), 0);
}

TEST(BenchmarkRunnerTest, EnvironmentIsTornDown) {
    BenchmarkRun run(memory_config());
    (void)run.run();

    auto& memory = dynamic_cast<MemoryAdapter&>(run.adapter());
    EXPECT_EQ(memory.document_count(), 0u);
}

TEST(BenchmarkRunnerTest, UnknownAdapterIsAConfigurationError) {
    BenchmarkConfig cfg = memory_config();
    cfg.connection.adapter = "cassandra";
    EXPECT_THROW(BenchmarkRun{cfg}, ConfigurationError);
}

TEST(BenchmarkRunnerTest, InvalidAdapterOptionsAbortTheRun) {
    BenchmarkConfig cfg = memory_config();
    cfg.connection.options["traversal"] = "random";

    BenchmarkRun run(cfg);
    EXPECT_THROW(run.run(), ConfigurationError);
}

TEST(BenchmarkRunnerTest, ReportJson) {
    BenchmarkRun run(memory_config());
    auto j = run.run().to_json();

    EXPECT_EQ(j.at("adapter").at("id"), "memory");
    EXPECT_EQ(j.at("succeeded"), 40);
    EXPECT_TRUE(j.at("summary").at("metrics").contains("overhead.total_latency"));
    EXPECT_GE(j.at("throughput_ops_per_sec").get<double>(), 0.0);
}
