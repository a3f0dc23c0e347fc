#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "metrics/metrics_collector.hpp"

using namespace docbench;
using std::chrono::microseconds;

TEST(MetricsCollectorTest, RecordsNamedTimings) {
    MetricsCollector collector;
    for (int i = 1; i <= 10; ++i) {
        collector.record_timing("op.read", microseconds(i));
    }

    auto summary = collector.summarize();
    ASSERT_TRUE(summary.has_metric("op.read"));
    EXPECT_EQ(summary.get("op.read").count(), 10);
    EXPECT_EQ(summary.get("op.read").max(), 10000);
    EXPECT_FALSE(summary.has_metric("op.write"));
    EXPECT_THROW(summary.get("op.write"), std::out_of_range);
}

TEST(MetricsCollectorTest, CountersAccumulate) {
    MetricsCollector collector;
    collector.add_counter("commands.failed");
    collector.add_counter("commands.failed", 4);

    auto summary = collector.summarize();
    EXPECT_EQ(summary.get_counter("commands.failed"), 5);
    EXPECT_EQ(summary.get_counter("never.touched"), 0);
    EXPECT_FALSE(summary.has_counter("never.touched"));
}

TEST(MetricsCollectorTest, ResetDropsEverything) {
    MetricsCollector collector;
    collector.record_timing("warmup.sample", microseconds(5));
    collector.add_counter("warmup.counter");

    collector.reset();
    auto summary = collector.summarize();
    EXPECT_EQ(summary.metric_count(), 0u);
    EXPECT_TRUE(summary.counter_names().empty());

    collector.record_timing("warmup.sample", microseconds(7));
    EXPECT_EQ(collector.summarize().get("warmup.sample").count(), 1);
}

TEST(MetricsCollectorTest, BreakdownRecordsEveryDimension) {
    MetricsCollector collector;
    auto b = OverheadBreakdown::builder()
        .total_latency(microseconds(100))
        .server_fetch_time(microseconds(10))
        .add_platform_specific("postgres.planning_time", microseconds(3))
        .build();

    collector.record_overhead_breakdown(b);
    collector.record_overhead_breakdown(b);

    auto summary = collector.summarize();
    for (const auto& [name, _] : b.dimensions()) {
        ASSERT_TRUE(summary.has_metric(std::string("overhead.") + name)) << name;
        EXPECT_EQ(summary.get(std::string("overhead.") + name).count(), 2);
    }
    EXPECT_EQ(summary.get("overhead.platform.postgres.planning_time").count(), 2);
}

TEST(MetricsCollectorTest, ConcurrentWritersOnSharedAndDistinctNames) {
    MetricsCollector collector;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 2000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&collector, t] {
            const std::string own = "thread." + std::to_string(t);
            for (int i = 0; i < kPerThread; ++i) {
                collector.record_timing("shared", microseconds(1));
                collector.record_timing(own, microseconds(2));
                collector.add_counter("ops");
            }
        });
    }
    for (auto& t : threads) t.join();

    auto summary = collector.summarize();
    EXPECT_EQ(summary.get("shared").count(), kThreads * kPerThread);
    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(summary.get("thread." + std::to_string(t)).count(), kPerThread);
    }
    EXPECT_EQ(summary.get_counter("ops"), kThreads * kPerThread);
}

TEST(MetricsCollectorTest, SummaryJsonShape) {
    MetricsCollector collector;
    collector.record_timing("x", microseconds(1));
    collector.add_counter("y", 3);

    auto j = collector.summarize().to_json();
    ASSERT_TRUE(j.contains("metrics"));
    ASSERT_TRUE(j.contains("counters"));
    const auto& x = j["metrics"]["x"];
    EXPECT_EQ(x["count"].get<int64_t>(), 1);
    for (const char* key : {"mean_ns", "min_ns", "max_ns", "p50_ns", "p95_ns", "p99_ns", "p999_ns"}) {
        EXPECT_TRUE(x.contains(key)) << key;
    }
    EXPECT_EQ(j["counters"]["y"].get<int64_t>(), 3);
}

TEST(MetricsCollectorTest, SeparateCollectorsDoNotShareSamples) {
    MetricsCollector a;
    MetricsCollector b;
    a.record_timing("op", microseconds(1));

    EXPECT_TRUE(a.summarize().has_metric("op"));
    EXPECT_FALSE(b.summarize().has_metric("op"));
}
