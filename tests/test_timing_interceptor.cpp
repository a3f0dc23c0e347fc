#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "adapters/timing_interceptor.hpp"

using namespace docbench;
using std::chrono::microseconds;
using std::chrono::milliseconds;

namespace {

class TimingInterceptorTest : public ::testing::Test {
protected:
    std::shared_ptr<MockTimeSource> clock = std::make_shared<MockTimeSource>(1'000'000);
    MetricsCollector collector;
    TimingInterceptor interceptor{collector, clock, "test"};
};

} // namespace

TEST_F(TimingInterceptorTest, RoundTripMinusServerIsOverhead) {
    interceptor.command_started({7, "find"});
    clock->advance(microseconds(500));
    interceptor.command_succeeded({7, "find", microseconds(200)});

    auto s = collector.summarize();
    EXPECT_EQ(s.get("test.client_round_trip").max(), 500'000);
    EXPECT_EQ(s.get("test.server_execution").max(), 200'000);
    EXPECT_EQ(s.get("test.overhead").max(), 300'000);
    EXPECT_EQ(s.get("test.find.overhead").count(), 1);
    EXPECT_EQ(interceptor.completed_count(), 1);
    EXPECT_EQ(interceptor.pending_count(), 0u);
}

TEST_F(TimingInterceptorTest, ServerTimeAboveRoundTripIsClamped) {
    interceptor.command_started({1, "insert"});
    clock->advance(microseconds(100));
    interceptor.command_succeeded({1, "insert", microseconds(150)});

    auto s = collector.summarize();
    EXPECT_EQ(s.get("test.overhead").max(), 0);
    EXPECT_EQ(interceptor.clamped_count(), 1);
    EXPECT_EQ(s.get_counter("test.commands.overhead_clamped"), 1);
}

TEST_F(TimingInterceptorTest, CompletionWithoutStartIsOrphaned) {
    interceptor.command_succeeded({42, "find", microseconds(10)});

    EXPECT_EQ(interceptor.orphaned_count(), 1);
    EXPECT_EQ(interceptor.completed_count(), 0);
    auto s = collector.summarize();
    EXPECT_FALSE(s.has_metric("test.client_round_trip"));
    EXPECT_EQ(s.get_counter("test.commands.orphaned"), 1);
}

TEST_F(TimingInterceptorTest, FailureRecordsOnlyFailedRoundTrip) {
    interceptor.command_started({3, "update"});
    clock->advance(microseconds(80));
    interceptor.command_failed({3, "update", microseconds(10), "duplicate key"});

    auto s = collector.summarize();
    EXPECT_EQ(s.get("test.failed.client_round_trip").max(), 80'000);
    EXPECT_FALSE(s.has_metric("test.overhead"));
    EXPECT_EQ(interceptor.failed_count(), 1);
    EXPECT_EQ(interceptor.total_count(), 1);
    EXPECT_EQ(interceptor.pending_count(), 0u);
}

TEST_F(TimingInterceptorTest, SecondCompletionForSameIdIsOrphaned) {
    interceptor.command_started({5, "find"});
    interceptor.command_succeeded({5, "find", microseconds(0)});
    interceptor.command_succeeded({5, "find", microseconds(0)});

    EXPECT_EQ(interceptor.completed_count(), 1);
    EXPECT_EQ(interceptor.orphaned_count(), 1);
}

TEST_F(TimingInterceptorTest, SameRequestIdOnTwoConnectionsStaysApart) {
    CommandStartedEvent first{1, "find"};
    first.connection_id = "c1";
    interceptor.command_started(first);
    clock->advance(microseconds(100));

    CommandStartedEvent second{1, "insert"};
    second.connection_id = "c2";
    interceptor.command_started(second);
    clock->advance(microseconds(50));

    CommandSucceededEvent done_second{1, "insert", microseconds(0)};
    done_second.connection_id = "c2";
    interceptor.command_succeeded(done_second);
    CommandSucceededEvent done_first{1, "find", microseconds(0)};
    done_first.connection_id = "c1";
    interceptor.command_succeeded(done_first);

    auto s = collector.summarize();
    EXPECT_EQ(s.get("test.find.client_round_trip").max(), 150'000);
    EXPECT_EQ(s.get("test.insert.client_round_trip").max(), 50'000);
    EXPECT_EQ(interceptor.completed_count(), 2);
    EXPECT_EQ(interceptor.orphaned_count(), 0);
}

TEST_F(TimingInterceptorTest, CompletionFromAnotherConnectionIsOrphaned) {
    CommandStartedEvent started{9, "find"};
    started.connection_id = "c1";
    interceptor.command_started(started);

    CommandSucceededEvent foreign{9, "find", microseconds(0)};
    foreign.connection_id = "c2";
    interceptor.command_succeeded(foreign);

    EXPECT_EQ(interceptor.orphaned_count(), 1);
    EXPECT_EQ(interceptor.pending_count(), 1u);
}

TEST_F(TimingInterceptorTest, SamplesGoToTheCollectorNamedAtStart) {
    MetricsCollector caller;
    CommandStartedEvent started{4, "find"};
    started.collector = &caller;
    interceptor.command_started(started);
    clock->advance(microseconds(30));
    interceptor.command_succeeded({4, "find", microseconds(10)});

    CommandStartedEvent failing{5, "update"};
    failing.collector = &caller;
    interceptor.command_started(failing);
    interceptor.command_failed({5, "update", microseconds(0), "boom"});

    auto given = caller.summarize();
    EXPECT_EQ(given.get("test.overhead").max(), 20'000);
    EXPECT_EQ(given.get_counter("test.commands.succeeded"), 1);
    EXPECT_EQ(given.get("test.failed.client_round_trip").count(), 1);
    EXPECT_EQ(given.get_counter("test.commands.failed"), 1);
    EXPECT_EQ(collector.summarize().metric_count(), 0u);
}

TEST_F(TimingInterceptorTest, StaleEntriesAreEvicted) {
    interceptor.command_started({1, "find"});
    clock->advance(milliseconds(100));
    interceptor.command_started({2, "find"});
    clock->advance(milliseconds(50));

    EXPECT_EQ(interceptor.evict_stale(milliseconds(120)), 1u);
    EXPECT_EQ(interceptor.pending_count(), 1u);
    EXPECT_EQ(interceptor.evicted_count(), 1);

    // The survivor still correlates
    interceptor.command_succeeded({2, "find", microseconds(0)});
    EXPECT_EQ(interceptor.completed_count(), 1);

    // The evicted one no longer does
    interceptor.command_succeeded({1, "find", microseconds(0)});
    EXPECT_EQ(interceptor.orphaned_count(), 1);
}

TEST_F(TimingInterceptorTest, ResetClearsPendingAndStatistics) {
    interceptor.command_started({1, "find"});
    interceptor.command_succeeded({9, "find", microseconds(0)});

    interceptor.reset();
    EXPECT_EQ(interceptor.pending_count(), 0u);
    EXPECT_EQ(interceptor.orphaned_count(), 0);
}

TEST_F(TimingInterceptorTest, ConcurrentCommandsEachCorrelateOnce) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < kPerThread; ++i) {
                int32_t id = t * kPerThread + i;
                interceptor.command_started({id, "find"});
                interceptor.command_succeeded({id, "find", microseconds(0)});
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(interceptor.completed_count(), kThreads * kPerThread);
    EXPECT_EQ(interceptor.orphaned_count(), 0);
    EXPECT_EQ(interceptor.pending_count(), 0u);
    EXPECT_EQ(collector.summarize().get("test.client_round_trip").count(), kThreads * kPerThread);
}

TEST_F(TimingInterceptorTest, CompletionOnAnotherThreadCorrelates) {
    constexpr int kCommands = 200;
    for (int32_t id = 0; id < kCommands; ++id) {
        interceptor.command_started({id, "aggregate"});
    }
    clock->advance(microseconds(40));

    std::thread completer([this] {
        for (int32_t id = kCommands - 1; id >= 0; --id) {
            interceptor.command_succeeded({id, "aggregate", microseconds(10)});
        }
    });
    completer.join();

    EXPECT_EQ(interceptor.completed_count(), kCommands);
    auto s = collector.summarize();
    EXPECT_EQ(s.get("test.aggregate.overhead").count(), kCommands);
    EXPECT_EQ(s.get("test.aggregate.overhead").max(), 30'000);
}
