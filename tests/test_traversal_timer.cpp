#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "adapters/traversal_timer.hpp"

using namespace docbench;
using std::chrono::microseconds;

namespace {

class TraversalTimerTest : public ::testing::Test {
protected:
    std::shared_ptr<MockTimeSource> clock = std::make_shared<MockTimeSource>();
    MetricsCollector collector;
    TraversalTimer timer{collector, clock, "trav"};
};

} // namespace

TEST_F(TraversalTimerTest, TracksFieldPositionsAndCount) {
    timer.start_deserialization("op1");
    timer.record_field_access("op1", "a", 0);
    timer.record_field_access("op1", "b", 1);
    timer.record_field_access("op1", "c", 2);
    timer.end_deserialization("op1");

    auto b = timer.breakdown("op1");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->field_count, 3);
    EXPECT_EQ(b->last_field_position, 2);
    EXPECT_EQ(timer.field_position("op1", "b"), 1);
    EXPECT_EQ(timer.field_position("op1", "zz"), -1);
}

TEST_F(TraversalTimerTest, FieldAccessDeltaIsSincePreviousEvent) {
    timer.start_deserialization("op");
    clock->advance(microseconds(5));
    timer.record_field_access("op", "first", 0);
    clock->advance(microseconds(12));
    timer.record_field_access("op", "second", 1);
    clock->advance(microseconds(3));
    timer.end_deserialization("op");

    auto s = collector.summarize();
    EXPECT_EQ(s.get("trav.field_access.first").max(), 5'000);
    EXPECT_EQ(s.get("trav.field_access.second").max(), 12'000);
    EXPECT_EQ(s.get("trav.deserialization.total").max(), 20'000);
    EXPECT_EQ(s.get_counter("trav.deserialization.field_count"), 2);
    EXPECT_EQ(timer.total_deserialization_time("op"), microseconds(20));
}

TEST_F(TraversalTimerTest, NestingDepthTracksMaximum) {
    timer.start_deserialization("op");
    timer.enter_nested_document("op", "a");
    timer.enter_nested_document("op", "b");
    EXPECT_EQ(timer.current_nesting_depth("op"), 2);
    timer.exit_nested_document("op");
    timer.exit_nested_document("op");
    timer.exit_nested_document("op");  // extra exit does not go negative

    EXPECT_EQ(timer.current_nesting_depth("op"), 0);
    EXPECT_EQ(timer.max_nesting_depth("op"), 2);
}

TEST_F(TraversalTimerTest, ArrayElementsAreCountedPerArray) {
    timer.start_deserialization("op");
    timer.enter_array("op", "items");
    timer.record_array_element_access("op", "items", 0);
    timer.record_array_element_access("op", "items", 1);
    timer.exit_array("op");
    timer.enter_array("op", "tags");
    timer.record_array_element_access("op", "tags", 4);
    timer.exit_array("op");

    EXPECT_EQ(timer.array_element_count("op", "items"), 2);
    EXPECT_EQ(timer.array_element_count("op", "tags"), 1);
    EXPECT_EQ(timer.breakdown("op")->total_array_elements, 3);
}

TEST_F(TraversalTimerTest, OperationIdsAreIndependent) {
    timer.start_deserialization("x");
    timer.start_deserialization("y");
    timer.record_field_access("x", "f", 7);
    timer.enter_nested_document("y", "n");

    EXPECT_EQ(timer.field_access_count("x"), 1);
    EXPECT_EQ(timer.field_access_count("y"), 0);
    EXPECT_EQ(timer.max_nesting_depth("x"), 0);
    EXPECT_EQ(timer.max_nesting_depth("y"), 1);

    timer.clear("x");
    EXPECT_FALSE(timer.breakdown("x").has_value());
    EXPECT_TRUE(timer.breakdown("y").has_value());
    EXPECT_EQ(timer.open_contexts(), 1u);
}

TEST_F(TraversalTimerTest, ContextRecordsIntoItsOwnCollector) {
    MetricsCollector caller;
    timer.start_deserialization("op", &caller);
    clock->advance(std::chrono::nanoseconds(40));
    timer.record_field_access("op", "f", 0);
    timer.end_deserialization("op");

    auto given = caller.summarize();
    EXPECT_EQ(given.get("trav.field_access.f").max(), 40);
    EXPECT_EQ(given.get("trav.deserialization.total").count(), 1);
    EXPECT_EQ(given.get_counter("trav.deserialization.field_count"), 1);
    EXPECT_EQ(collector.summarize().metric_count(), 0u);
}

TEST_F(TraversalTimerTest, UnknownIdsAreIgnored) {
    timer.record_field_access("ghost", "f", 0);
    timer.end_deserialization("ghost");

    EXPECT_EQ(timer.field_access_count("ghost"), 0);
    EXPECT_EQ(timer.total_deserialization_time("ghost"), Duration::zero());
    EXPECT_FALSE(collector.summarize().has_metric("trav.field_access.f"));
}

TEST_F(TraversalTimerTest, ConcurrentOperationsDoNotInterfere) {
    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t] {
            const std::string id = "op-" + std::to_string(t);
            timer.start_deserialization(id);
            for (int f = 0; f <= t; ++f) {
                timer.record_field_access(id, "field_" + std::to_string(f), f);
            }
            timer.end_deserialization(id);
        });
    }
    for (auto& t : threads) t.join();

    for (int t = 0; t < kThreads; ++t) {
        const std::string id = "op-" + std::to_string(t);
        EXPECT_EQ(timer.field_access_count(id), t + 1);
        EXPECT_EQ(timer.breakdown(id)->last_field_position, t);
    }
}
