#pragma once
// Field-level traversal timing inside one operation's deserialization.
//
// Each open operation id has its own context (field-access counter, observed
// field positions, nesting depth, per-array element counts, last-event
// timestamp). Contexts never share state; the id map is guarded by a shared
// mutex and each context by its own mutex. A context records into the
// collector it was opened with, or the timer's own when none was given.
//
// Samples, under "<prefix>.":
//   field_access.<field>          delta since the previous traversal event
//   deserialization.total         endDeserialization - startDeserialization
//   deserialization.field_count   counter, fields accessed per operation
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "../metrics/metrics_collector.hpp"
#include "../utils/timer.hpp"

namespace docbench {

struct TraversalBreakdown {
    Duration total_time{0};
    int field_count = 0;
    int max_nesting_depth = 0;
    int last_field_position = -1;
    int total_array_elements = 0;

    [[nodiscard]] nlohmann::json to_json() const {
        return {
            {"total_ns", total_time.count()},
            {"field_count", field_count},
            {"max_nesting_depth", max_nesting_depth},
            {"last_field_position", last_field_position},
            {"total_array_elements", total_array_elements},
        };
    }
};

class TraversalTimer {
public:
    TraversalTimer(MetricsCollector& collector, std::shared_ptr<TimeSource> time_source,
                   std::string metric_prefix);

    void start_deserialization(const std::string& operation_id, MetricsCollector* collector = nullptr);

    // position < 0 means "not known"
    void record_field_access(const std::string& operation_id, const std::string& field_name,
                             int position = -1);

    void enter_nested_document(const std::string& operation_id, const std::string& field_name);
    void exit_nested_document(const std::string& operation_id);

    void enter_array(const std::string& operation_id, const std::string& array_name);
    void exit_array(const std::string& operation_id);
    void record_array_element_access(const std::string& operation_id, const std::string& array_name,
                                     int index);

    void end_deserialization(const std::string& operation_id);

    // Queries return neutral values (0, -1, zero duration) for unknown ids
    [[nodiscard]] int field_access_count(const std::string& operation_id) const;
    [[nodiscard]] int field_position(const std::string& operation_id, const std::string& field_name) const;
    [[nodiscard]] int max_nesting_depth(const std::string& operation_id) const;
    [[nodiscard]] int current_nesting_depth(const std::string& operation_id) const;
    [[nodiscard]] int array_element_count(const std::string& operation_id, const std::string& array_name) const;
    [[nodiscard]] Duration total_deserialization_time(const std::string& operation_id) const;

    [[nodiscard]] std::optional<TraversalBreakdown> breakdown(const std::string& operation_id) const;

    // Removes one context; others are unaffected
    void clear(const std::string& operation_id);

    [[nodiscard]] size_t open_contexts() const;

private:
    struct Context {
        Context(int64_t start, MetricsCollector& out) : start_ns(start), last_event_ns(start), sink(out) {}

        mutable std::mutex mutex;
        int64_t start_ns;
        int64_t last_event_ns;
        int64_t end_ns = 0;
        bool ended = false;
        int field_access_count = 0;
        std::map<std::string, int> field_positions;
        std::map<std::string, int> array_element_counts;
        int total_array_elements = 0;
        int current_depth = 0;
        int max_depth = 0;
        int last_field_position = -1;
        std::string current_array;
        MetricsCollector& sink;
    };

    [[nodiscard]] std::shared_ptr<Context> find(const std::string& operation_id) const;

    std::string metric(const std::string& suffix) const { return prefix_ + "." + suffix; }

    MetricsCollector& collector_;
    std::shared_ptr<TimeSource> time_source_;
    std::string prefix_;

    mutable std::shared_mutex contexts_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Context>> contexts_;
};

} // namespace docbench
