#include "traversal_timer.hpp"

#include <algorithm>
#include <stdexcept>

namespace docbench {

TraversalTimer::TraversalTimer(MetricsCollector& collector, std::shared_ptr<TimeSource> time_source,
                               std::string metric_prefix)
    : collector_(collector)
    , time_source_(std::move(time_source))
    , prefix_(std::move(metric_prefix)) {
    if (!time_source_) {
        throw std::invalid_argument("TraversalTimer requires a time source");
    }
}

std::shared_ptr<TraversalTimer::Context> TraversalTimer::find(const std::string& operation_id) const {
    std::shared_lock<std::shared_mutex> lock(contexts_mutex_);
    auto it = contexts_.find(operation_id);
    return it == contexts_.end() ? nullptr : it->second;
}

void TraversalTimer::start_deserialization(const std::string& operation_id, MetricsCollector* collector) {
    auto ctx = std::make_shared<Context>(time_source_->now_ns(), collector ? *collector : collector_);
    std::unique_lock<std::shared_mutex> lock(contexts_mutex_);
    contexts_[operation_id] = std::move(ctx);
}

void TraversalTimer::record_field_access(const std::string& operation_id, const std::string& field_name,
                                         int position) {
    auto ctx = find(operation_id);
    if (!ctx) return;

    Duration delta;
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        int64_t now = time_source_->now_ns();
        delta = Duration(now - ctx->last_event_ns);
        ctx->last_event_ns = now;
        ++ctx->field_access_count;
        if (position >= 0) {
            ctx->field_positions[field_name] = position;
            ctx->last_field_position = std::max(ctx->last_field_position, position);
        }
    }
    ctx->sink.record_timing(metric("field_access." + field_name), delta);
}

void TraversalTimer::enter_nested_document(const std::string& operation_id, const std::string&) {
    auto ctx = find(operation_id);
    if (!ctx) return;

    std::lock_guard<std::mutex> lock(ctx->mutex);
    ++ctx->current_depth;
    ctx->max_depth = std::max(ctx->max_depth, ctx->current_depth);
    ctx->last_event_ns = time_source_->now_ns();
}

void TraversalTimer::exit_nested_document(const std::string& operation_id) {
    auto ctx = find(operation_id);
    if (!ctx) return;

    std::lock_guard<std::mutex> lock(ctx->mutex);
    if (ctx->current_depth > 0) --ctx->current_depth;
    ctx->last_event_ns = time_source_->now_ns();
}

void TraversalTimer::enter_array(const std::string& operation_id, const std::string& array_name) {
    auto ctx = find(operation_id);
    if (!ctx) return;

    std::lock_guard<std::mutex> lock(ctx->mutex);
    ctx->current_array = array_name;
    ctx->array_element_counts.emplace(array_name, 0);
    ctx->last_event_ns = time_source_->now_ns();
}

void TraversalTimer::exit_array(const std::string& operation_id) {
    auto ctx = find(operation_id);
    if (!ctx) return;

    std::lock_guard<std::mutex> lock(ctx->mutex);
    ctx->current_array.clear();
    ctx->last_event_ns = time_source_->now_ns();
}

void TraversalTimer::record_array_element_access(const std::string& operation_id,
                                                 const std::string& array_name, int) {
    auto ctx = find(operation_id);
    if (!ctx) return;

    std::lock_guard<std::mutex> lock(ctx->mutex);
    ++ctx->array_element_counts[array_name];
    ++ctx->total_array_elements;
    ctx->last_event_ns = time_source_->now_ns();
}

void TraversalTimer::end_deserialization(const std::string& operation_id) {
    auto ctx = find(operation_id);
    if (!ctx) return;

    Duration total;
    int fields = 0;
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        ctx->end_ns = time_source_->now_ns();
        ctx->ended = true;
        total = Duration(ctx->end_ns - ctx->start_ns);
        fields = ctx->field_access_count;
    }
    ctx->sink.record_timing(metric("deserialization.total"), total);
    ctx->sink.add_counter(metric("deserialization.field_count"), fields);
}

int TraversalTimer::field_access_count(const std::string& operation_id) const {
    auto ctx = find(operation_id);
    if (!ctx) return 0;
    std::lock_guard<std::mutex> lock(ctx->mutex);
    return ctx->field_access_count;
}

int TraversalTimer::field_position(const std::string& operation_id, const std::string& field_name) const {
    auto ctx = find(operation_id);
    if (!ctx) return -1;
    std::lock_guard<std::mutex> lock(ctx->mutex);
    auto it = ctx->field_positions.find(field_name);
    return it == ctx->field_positions.end() ? -1 : it->second;
}

int TraversalTimer::max_nesting_depth(const std::string& operation_id) const {
    auto ctx = find(operation_id);
    if (!ctx) return 0;
    std::lock_guard<std::mutex> lock(ctx->mutex);
    return ctx->max_depth;
}

int TraversalTimer::current_nesting_depth(const std::string& operation_id) const {
    auto ctx = find(operation_id);
    if (!ctx) return 0;
    std::lock_guard<std::mutex> lock(ctx->mutex);
    return ctx->current_depth;
}

int TraversalTimer::array_element_count(const std::string& operation_id, const std::string& array_name) const {
    auto ctx = find(operation_id);
    if (!ctx) return 0;
    std::lock_guard<std::mutex> lock(ctx->mutex);
    auto it = ctx->array_element_counts.find(array_name);
    return it == ctx->array_element_counts.end() ? 0 : it->second;
}

Duration TraversalTimer::total_deserialization_time(const std::string& operation_id) const {
    auto ctx = find(operation_id);
    if (!ctx) return Duration::zero();
    std::lock_guard<std::mutex> lock(ctx->mutex);
    return ctx->ended ? Duration(ctx->end_ns - ctx->start_ns) : Duration::zero();
}

std::optional<TraversalBreakdown> TraversalTimer::breakdown(const std::string& operation_id) const {
    auto ctx = find(operation_id);
    if (!ctx) return std::nullopt;
    std::lock_guard<std::mutex> lock(ctx->mutex);

    TraversalBreakdown b;
    b.total_time = ctx->ended ? Duration(ctx->end_ns - ctx->start_ns) : Duration::zero();
    b.field_count = ctx->field_access_count;
    b.max_nesting_depth = ctx->max_depth;
    b.last_field_position = ctx->last_field_position;
    b.total_array_elements = ctx->total_array_elements;
    return b;
}

void TraversalTimer::clear(const std::string& operation_id) {
    std::unique_lock<std::shared_mutex> lock(contexts_mutex_);
    contexts_.erase(operation_id);
}

size_t TraversalTimer::open_contexts() const {
    std::shared_lock<std::shared_mutex> lock(contexts_mutex_);
    return contexts_.size();
}

} // namespace docbench
