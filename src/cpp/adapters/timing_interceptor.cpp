#include "timing_interceptor.hpp"
#include "../utils/logger.hpp"

#include <stdexcept>

namespace docbench {

TimingInterceptor::TimingInterceptor(MetricsCollector& collector,
                                     std::shared_ptr<TimeSource> time_source,
                                     std::string metric_prefix)
    : collector_(collector)
    , time_source_(std::move(time_source))
    , prefix_(std::move(metric_prefix)) {
    if (!time_source_) {
        throw std::invalid_argument("TimingInterceptor requires a time source");
    }
}

void TimingInterceptor::command_started(const CommandStartedEvent& event) {
    PendingKey key{event.connection_id, event.request_id};
    PendingCommand entry{event.command_name, event.collector, time_source_->now_ns()};
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    // A reused id replaces whatever was left behind under it
    shard.pending[std::move(key)] = std::move(entry);
}

bool TimingInterceptor::take_pending(const PendingKey& key, PendingCommand& out) {
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.pending.find(key);
    if (it == shard.pending.end()) return false;
    out = std::move(it->second);
    shard.pending.erase(it);
    return true;
}

void TimingInterceptor::command_succeeded(const CommandSucceededEvent& event) {
    PendingCommand pending{};
    if (!take_pending({event.connection_id, event.request_id}, pending)) {
        // Started before we were attached, or already evicted
        orphaned_.fetch_add(1, std::memory_order_relaxed);
        collector_.add_counter(metric("commands.orphaned"));
        LOG_DBG("[correlation] %s: completion for unknown request %d on '%s' (%s)",
            prefix_.c_str(), event.request_id, event.connection_id.c_str(), event.command_name.c_str());
        return;
    }

    MetricsCollector& out = sink(pending);
    int64_t end_ns = time_source_->now_ns();
    Duration round_trip(end_ns - pending.start_ns);
    Duration server = event.server_elapsed;
    Duration overhead = round_trip - server;
    if (overhead.count() < 0) {
        // Client and backend clocks disagree; never emit a negative sample
        clamped_.fetch_add(1, std::memory_order_relaxed);
        out.add_counter(metric("commands.overhead_clamped"));
        LOG_DBG("[correlation] %s: server time %lld ns exceeds round trip %lld ns (request %d)",
            prefix_.c_str(), static_cast<long long>(server.count()),
            static_cast<long long>(round_trip.count()), event.request_id);
        overhead = Duration::zero();
    }

    out.record_timing(metric("client_round_trip"), round_trip);
    out.record_timing(metric("server_execution"), server);
    out.record_timing(metric("overhead"), overhead);

    const std::string& kind = pending.command_name;
    out.record_timing(metric(kind + ".client_round_trip"), round_trip);
    out.record_timing(metric(kind + ".server_execution"), server);
    out.record_timing(metric(kind + ".overhead"), overhead);

    completed_.fetch_add(1, std::memory_order_relaxed);
    out.add_counter(metric("commands.succeeded"));
}

void TimingInterceptor::command_failed(const CommandFailedEvent& event) {
    PendingCommand pending{};
    if (take_pending({event.connection_id, event.request_id}, pending)) {
        Duration round_trip(time_source_->now_ns() - pending.start_ns);
        sink(pending).record_timing(metric("failed.client_round_trip"), round_trip);
        sink(pending).add_counter(metric("commands.failed"));
    } else {
        orphaned_.fetch_add(1, std::memory_order_relaxed);
        collector_.add_counter(metric("commands.orphaned"));
        collector_.add_counter(metric("commands.failed"));
    }

    failed_.fetch_add(1, std::memory_order_relaxed);
    LOG_DBG("[correlation] %s: %s request %d failed: %s", prefix_.c_str(),
        event.command_name.c_str(), event.request_id, event.error.c_str());
}

size_t TimingInterceptor::evict_stale(Duration max_age) {
    int64_t cutoff = time_source_->now_ns() - max_age.count();
    size_t evicted = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.pending.begin(); it != shard.pending.end();) {
            if (it->second.start_ns < cutoff) {
                it = shard.pending.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
    }
    if (evicted > 0) {
        evicted_.fetch_add(static_cast<int64_t>(evicted), std::memory_order_relaxed);
        collector_.add_counter(metric("commands.evicted"), static_cast<int64_t>(evicted));
        LOG_WRN("[correlation] %s: evicted %zu stale pending command(s)", prefix_.c_str(), evicted);
    }
    return evicted;
}

size_t TimingInterceptor::pending_count() const {
    size_t n = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        n += shard.pending.size();
    }
    return n;
}

void TimingInterceptor::reset() {
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.pending.clear();
    }
    completed_.store(0, std::memory_order_relaxed);
    failed_.store(0, std::memory_order_relaxed);
    orphaned_.store(0, std::memory_order_relaxed);
    evicted_.store(0, std::memory_order_relaxed);
    clamped_.store(0, std::memory_order_relaxed);
}

} // namespace docbench
