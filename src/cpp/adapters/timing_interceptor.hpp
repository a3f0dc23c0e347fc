#pragma once
// Correlates asynchronous command notifications with their start timestamps.
//
// Backends raise started/succeeded/failed notifications identified only by a
// transient numeric request id, possibly on a thread other than the caller's
// and with ids reused over a connection's lifetime. Every connection numbers
// its own requests, so pending entries are keyed by (connection id, request
// id). The map is sharded: each shard has its own mutex, so unrelated
// in-flight commands do not serialize on one lock.
//
// Samples go to the collector named in the started event, falling back to the
// interceptor's own; orphans and evictions always go to the interceptor's own.
//
// Per successful completion it records, under "<prefix>.":
//   client_round_trip, server_execution, overhead          (global)
//   <command>.client_round_trip, .server_execution, .overhead  (per kind)
// Failures record only failed.client_round_trip.
#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "../metrics/metrics_collector.hpp"
#include "../utils/timer.hpp"

namespace docbench {

// connection_id is stamped by the raising Connection
struct CommandStartedEvent {
    int32_t request_id = 0;
    std::string command_name;
    MetricsCollector* collector = nullptr;   // caller's collector for this command
    std::string connection_id;
};

struct CommandSucceededEvent {
    int32_t request_id = 0;
    std::string command_name;
    Duration server_elapsed{0};     // as reported by the backend
    std::string connection_id;
};

struct CommandFailedEvent {
    int32_t request_id = 0;
    std::string command_name;
    Duration server_elapsed{0};
    std::string error;
    std::string connection_id;
};

// Receiver of backend command notifications; may be invoked from any thread
class CommandListener {
public:
    virtual ~CommandListener() = default;

    virtual void command_started(const CommandStartedEvent& event) = 0;
    virtual void command_succeeded(const CommandSucceededEvent& event) = 0;
    virtual void command_failed(const CommandFailedEvent& event) = 0;
};

class TimingInterceptor final : public CommandListener {
public:
    TimingInterceptor(MetricsCollector& collector, std::shared_ptr<TimeSource> time_source,
                      std::string metric_prefix);

    void command_started(const CommandStartedEvent& event) override;
    void command_succeeded(const CommandSucceededEvent& event) override;
    void command_failed(const CommandFailedEvent& event) override;

    // Drops pending entries started more than max_age ago; they count as misses
    size_t evict_stale(Duration max_age);

    [[nodiscard]] int64_t completed_count() const noexcept { return completed_.load(std::memory_order_relaxed); }
    [[nodiscard]] int64_t failed_count() const noexcept { return failed_.load(std::memory_order_relaxed); }
    [[nodiscard]] int64_t orphaned_count() const noexcept { return orphaned_.load(std::memory_order_relaxed); }
    [[nodiscard]] int64_t evicted_count() const noexcept { return evicted_.load(std::memory_order_relaxed); }
    [[nodiscard]] int64_t clamped_count() const noexcept { return clamped_.load(std::memory_order_relaxed); }
    [[nodiscard]] int64_t total_count() const noexcept { return completed_count() + failed_count(); }
    [[nodiscard]] size_t pending_count() const;

    // Clears pending entries and local statistics (collector is untouched)
    void reset();

    [[nodiscard]] const std::string& metric_prefix() const noexcept { return prefix_; }

private:
    struct PendingKey {
        std::string connection_id;
        int32_t request_id;

        bool operator==(const PendingKey& o) const {
            return request_id == o.request_id && connection_id == o.connection_id;
        }
    };

    struct PendingKeyHash {
        size_t operator()(const PendingKey& k) const noexcept {
            size_t h = std::hash<std::string>{}(k.connection_id);
            return h ^ (static_cast<size_t>(static_cast<uint32_t>(k.request_id)) * 0x9e3779b97f4a7c15ULL);
        }
    };

    struct PendingCommand {
        std::string command_name;
        MetricsCollector* collector;
        int64_t start_ns;
    };

    static constexpr size_t kShardCount = 16;

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<PendingKey, PendingCommand, PendingKeyHash> pending;
    };

    Shard& shard_for(const PendingKey& key) {
        return shards_[PendingKeyHash{}(key) % kShardCount];
    }

    // Atomically removes the entry; false when no start was seen
    bool take_pending(const PendingKey& key, PendingCommand& out);

    MetricsCollector& sink(const PendingCommand& p) const { return p.collector ? *p.collector : collector_; }

    std::string metric(const std::string& suffix) const { return prefix_ + "." + suffix; }

    MetricsCollector& collector_;
    std::shared_ptr<TimeSource> time_source_;
    std::string prefix_;

    std::array<Shard, kShardCount> shards_;

    std::atomic<int64_t> completed_{0};
    std::atomic<int64_t> failed_{0};
    std::atomic<int64_t> orphaned_{0};
    std::atomic<int64_t> evicted_{0};
    std::atomic<int64_t> clamped_{0};
};

} // namespace docbench
