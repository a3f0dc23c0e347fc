#pragma once
// Instrumented connection to one backend.
//
// Owns the native handle (subclass), accumulates per-connection timing totals
// and fans command notifications out to registered listeners (the timing
// correlation layer). close() is idempotent; ScopedConnection guarantees it
// runs on every exit path.
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "timing_interceptor.hpp"
#include "../utils/timer.hpp"

namespace docbench {

// Totals accumulated over a connection's lifetime (since the last reset)
struct ConnectionTimingMetrics {
    Duration serialization_time{0};
    Duration wire_transmit_time{0};
    Duration wire_receive_time{0};
    Duration deserialization_time{0};
    int64_t bytes_sent = 0;
    int64_t bytes_received = 0;
    int64_t operation_count = 0;

    ConnectionTimingMetrics& operator+=(const ConnectionTimingMetrics& o) {
        serialization_time += o.serialization_time;
        wire_transmit_time += o.wire_transmit_time;
        wire_receive_time += o.wire_receive_time;
        deserialization_time += o.deserialization_time;
        bytes_sent += o.bytes_sent;
        bytes_received += o.bytes_received;
        operation_count += o.operation_count;
        return *this;
    }

    [[nodiscard]] nlohmann::json to_json() const {
        return {
            {"serialization_ns", serialization_time.count()},
            {"wire_transmit_ns", wire_transmit_time.count()},
            {"wire_receive_ns", wire_receive_time.count()},
            {"deserialization_ns", deserialization_time.count()},
            {"bytes_sent", bytes_sent},
            {"bytes_received", bytes_received},
            {"operation_count", operation_count},
        };
    }
};

class Connection {
public:
    explicit Connection(std::string connection_id)
        : connection_id_(std::move(connection_id)) {}

    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] const std::string& connection_id() const noexcept { return connection_id_; }

    // False once closed or when the backend link is known to be broken
    [[nodiscard]] virtual bool is_valid() const { return !closed_.load(); }

    // Safe to call any number of times; only the first call releases the handle
    void close() {
        bool expected = false;
        if (closed_.compare_exchange_strong(expected, true)) {
            do_close();
        }
    }

    [[nodiscard]] bool is_closed() const noexcept { return closed_.load(); }

    void add_command_listener(std::shared_ptr<CommandListener> listener) {
        if (!listener) return;
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners_.push_back(std::move(listener));
    }

    void remove_command_listener(const std::shared_ptr<CommandListener>& listener) {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (*it == listener) {
                listeners_.erase(it);
                return;
            }
        }
    }

    [[nodiscard]] ConnectionTimingMetrics timing_metrics() const {
        ConnectionTimingMetrics m;
        m.serialization_time = Duration(serialization_ns_.load(std::memory_order_relaxed));
        m.wire_transmit_time = Duration(wire_transmit_ns_.load(std::memory_order_relaxed));
        m.wire_receive_time = Duration(wire_receive_ns_.load(std::memory_order_relaxed));
        m.deserialization_time = Duration(deserialization_ns_.load(std::memory_order_relaxed));
        m.bytes_sent = bytes_sent_.load(std::memory_order_relaxed);
        m.bytes_received = bytes_received_.load(std::memory_order_relaxed);
        m.operation_count = operation_count_.load(std::memory_order_relaxed);
        return m;
    }

    void reset_timing_metrics() {
        serialization_ns_.store(0);
        wire_transmit_ns_.store(0);
        wire_receive_ns_.store(0);
        deserialization_ns_.store(0);
        bytes_sent_.store(0);
        bytes_received_.store(0);
        operation_count_.store(0);
    }

    // Accumulators, fed by the owning adapter
    void record_serialization(Duration d) { serialization_ns_.fetch_add(d.count(), std::memory_order_relaxed); }
    void record_wire_transmit(Duration d) { wire_transmit_ns_.fetch_add(d.count(), std::memory_order_relaxed); }
    void record_wire_receive(Duration d) { wire_receive_ns_.fetch_add(d.count(), std::memory_order_relaxed); }
    void record_deserialization(Duration d) { deserialization_ns_.fetch_add(d.count(), std::memory_order_relaxed); }
    void record_bytes_sent(int64_t n) { bytes_sent_.fetch_add(n, std::memory_order_relaxed); }
    void record_bytes_received(int64_t n) { bytes_received_.fetch_add(n, std::memory_order_relaxed); }
    void record_operation() { operation_count_.fetch_add(1, std::memory_order_relaxed); }

protected:
    // Releases the native handle; called exactly once
    virtual void do_close() = 0;

    // Notifications may be raised from any thread. Each is stamped with this
    // connection's id, since request ids are only unique per connection.
    void notify_started(CommandStartedEvent event) {
        event.connection_id = connection_id_;
        for (const auto& l : listeners()) l->command_started(event);
    }
    void notify_succeeded(CommandSucceededEvent event) {
        event.connection_id = connection_id_;
        for (const auto& l : listeners()) l->command_succeeded(event);
    }
    void notify_failed(CommandFailedEvent event) {
        event.connection_id = connection_id_;
        for (const auto& l : listeners()) l->command_failed(event);
    }

    // Wrapping 32-bit request id, as a wire protocol would assign it; unique
    // only within this connection
    int32_t next_request_id() {
        uint32_t raw = next_request_id_.fetch_add(1, std::memory_order_relaxed);
        return static_cast<int32_t>(raw & 0x7fffffffu);
    }

private:
    std::vector<std::shared_ptr<CommandListener>> listeners() const {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        return listeners_;
    }

    std::string connection_id_;
    std::atomic<bool> closed_{false};

    mutable std::mutex listeners_mutex_;
    std::vector<std::shared_ptr<CommandListener>> listeners_;

    std::atomic<uint32_t> next_request_id_{1};

    std::atomic<int64_t> serialization_ns_{0};
    std::atomic<int64_t> wire_transmit_ns_{0};
    std::atomic<int64_t> wire_receive_ns_{0};
    std::atomic<int64_t> deserialization_ns_{0};
    std::atomic<int64_t> bytes_sent_{0};
    std::atomic<int64_t> bytes_received_{0};
    std::atomic<int64_t> operation_count_{0};
};

// Closes the connection when leaving scope, whatever the exit path
class ScopedConnection {
public:
    explicit ScopedConnection(std::unique_ptr<Connection> conn) : conn_(std::move(conn)) {}

    ~ScopedConnection() {
        if (conn_) conn_->close();
    }

    ScopedConnection(ScopedConnection&&) noexcept = default;
    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            if (conn_) conn_->close();
            conn_ = std::move(other.conn_);
        }
        return *this;
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    Connection& operator*() const { return *conn_; }
    Connection* operator->() const { return conn_.get(); }
    [[nodiscard]] Connection* get() const noexcept { return conn_.get(); }

private:
    std::unique_ptr<Connection> conn_;
};

} // namespace docbench
