#pragma once
// In-process reference backend.
//
// Documents live in process memory. Every connection runs a session thread
// that plays the server: commands are handed over through a blocking queue,
// executed there, and completion notifications are raised on that thread,
// so correlation never sees same-thread delivery.
//
// Option "traversal" selects how the server stores and walks documents:
//   sequential  field-ordered documents, paths resolved by scanning fields
//   indexed     keyed documents, paths resolved by per-level lookup
// Unlike a wire backend it can time its own traversal, so it reports
// server_traversal_time.
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "db_adapter.hpp"
#include "document_navigator.hpp"
#include "traversal_timer.hpp"

namespace docbench {

class MemoryStore;

class MemoryAdapter final : public DbAdapter {
public:
    static constexpr const char* ADAPTER_ID = "memory";

    explicit MemoryAdapter(MetricsCollector& collector,
                           std::shared_ptr<TimeSource> time_source = SystemTimeSource::instance());
    ~MemoryAdapter() override;

    [[nodiscard]] std::string adapter_id() const override { return ADAPTER_ID; }
    [[nodiscard]] std::string display_name() const override { return "In-process document store"; }
    [[nodiscard]] std::string version() const override { return "1.0"; }
    [[nodiscard]] CapabilitySet capabilities() const override;

    [[nodiscard]] std::vector<ValidationError> validate_config(const ConnectionConfig& config) const override;
    [[nodiscard]] std::map<std::string, std::string> configuration_options() const override;

    std::unique_ptr<Connection> connect(const ConnectionConfig& config) override;

    OperationResult execute(Connection& conn, const Operation& op, MetricsCollector& collector) override;

    void setup_test_environment(const TestEnvironmentConfig& config) override;
    void teardown_test_environment() override;

    [[nodiscard]] TimingInterceptor* timing_interceptor() override { return interceptor_.get(); }
    [[nodiscard]] TraversalTimer& traversal_timer() noexcept { return traversal_timer_; }

    // Set by the first successful connect()
    [[nodiscard]] std::optional<TraversalStrategy> strategy() const;

    // Documents currently held (0 before the first connect)
    [[nodiscard]] size_t document_count() const;

protected:
    [[nodiscard]] const TimeSource& time_source() const override { return *time_source_; }

private:
    std::shared_ptr<TimeSource> time_source_;
    std::shared_ptr<TimingInterceptor> interceptor_;
    TraversalTimer traversal_timer_;
    CapabilitySet capabilities_;             // guarded by state_mutex_

    mutable std::mutex state_mutex_;
    std::shared_ptr<MemoryStore> store_;     // created on first connect
    int next_connection_ = 0;
};

} // namespace docbench
