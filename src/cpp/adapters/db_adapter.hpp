#pragma once
// Abstract document-database adapter.
//
// Backends differ in what they can observe; each advertises an open set of
// capability tags and callers query it before relying on optional behavior.
// A dimension an adapter cannot observe is reported as zero, never omitted.
//
// Error policy:
//   connect()   ConfigurationError (all problems, before any network attempt)
//               or ConnectionError
//   execute()   never throws; a failed operation is a failed OperationResult
//   setup/teardown_test_environment()  SetupError; both idempotent
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "capability.hpp"
#include "connection.hpp"
#include "operation.hpp"
#include "operation_result.hpp"
#include "timing_interceptor.hpp"
#include "../config.hpp"
#include "../metrics/metrics_collector.hpp"
#include "../utils/errors.hpp"
#include "../utils/timer.hpp"

namespace docbench {

class DbAdapter {
public:
    virtual ~DbAdapter() = default;

    // System identification
    [[nodiscard]] virtual std::string adapter_id() const = 0;
    [[nodiscard]] virtual std::string display_name() const = 0;
    [[nodiscard]] virtual std::string version() const = 0;

    // A copy: the set may grow when the first connection fixes the backend layout
    [[nodiscard]] virtual CapabilitySet capabilities() const = 0;

    [[nodiscard]] bool has_capability(const std::string& tag) const {
        return capabilities().contains(tag);
    }

    [[nodiscard]] bool has_all_capabilities(const CapabilitySet& required) const {
        return capabilities().contains_all(required);
    }

    // Throws CapabilityNotSupportedError when the tag is not advertised
    void require_capability(const std::string& tag) const {
        if (!has_capability(tag)) {
            throw CapabilityNotSupportedError(tag, adapter_id());
        }
    }

    // Every problem with the config, generic checks included; empty = valid
    [[nodiscard]] virtual std::vector<ValidationError> validate_config(const ConnectionConfig& config) const {
        return config.validate();
    }

    // Adapter-specific option keys with a short description each
    [[nodiscard]] virtual std::map<std::string, std::string> configuration_options() const = 0;

    virtual std::unique_ptr<Connection> connect(const ConnectionConfig& config) = 0;

    virtual OperationResult execute(Connection& conn, const Operation& op, MetricsCollector& collector) = 0;

    // Runs execute() per item; partial failure is reported, not thrown
    virtual BulkResult execute_bulk(Connection& conn, const std::vector<Operation>& ops,
                                    MetricsCollector& collector);

    // The captured breakdown, or a total-only one when nothing finer exists
    [[nodiscard]] virtual OverheadBreakdown get_overhead_breakdown(const OperationResult& result) const {
        if (result.overhead_breakdown()) return *result.overhead_breakdown();
        return OverheadBreakdown::total_only(result.total_duration());
    }

    virtual void setup_test_environment(const TestEnvironmentConfig& config) = 0;
    virtual void teardown_test_environment() = 0;

    // Correlation layer fed by this adapter's connections, if it has one
    [[nodiscard]] virtual TimingInterceptor* timing_interceptor() { return nullptr; }

protected:
    // connect() helper: throws ConfigurationError carrying every problem
    void ensure_valid_config(const ConnectionConfig& config) const {
        auto errors = validate_config(config);
        if (!errors.empty()) throw ConfigurationError(std::move(errors));
    }

    // Elapsed time on the adapter's clock; used by execute_bulk
    [[nodiscard]] virtual const TimeSource& time_source() const { return *SystemTimeSource::instance(); }
};

// Known adapter ids: "postgres", "memory". Throws ConfigurationError otherwise.
std::unique_ptr<DbAdapter> create_adapter(const std::string& adapter_id, MetricsCollector& collector,
                                          std::shared_ptr<TimeSource> time_source = SystemTimeSource::instance());

} // namespace docbench
