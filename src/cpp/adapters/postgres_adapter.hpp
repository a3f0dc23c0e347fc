#pragma once
// PostgreSQL document adapter (libpq).
//
// Documents live in one table (id TEXT PRIMARY KEY, doc JSON|JSONB). The
// option "document_format" picks the storage the comparison is about:
//   json   text, re-parsed and scanned in field order on every path access
//   jsonb  binary, per-level keyed lookup
//
// Every statement reports its own server time
// (clock_timestamp() - statement_timestamp()) and goes through a command
// channel that raises started/succeeded/failed notifications for the timing
// correlation layer. Aggregates with explain run EXPLAIN (ANALYZE) and report
// planning and execution time. Server traversal time is not observable here
// and is reported as zero.
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "db_adapter.hpp"
#include "traversal_timer.hpp"

namespace docbench {

enum class DocumentFormat { JSON, JSONB };

inline const char* document_format_str(DocumentFormat f) {
    switch (f) {
        case DocumentFormat::JSON:  return "json";
        case DocumentFormat::JSONB: return "jsonb";
    }
    return "??";
}

class PostgresAdapter final : public DbAdapter {
public:
    static constexpr const char* ADAPTER_ID = "postgres";

    explicit PostgresAdapter(MetricsCollector& collector,
                             std::shared_ptr<TimeSource> time_source = SystemTimeSource::instance());
    ~PostgresAdapter() override = default;

    [[nodiscard]] std::string adapter_id() const override { return ADAPTER_ID; }
    [[nodiscard]] std::string display_name() const override { return "PostgreSQL (json/jsonb)"; }
    [[nodiscard]] std::string version() const override;
    [[nodiscard]] CapabilitySet capabilities() const override;

    [[nodiscard]] std::vector<ValidationError> validate_config(const ConnectionConfig& config) const override;
    [[nodiscard]] std::map<std::string, std::string> configuration_options() const override;

    // Throws ConfigurationError before any network attempt, ConnectionError
    // when the server cannot be reached or rejects the credentials
    std::unique_ptr<Connection> connect(const ConnectionConfig& config) override;

    OperationResult execute(Connection& conn, const Operation& op, MetricsCollector& collector) override;

    void setup_test_environment(const TestEnvironmentConfig& config) override;
    void teardown_test_environment() override;

    [[nodiscard]] TimingInterceptor* timing_interceptor() override { return interceptor_.get(); }

    // Set by the first successful connect()
    [[nodiscard]] std::optional<DocumentFormat> document_format() const;

protected:
    [[nodiscard]] const TimeSource& time_source() const override { return *time_source_; }

private:
    // Runs DDL on a short-lived connection outside the command channel
    void run_ddl(const std::vector<std::string>& statements) const;

    std::shared_ptr<TimeSource> time_source_;
    std::shared_ptr<TimingInterceptor> interceptor_;
    TraversalTimer traversal_timer_;
    CapabilitySet capabilities_;             // guarded by state_mutex_

    mutable std::mutex state_mutex_;
    std::optional<ConnectionConfig> config_;      // remembered for fixture DDL
    std::optional<DocumentFormat> format_;
    std::string table_ = "benchmark_docs";
    bool table_created_ = false;
    int next_connection_ = 0;
};

} // namespace docbench
