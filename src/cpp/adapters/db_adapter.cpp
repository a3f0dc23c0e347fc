#include "db_adapter.hpp"
#include "memory_adapter.hpp"
#include "postgres_adapter.hpp"
#include "../utils/logger.hpp"

namespace docbench {

BulkResult DbAdapter::execute_bulk(Connection& conn, const std::vector<Operation>& ops,
                                   MetricsCollector& collector) {
    BulkResult bulk;
    bulk.results.reserve(ops.size());

    Timer timer(time_source());
    timer.start();
    for (const auto& op : ops) {
        OperationResult r = execute(conn, op, collector);
        if (r.ok()) {
            ++bulk.succeeded;
        } else {
            ++bulk.failed;
        }
        bulk.results.push_back(std::move(r));
    }
    timer.stop();

    bulk.total = static_cast<int64_t>(ops.size());
    bulk.total_duration = timer.elapsed();
    if (bulk.failed > 0) {
        LOG_WRN("[%s] Bulk of %lld operation(s): %lld failed", adapter_id().c_str(),
            static_cast<long long>(bulk.total), static_cast<long long>(bulk.failed));
    }
    return bulk;
}

std::unique_ptr<DbAdapter> create_adapter(const std::string& adapter_id, MetricsCollector& collector,
                                          std::shared_ptr<TimeSource> time_source) {
    if (adapter_id == PostgresAdapter::ADAPTER_ID) {
        return std::make_unique<PostgresAdapter>(collector, std::move(time_source));
    }
    if (adapter_id == MemoryAdapter::ADAPTER_ID) {
        return std::make_unique<MemoryAdapter>(collector, std::move(time_source));
    }
    throw ConfigurationError("adapter", "unknown adapter '" + adapter_id + "' (valid: postgres, memory)");
}

} // namespace docbench
