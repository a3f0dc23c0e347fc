#pragma once
// Outcome of one executed operation, built once and never mutated.
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "operation.hpp"
#include "../metrics/overhead_breakdown.hpp"
#include "../utils/timer.hpp"

namespace docbench {

class OperationResult {
public:
    class Builder;

    static OperationResult success(std::string operation_id, OperationType type,
                                   Duration total, std::optional<OverheadBreakdown> breakdown = std::nullopt);

    static OperationResult failure(std::string operation_id, OperationType type,
                                   Duration total, std::string error);

    [[nodiscard]] const std::string& operation_id() const noexcept { return operation_id_; }
    [[nodiscard]] OperationType type() const noexcept { return type_; }
    [[nodiscard]] bool ok() const noexcept { return success_; }
    [[nodiscard]] Duration total_duration() const noexcept { return total_; }
    [[nodiscard]] const std::optional<Document>& payload() const noexcept { return payload_; }
    [[nodiscard]] const std::optional<OverheadBreakdown>& overhead_breakdown() const noexcept {
        return breakdown_;
    }
    [[nodiscard]] const std::map<std::string, nlohmann::json>& metadata() const noexcept { return metadata_; }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }

    [[nodiscard]] nlohmann::json to_json() const;

private:
    OperationResult() = default;

    std::string operation_id_;
    OperationType type_ = OperationType::READ;
    bool success_ = false;
    Duration total_{0};
    std::optional<Document> payload_;
    std::optional<OverheadBreakdown> breakdown_;
    std::map<std::string, nlohmann::json> metadata_;
    std::string error_;
};

class OperationResult::Builder {
public:
    Builder(std::string operation_id, OperationType type) {
        r_.operation_id_ = std::move(operation_id);
        r_.type_ = type;
    }

    Builder& success(bool ok) { r_.success_ = ok; return *this; }
    Builder& total_duration(Duration d) { r_.total_ = d; return *this; }
    Builder& payload(Document doc) { r_.payload_ = std::move(doc); return *this; }
    Builder& overhead_breakdown(OverheadBreakdown b) { r_.breakdown_ = std::move(b); return *this; }
    Builder& metadata(const std::string& key, nlohmann::json value) {
        r_.metadata_[key] = std::move(value);
        return *this;
    }
    Builder& error(std::string message) { r_.error_ = std::move(message); return *this; }

    [[nodiscard]] OperationResult build() const { return r_; }

private:
    OperationResult r_;
};

// Per-item counts for a batch; partial failure is a normal outcome
struct BulkResult {
    int64_t total = 0;
    int64_t succeeded = 0;
    int64_t failed = 0;
    Duration total_duration{0};
    std::vector<OperationResult> results;

    [[nodiscard]] bool all_succeeded() const noexcept { return failed == 0; }

    [[nodiscard]] double throughput_ops_per_sec() const noexcept {
        if (total_duration.count() <= 0) return 0.0;
        return static_cast<double>(total) * 1e9 / static_cast<double>(total_duration.count());
    }
};

} // namespace docbench
