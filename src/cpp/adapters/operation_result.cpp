#include "operation_result.hpp"

namespace docbench {

OperationResult OperationResult::success(std::string operation_id, OperationType type,
                                         Duration total, std::optional<OverheadBreakdown> breakdown) {
    Builder b(std::move(operation_id), type);
    b.success(true).total_duration(total);
    if (breakdown) b.overhead_breakdown(std::move(*breakdown));
    return b.build();
}

OperationResult OperationResult::failure(std::string operation_id, OperationType type,
                                         Duration total, std::string error) {
    return Builder(std::move(operation_id), type)
        .success(false)
        .total_duration(total)
        .error(std::move(error))
        .build();
}

nlohmann::json OperationResult::to_json() const {
    nlohmann::json j = {
        {"operation_id", operation_id_},
        {"type", operation_type_str(type_)},
        {"success", success_},
        {"total_duration_ns", total_.count()},
    };
    if (!error_.empty()) j["error"] = error_;
    if (breakdown_) j["overhead"] = breakdown_->to_json();
    if (!metadata_.empty()) j["metadata"] = metadata_;
    return j;
}

} // namespace docbench
