#pragma once
// Benchmark operations: a closed set of request kinds, dispatched on by
// adapters via std::visit. Every operation carries a caller-assigned id that
// correlates it with its OperationResult.
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace docbench {

// Documents keep their field order: sequential-scan traversal depends on it
using Document = nlohmann::ordered_json;

enum class OperationType { INSERT, READ, UPDATE, DELETE, AGGREGATE };

inline const char* operation_type_str(OperationType t) {
    switch (t) {
        case OperationType::INSERT:    return "insert";
        case OperationType::READ:      return "read";
        case OperationType::UPDATE:    return "update";
        case OperationType::DELETE:    return "delete";
        case OperationType::AGGREGATE: return "aggregate";
    }
    return "??";
}

enum class ReadPreference { PRIMARY, PRIMARY_PREFERRED, SECONDARY, SECONDARY_PREFERRED, NEAREST };

inline const char* read_preference_str(ReadPreference p) {
    switch (p) {
        case ReadPreference::PRIMARY:             return "primary";
        case ReadPreference::PRIMARY_PREFERRED:   return "primaryPreferred";
        case ReadPreference::SECONDARY:           return "secondary";
        case ReadPreference::SECONDARY_PREFERRED: return "secondaryPreferred";
        case ReadPreference::NEAREST:             return "nearest";
    }
    return "??";
}

struct InsertOperation {
    std::string id;
    std::string document_id;
    Document document;
};

struct ReadOperation {
    std::string id;
    std::string document_id;
    std::vector<std::string> projection_paths;  // empty = full document
    ReadPreference read_preference = ReadPreference::PRIMARY;

    [[nodiscard]] bool has_projection() const noexcept { return !projection_paths.empty(); }
};

struct UpdateOperation {
    std::string id;
    std::string document_id;
    std::string path;
    nlohmann::json new_value;
    bool upsert = false;
};

struct DeleteOperation {
    std::string id;
    std::string document_id;
};

struct AggregateOperation {
    std::string id;
    std::vector<std::string> pipeline_stages;
    bool explain = false;
};

using Operation = std::variant<InsertOperation, ReadOperation, UpdateOperation,
                               DeleteOperation, AggregateOperation>;

inline const std::string& operation_id(const Operation& op) {
    return std::visit([](const auto& o) -> const std::string& { return o.id; }, op);
}

inline OperationType operation_type(const Operation& op) {
    // Alternative order matches the OperationType enumerators
    return static_cast<OperationType>(op.index());
}

// Convenience constructors
inline Operation make_insert(std::string id, std::string document_id, Document doc) {
    return InsertOperation{std::move(id), std::move(document_id), std::move(doc)};
}

inline Operation make_read(std::string id, std::string document_id,
                           std::vector<std::string> projection = {},
                           ReadPreference pref = ReadPreference::PRIMARY) {
    return ReadOperation{std::move(id), std::move(document_id), std::move(projection), pref};
}

inline Operation make_update(std::string id, std::string document_id, std::string path,
                             nlohmann::json value, bool upsert = false) {
    return UpdateOperation{std::move(id), std::move(document_id), std::move(path),
                           std::move(value), upsert};
}

inline Operation make_delete(std::string id, std::string document_id) {
    return DeleteOperation{std::move(id), std::move(document_id)};
}

inline Operation make_aggregate(std::string id, std::vector<std::string> stages, bool explain = false) {
    return AggregateOperation{std::move(id), std::move(stages), explain};
}

} // namespace docbench
