#pragma once
// Named optional adapter behaviors. The set is open: adapters may advertise
// tags beyond the well-known ones below. Callers query, never infer.
#include <initializer_list>
#include <set>
#include <string>

namespace docbench {

namespace capability {
// Document access patterns
inline constexpr const char* NESTED_DOCUMENT_ACCESS     = "nested_document_access";
inline constexpr const char* ARRAY_INDEX_ACCESS         = "array_index_access";
inline constexpr const char* PARTIAL_DOCUMENT_RETRIEVAL = "partial_document_retrieval";
inline constexpr const char* HASH_INDEXED_FIELD_ACCESS  = "hash_indexed_field_access";

// Operations
inline constexpr const char* BULK_INSERT = "bulk_insert";
inline constexpr const char* BULK_READ   = "bulk_read";
inline constexpr const char* BULK_UPDATE = "bulk_update";

// Indexing and transactions
inline constexpr const char* SECONDARY_INDEXES           = "secondary_indexes";
inline constexpr const char* JSON_PATH_INDEXES           = "json_path_indexes";
inline constexpr const char* SINGLE_DOCUMENT_ATOMICITY   = "single_document_atomicity";
inline constexpr const char* MULTI_DOCUMENT_TRANSACTIONS = "multi_document_transactions";

// Instrumentation
inline constexpr const char* SERVER_EXECUTION_TIME   = "server_execution_time";
inline constexpr const char* SERVER_TRAVERSAL_TIME   = "server_traversal_time";
inline constexpr const char* EXPLAIN_PLAN            = "explain_plan";
inline constexpr const char* CLIENT_TIMING_HOOKS     = "client_timing_hooks";
inline constexpr const char* DESERIALIZATION_METRICS = "deserialization_metrics";
} // namespace capability

class CapabilitySet {
public:
    CapabilitySet() = default;
    CapabilitySet(std::initializer_list<std::string> tags) : tags_(tags) {}

    void add(const std::string& tag) { tags_.insert(tag); }
    void remove(const std::string& tag) { tags_.erase(tag); }

    [[nodiscard]] bool contains(const std::string& tag) const { return tags_.count(tag) != 0; }

    [[nodiscard]] bool contains_all(const CapabilitySet& other) const {
        for (const auto& t : other.tags_) {
            if (!contains(t)) return false;
        }
        return true;
    }

    [[nodiscard]] const std::set<std::string>& tags() const noexcept { return tags_; }
    [[nodiscard]] size_t size() const noexcept { return tags_.size(); }

private:
    std::set<std::string> tags_;
};

} // namespace docbench
