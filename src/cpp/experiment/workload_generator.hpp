#pragma once
// Generates scaling documents and the operation mix of a benchmark phase.
//
// Document shape (fields_per_level = N, nesting_depth = D, array_length = A):
//   { "field_0" .. "field_<N-1>",
//     "nested_1": { "field_0" .. "field_<N-1>", "nested_2": { ... up to D } },
//     "items": [ {"index": 0, "value": ...}, ... A elements ] }
// Field order is fixed, so "field_<k>" always sits at ordinal position k:
// reading the first vs. the last field exposes position-dependent cost.
//
// Deterministic for a given seed (xoshiro256**).
#include <cstdint>
#include <string>
#include <vector>
#include "../adapters/operation.hpp"
#include "../config.hpp"

namespace docbench {

class WorkloadGenerator {
public:
    WorkloadGenerator(const WorkloadConfig& cfg, uint64_t seed);

    [[nodiscard]] Document make_document(int index);

    [[nodiscard]] static std::string document_id(int index);

    // One insert per document of the workload
    [[nodiscard]] std::vector<Operation> seed_operations(const std::string& id_prefix);

    // Read with the configured projection, or an update/delete, per read_ratio
    [[nodiscard]] Operation next_operation(const std::string& operation_id);

private:
    Document make_level(int depth);

    void seed_prng(uint64_t seed);
    uint64_t next_u64();
    double next_unit();    // [0, 1)

    WorkloadConfig cfg_;
    uint64_t prng_state_[4]{};
};

} // namespace docbench
