#include "workload_generator.hpp"

#include <cstdio>

namespace docbench {

static uint64_t splitmix64(uint64_t& x) {
    uint64_t z = (x += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

static uint64_t rotl64(uint64_t x, int k) {
    return (x << k) | (x >> (64 - k));
}

WorkloadGenerator::WorkloadGenerator(const WorkloadConfig& cfg, uint64_t seed) : cfg_(cfg) {
    seed_prng(seed);
}

void WorkloadGenerator::seed_prng(uint64_t seed) {
    uint64_t s = seed;
    prng_state_[0] = splitmix64(s);
    prng_state_[1] = splitmix64(s);
    prng_state_[2] = splitmix64(s);
    prng_state_[3] = splitmix64(s);
}

uint64_t WorkloadGenerator::next_u64() {
    const uint64_t result = rotl64(prng_state_[1] * 5, 7) * 9;
    const uint64_t t = prng_state_[1] << 17;
    prng_state_[2] ^= prng_state_[0];
    prng_state_[3] ^= prng_state_[1];
    prng_state_[1] ^= prng_state_[2];
    prng_state_[0] ^= prng_state_[3];
    prng_state_[2] ^= t;
    prng_state_[3] = rotl64(prng_state_[3], 45);
    return result;
}

double WorkloadGenerator::next_unit() {
    return static_cast<double>(next_u64() >> 11) * 0x1.0p-53;
}

std::string WorkloadGenerator::document_id(int index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "doc-%06d", index);
    return buf;
}

Document WorkloadGenerator::make_level(int depth) {
    Document level = Document::object();
    for (int f = 0; f < cfg_.fields_per_level; ++f) {
        const std::string name = "field_" + std::to_string(f);
        // Alternate value kinds so decoders see strings and numbers
        if (f % 2 == 0) {
            level[name] = "value_" + std::to_string(next_u64() % 100000);
        } else {
            level[name] = static_cast<int64_t>(next_u64() % 1000000);
        }
    }
    if (depth < cfg_.nesting_depth) {
        level["nested_" + std::to_string(depth + 1)] = make_level(depth + 1);
    }
    return level;
}

Document WorkloadGenerator::make_document(int index) {
    Document doc = make_level(0);
    if (cfg_.array_length > 0) {
        Document items = Document::array();
        for (int i = 0; i < cfg_.array_length; ++i) {
            items.push_back({{"index", i}, {"value", static_cast<int64_t>(next_u64() % 1000)}});
        }
        doc["items"] = std::move(items);
    }
    doc["seq"] = index;
    return doc;
}

std::vector<Operation> WorkloadGenerator::seed_operations(const std::string& id_prefix) {
    std::vector<Operation> ops;
    ops.reserve(static_cast<size_t>(cfg_.document_count));
    for (int i = 0; i < cfg_.document_count; ++i) {
        ops.push_back(make_insert(id_prefix + "-" + std::to_string(i), document_id(i), make_document(i)));
    }
    return ops;
}

Operation WorkloadGenerator::next_operation(const std::string& operation_id) {
    const int target = static_cast<int>(next_u64() % static_cast<uint64_t>(cfg_.document_count));
    const double roll = next_unit();

    if (roll < cfg_.read_ratio) {
        return make_read(operation_id, document_id(target), cfg_.projection_paths);
    }
    // Remainder split evenly between update and delete
    const double write_share = (roll - cfg_.read_ratio) / (1.0 - cfg_.read_ratio);
    if (write_share < 0.5) {
        const int field = static_cast<int>(next_u64() % static_cast<uint64_t>(cfg_.fields_per_level));
        return make_update(operation_id, document_id(target), "field_" + std::to_string(field),
                           static_cast<int64_t>(next_u64() % 1000000));
    }
    return make_delete(operation_id, document_id(target));
}

} // namespace docbench
