#pragma once
// Backend-neutral aggregation pipeline.
//
// Each stage is a JSON object with exactly one operator:
//   {"$match":   {"<path>": <value>, ...}}   equality on dotted paths, ANDed
//   {"$project": ["<path>", ...]}
//   {"$limit":   <n>}
//   {"$count":   "<field>"}
// Adapters translate the parsed form into their own query language.
// Stages are applied in a fixed order: match, limit, project, count.
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace docbench {

struct MatchCondition {
    std::string path;
    nlohmann::json value;
};

struct AggregatePipeline {
    std::vector<MatchCondition> match;
    std::vector<std::string> project;
    std::optional<int64_t> limit;
    std::optional<std::string> count_field;
    size_t stages = 0;              // number of stages parsed
};

// Throws std::invalid_argument on malformed JSON or an unknown operator
AggregatePipeline parse_pipeline(const std::vector<std::string>& stages);

} // namespace docbench
