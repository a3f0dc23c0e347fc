#include "aggregate_pipeline.hpp"
#include "document_navigator.hpp"

#include <stdexcept>

namespace docbench {

AggregatePipeline parse_pipeline(const std::vector<std::string>& stages) {
    AggregatePipeline p;

    for (const auto& text : stages) {
        nlohmann::json stage;
        try {
            stage = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::invalid_argument(std::string("malformed pipeline stage: ") + e.what());
        }
        if (!stage.is_object() || stage.size() != 1) {
            throw std::invalid_argument("pipeline stage must have exactly one operator: " + text);
        }

        const std::string op = stage.begin().key();
        const nlohmann::json& arg = stage.begin().value();

        if (op == "$match") {
            if (!arg.is_object()) throw std::invalid_argument("$match expects an object");
            for (const auto& [path, value] : arg.items()) {
                parse_path(path);   // reject malformed paths up front
                p.match.push_back({path, value});
            }
        } else if (op == "$project") {
            if (!arg.is_array()) throw std::invalid_argument("$project expects an array of paths");
            for (const auto& path : arg) {
                if (!path.is_string()) throw std::invalid_argument("$project paths must be strings");
                parse_path(path.get<std::string>());
                p.project.push_back(path.get<std::string>());
            }
        } else if (op == "$limit") {
            if (!arg.is_number_integer() || arg.get<int64_t>() < 0) {
                throw std::invalid_argument("$limit expects a non-negative integer");
            }
            p.limit = arg.get<int64_t>();
        } else if (op == "$count") {
            if (!arg.is_string() || arg.get<std::string>().empty()) {
                throw std::invalid_argument("$count expects a field name");
            }
            p.count_field = arg.get<std::string>();
        } else {
            throw std::invalid_argument("unsupported pipeline operator: " + op);
        }
        ++p.stages;
    }
    return p;
}

} // namespace docbench
