#pragma once
#include <cstdint>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "metrics/histogram.hpp"
#include "utils/errors.hpp"

namespace docbench {

// Connection parameters for one adapter instance
struct ConnectionConfig {
    std::string adapter = "postgres";     // postgres | memory
    std::string uri;                      // e.g. postgresql://host:5432/db
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string database = "docbench";
    std::string user;
    std::string password;
    std::map<std::string, std::string> options;  // adapter-specific

    [[nodiscard]] int get_int_option(const std::string& key, int fallback) const {
        auto it = options.find(key);
        if (it == options.end()) return fallback;
        try {
            return std::stoi(it->second);
        } catch (const std::exception&) {
            return fallback;
        }
    }

    [[nodiscard]] std::string get_string_option(const std::string& key, const std::string& fallback) const {
        auto it = options.find(key);
        return it == options.end() ? fallback : it->second;
    }

    [[nodiscard]] bool get_bool_option(const std::string& key, bool fallback) const {
        auto it = options.find(key);
        if (it == options.end()) return fallback;
        return it->second == "true" || it->second == "1" || it->second == "yes";
    }

    // Generic checks; adapters add their own on top. Reports every problem.
    [[nodiscard]] std::vector<ValidationError> validate() const {
        std::vector<ValidationError> errors;
        if (adapter.empty()) {
            errors.push_back({"adapter", "adapter id is required"});
        }
        if (uri.empty() && host.empty()) {
            errors.push_back({"host", "either uri or host is required"});
        }
        if (uri.empty() && port == 0) {
            errors.push_back({"port", "port must be non-zero"});
        }
        if (database.empty()) {
            errors.push_back({"database", "database name is required"});
        }
        for (const auto& [key, value] : options) {
            if (key.empty()) {
                errors.push_back({"options", "option with empty key"});
            } else if (value.empty()) {
                errors.push_back({"options." + key, "option value must not be empty"});
            }
        }
        return errors;
    }
};

struct IndexDefinition {
    std::string name;
    std::vector<std::string> fields;  // dotted paths
};

// Fixture for one benchmark run (collection or table)
struct TestEnvironmentConfig {
    std::string collection_name = "benchmark_docs";
    bool drop_existing = true;
    std::vector<IndexDefinition> indexes;
};

// Shape of generated scaling documents
struct WorkloadConfig {
    int document_count = 100;
    int fields_per_level = 20;
    int nesting_depth = 2;
    int array_length = 10;
    std::vector<std::string> projection_paths = {"field_0", "field_19", "nested_1.field_19"};
    double read_ratio = 1.0;      // remainder split evenly between update/delete
    uint64_t seed = 42;           // PRNG seed for reproducible documents
};

// Full benchmark configuration
struct BenchmarkConfig {
    ConnectionConfig connection;
    TestEnvironmentConfig environment;
    WorkloadConfig workload;

    int warmup_iterations = 100;
    int measure_iterations = 1000;
    int threads = 1;
    int correlation_timeout_ms = 30000;   // pending commands older than this are evicted

    HistogramSettings histogram;

    std::string log_level = "info";
    std::string results_file;     // empty = no export
    bool dry_run = false;

    [[nodiscard]] std::vector<ValidationError> validate() const {
        std::vector<ValidationError> errors = connection.validate();
        if (warmup_iterations < 0) {
            errors.push_back({"warmup_iterations", "must be >= 0"});
        }
        if (measure_iterations <= 0) {
            errors.push_back({"measure_iterations", "must be > 0"});
        }
        if (threads < 1) {
            errors.push_back({"threads", "must be >= 1"});
        }
        if (correlation_timeout_ms <= 0) {
            errors.push_back({"correlation_timeout_ms", "must be > 0"});
        }
        if (histogram.significant_digits < 1 || histogram.significant_digits > 5) {
            errors.push_back({"histogram.significant_digits", "must be in [1, 5]"});
        }
        if (histogram.highest_trackable_ns < 1'000'000) {
            errors.push_back({"histogram.highest_trackable_ns", "must be at least 1 ms"});
        }
        if (workload.document_count <= 0) {
            errors.push_back({"workload.document_count", "must be > 0"});
        }
        if (workload.fields_per_level <= 0) {
            errors.push_back({"workload.fields_per_level", "must be > 0"});
        }
        if (workload.nesting_depth < 0 || workload.array_length < 0) {
            errors.push_back({"workload", "nesting_depth and array_length must be >= 0"});
        }
        if (workload.read_ratio < 0.0 || workload.read_ratio > 1.0) {
            errors.push_back({"workload.read_ratio", "must be in [0, 1]"});
        }
        if (environment.collection_name.empty()) {
            errors.push_back({"environment.collection", "collection name is required"});
        }
        return errors;
    }

    static BenchmarkConfig from_json(const std::string& path);
    static BenchmarkConfig parse(const nlohmann::json& j);
};

inline BenchmarkConfig BenchmarkConfig::from_json(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigurationError("config", "cannot open config file " + path);
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("config", std::string("malformed JSON: ") + e.what());
    }
    return parse(j);
}

inline BenchmarkConfig BenchmarkConfig::parse(const nlohmann::json& j) {
    BenchmarkConfig cfg;
    try {
        cfg.warmup_iterations = j.value("warmup_iterations", cfg.warmup_iterations);
        cfg.measure_iterations = j.value("measure_iterations", cfg.measure_iterations);
        cfg.threads = j.value("threads", cfg.threads);
        cfg.correlation_timeout_ms = j.value("correlation_timeout_ms", cfg.correlation_timeout_ms);
        cfg.log_level = j.value("log_level", cfg.log_level);
        cfg.results_file = j.value("results_file", cfg.results_file);
        cfg.dry_run = j.value("dry_run", cfg.dry_run);

        if (j.contains("connection")) {
            const auto& c = j["connection"];
            cfg.connection.adapter = c.value("adapter", cfg.connection.adapter);
            cfg.connection.uri = c.value("uri", cfg.connection.uri);
            cfg.connection.host = c.value("host", cfg.connection.host);
            cfg.connection.port = c.value("port", cfg.connection.port);
            cfg.connection.database = c.value("database", cfg.connection.database);
            cfg.connection.user = c.value("user", cfg.connection.user);
            cfg.connection.password = c.value("password", cfg.connection.password);
            if (c.contains("options")) {
                for (const auto& [key, value] : c["options"].items()) {
                    cfg.connection.options[key] =
                        value.is_string() ? value.get<std::string>() : value.dump();
                }
            }
        }

        if (j.contains("environment")) {
            const auto& e = j["environment"];
            cfg.environment.collection_name = e.value("collection", cfg.environment.collection_name);
            cfg.environment.drop_existing = e.value("drop_existing", cfg.environment.drop_existing);
            if (e.contains("indexes")) {
                for (const auto& idx : e["indexes"]) {
                    IndexDefinition def;
                    def.name = idx.value("name", "");
                    def.fields = idx.value("fields", std::vector<std::string>{});
                    cfg.environment.indexes.push_back(def);
                }
            }
        }

        if (j.contains("workload")) {
            const auto& w = j["workload"];
            cfg.workload.document_count = w.value("document_count", cfg.workload.document_count);
            cfg.workload.fields_per_level = w.value("fields_per_level", cfg.workload.fields_per_level);
            cfg.workload.nesting_depth = w.value("nesting_depth", cfg.workload.nesting_depth);
            cfg.workload.array_length = w.value("array_length", cfg.workload.array_length);
            cfg.workload.projection_paths = w.value("projection_paths", cfg.workload.projection_paths);
            cfg.workload.read_ratio = w.value("read_ratio", cfg.workload.read_ratio);
            cfg.workload.seed = w.value("seed", cfg.workload.seed);
        }

        if (j.contains("histogram")) {
            const auto& h = j["histogram"];
            cfg.histogram.significant_digits = h.value("significant_digits", cfg.histogram.significant_digits);
            cfg.histogram.highest_trackable_ns = h.value("highest_trackable_ns", cfg.histogram.highest_trackable_ns);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("config", std::string("invalid value: ") + e.what());
    }

    auto errors = cfg.validate();
    if (!errors.empty()) throw ConfigurationError(std::move(errors));
    return cfg;
}

} // namespace docbench
