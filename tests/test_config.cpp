#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "config.hpp"

using namespace docbench;

namespace {

bool has_error_for(const std::vector<ValidationError>& errors, const std::string& field) {
    for (const auto& e : errors) {
        if (e.field == field) return true;
    }
    return false;
}

} // namespace

TEST(ConfigTest, DefaultsAreValid) {
    BenchmarkConfig cfg;
    EXPECT_TRUE(cfg.validate().empty());
}

TEST(ConfigTest, ParsesNestedSections) {
    auto cfg = BenchmarkConfig::parse(nlohmann::json::parse(R"({
        "warmup_iterations": 5,
        "measure_iterations": 50,
        "threads": 4,
        "correlation_timeout_ms": 1500,
        "connection": {"adapter": "memory", "options": {"traversal": "indexed", "simulated_latency_us": 20}},
        "environment": {"collection": "docs", "drop_existing": false,
                        "indexes": [{"name": "by_seq", "fields": ["seq"]}]},
        "workload": {"document_count": 10, "projection_paths": ["field_0"], "read_ratio": 0.5, "seed": 7},
        "histogram": {"significant_digits": 2}
    })"));

    EXPECT_EQ(cfg.warmup_iterations, 5);
    EXPECT_EQ(cfg.measure_iterations, 50);
    EXPECT_EQ(cfg.threads, 4);
    EXPECT_EQ(cfg.correlation_timeout_ms, 1500);
    EXPECT_EQ(cfg.connection.adapter, "memory");
    EXPECT_EQ(cfg.connection.get_string_option("traversal", ""), "indexed");
    EXPECT_EQ(cfg.connection.get_int_option("simulated_latency_us", 0), 20);
    EXPECT_EQ(cfg.environment.collection_name, "docs");
    EXPECT_FALSE(cfg.environment.drop_existing);
    ASSERT_EQ(cfg.environment.indexes.size(), 1u);
    EXPECT_EQ(cfg.environment.indexes[0].fields[0], "seq");
    EXPECT_EQ(cfg.workload.document_count, 10);
    EXPECT_DOUBLE_EQ(cfg.workload.read_ratio, 0.5);
    EXPECT_EQ(cfg.workload.seed, 7u);
    EXPECT_EQ(cfg.histogram.significant_digits, 2);
}

TEST(ConfigTest, ReportsEveryProblemAtOnce) {
    try {
        BenchmarkConfig::parse(nlohmann::json::parse(R"({
            "measure_iterations": 0,
            "threads": 0,
            "workload": {"read_ratio": 1.5},
            "connection": {"database": ""}
        })"));
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        const auto& errors = e.errors();
        EXPECT_GE(errors.size(), 4u);
        EXPECT_TRUE(has_error_for(errors, "measure_iterations"));
        EXPECT_TRUE(has_error_for(errors, "threads"));
        EXPECT_TRUE(has_error_for(errors, "workload.read_ratio"));
        EXPECT_TRUE(has_error_for(errors, "database"));
        EXPECT_NE(std::string(e.what()).find("threads"), std::string::npos);
    }
}

TEST(ConfigTest, WrongValueTypeIsAConfigurationError) {
    EXPECT_THROW(BenchmarkConfig::parse(nlohmann::json::parse(R"({"threads": "many"})")),
                 ConfigurationError);
}

TEST(ConfigTest, MissingFileIsAConfigurationError) {
    EXPECT_THROW(BenchmarkConfig::from_json("/nonexistent/docbench.json"), ConfigurationError);
}

TEST(ConfigTest, MalformedFileIsAConfigurationError) {
    const std::string path = ::testing::TempDir() + "docbench_malformed.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(BenchmarkConfig::from_json(path), ConfigurationError);
    std::remove(path.c_str());
}

TEST(ConfigTest, ConnectionOptionGetters) {
    ConnectionConfig c;
    c.options = {{"n", "12"}, {"bad", "x"}, {"flag", "yes"}};

    EXPECT_EQ(c.get_int_option("n", 0), 12);
    EXPECT_EQ(c.get_int_option("bad", 3), 3);
    EXPECT_EQ(c.get_int_option("absent", 9), 9);
    EXPECT_TRUE(c.get_bool_option("flag", false));
    EXPECT_EQ(c.get_string_option("absent", "dflt"), "dflt");
}

TEST(ConfigTest, EmptyOptionValueIsRejected) {
    ConnectionConfig c;
    c.options["traversal"] = "";
    EXPECT_TRUE(has_error_for(c.validate(), "options.traversal"));
}
