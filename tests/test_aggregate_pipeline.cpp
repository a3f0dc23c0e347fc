#include <gtest/gtest.h>

#include <stdexcept>

#include "adapters/aggregate_pipeline.hpp"

using namespace docbench;

TEST(AggregatePipelineTest, ParsesAllStages) {
    auto p = parse_pipeline({
        R"({"$match": {"status": "active", "nested_1.field_1": 7}})",
        R"({"$project": ["field_0", "items[0].value"]})",
        R"({"$limit": 5})",
    });

    EXPECT_EQ(p.stages, 3u);
    ASSERT_EQ(p.match.size(), 2u);
    EXPECT_EQ(p.project, (std::vector<std::string>{"field_0", "items[0].value"}));
    ASSERT_TRUE(p.limit.has_value());
    EXPECT_EQ(*p.limit, 5);
    EXPECT_FALSE(p.count_field.has_value());
}

TEST(AggregatePipelineTest, CountStage) {
    auto p = parse_pipeline({R"({"$match": {"seq": 3}})", R"({"$count": "n"})"});
    ASSERT_TRUE(p.count_field.has_value());
    EXPECT_EQ(*p.count_field, "n");
    EXPECT_EQ(p.match[0].value.get<int>(), 3);
}

TEST(AggregatePipelineTest, EmptyPipelineIsValid) {
    auto p = parse_pipeline({});
    EXPECT_EQ(p.stages, 0u);
    EXPECT_TRUE(p.match.empty());
}

TEST(AggregatePipelineTest, RejectsMalformedStages) {
    const std::vector<std::string> bad = {
        "not json",
        R"({"$match": {}, "$limit": 1})",
        R"({"$group": {}})",
        R"({"$limit": -1})",
        R"({"$limit": "ten"})",
        R"({"$project": "field_0"})",
        R"({"$project": [1]})",
        R"({"$count": ""})",
        R"({"$match": {"a..b": 1}})",
        R"([1, 2])",
    };
    for (const auto& stage : bad) {
        EXPECT_THROW(parse_pipeline({stage}), std::invalid_argument) << stage;
    }
}
