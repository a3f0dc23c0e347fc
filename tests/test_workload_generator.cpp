#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "experiment/workload_generator.hpp"

using namespace docbench;

namespace {

WorkloadConfig small_workload() {
    WorkloadConfig w;
    w.document_count = 8;
    w.fields_per_level = 4;
    w.nesting_depth = 2;
    w.array_length = 3;
    w.projection_paths = {"field_0", "nested_1.field_3"};
    return w;
}

} // namespace

TEST(WorkloadGeneratorTest, SameSeedSameDocuments) {
    WorkloadGenerator a(small_workload(), 11);
    WorkloadGenerator b(small_workload(), 11);
    WorkloadGenerator c(small_workload(), 12);

    const Document da = a.make_document(0);
    EXPECT_EQ(da, b.make_document(0));
    EXPECT_NE(da, c.make_document(0));
}

TEST(WorkloadGeneratorTest, DocumentShape) {
    WorkloadGenerator gen(small_workload(), 1);
    const Document doc = gen.make_document(5);

    // field_<k> sits at ordinal position k
    auto it = doc.begin();
    for (int k = 0; k < 4; ++k, ++it) {
        EXPECT_EQ(it.key(), "field_" + std::to_string(k));
    }
    EXPECT_TRUE(doc.at("field_0").is_string());
    EXPECT_TRUE(doc.at("field_1").is_number_integer());

    ASSERT_TRUE(doc.contains("nested_1"));
    ASSERT_TRUE(doc.at("nested_1").contains("nested_2"));
    EXPECT_FALSE(doc.at("nested_1").at("nested_2").contains("nested_3"));
    EXPECT_TRUE(doc.at("nested_1").at("nested_2").contains("field_3"));

    ASSERT_EQ(doc.at("items").size(), 3u);
    EXPECT_EQ(doc.at("items")[2].at("index"), 2);
    EXPECT_EQ(doc.at("seq"), 5);
}

TEST(WorkloadGeneratorTest, NoArrayWhenLengthIsZero) {
    WorkloadConfig w = small_workload();
    w.array_length = 0;
    w.nesting_depth = 0;
    WorkloadGenerator gen(w, 1);

    const Document doc = gen.make_document(0);
    EXPECT_FALSE(doc.contains("items"));
    EXPECT_FALSE(doc.contains("nested_1"));
}

TEST(WorkloadGeneratorTest, SeedOperationsInsertEveryDocument) {
    WorkloadGenerator gen(small_workload(), 3);
    auto ops = gen.seed_operations("seed");

    ASSERT_EQ(ops.size(), 8u);
    const auto& first = std::get<InsertOperation>(ops.front());
    EXPECT_EQ(first.id, "seed-0");
    EXPECT_EQ(first.document_id, "doc-000000");
    EXPECT_EQ(std::get<InsertOperation>(ops.back()).document_id, "doc-000007");
    EXPECT_EQ(WorkloadGenerator::document_id(123456), "doc-123456");
}

TEST(WorkloadGeneratorTest, ReadOnlyMixUsesTheProjection) {
    WorkloadGenerator gen(small_workload(), 5);
    for (int i = 0; i < 200; ++i) {
        Operation op = gen.next_operation("op-" + std::to_string(i));
        ASSERT_TRUE(std::holds_alternative<ReadOperation>(op));
        const auto& read = std::get<ReadOperation>(op);
        EXPECT_EQ(read.projection_paths, small_workload().projection_paths);
        EXPECT_EQ(read.document_id.rfind("doc-", 0), 0u);
    }
}

TEST(WorkloadGeneratorTest, WriteOnlyMixSplitsUpdatesAndDeletes) {
    WorkloadConfig w = small_workload();
    w.read_ratio = 0.0;
    WorkloadGenerator gen(w, 9);

    int updates = 0;
    int deletes = 0;
    for (int i = 0; i < 400; ++i) {
        Operation op = gen.next_operation("op");
        ASSERT_FALSE(std::holds_alternative<ReadOperation>(op));
        if (const auto* u = std::get_if<UpdateOperation>(&op)) {
            ++updates;
            EXPECT_EQ(u->path.rfind("field_", 0), 0u);
        } else if (std::holds_alternative<DeleteOperation>(op)) {
            ++deletes;
        }
    }
    EXPECT_EQ(updates + deletes, 400);
    EXPECT_GT(updates, 100);
    EXPECT_GT(deletes, 100);
}
