#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "adapters/memory_adapter.hpp"
#include "adapters/postgres_adapter.hpp"

using namespace docbench;

namespace {

ConnectionConfig pg_config() {
    ConnectionConfig c;
    c.adapter = "postgres";
    c.host = "127.0.0.1";
    c.port = 5432;
    c.database = "docbench";
    c.user = "docbench";
    return c;
}

bool has_error_for(const std::vector<ValidationError>& errors, const std::string& field) {
    for (const auto& e : errors) {
        if (e.field == field) return true;
    }
    return false;
}

} // namespace

TEST(PostgresAdapterTest, IdentityAndCapabilities) {
    MetricsCollector collector;
    PostgresAdapter adapter(collector);

    EXPECT_EQ(adapter.adapter_id(), "postgres");
    EXPECT_EQ(adapter.version().rfind("libpq ", 0), 0u);
    EXPECT_TRUE(adapter.has_capability(capability::MULTI_DOCUMENT_TRANSACTIONS));
    EXPECT_TRUE(adapter.has_capability(capability::EXPLAIN_PLAN));
    EXPECT_FALSE(adapter.has_capability(capability::SERVER_TRAVERSAL_TIME));
    EXPECT_THROW(adapter.require_capability(capability::SERVER_TRAVERSAL_TIME), CapabilityNotSupportedError);
    EXPECT_FALSE(adapter.document_format().has_value());

    auto options = adapter.configuration_options();
    EXPECT_TRUE(options.count("document_format"));
}

TEST(PostgresAdapterTest, ValidConfigPasses) {
    MetricsCollector collector;
    PostgresAdapter adapter(collector);
    EXPECT_TRUE(adapter.validate_config(pg_config()).empty());

    ConnectionConfig by_uri = pg_config();
    by_uri.user.clear();
    by_uri.uri = "postgresql://bench@db.example:5432/docbench";
    EXPECT_TRUE(adapter.validate_config(by_uri).empty());
}

TEST(PostgresAdapterTest, ConfigProblemsAreReportedTogether) {
    MetricsCollector collector;
    PostgresAdapter adapter(collector);

    ConnectionConfig c = pg_config();
    c.user.clear();
    c.database.clear();
    c.options["document_format"] = "xml";
    c.options["connect_timeout_s"] = "0";

    auto errors = adapter.validate_config(c);
    EXPECT_TRUE(has_error_for(errors, "user"));
    EXPECT_TRUE(has_error_for(errors, "database"));
    EXPECT_TRUE(has_error_for(errors, "options.document_format"));
    EXPECT_TRUE(has_error_for(errors, "options.connect_timeout_s"));

    ConnectionConfig bad_uri = pg_config();
    bad_uri.uri = "mysql://localhost/db";
    EXPECT_TRUE(has_error_for(adapter.validate_config(bad_uri), "uri"));
}

TEST(PostgresAdapterTest, InvalidConfigFailsBeforeAnyNetworkAttempt) {
    MetricsCollector collector;
    PostgresAdapter adapter(collector);

    ConnectionConfig c = pg_config();
    c.host = "unresolvable.invalid";
    c.options["document_format"] = "xml";

    // ConfigurationError, not ConnectionError: the host is never contacted
    EXPECT_THROW((void)adapter.connect(c), ConfigurationError);
    EXPECT_FALSE(adapter.document_format().has_value());
}

TEST(PostgresAdapterTest, UnreachableServerIsAConnectionError) {
    MetricsCollector collector;
    PostgresAdapter adapter(collector);

    ConnectionConfig c = pg_config();
    c.port = 1;  // nothing listens here
    c.options["connect_timeout_s"] = "2";

    try {
        (void)adapter.connect(c);
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.adapter_id(), "postgres");
    }
}

TEST(PostgresAdapterTest, SetupWithoutConnectionFails) {
    MetricsCollector collector;
    PostgresAdapter adapter(collector);

    TestEnvironmentConfig env;
    EXPECT_THROW(adapter.setup_test_environment(env), SetupError);

    env.collection_name = "docs; DROP TABLE x";
    EXPECT_THROW(adapter.setup_test_environment(env), SetupError);
    EXPECT_NO_THROW(adapter.teardown_test_environment());
}

TEST(PostgresAdapterTest, ForeignConnectionIsRejected) {
    MetricsCollector collector;
    PostgresAdapter pg(collector);
    MemoryAdapter memory(collector);

    ConnectionConfig mc;
    mc.adapter = "memory";
    ScopedConnection conn(memory.connect(mc));

    auto r = pg.execute(*conn, make_read("r", "doc"), collector);
    EXPECT_FALSE(r.ok());
    EXPECT_NE(r.error().find("postgres"), std::string::npos);
}

TEST(PostgresAdapterTest, FallsBackToTotalOnlyBreakdown) {
    MetricsCollector collector;
    PostgresAdapter adapter(collector);

    auto r = OperationResult::failure("op", OperationType::READ, std::chrono::microseconds(70), "boom");
    auto b = adapter.get_overhead_breakdown(r);
    EXPECT_EQ(b.total_latency(), std::chrono::microseconds(70));
    EXPECT_EQ(b.server_execution_time(), Duration::zero());
}

// Runs only against a live server: DOCBENCH_PG_URI=postgresql://user:pw@host/db
class PostgresLiveTest : public ::testing::TestWithParam<const char*> {
protected:
    void SetUp() override {
        const char* uri = std::getenv("DOCBENCH_PG_URI");
        if (!uri || !*uri) GTEST_SKIP() << "DOCBENCH_PG_URI not set";

        config.adapter = "postgres";
        config.uri = uri;
        config.options["document_format"] = GetParam();
        conn = std::make_unique<ScopedConnection>(adapter.connect(config));

        TestEnvironmentConfig env;
        env.collection_name = std::string("docbench_test_") + GetParam();
        env.indexes.push_back({"docbench_test_city_" + std::string(GetParam()), {"address.city"}});
        adapter.setup_test_environment(env);
    }

    void TearDown() override {
        if (!conn) return;
        conn.reset();
        adapter.teardown_test_environment();
    }

    OperationResult run(const Operation& op) { return adapter.execute(**conn, op, collector); }

    MetricsCollector collector;
    PostgresAdapter adapter{collector};
    ConnectionConfig config;
    std::unique_ptr<ScopedConnection> conn;
};

TEST_P(PostgresLiveTest, CrudAndAggregate) {
    Document doc = Document::parse(R"({"name": "ada", "address": {"city": "Dresden", "zip": 1069}, "tags": [1, 2]})");

    auto ins = run(make_insert("i", "d1", doc));
    ASSERT_TRUE(ins.ok()) << ins.error();
    EXPECT_FALSE(run(make_insert("i2", "d1", doc)).ok());

    auto read = run(make_read("r", "d1", {"address.city", "tags[0]"}));
    ASSERT_TRUE(read.ok()) << read.error();
    ASSERT_TRUE(read.payload().has_value());
    EXPECT_EQ(read.payload()->at("address").at("city"), "Dresden");
    EXPECT_FALSE(read.payload()->contains("name"));

    ASSERT_TRUE(run(make_update("u", "d1", "address.zip", 1099)).ok());
    EXPECT_EQ(run(make_read("r2", "d1")).payload()->at("address").at("zip"), 1099);

    const std::vector<std::string> pipeline = {R"({"$match": {"address.city": "Dresden"}})", R"({"$count": "n"})"};
    auto agg = run(make_aggregate("a", pipeline));
    ASSERT_TRUE(agg.ok()) << agg.error();
    EXPECT_EQ(agg.payload()->at("n"), 1);

    // EXPLAIN ANALYZE returns the plan instead of the rows
    auto plan = run(make_aggregate("a2", pipeline, true));
    ASSERT_TRUE(plan.ok()) << plan.error();
    ASSERT_TRUE(plan.metadata().count("explain"));
    ASSERT_TRUE(plan.overhead_breakdown().has_value());
    EXPECT_TRUE(plan.overhead_breakdown()->platform_specific().count("postgres.execution_time"));

    EXPECT_EQ(run(make_delete("d", "d1")).metadata().at("affected").get<int64_t>(), 1);
    EXPECT_FALSE(run(make_read("r3", "d1")).payload().has_value());

    EXPECT_EQ(adapter.timing_interceptor()->orphaned_count(), 0);
}

INSTANTIATE_TEST_SUITE_P(Formats, PostgresLiveTest, ::testing::Values("json", "jsonb"));
