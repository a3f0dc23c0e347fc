#include "postgres_adapter.hpp"
#include "aggregate_pipeline.hpp"
#include "document_navigator.hpp"
#include "../utils/logger.hpp"

#include <libpq-fe.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace docbench {

namespace {

// Server time of the statement itself, in microseconds
constexpr const char* SERVER_US =
    "(EXTRACT(EPOCH FROM clock_timestamp() - statement_timestamp()) * 1000000)::float8";

// Owns a PGresult; every exit path clears it
class PgResult {
public:
    explicit PgResult(PGresult* res = nullptr) : res_(res) {}
    ~PgResult() { if (res_) PQclear(res_); }

    PgResult(PgResult&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    PgResult& operator=(PgResult&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }

    PgResult(const PgResult&) = delete;
    PgResult& operator=(const PgResult&) = delete;

    [[nodiscard]] PGresult* get() const noexcept { return res_; }
    explicit operator bool() const noexcept { return res_ != nullptr; }

    [[nodiscard]] ExecStatusType status() const { return res_ ? PQresultStatus(res_) : PGRES_FATAL_ERROR; }
    [[nodiscard]] int rows() const { return res_ ? PQntuples(res_) : 0; }
    [[nodiscard]] int columns() const { return res_ ? PQnfields(res_) : 0; }
    [[nodiscard]] bool is_null(int row, int col) const { return PQgetisnull(res_, row, col) != 0; }
    [[nodiscard]] std::string value(int row, int col) const {
        return std::string(PQgetvalue(res_, row, col), static_cast<size_t>(PQgetlength(res_, row, col)));
    }

    [[nodiscard]] int64_t payload_bytes() const {
        int64_t n = 0;
        for (int r = 0; r < rows(); ++r) {
            for (int c = 0; c < columns(); ++c) n += PQgetlength(res_, r, c);
        }
        return n;
    }

private:
    PGresult* res_;
};

Duration from_micros(double us) {
    if (!(us > 0.0)) return Duration::zero();
    return Duration(static_cast<int64_t>(std::llround(us * 1000.0)));
}

Duration from_millis(double ms) {
    return from_micros(ms * 1000.0);
}

Duration non_negative(int64_t ns) {
    return Duration(std::max<int64_t>(ns, 0));
}

bool is_identifier(const std::string& s) {
    if (s.empty() || s.size() > 63) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

std::string quote_ident(const std::string& s) {
    return "\"" + s + "\"";
}

std::string quote_literal(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

const char* command_name(OperationType t) {
    switch (t) {
        case OperationType::INSERT:    return "insert";
        case OperationType::READ:      return "select";
        case OperationType::UPDATE:    return "update";
        case OperationType::DELETE:    return "delete";
        case OperationType::AGGREGATE: return "aggregate";
    }
    return "??";
}

struct PgOutcome {
    bool ok = false;
    std::string error;
    PgResult result;
    Duration server{0};
    Duration transmit{0};
    Duration receive{0};
    Duration planning{0};       // explain only
    Duration execution{0};      // explain only
    std::optional<nlohmann::json> plan;
};

// One SQL statement plus what is needed to decode its result
struct Statement {
    OperationType type = OperationType::READ;
    std::string sql;
    std::vector<std::string> params;
    bool explain = false;
    std::vector<std::string> roots;              // projection roots, in column order
    std::optional<std::string> count_field;

    [[nodiscard]] int64_t wire_size() const {
        size_t n = sql.size();
        for (const auto& p : params) n += p.size();
        return static_cast<int64_t>(n);
    }
};

class StatementBuilder {
public:
    StatementBuilder(std::string table, DocumentFormat format)
        : table_(quote_ident(table)), format_(document_format_str(format)) {}

    Statement operator()(const InsertOperation& op) const {
        Statement s;
        s.type = OperationType::INSERT;
        s.params = {op.document_id, op.document.dump()};
        s.sql = "WITH w AS (INSERT INTO " + table_ + " (id, doc) VALUES ($1, $2::" + format_ +
                ") RETURNING 1) SELECT (SELECT count(*) FROM w), " + SERVER_US;
        return s;
    }

    Statement operator()(const ReadOperation& op) const {
        Statement s;
        s.type = OperationType::READ;
        s.params = {op.document_id};

        std::string cols;
        if (!op.has_projection()) {
            cols = "doc::text AS c0";
        } else {
            for (const auto& path : op.projection_paths) {
                std::string root = projection_root(path);
                if (root.empty()) {
                    // An index into the document itself: fetch everything
                    s.roots.clear();
                    cols = "doc::text AS c0";
                    break;
                }
                if (std::find(s.roots.begin(), s.roots.end(), root) != s.roots.end()) continue;
                s.params.push_back(to_pg_text_path(root));
                if (!cols.empty()) cols += ", ";
                cols += "(doc #> $" + std::to_string(s.params.size()) + "::text[])::text AS c" +
                        std::to_string(s.roots.size());
                s.roots.push_back(root);
            }
        }

        std::string outer = "x.found";
        size_t ncols = s.roots.empty() ? 1 : s.roots.size();
        for (size_t i = 0; i < ncols; ++i) outer += ", x.c" + std::to_string(i);

        s.sql = "SELECT " + outer + ", " + SERVER_US +
                " FROM (SELECT 1) AS one LEFT JOIN (SELECT true AS found, " + cols +
                " FROM " + table_ + " WHERE id = $1) AS x ON true";
        return s;
    }

    Statement operator()(const UpdateOperation& op) const {
        Statement s;
        s.type = OperationType::UPDATE;
        s.params = {op.document_id, to_pg_text_path(op.path), op.new_value.dump()};
        const std::string patched_new = "jsonb_set('{}'::jsonb, $2::text[], $3::jsonb, true)::" + format_;
        const std::string patched = "jsonb_set(" + table_ + ".doc::jsonb, $2::text[], $3::jsonb, true)::" + format_;
        std::string write;
        if (op.upsert) {
            write = "INSERT INTO " + table_ + " (id, doc) VALUES ($1, " + patched_new +
                    ") ON CONFLICT (id) DO UPDATE SET doc = " + patched + " RETURNING 1";
        } else {
            write = "UPDATE " + table_ + " SET doc = " + patched + " WHERE id = $1 RETURNING 1";
        }
        s.sql = "WITH w AS (" + write + ") SELECT (SELECT count(*) FROM w), " + SERVER_US;
        return s;
    }

    Statement operator()(const DeleteOperation& op) const {
        Statement s;
        s.type = OperationType::DELETE;
        s.params = {op.document_id};
        s.sql = "WITH w AS (DELETE FROM " + table_ + " WHERE id = $1 RETURNING 1) "
                "SELECT (SELECT count(*) FROM w), " + std::string(SERVER_US);
        return s;
    }

    Statement operator()(const AggregateOperation& op) const {
        AggregatePipeline p = parse_pipeline(op.pipeline_stages);

        Statement s;
        s.type = OperationType::AGGREGATE;
        s.explain = op.explain;
        s.count_field = p.count_field;

        auto param = [&s](std::string v) {
            s.params.push_back(std::move(v));
            return "$" + std::to_string(s.params.size());
        };

        std::string where;
        for (const auto& cond : p.match) {
            where += where.empty() ? " WHERE " : " AND ";
            std::string expected = cond.value.is_string() ? cond.value.get<std::string>() : cond.value.dump();
            where += "doc #>> " + param(to_pg_text_path(cond.path)) + "::text[] = " + param(expected) + "::text";
        }

        std::string value_expr = "doc";
        if (!p.project.empty()) {
            value_expr = "json_build_object(";
            bool first = true;
            for (const auto& path : p.project) {
                std::string root = projection_root(path);
                if (root.empty()) {
                    value_expr = "doc";
                    s.roots.clear();
                    break;
                }
                if (std::find(s.roots.begin(), s.roots.end(), root) != s.roots.end()) continue;
                if (!first) value_expr += ", ";
                first = false;
                value_expr += param(root) + "::text, doc #> " + param(to_pg_text_path(root)) + "::text[]";
                s.roots.push_back(root);
            }
            if (!s.roots.empty()) value_expr += ")";
        }

        std::string limit;
        if (p.limit) limit = " LIMIT " + param(std::to_string(*p.limit)) + "::bigint";

        if (p.count_field) {
            s.sql = "SELECT count(*)::text, " + std::string(SERVER_US) +
                    " FROM (SELECT 1 FROM " + table_ + where + limit + ") AS x";
        } else {
            s.sql = "SELECT coalesce(json_agg(x.v), '[]'::json)::text, " + std::string(SERVER_US) +
                    " FROM (SELECT " + value_expr + " AS v FROM " + table_ + where + limit + ") AS x";
        }
        if (s.explain) s.sql = "EXPLAIN (ANALYZE, FORMAT JSON) " + s.sql;
        return s;
    }

private:
    std::string table_;
    std::string format_;
};

// Rebuilds a nested document from values keyed by projection root
Document nest(const Document& flat) {
    Document out = Document::object();
    for (auto it = flat.begin(); it != flat.end(); ++it) {
        if (it.value().is_null()) continue;
        out[Document::json_pointer(to_json_pointer(it.key()))] = it.value();
    }
    return out;
}

// Client end of a libpq session
class PostgresConnection final : public Connection {
public:
    PostgresConnection(std::string id, PGconn* conn, std::shared_ptr<TimeSource> clock)
        : Connection(std::move(id)), conn_(conn), clock_(std::move(clock)) {}

    ~PostgresConnection() override { close(); }

    [[nodiscard]] bool is_valid() const override {
        return !is_closed() && conn_ && PQstatus(conn_) == CONNECTION_OK;
    }

    // PQreset when the link dropped; true when usable afterwards
    bool ensure_alive() {
        if (is_closed() || !conn_) return false;
        if (PQstatus(conn_) == CONNECTION_OK) return true;

        LOG_WRN("[postgres] Connection %s lost, trying PQreset", connection_id().c_str());
        PQreset(conn_);
        if (PQstatus(conn_) == CONNECTION_OK) {
            LOG_INF("[postgres] PQreset successful (server %s)", PQparameterStatus(conn_, "server_version"));
            return true;
        }
        LOG_ERR("[postgres] PQreset failed: %s", PQerrorMessage(conn_));
        return false;
    }

    // The command channel: every statement raises started and then
    // succeeded or failed, carrying the server-reported elapsed time
    PgOutcome run(const std::string& command, const Statement& stmt, MetricsCollector& collector) {
        PgOutcome out;
        const int32_t request_id = next_request_id();
        CommandStartedEvent started{request_id, command};
        started.collector = &collector;
        notify_started(std::move(started));

        std::vector<const char*> values;
        values.reserve(stmt.params.size());
        for (const auto& p : stmt.params) values.push_back(p.c_str());

        const int64_t t0 = clock_->now_ns();
        int sent = PQsendQueryParams(conn_, stmt.sql.c_str(), static_cast<int>(values.size()),
                                     nullptr, values.empty() ? nullptr : values.data(),
                                     nullptr, nullptr, 0);
        const int64_t t1 = clock_->now_ns();
        if (!sent) {
            out.error = PQerrorMessage(conn_);
            notify_failed({request_id, command, Duration::zero(), out.error});
            return out;
        }

        out.result = PgResult(PQgetResult(conn_));
        while (PGresult* extra = PQgetResult(conn_)) PQclear(extra);
        const int64_t t2 = clock_->now_ns();

        out.transmit = Duration(t1 - t0);
        if (out.result.status() != PGRES_TUPLES_OK || out.result.rows() < 1) {
            out.error = out.result ? PQresultErrorMessage(out.result.get()) : PQerrorMessage(conn_);
            if (out.error.empty()) out.error = "statement returned no rows";
            while (!out.error.empty() && out.error.back() == '\n') out.error.pop_back();
            notify_failed({request_id, command, Duration::zero(), out.error});
            return out;
        }

        try {
            if (stmt.explain) {
                auto plan = nlohmann::json::parse(out.result.value(0, 0));
                const auto& top = plan.at(0);
                out.planning = from_millis(top.value("Planning Time", 0.0));
                out.execution = from_millis(top.value("Execution Time", 0.0));
                out.server = out.planning + out.execution;
                out.plan = top;
            } else {
                int col = out.result.columns() - 1;
                out.server = from_micros(std::strtod(out.result.value(0, col).c_str(), nullptr));
            }
        } catch (const nlohmann::json::exception& e) {
            out.error = std::string("unreadable EXPLAIN output: ") + e.what();
            notify_failed({request_id, command, Duration::zero(), out.error});
            return out;
        }

        out.receive = non_negative((t2 - t1) - out.server.count());
        out.ok = true;
        notify_succeeded({request_id, command, out.server});
        return out;
    }

protected:
    void do_close() override {
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
            LOG_DBG("[postgres] Connection %s closed", connection_id().c_str());
        }
    }

private:
    PGconn* conn_;
    std::shared_ptr<TimeSource> clock_;
};

// keyword/value pairs for PQconnectdbParams
PGconn* open_pg(const ConnectionConfig& config) {
    const std::string port = std::to_string(config.port);
    const std::string timeout = std::to_string(config.get_int_option("connect_timeout_s", 10));

    std::vector<const char*> keys;
    std::vector<const char*> vals;
    if (!config.uri.empty()) {
        keys.push_back("dbname");           vals.push_back(config.uri.c_str());
    } else {
        keys.push_back("host");             vals.push_back(config.host.c_str());
        keys.push_back("port");             vals.push_back(port.c_str());
        keys.push_back("dbname");           vals.push_back(config.database.c_str());
        keys.push_back("user");             vals.push_back(config.user.c_str());
        if (!config.password.empty()) {
            keys.push_back("password");     vals.push_back(config.password.c_str());
        }
    }
    keys.push_back("connect_timeout");      vals.push_back(timeout.c_str());
    keys.push_back("application_name");     vals.push_back("docbench");
    keys.push_back(nullptr);                vals.push_back(nullptr);

    return PQconnectdbParams(keys.data(), vals.data(), config.uri.empty() ? 0 : 1);
}

std::string describe_endpoint(const ConnectionConfig& config) {
    if (!config.uri.empty()) return config.uri;
    return config.host + ":" + std::to_string(config.port) + "/" + config.database;
}

} // namespace

PostgresAdapter::PostgresAdapter(MetricsCollector& collector, std::shared_ptr<TimeSource> time_source)
    : time_source_(std::move(time_source))
    , interceptor_(std::make_shared<TimingInterceptor>(collector, time_source_, ADAPTER_ID))
    , traversal_timer_(collector, time_source_, ADAPTER_ID)
    , capabilities_{
          capability::NESTED_DOCUMENT_ACCESS,
          capability::ARRAY_INDEX_ACCESS,
          capability::PARTIAL_DOCUMENT_RETRIEVAL,
          capability::BULK_INSERT,
          capability::BULK_READ,
          capability::BULK_UPDATE,
          capability::SECONDARY_INDEXES,
          capability::JSON_PATH_INDEXES,
          capability::SINGLE_DOCUMENT_ATOMICITY,
          capability::MULTI_DOCUMENT_TRANSACTIONS,
          capability::SERVER_EXECUTION_TIME,
          capability::EXPLAIN_PLAN,
          capability::CLIENT_TIMING_HOOKS,
          capability::DESERIALIZATION_METRICS,
      } {}

std::string PostgresAdapter::version() const {
    int v = PQlibVersion();
    return "libpq " + std::to_string(v / 10000) + "." + std::to_string(v % 100);
}

std::vector<ValidationError> PostgresAdapter::validate_config(const ConnectionConfig& config) const {
    auto errors = DbAdapter::validate_config(config);
    if (config.adapter != ADAPTER_ID) {
        errors.push_back({"adapter", "expected '" + std::string(ADAPTER_ID) + "', got '" + config.adapter + "'"});
    }
    if (!config.uri.empty()) {
        if (config.uri.rfind("postgresql://", 0) != 0 && config.uri.rfind("postgres://", 0) != 0) {
            errors.push_back({"uri", "must start with postgresql:// or postgres://"});
        }
    } else if (config.user.empty()) {
        errors.push_back({"user", "user is required when no uri is given"});
    }
    const std::string format = config.get_string_option("document_format", "jsonb");
    if (format != "json" && format != "jsonb") {
        errors.push_back({"options.document_format", "must be 'json' or 'jsonb'"});
    }
    if (config.options.count("connect_timeout_s") && config.get_int_option("connect_timeout_s", 0) <= 0) {
        errors.push_back({"options.connect_timeout_s", "must be a positive integer"});
    }
    return errors;
}

std::map<std::string, std::string> PostgresAdapter::configuration_options() const {
    return {
        {"document_format", "Column type for documents: json or jsonb (default: jsonb)"},
        {"connect_timeout_s", "Connection timeout in seconds (default: 10)"},
    };
}

CapabilitySet PostgresAdapter::capabilities() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return capabilities_;
}

std::unique_ptr<Connection> PostgresAdapter::connect(const ConnectionConfig& config) {
    ensure_valid_config(config);

    const DocumentFormat format = config.get_string_option("document_format", "jsonb") == "json"
        ? DocumentFormat::JSON : DocumentFormat::JSONB;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (format_ && *format_ != format) {
            throw ConfigurationError("options.document_format",
                std::string("adapter already bound to ") + document_format_str(*format_));
        }
    }

    PGconn* raw = open_pg(config);
    if (!raw || PQstatus(raw) != CONNECTION_OK) {
        std::string msg = raw ? PQerrorMessage(raw) : "out of memory";
        while (!msg.empty() && msg.back() == '\n') msg.pop_back();
        LOG_ERR("[postgres] Connection to %s failed: %s", describe_endpoint(config).c_str(), msg.c_str());
        if (raw) PQfinish(raw);
        throw ConnectionError(ADAPTER_ID, "cannot connect to " + describe_endpoint(config) + ": " + msg);
    }

    std::string id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!format_) {
            format_ = format;
            if (format == DocumentFormat::JSONB) capabilities_.add(capability::HASH_INDEXED_FIELD_ACCESS);
        }
        config_ = config;
        id = "postgres-" + std::to_string(++next_connection_);
    }

    LOG_INF("[postgres] Connected to %s (server %s, format %s)", describe_endpoint(config).c_str(),
        PQparameterStatus(raw, "server_version"), document_format_str(format));

    auto conn = std::make_unique<PostgresConnection>(id, raw, time_source_);
    conn->add_command_listener(interceptor_);
    return conn;
}

OperationResult PostgresAdapter::execute(Connection& conn, const Operation& op, MetricsCollector& collector) {
    const TimeSource& clock = *time_source_;
    const std::string& op_id = operation_id(op);
    const OperationType type = operation_type(op);
    const int64_t start = clock.now_ns();

    auto* session = dynamic_cast<PostgresConnection*>(&conn);
    if (!session) {
        return OperationResult::failure(op_id, type, Duration::zero(),
            "connection was not opened by the postgres adapter");
    }
    if (!session->ensure_alive()) {
        return OperationResult::failure(op_id, type, Duration::zero(), "connection is closed or broken");
    }

    std::string table;
    DocumentFormat format;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        table = table_;
        format = format_.value_or(DocumentFormat::JSONB);
    }

    try {
        Duration serialization{0};
        Statement stmt;
        {
            ScopedTimer t(clock, serialization);
            stmt = std::visit(StatementBuilder(table, format), op);
        }

        PgOutcome out = session->run(command_name(type), stmt, collector);
        session->record_operation();
        session->record_serialization(serialization);
        session->record_bytes_sent(stmt.wire_size());

        if (!out.ok) {
            LOG_DBG("[postgres] %s %s failed: %s", operation_type_str(type), op_id.c_str(), out.error.c_str());
            return OperationResult::failure(op_id, type, Duration(clock.now_ns() - start), out.error);
        }

        OperationResult::Builder builder(op_id, type);
        Duration deserialization{0};
        std::optional<Document> payload;
        int64_t affected = 0;
        {
            ScopedTimer t(clock, deserialization);
            const PgResult& res = out.result;
            switch (type) {
                case OperationType::READ:
                    if (!res.is_null(0, 0)) {
                        affected = 1;
                        if (stmt.roots.empty()) {
                            payload = Document::parse(res.value(0, 1));
                        } else {
                            Document doc = Document::object();
                            for (size_t i = 0; i < stmt.roots.size(); ++i) {
                                int col = static_cast<int>(i) + 1;
                                if (res.is_null(0, col)) continue;
                                doc[Document::json_pointer(to_json_pointer(stmt.roots[i]))] =
                                    Document::parse(res.value(0, col));
                            }
                            payload = std::move(doc);
                        }
                    }
                    break;
                case OperationType::INSERT:
                case OperationType::UPDATE:
                case OperationType::DELETE:
                    affected = std::strtoll(res.value(0, 0).c_str(), nullptr, 10);
                    payload = Document{{type == OperationType::INSERT ? "inserted"
                                        : type == OperationType::UPDATE ? "modified" : "deleted", affected}};
                    break;
                case OperationType::AGGREGATE:
                    if (stmt.explain) {
                        payload = Document{{"explain", Document::parse(out.plan->dump())}};
                    } else if (stmt.count_field) {
                        affected = std::strtoll(res.value(0, 0).c_str(), nullptr, 10);
                        payload = Document{{*stmt.count_field, affected}};
                    } else {
                        Document rows = Document::parse(res.value(0, 0));
                        if (!stmt.roots.empty()) {
                            for (auto& row : rows) row = nest(row);
                        }
                        affected = static_cast<int64_t>(rows.size());
                        payload = Document{{"results", std::move(rows)}};
                    }
                    break;
            }
        }
        session->record_bytes_received(out.result.payload_bytes());
        session->record_wire_transmit(out.transmit);
        session->record_wire_receive(out.receive);
        session->record_deserialization(deserialization);
        builder.metadata("affected", affected);

        Duration client_traversal{0};
        if (type == OperationType::READ && payload) {
            const auto& read = std::get<ReadOperation>(op);
            if (read.has_projection()) {
                // json is scanned in field order, jsonb looked up per level
                TraversalStrategy strategy = format == DocumentFormat::JSON
                    ? TraversalStrategy::SEQUENTIAL : TraversalStrategy::INDEXED;
                auto traversal = traverse_paths(traversal_timer_, strategy, *payload,
                                                read.projection_paths, op_id, &collector);
                if (traversal) {
                    client_traversal = traversal->total_time;
                    builder.metadata("traversal", traversal->to_json());
                }
            }
        }

        const bool fetches = type == OperationType::READ || type == OperationType::AGGREGATE;
        const Duration total(clock.now_ns() - start);
        auto breakdown_builder = OverheadBreakdown::builder();
        breakdown_builder
            .total_latency(total)
            .serialization_time(serialization)
            .wire_transmit_time(out.transmit)
            .server_execution_time(out.server)
            .server_parse_time(out.planning)
            .server_traversal_time(Duration::zero())
            .server_fetch_time(fetches ? (stmt.explain ? out.execution : out.server) : Duration::zero())
            .wire_receive_time(out.receive)
            .deserialization_time(deserialization)
            .client_traversal_time(client_traversal);
        if (stmt.explain) {
            breakdown_builder.add_platform_specific("postgres.planning_time", out.planning);
            breakdown_builder.add_platform_specific("postgres.execution_time", out.execution);
            builder.metadata("explain", *out.plan);
        }
        OverheadBreakdown breakdown = breakdown_builder.build();
        collector.record_overhead_breakdown(breakdown);

        builder.success(true).total_duration(total).overhead_breakdown(breakdown);
        if (payload) builder.payload(std::move(*payload));
        return builder.build();
    } catch (const std::exception& e) {
        LOG_DBG("[postgres] %s %s raised: %s", operation_type_str(type), op_id.c_str(), e.what());
        return OperationResult::failure(op_id, type, Duration(clock.now_ns() - start), e.what());
    }
}

void PostgresAdapter::run_ddl(const std::vector<std::string>& statements) const {
    ConnectionConfig config;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!config_) throw SetupError("[postgres] Not connected: call connect() before setting up the environment");
        config = *config_;
    }

    PGconn* conn = open_pg(config);
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        std::string msg = conn ? PQerrorMessage(conn) : "out of memory";
        if (conn) PQfinish(conn);
        throw SetupError("[postgres] Fixture connection failed: " + msg);
    }

    for (const auto& sql : statements) {
        PgResult res(PQexec(conn, sql.c_str()));
        if (res.status() != PGRES_COMMAND_OK && res.status() != PGRES_TUPLES_OK) {
            std::string msg = PQerrorMessage(conn);
            LOG_ERR("[postgres] SQL error: %s\n  SQL: %s", msg.c_str(), sql.c_str());
            PQfinish(conn);
            throw SetupError("[postgres] " + msg);
        }
        LOG_DBG("[postgres] %s", sql.c_str());
    }
    PQfinish(conn);
}

void PostgresAdapter::setup_test_environment(const TestEnvironmentConfig& config) {
    if (!is_identifier(config.collection_name)) {
        throw SetupError("[postgres] Invalid table name: " + config.collection_name);
    }

    DocumentFormat format;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        format = format_.value_or(DocumentFormat::JSONB);
    }

    const std::string table = quote_ident(config.collection_name);
    std::vector<std::string> ddl;
    if (config.drop_existing) ddl.push_back("DROP TABLE IF EXISTS " + table);
    ddl.push_back("CREATE TABLE IF NOT EXISTS " + table + " (id TEXT PRIMARY KEY, doc " +
                  document_format_str(format) + " NOT NULL)");

    for (const auto& index : config.indexes) {
        if (!is_identifier(index.name) || index.fields.empty()) {
            throw SetupError("[postgres] Invalid index definition: " + index.name);
        }
        std::string exprs;
        for (const auto& field : index.fields) {
            if (!exprs.empty()) exprs += ", ";
            exprs += "(doc #>> " + quote_literal(to_pg_text_path(field)) + ")";
        }
        ddl.push_back("CREATE INDEX IF NOT EXISTS " + quote_ident(index.name) + " ON " + table + " (" + exprs + ")");
    }

    run_ddl(ddl);

    std::lock_guard<std::mutex> lock(state_mutex_);
    table_ = config.collection_name;
    table_created_ = true;
    LOG_INF("[postgres] Test environment ready: table %s (%s, %zu index(es))",
        table_.c_str(), document_format_str(format), config.indexes.size());
}

void PostgresAdapter::teardown_test_environment() {
    std::string table;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!table_created_) return;
        table = table_;
    }

    LOG_WRN("[postgres] Dropping table %s", table.c_str());
    run_ddl({"DROP TABLE IF EXISTS " + quote_ident(table)});

    std::lock_guard<std::mutex> lock(state_mutex_);
    table_created_ = false;
}

std::optional<DocumentFormat> PostgresAdapter::document_format() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return format_;
}

} // namespace docbench
