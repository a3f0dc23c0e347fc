#include "memory_adapter.hpp"
#include "aggregate_pipeline.hpp"
#include "../utils/blocking_queue.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <future>
#include <shared_mutex>
#include <thread>
#include <unordered_map>

namespace docbench {

namespace {

const char* command_name(OperationType t) {
    switch (t) {
        case OperationType::INSERT:    return "insert";
        case OperationType::READ:      return "find";
        case OperationType::UPDATE:    return "update";
        case OperationType::DELETE:    return "delete";
        case OperationType::AGGREGATE: return "aggregate";
    }
    return "??";
}

// What crosses the client/server boundary: text, as on a wire
struct Request {
    OperationType type = OperationType::READ;
    std::string document_id;
    std::string body;                      // document or new value, as JSON text
    std::vector<std::string> paths;        // projection, or the single update path
    std::vector<std::string> stages;
    bool upsert = false;
    bool explain = false;

    [[nodiscard]] int64_t wire_size() const {
        size_t n = document_id.size() + body.size();
        for (const auto& p : paths) n += p.size();
        for (const auto& s : stages) n += s.size();
        return static_cast<int64_t>(n);
    }
};

struct ServerTimings {
    Duration parse{0};
    Duration index{0};
    Duration traversal{0};
    Duration fetch{0};
    Duration execution{0};
};

struct Reply {
    bool ok = false;
    std::string error;
    std::string body;          // empty when there is nothing to return
    int64_t affected = 0;
    ServerTimings timings;
    int64_t picked_ns = 0;     // session thread dequeued the command
    int64_t completed_ns = 0;  // completion notified, reply about to be handed back
};

struct RequestEncoder {
    Request operator()(const InsertOperation& op) const {
        Request r;
        r.type = OperationType::INSERT;
        r.document_id = op.document_id;
        r.body = op.document.dump();
        return r;
    }
    Request operator()(const ReadOperation& op) const {
        Request r;
        r.type = OperationType::READ;
        r.document_id = op.document_id;
        r.paths = op.projection_paths;
        return r;
    }
    Request operator()(const UpdateOperation& op) const {
        Request r;
        r.type = OperationType::UPDATE;
        r.document_id = op.document_id;
        r.body = op.new_value.dump();
        r.paths = {op.path};
        r.upsert = op.upsert;
        return r;
    }
    Request operator()(const DeleteOperation& op) const {
        Request r;
        r.type = OperationType::DELETE;
        r.document_id = op.document_id;
        return r;
    }
    Request operator()(const AggregateOperation& op) const {
        Request r;
        r.type = OperationType::AGGREGATE;
        r.stages = op.pipeline_stages;
        r.explain = op.explain;
        return r;
    }
};

Duration non_negative(int64_t ns) {
    return Duration(std::max<int64_t>(ns, 0));
}

} // namespace

// The server side: one collection, shared by every connection of an adapter
class MemoryStore {
public:
    MemoryStore(TraversalStrategy strategy, std::shared_ptr<TimeSource> clock)
        : strategy_(strategy), clock_(std::move(clock)), navigator_(strategy) {}

    [[nodiscard]] TraversalStrategy strategy() const noexcept { return strategy_; }

    Reply serve(const Request& req) {
        try {
            if (strategy_ == TraversalStrategy::SEQUENTIAL) return serve_on(ordered_docs_, req);
            return serve_on(keyed_docs_, req);
        } catch (const std::exception& e) {
            Reply r;
            r.error = e.what();
            return r;
        }
    }

    void reset_collection(const TestEnvironmentConfig& config) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        collection_ = config.collection_name;
        if (config.drop_existing) {
            ordered_docs_.clear();
            keyed_docs_.clear();
        }
        indexes_ = config.indexes;
    }

    void drop_collection() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        ordered_docs_.clear();
        keyed_docs_.clear();
        indexes_.clear();
        collection_.clear();
    }

    [[nodiscard]] size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return ordered_docs_.size() + keyed_docs_.size();
    }

private:
    int64_t now() const { return clock_->now_ns(); }

    template <typename Json>
    Reply serve_on(std::unordered_map<std::string, Json>& docs, const Request& req) {
        switch (req.type) {
            case OperationType::INSERT:    return do_insert(docs, req);
            case OperationType::READ:      return do_read(docs, req);
            case OperationType::UPDATE:    return do_update(docs, req);
            case OperationType::DELETE:    return do_delete(docs, req);
            case OperationType::AGGREGATE: return do_aggregate(docs, req);
        }
        Reply r;
        r.error = "unknown command";
        return r;
    }

    // Copies the values found under `paths` into a new document of the same shape
    template <typename Json>
    Json project(const Json& doc, const std::vector<std::string>& paths, ServerTimings& t) const {
        std::vector<std::pair<std::string, const Json*>> found;
        int64_t t0 = now();
        for (const auto& path : paths) {
            std::string root = projection_root(path);
            if (root.empty()) {
                // Path starts with an index into the document itself
                t.traversal += Duration(now() - t0);
                return doc;
            }
            if (const Json* v = navigator_.resolve(doc, root, std::string())) found.emplace_back(root, v);
        }
        int64_t t1 = now();
        t.traversal += Duration(t1 - t0);

        Json out = Json::object();
        for (const auto& [root, value] : found) {
            out[typename Json::json_pointer(to_json_pointer(root))] = *value;
        }
        t.fetch += Duration(now() - t1);
        return out;
    }

    template <typename Json>
    Reply do_insert(std::unordered_map<std::string, Json>& docs, const Request& req) {
        Reply r;
        int64_t t0 = now();
        Json doc = Json::parse(req.body);
        r.timings.parse = Duration(now() - t0);

        std::unique_lock<std::shared_mutex> lock(mutex_);
        int64_t t1 = now();
        bool exists = docs.find(req.document_id) != docs.end();
        r.timings.index = Duration(now() - t1);
        if (exists) {
            r.error = "duplicate key: " + req.document_id;
            return r;
        }
        docs.emplace(req.document_id, std::move(doc));

        r.ok = true;
        r.affected = 1;
        r.body = R"({"inserted":1})";
        return r;
    }

    template <typename Json>
    Reply do_read(std::unordered_map<std::string, Json>& docs, const Request& req) {
        Reply r;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        int64_t t0 = now();
        auto it = docs.find(req.document_id);
        r.timings.index = Duration(now() - t0);
        r.ok = true;
        if (it == docs.end()) return r;

        r.affected = 1;
        if (req.paths.empty()) {
            int64_t t1 = now();
            r.body = it->second.dump();
            r.timings.fetch = Duration(now() - t1);
        } else {
            Json projected = project(it->second, req.paths, r.timings);
            int64_t t1 = now();
            r.body = projected.dump();
            r.timings.fetch += Duration(now() - t1);
        }
        return r;
    }

    template <typename Json>
    Reply do_update(std::unordered_map<std::string, Json>& docs, const Request& req) {
        Reply r;
        int64_t t0 = now();
        Json value = Json::parse(req.body);
        typename Json::json_pointer target(to_json_pointer(req.paths.at(0)));
        r.timings.parse = Duration(now() - t0);

        std::unique_lock<std::shared_mutex> lock(mutex_);
        int64_t t1 = now();
        auto it = docs.find(req.document_id);
        r.timings.index = Duration(now() - t1);
        if (it == docs.end()) {
            r.ok = true;
            if (!req.upsert) return r;
            it = docs.emplace(req.document_id, Json::object()).first;
        }

        int64_t t2 = now();
        navigator_.resolve(it->second, req.paths[0], std::string());
        int64_t t3 = now();
        r.timings.traversal = Duration(t3 - t2);

        it->second[target] = std::move(value);
        r.timings.fetch = Duration(now() - t3);

        r.ok = true;
        r.affected = 1;
        r.body = R"({"modified":1})";
        return r;
    }

    template <typename Json>
    Reply do_delete(std::unordered_map<std::string, Json>& docs, const Request& req) {
        Reply r;
        std::unique_lock<std::shared_mutex> lock(mutex_);
        int64_t t0 = now();
        r.affected = static_cast<int64_t>(docs.erase(req.document_id));
        r.timings.index = Duration(now() - t0);
        r.ok = true;
        r.body = r.affected ? R"({"deleted":1})" : R"({"deleted":0})";
        return r;
    }

    template <typename Json>
    Reply do_aggregate(std::unordered_map<std::string, Json>& docs, const Request& req) {
        Reply r;
        int64_t t0 = now();
        AggregatePipeline pipeline = parse_pipeline(req.stages);
        std::vector<std::pair<std::string, Json>> conditions;
        for (const auto& c : pipeline.match) {
            conditions.emplace_back(c.path, Json::parse(c.value.dump()));
        }
        r.timings.parse = Duration(now() - t0);

        std::shared_lock<std::shared_mutex> lock(mutex_);
        Json results = Json::array();
        int64_t examined = 0;
        int64_t matched = 0;

        for (const auto& entry : docs) {
            if (pipeline.limit && matched >= *pipeline.limit) break;
            const Json& doc = entry.second;
            ++examined;

            int64_t t1 = now();
            bool is_match = true;
            for (const auto& [path, expected] : conditions) {
                const Json* v = navigator_.resolve(doc, path, std::string());
                if (!v || *v != expected) {
                    is_match = false;
                    break;
                }
            }
            r.timings.traversal += Duration(now() - t1);
            if (!is_match) continue;
            ++matched;

            if (pipeline.count_field) continue;
            if (pipeline.project.empty()) {
                int64_t t2 = now();
                results.push_back(doc);
                r.timings.fetch += Duration(now() - t2);
            } else {
                results.push_back(project(doc, pipeline.project, r.timings));
            }
        }

        int64_t t3 = now();
        Json out = Json::object();
        if (pipeline.count_field) {
            out[*pipeline.count_field] = matched;
        } else {
            out["results"] = std::move(results);
        }
        if (req.explain) {
            out["explain"] = {
                {"collection", collection_},
                {"stages", pipeline.stages},
                {"documents_examined", examined},
                {"documents_matched", matched},
                {"traversal", traversal_strategy_str(strategy_)},
                {"index_used", false},
            };
        }
        r.body = out.dump();
        r.timings.fetch += Duration(now() - t3);

        r.ok = true;
        r.affected = matched;
        return r;
    }

    const TraversalStrategy strategy_;
    std::shared_ptr<TimeSource> clock_;
    DocumentNavigator navigator_;   // server side: no client traversal timer

    mutable std::shared_mutex mutex_;
    std::string collection_;
    std::vector<IndexDefinition> indexes_;
    std::unordered_map<std::string, Document> ordered_docs_;
    std::unordered_map<std::string, nlohmann::json> keyed_docs_;
};

namespace {

// Client end of a session; the session thread plays the server
class MemoryConnection final : public Connection {
public:
    MemoryConnection(std::string id, std::shared_ptr<MemoryStore> store,
                     std::shared_ptr<TimeSource> clock, Duration simulated_latency)
        : Connection(std::move(id))
        , store_(std::move(store))
        , clock_(std::move(clock))
        , latency_(simulated_latency) {
        session_ = std::thread([this] { serve(); });
    }

    ~MemoryConnection() override { close(); }

    // Blocks until the session thread has executed the command. Correlated
    // samples go to `collector`; handed_over_ns is when the command entered
    // the queue.
    Reply round_trip(Request request, MetricsCollector& collector, int64_t& handed_over_ns) {
        Command cmd;
        cmd.request_id = next_request_id();
        cmd.command_name = command_name(request.type);
        cmd.request = std::move(request);

        const int32_t request_id = cmd.request_id;
        const std::string name = cmd.command_name;
        std::future<Reply> pending = cmd.reply.get_future();

        CommandStartedEvent started{request_id, name};
        started.collector = &collector;
        notify_started(std::move(started));
        handed_over_ns = clock_->now_ns();
        if (!queue_.push(std::move(cmd))) {
            notify_failed({request_id, name, Duration::zero(), "connection closed"});
            Reply r;
            r.error = "connection closed";
            return r;
        }
        return pending.get();
    }

protected:
    void do_close() override {
        queue_.close();
        if (session_.joinable()) session_.join();
        LOG_DBG("[memory] connection %s closed", connection_id().c_str());
    }

private:
    struct Command {
        int32_t request_id = 0;
        std::string command_name;
        Request request;
        std::promise<Reply> reply;
    };

    void serve() {
        while (auto cmd = queue_.pop()) {
            int64_t picked = clock_->now_ns();
            Reply reply = store_->serve(cmd->request);
            if (latency_.count() > 0) std::this_thread::sleep_for(latency_);
            reply.timings.execution = Duration(clock_->now_ns() - picked);
            reply.picked_ns = picked;

            if (reply.ok) {
                notify_succeeded({cmd->request_id, cmd->command_name, reply.timings.execution});
            } else {
                notify_failed({cmd->request_id, cmd->command_name, reply.timings.execution, reply.error});
            }
            reply.completed_ns = clock_->now_ns();
            cmd->reply.set_value(std::move(reply));
        }
    }

    std::shared_ptr<MemoryStore> store_;
    std::shared_ptr<TimeSource> clock_;
    Duration latency_;
    BlockingQueue<Command> queue_;
    std::thread session_;
};

} // namespace

MemoryAdapter::MemoryAdapter(MetricsCollector& collector, std::shared_ptr<TimeSource> time_source)
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
          capability::SINGLE_DOCUMENT_ATOMICITY,
          capability::SERVER_EXECUTION_TIME,
          capability::SERVER_TRAVERSAL_TIME,
          capability::EXPLAIN_PLAN,
          capability::CLIENT_TIMING_HOOKS,
          capability::DESERIALIZATION_METRICS,
      } {}

MemoryAdapter::~MemoryAdapter() = default;

std::vector<ValidationError> MemoryAdapter::validate_config(const ConnectionConfig& config) const {
    auto errors = DbAdapter::validate_config(config);
    if (config.adapter != ADAPTER_ID) {
        errors.push_back({"adapter", "expected '" + std::string(ADAPTER_ID) + "', got '" + config.adapter + "'"});
    }
    const std::string traversal = config.get_string_option("traversal", "sequential");
    if (traversal != "sequential" && traversal != "indexed") {
        errors.push_back({"options.traversal", "must be 'sequential' or 'indexed'"});
    }
    if (config.options.count("simulated_latency_us") &&
        config.get_int_option("simulated_latency_us", -1) < 0) {
        errors.push_back({"options.simulated_latency_us", "must be a non-negative integer"});
    }
    return errors;
}

std::map<std::string, std::string> MemoryAdapter::configuration_options() const {
    return {
        {"traversal", "Server document layout: sequential or indexed (default: sequential)"},
        {"simulated_latency_us", "Extra server time per command in microseconds (default: 0)"},
    };
}

CapabilitySet MemoryAdapter::capabilities() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return capabilities_;
}

std::unique_ptr<Connection> MemoryAdapter::connect(const ConnectionConfig& config) {
    ensure_valid_config(config);

    const TraversalStrategy strategy =
        parse_traversal_strategy(config.get_string_option("traversal", "sequential"));
    const Duration latency = std::chrono::microseconds(config.get_int_option("simulated_latency_us", 0));

    std::shared_ptr<MemoryStore> store;
    std::string id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!store_) {
            store_ = std::make_shared<MemoryStore>(strategy, time_source_);
            if (strategy == TraversalStrategy::INDEXED) {
                capabilities_.add(capability::HASH_INDEXED_FIELD_ACCESS);
            }
            LOG_INF("[memory] Store opened (traversal=%s)", traversal_strategy_str(strategy));
        } else if (store_->strategy() != strategy) {
            throw ConfigurationError("options.traversal",
                std::string("store already opened with traversal=") + traversal_strategy_str(store_->strategy()));
        }
        store = store_;
        id = "memory-" + std::to_string(++next_connection_);
    }

    auto conn = std::make_unique<MemoryConnection>(id, std::move(store), time_source_, latency);
    conn->add_command_listener(interceptor_);
    LOG_DBG("[memory] Connection %s opened", id.c_str());
    return conn;
}

OperationResult MemoryAdapter::execute(Connection& conn, const Operation& op, MetricsCollector& collector) {
    const TimeSource& clock = *time_source_;
    const std::string& op_id = operation_id(op);
    const OperationType type = operation_type(op);
    const int64_t start = clock.now_ns();

    auto* session = dynamic_cast<MemoryConnection*>(&conn);
    if (!session) {
        return OperationResult::failure(op_id, type, Duration::zero(),
            "connection was not opened by the memory adapter");
    }
    if (!session->is_valid()) {
        return OperationResult::failure(op_id, type, Duration::zero(), "connection is closed");
    }

    try {
        Duration serialization{0};
        Request request;
        {
            ScopedTimer t(clock, serialization);
            request = std::visit(RequestEncoder{}, op);
        }
        const int64_t bytes_out = request.wire_size();

        int64_t handed_over = 0;
        Reply reply = session->round_trip(std::move(request), collector, handed_over);
        const int64_t received = clock.now_ns();

        session->record_operation();
        session->record_serialization(serialization);
        session->record_bytes_sent(bytes_out);

        if (!reply.ok) {
            LOG_DBG("[memory] %s %s failed: %s", operation_type_str(type), op_id.c_str(), reply.error.c_str());
            return OperationResult::failure(op_id, type, Duration(received - start), reply.error);
        }

        const Duration wire_transmit = non_negative(reply.picked_ns - handed_over);
        const Duration wire_receive = non_negative(received - reply.completed_ns);

        Duration deserialization{0};
        std::optional<Document> payload;
        if (!reply.body.empty()) {
            ScopedTimer t(clock, deserialization);
            payload = Document::parse(reply.body);
        }

        OperationResult::Builder builder(op_id, type);
        builder.metadata("affected", reply.affected);

        Duration client_traversal{0};
        if (type == OperationType::READ && payload) {
            const auto& read = std::get<ReadOperation>(op);
            if (read.has_projection()) {
                auto traversal = traverse_paths(traversal_timer_, *strategy(), *payload,
                                                read.projection_paths, op_id, &collector);
                if (traversal) {
                    client_traversal = traversal->total_time;
                    builder.metadata("traversal", traversal->to_json());
                }
            }
        }
        if (type == OperationType::AGGREGATE && payload && payload->contains("explain")) {
            builder.metadata("explain", nlohmann::json::parse((*payload)["explain"].dump()));
        }

        session->record_wire_transmit(wire_transmit);
        session->record_wire_receive(wire_receive);
        session->record_deserialization(deserialization);
        session->record_bytes_received(static_cast<int64_t>(reply.body.size()));

        const Duration total(clock.now_ns() - start);
        OverheadBreakdown breakdown = OverheadBreakdown::builder()
            .total_latency(total)
            .serialization_time(serialization)
            .wire_transmit_time(wire_transmit)
            .server_execution_time(reply.timings.execution)
            .server_parse_time(reply.timings.parse)
            .server_index_time(reply.timings.index)
            .server_traversal_time(reply.timings.traversal)
            .server_fetch_time(reply.timings.fetch)
            .wire_receive_time(wire_receive)
            .deserialization_time(deserialization)
            .client_traversal_time(client_traversal)
            .build();
        collector.record_overhead_breakdown(breakdown);

        builder.success(true).total_duration(total).overhead_breakdown(breakdown);
        if (payload) builder.payload(std::move(*payload));
        return builder.build();
    } catch (const std::exception& e) {
        LOG_DBG("[memory] %s %s raised: %s", operation_type_str(type), op_id.c_str(), e.what());
        return OperationResult::failure(op_id, type, Duration(clock.now_ns() - start), e.what());
    }
}

void MemoryAdapter::setup_test_environment(const TestEnvironmentConfig& config) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!store_) {
        throw SetupError("[memory] Not connected: call connect() before setting up the environment");
    }
    store_->reset_collection(config);
    LOG_INF("[memory] Test environment ready: collection %s (%zu index definition(s), drop_existing=%s)",
        config.collection_name.c_str(), config.indexes.size(), config.drop_existing ? "true" : "false");
}

void MemoryAdapter::teardown_test_environment() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (store_) store_->drop_collection();
}

std::optional<TraversalStrategy> MemoryAdapter::strategy() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!store_) return std::nullopt;
    return store_->strategy();
}

size_t MemoryAdapter::document_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return store_ ? store_->size() : 0;
}

} // namespace docbench
