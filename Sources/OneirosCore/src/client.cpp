#include "oneiros/client.hpp"
#include "oneiros/errors.hpp"
#include "oneiros/log.hpp"

namespace oneiros {

// Single definition of the global log level
std::atomic<log_level> g_log_level{log_level::off};

namespace {

// A query resolves to one entry per statement; the first failed one fails the call.
json unwrap_query_result(json result) {
    if (!result.is_array()) return result;
    for (const auto& statement : result) {
        if (!statement.is_object()) continue;
        std::string status = statement.value("status", std::string("OK"));
        if (status == "OK") continue;

        std::string message;
        if (auto detail = statement.find("detail"); detail != statement.end() && detail->is_string()) {
            message = detail->get<std::string>();
        } else if (auto text = statement.find("result"); text != statement.end()) {
            message = text->is_string() ? text->get<std::string>() : text->dump();
        } else {
            message = "statement failed with status " + status;
        }
        throw remote_error(0, message);
    }
    return result;
}

scope exactly(const std::optional<std::string>& value) {
    return value ? scope(*value) : scope::none();
}

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

client::client(client_config config, std::shared_ptr<scheduler> sched)
    : client(config, get_network_factory()->create_transport(), std::move(sched)) {}

client::client(client_config config, std::unique_ptr<rpc_transport> transport,
               std::shared_ptr<scheduler> sched)
    : config_(std::move(config))
    , scheduler_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>())
    , transport_(std::move(transport)) {
    config_.validate();
    if (!transport_) {
        throw configuration_error("client needs a transport");
    }

    pipeline_ = std::make_shared<encryption_pipeline>(config_.security, config_.defaults);
    correlator_ = request_correlator::create([this](const std::string& frame) {
        transport_->send(transport_message::from_string(frame));
    });
    router_ = live_subscription_router::create(correlator_, config_.live_buffer_watermark,
                                               config_.request_timeout, pipeline_);
    install_transport_handlers();
}

client::~client() {
    transport_->set_on_open(nullptr);
    transport_->set_on_message(nullptr);
    transport_->set_on_error(nullptr);
    transport_->set_on_close(nullptr);
    if (transport_->state() != transport_state::closed) {
        transport_->disconnect();
    }
    session_.disconnected();
    correlator_->fail_all("client destroyed");
    router_->close_all();
}

void client::install_transport_handlers() {
    transport_->set_on_open([this] { on_transport_open(); });
    transport_->set_on_message([this](const transport_message& msg) { on_transport_message(msg); });
    transport_->set_on_error([this](const std::string& error) { on_transport_error(error); });
    transport_->set_on_close([this](int code, const std::string& reason) { on_transport_close(code, reason); });
}

// ============================================================================
// Connection management
// ============================================================================

void client::connect() {
    if (!session_.begin_connect()) {
        if (session_.is_connected()) return;
        throw connection_error("connect already in progress");
    }
    notify_state(connection_state::connecting);
    LOG_INFO("client", "Connecting to %s", config_.url.c_str());

    {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        open_outcome_ = open_outcome::waiting;
        open_error_.clear();
    }

    std::string failure;
    try {
        transport_->connect(config_.url);
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (failure.empty()) {
        std::unique_lock<std::mutex> lock(connect_mutex_);
        bool settled = connect_cv_.wait_for(lock, config_.connect_timeout, [this] {
            return open_outcome_ != open_outcome::waiting;
        });
        if (!settled) {
            failure = "timed out connecting to " + config_.url;
        } else if (open_outcome_ == open_outcome::failed) {
            failure = open_error_.empty() ? "connection failed" : open_error_;
        }
        open_outcome_ = open_outcome::idle;
    }

    if (!failure.empty()) {
        LOG_ERROR("client", "Connection to %s failed: %s", config_.url.c_str(), failure.c_str());
        if (transport_->state() != transport_state::closed) {
            transport_->disconnect();
        }
        teardown(failure);
        throw connection_error(failure);
    }

    session_.connected();
    notify_state(connection_state::connected);
    LOG_INFO("client", "Connected to %s", config_.url.c_str());

    try {
        if (config_.has_credentials()) {
            signin(json{{"user", config_.username}, {"pass", config_.password}}).get();
        }
        if (!config_.namespace_name.empty() && !config_.database_name.empty()) {
            use(config_.namespace_name, config_.database_name).get();
        }
    } catch (const oneiros_error& e) {
        LOG_ERROR("client", "Session initialisation failed: %s", e.what());
        disconnect();
        throw;
    }
}

void client::disconnect() {
    if (transport_->state() != transport_state::closed) {
        transport_->disconnect();
    }
    teardown("disconnected");
}

void client::teardown(const std::string& reason) {
    connection_state previous = session_.disconnected();
    correlator_->fail_all(reason);
    router_->close_all();
    if (previous != connection_state::disconnected) {
        LOG_INFO("client", "Connection closed: %s", reason.c_str());
        notify_state(connection_state::disconnected);
    }
}

void client::notify_state(connection_state state) {
    if (!on_state_change_) return;
    auto handler = on_state_change_;
    scheduler_->invoke([handler, state] { handler(state); });
}

void client::report_error(const std::string& error) {
    if (!on_error_) return;
    auto handler = on_error_;
    scheduler_->invoke([handler, error] { handler(error); });
}

// ============================================================================
// Transport callbacks
// ============================================================================

void client::on_transport_open() {
    {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        if (open_outcome_ != open_outcome::waiting) return;
        open_outcome_ = open_outcome::opened;
    }
    connect_cv_.notify_all();
}

void client::on_transport_error(const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        if (open_outcome_ == open_outcome::waiting) {
            open_outcome_ = open_outcome::failed;
            open_error_ = error;
            connect_cv_.notify_all();
            return;
        }
    }
    LOG_ERROR("client", "Transport error: %s", error.c_str());
    report_error(error);
}

void client::on_transport_close(int code, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(connect_mutex_);
        if (open_outcome_ == open_outcome::waiting) {
            open_outcome_ = open_outcome::failed;
            open_error_ = "closed during connect: " + reason;
            connect_cv_.notify_all();
            return;
        }
    }
    teardown("connection closed (" + std::to_string(code) + "): " + reason);
}

// Single demultiplexing point: replies go to the correlator, everything
// else to the live router.
void client::on_transport_message(const transport_message& msg) {
    json frame;
    try {
        frame = json::parse(msg.as_string());
    } catch (const json::parse_error& e) {
        LOG_ERROR("client", "Dropping malformed frame: %s", e.what());
        return;
    }

    if (auto response = rpc_response::from_json(frame)) {
        if (correlator_->dispatch(*response)) return;
    }
    if (router_->dispatch(frame)) return;

    std::string id = frame.is_object() && frame.contains("id") ? frame["id"].dump() : std::string("<none>");
    LOG_WARN("rpc", "Dropping frame with unknown id %s", id.c_str());
}

// ============================================================================
// Request plumbing
// ============================================================================

void client::require(gate required) const {
    auto current = session_.snapshot();
    if (!current.connected()) {
        throw connection_error("client is not connected");
    }
    if (required == gate::scope && !current.has_scope()) {
        throw configuration_error("no namespace and database selected; call use() first");
    }
}

rpc_call client::send(const std::string& method, json params, gate required,
                      request_correlator::completion on_result,
                      std::optional<std::chrono::milliseconds> timeout) {
    require(required);
    return correlator_->send(method, std::move(params), timeout.value_or(config_.request_timeout),
                             std::move(on_result));
}

rpc_call client::call(const std::string& method, json params,
                      std::optional<std::chrono::milliseconds> timeout) {
    return send(method, std::move(params), gate::connection, nullptr, timeout);
}

// ============================================================================
// Authentication and session
// ============================================================================

rpc_call client::signin(const json& credentials) {
    return send("signin", json::array({credentials}), gate::connection, [this](json result) {
        session_.authenticated(result.is_string() ? std::optional<std::string>(result.get<std::string>())
                                                  : std::nullopt);
        return result;
    });
}

rpc_call client::signup(const json& credentials) {
    return send("signup", json::array({credentials}), gate::connection, [this](json result) {
        session_.authenticated(result.is_string() ? std::optional<std::string>(result.get<std::string>())
                                                  : std::nullopt);
        return result;
    });
}

rpc_call client::authenticate(const std::string& token) {
    return send("authenticate", json::array({token}), gate::connection, [this, token](json result) {
        session_.authenticated(token);
        return result;
    });
}

rpc_call client::invalidate() {
    return send("invalidate", json::array(), gate::connection, [this](json result) {
        session_.invalidated();
        return result;
    });
}

rpc_call client::info() {
    return send("info", json::array(), gate::connection);
}

rpc_call client::reset() {
    return send("reset", json::array(), gate::connection, [this](json result) {
        session_.reset();
        router_->close_all();
        return result;
    });
}

rpc_call client::ping() {
    return send("ping", json::array(), gate::connection);
}

rpc_call client::version() {
    return send("version", json::array(), gate::connection);
}

rpc_call client::use(const scope& ns, const scope& db) {
    // "keep" resolves to the value in effect now; the acknowledgement applies
    // exactly the pair that was sent, whatever other use() calls did meanwhile.
    auto current = session_.snapshot();
    auto sent_ns = ns.apply(current.namespace_name);
    auto sent_db = db.apply(current.database_name);
    json params = json::array({optional_string(sent_ns), optional_string(sent_db)});
    return send("use", std::move(params), gate::connection, [this, sent_ns, sent_db](json result) {
        session_.use(exactly(sent_ns), exactly(sent_db));
        return result;
    });
}

rpc_call client::let(const std::string& name, const json& value) {
    return send("let", json::array({name, value}), gate::connection, [this, name, value](json result) {
        session_.let(name, value);
        return result;
    });
}

rpc_call client::unset(const std::string& name) {
    return send("unset", json::array({name}), gate::connection, [this, name](json result) {
        session_.unset(name);
        return result;
    });
}

// ============================================================================
// Queries
// ============================================================================

rpc_call client::query(const std::string& sql, const json& vars,
                       std::optional<std::chrono::milliseconds> timeout) {
    json params = json::array({sql, vars.is_null() ? json::object() : vars});
    return send("query", std::move(params), gate::scope, unwrap_query_result, timeout);
}

rpc_call client::graphql(const json& request, const json& options) {
    return send("graphql", json::array({request, options}), gate::scope);
}

rpc_call client::run(const std::string& function, const std::optional<std::string>& version,
                     const json& args) {
    return send("run", json::array({function, optional_string(version), args}), gate::scope);
}

rpc_call client::select(const std::string& thing) {
    return send("select", json::array({thing}), gate::scope);
}

rpc_call client::create(const std::string& thing, const json& data) {
    json params = json::array({thing});
    if (!data.is_null()) params.push_back(data);
    return send("create", std::move(params), gate::scope);
}

rpc_call client::insert(const std::string& table, const json& data) {
    return send("insert", json::array({table, data}), gate::scope);
}

rpc_call client::update(const std::string& thing, const json& data) {
    json params = json::array({thing});
    if (!data.is_null()) params.push_back(data);
    return send("update", std::move(params), gate::scope);
}

rpc_call client::upsert(const std::string& thing, const json& data) {
    json params = json::array({thing});
    if (!data.is_null()) params.push_back(data);
    return send("upsert", std::move(params), gate::scope);
}

rpc_call client::merge(const std::string& thing, const json& data) {
    return send("merge", json::array({thing, data}), gate::scope);
}

rpc_call client::patch(const std::string& thing, const json& patches, bool diff) {
    return send("patch", json::array({thing, patches, diff}), gate::scope);
}

rpc_call client::remove(const std::string& thing) {
    return send("delete", json::array({thing}), gate::scope);
}

rpc_call client::relate(const std::string& in, const std::string& relation, const std::string& out,
                        const json& data) {
    json params = json::array({in, relation, out});
    if (!data.is_null()) params.push_back(data);
    return send("relate", std::move(params), gate::scope);
}

rpc_call client::insert_relation(const std::string& table, const json& data) {
    return send("insert_relation", json::array({table, data}), gate::scope);
}

// ============================================================================
// Live queries
// ============================================================================

rpc_call client::live(const std::string& table, bool diff) {
    return send("live", json::array({table, diff}), gate::scope);
}

rpc_call client::kill(const std::string& live_id) {
    require(gate::connection);
    return router_->unsubscribe(live_id);
}

notification_stream client::subscribe(const std::string& table, bool diff, field_descriptors descriptors) {
    require(gate::scope);
    return router_->subscribe(table, diff, std::move(descriptors));
}

notification_stream client::subscribe(const live_select_statement& statement, field_descriptors descriptors) {
    std::string sql = statement.build();
    require(gate::scope);

    // The stream is attached on the demultiplexer while the reply is
    // processed; the caller takes it over once the call resolves.
    auto attached = std::make_shared<std::optional<notification_stream>>();
    auto router = router_;
    auto call = send("query", json::array({sql, json::object()}), gate::scope,
                     [attached, router, sql, descriptors = std::move(descriptors)](json result) {
                         result = unwrap_query_result(std::move(result));
                         if (!result.is_array() || result.empty() || !result[0].is_object() ||
                             !result[0].contains("result") || !result[0]["result"].is_string()) {
                             throw oneiros_error("LIVE SELECT returned no subscription id");
                         }
                         std::string live_id = result[0]["result"].get<std::string>();
                         *attached = router->attach(live_id, sql, false, descriptors);
                         return result;
                     });
    call.get();
    if (!*attached) {
        throw oneiros_error("LIVE SELECT returned no subscription id");
    }
    return std::move(**attached);
}

} // namespace oneiros
