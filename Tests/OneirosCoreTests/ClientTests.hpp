#pragma once

#include <OneirosCore.hpp>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace client_tests {

using namespace std::chrono_literals;
using oneiros::connection_state;
using oneiros::json;

// ============================================================================
// Scripted server
// ============================================================================
//
// Answers each request frame synchronously through mock_transport's
// responder. Methods listed in `silent` get no reply; methods listed in
// `failing` get an RPC error.

struct scripted_server {
    std::set<std::string> silent;
    std::set<std::string> failing;
    int next_live = 0;

    std::optional<std::string> operator()(const std::string& text) {
        json request = json::parse(text);
        std::string method = request["method"].get<std::string>();
        const json& params = request["params"];

        if (silent.count(method)) return std::nullopt;

        json response = {{"id", request["id"]}};
        if (failing.count(method)) {
            response["error"] = {{"code", -32000}, {"message", "There was a problem with the " + method + " call"}};
            return response.dump();
        }

        if (method == "signin" || method == "signup") {
            const json& creds = params[0];
            if (creds.value("user", "") == "root" && creds.value("pass", "") == "root") {
                response["result"] = "token-abc";
            } else {
                response["error"] = {{"code", -32000}, {"message", "There was a problem with authentication"}};
            }
        } else if (method == "query") {
            std::string sql = params[0].get<std::string>();
            if (sql.find("THROW") != std::string::npos) {
                response["result"] = json::array({
                    json{{"status", "OK"}, {"result", json::array()}, {"time", "1ms"}},
                    json{{"status", "ERR"}, {"result", "An error occurred: boom"}, {"time", "1ms"}},
                });
            } else if (sql.rfind("LIVE SELECT", 0) == 0) {
                response["result"] = json::array({json{{"status", "OK"}, {"result", "live-q1"}, {"time", "1ms"}}});
            } else {
                response["result"] = json::array(
                    {json{{"status", "OK"}, {"result", json::array({json{{"id", "person:1"}}})}, {"time", "1ms"}}});
            }
        } else if (method == "live") {
            response["result"] = "live-" + std::to_string(++next_live);
        } else if (method == "version") {
            response["result"] = "surrealdb-2.0.0";
        } else if (method == "info") {
            response["result"] = {{"id", "user:root"}};
        } else if (method == "select" || method == "create" || method == "update" || method == "upsert" ||
                   method == "merge" || method == "patch" || method == "delete" || method == "insert" ||
                   method == "relate" || method == "insert_relation" || method == "run" || method == "graphql") {
            response["result"] = {{"echo", method}, {"params", params}};
        } else {
            response["result"] = nullptr;
        }
        return response.dump();
    }
};

/// Client wired to a mock transport answered by a scripted server.
struct client_fixture {
    std::shared_ptr<scripted_server> server = std::make_shared<scripted_server>();
    oneiros::mock_transport* transport = nullptr;
    std::mutex mutex;
    std::vector<connection_state> states;
    std::unique_ptr<oneiros::client> db;

    explicit client_fixture(oneiros::client_config config = default_config(),
                            std::shared_ptr<oneiros::scheduler> sched = nullptr) {
        auto mock = std::make_unique<oneiros::mock_transport>();
        transport = mock.get();
        auto script = server;
        transport->set_responder([script](const std::string& frame) { return (*script)(frame); });
        db = std::make_unique<oneiros::client>(std::move(config), std::move(mock), std::move(sched));
        db->set_on_state_change([this](connection_state state) {
            std::lock_guard<std::mutex> lock(mutex);
            states.push_back(state);
        });
    }

    static oneiros::client_config default_config() {
        oneiros::client_config config("ws://localhost:8000/rpc", "test", "test");
        config.username = "root";
        config.password = "root";
        return config;
    }

    json last_frame() const {
        auto msg = transport->last_sent_message();
        assert(msg.has_value());
        return json::parse(msg->as_string());
    }

    std::vector<json> frames() const {
        std::vector<json> out;
        for (const auto& msg : transport->get_sent_messages()) {
            out.push_back(json::parse(msg.as_string()));
        }
        return out;
    }

    std::vector<connection_state> observed_states() {
        std::lock_guard<std::mutex> lock(mutex);
        return states;
    }
};

template <typename Fn>
bool throws_connection_error(Fn&& fn) {
    try {
        fn();
    } catch (const oneiros::connection_error&) {
        return true;
    }
    return false;
}

// ============================================================================
// Connection
// ============================================================================

void test_connect_signs_in_and_selects_scope() {
    std::cout << "  test_connect_signs_in_and_selects_scope..." << std::flush;

    client_fixture f;
    f.db->connect();

    assert(f.db->is_connected());
    assert(f.db->state() == connection_state::authenticated);
    assert(f.transport->url() == "ws://localhost:8000/rpc");

    auto session = f.db->session_snapshot();
    assert(session.auth_token == std::optional<std::string>("token-abc"));
    assert(session.namespace_name == std::optional<std::string>("test"));
    assert(session.database_name == std::optional<std::string>("test"));

    auto frames = f.frames();
    assert(frames.size() == 2);
    assert(frames[0]["method"] == "signin");
    assert(frames[0]["params"][0]["user"] == "root");
    assert(frames[1]["method"] == "use");
    assert(frames[1]["params"] == json::array({"test", "test"}));

    auto states = f.observed_states();
    assert(states.size() == 2);
    assert(states[0] == connection_state::connecting);
    assert(states[1] == connection_state::connected);

    // Connecting again is a no-op
    f.db->connect();
    assert(f.transport->sent_count() == 2);

    f.db->disconnect();
    assert(f.db->state() == connection_state::disconnected);
    assert(f.observed_states().back() == connection_state::disconnected);

    std::cout << " OK" << std::endl;
}

void test_connect_failures() {
    std::cout << "  test_connect_failures..." << std::flush;

    client_fixture refused;
    refused.transport->fail_next_connect("connection refused");
    assert(throws_connection_error([&] { refused.db->connect(); }));
    assert(refused.db->state() == connection_state::disconnected);
    assert(refused.observed_states().back() == connection_state::disconnected);
    assert(refused.transport->sent_count() == 0);

    // The client can try again after a failed attempt
    refused.db->connect();
    assert(refused.db->is_connected());

    auto config = client_fixture::default_config();
    config.password = "wrong";
    client_fixture rejected(config);
    bool auth_failed = false;
    try {
        rejected.db->connect();
    } catch (const oneiros::remote_error& e) {
        auth_failed = true;
        assert(e.code() == -32000);
    }
    assert(auth_failed);
    assert(rejected.db->state() == connection_state::disconnected);

    std::cout << " OK" << std::endl;
}

void test_calls_require_connection() {
    std::cout << "  test_calls_require_connection..." << std::flush;

    client_fixture f;
    assert(throws_connection_error([&] { f.db->ping(); }));
    assert(throws_connection_error([&] { f.db->query("SELECT * FROM person"); }));
    assert(throws_connection_error([&] { f.db->subscribe("person"); }));
    assert(throws_connection_error([&] { f.db->kill("live-1"); }));
    assert(f.transport->sent_count() == 0);

    std::cout << " OK" << std::endl;
}

void test_queries_require_scope() {
    std::cout << "  test_queries_require_scope..." << std::flush;

    client_fixture f(oneiros::client_config("ws://localhost:8000/rpc", "", ""));
    f.db->connect();
    assert(f.db->state() == connection_state::connected);
    assert(f.transport->sent_count() == 0);

    bool no_scope = false;
    try {
        f.db->query("SELECT * FROM person");
    } catch (const oneiros::configuration_error&) {
        no_scope = true;
    }
    assert(no_scope);
    assert(f.transport->sent_count() == 0);

    // Session-level calls only need the connection
    f.db->ping().get();
    f.db->use("test", "test").get();
    auto rows = f.db->query("SELECT * FROM person").get();
    assert(rows[0]["result"][0]["id"] == "person:1");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Queries and builders
// ============================================================================

void test_query_status_unwrap() {
    std::cout << "  test_query_status_unwrap..." << std::flush;

    client_fixture f;
    f.db->connect();

    auto ok = f.db->query("SELECT * FROM person WHERE age > $min", json{{"min", 18}}).get();
    assert(ok.is_array() && ok.size() == 1);
    auto frame = f.last_frame();
    assert(frame["method"] == "query");
    assert(frame["params"][1]["min"] == 18);

    bool failed = false;
    try {
        f.db->query("SELECT 1; THROW 'boom'").get();
    } catch (const oneiros::remote_error& e) {
        failed = true;
        assert(std::string(e.server_message()).find("boom") != std::string::npos);
    }
    assert(failed);
    assert(f.db->is_connected());

    std::cout << " OK" << std::endl;
}

void test_execute_statements() {
    std::cout << "  test_execute_statements..." << std::flush;

    client_fixture f;
    f.db->connect();

    oneiros::select_statement select;
    select.from("person").where("age > 18").limit(5);
    f.db->execute(select).get();
    assert(f.last_frame()["params"][0] == "SELECT * FROM person WHERE age > 18 LIMIT 5");

    // Builder validation fails before anything is written
    auto before = f.transport->sent_count();
    bool missing = false;
    try {
        f.db->execute(f.db->relation().from("user:alice").via("purchased"));
    } catch (const oneiros::missing_target&) {
        missing = true;
    }
    assert(missing);
    assert(f.transport->sent_count() == before);

    auto relate = f.db->relation()
        .from("user:alice")
        .to("product:laptop")
        .via("purchased")
        .with_data(json{{"price", 999.99}});
    f.db->execute(relate).get();
    assert(f.last_frame()["params"][0] ==
           "RELATE user:alice->purchased->product:laptop CONTENT {\"price\":999.99} RETURN AFTER");

    std::cout << " OK" << std::endl;
}

void test_rpc_method_surface() {
    std::cout << "  test_rpc_method_surface..." << std::flush;

    client_fixture f;
    f.db->connect();

    auto expect = [&f](oneiros::rpc_call call, const std::string& method, const json& params) {
        auto result = call.get();
        auto frame = f.last_frame();
        assert(frame["method"] == method);
        assert(frame["params"] == params);
        return result;
    };

    auto data = json{{"name", "tobie"}};
    expect(f.db->select("person"), "select", json::array({"person"}));
    expect(f.db->create("person", data), "create", json::array({"person", data}));
    expect(f.db->create("person"), "create", json::array({"person"}));
    expect(f.db->insert("person", json::array({data})), "insert", json::array({"person", json::array({data})}));
    expect(f.db->update("person:1", data), "update", json::array({"person:1", data}));
    expect(f.db->upsert("person:1", data), "upsert", json::array({"person:1", data}));
    expect(f.db->merge("person:1", data), "merge", json::array({"person:1", data}));
    auto ops = json::array({json{{"op", "replace"}, {"path", "/name"}, {"value", "x"}}});
    expect(f.db->patch("person:1", ops, true), "patch", json::array({"person:1", ops, true}));
    expect(f.db->remove("person:1"), "delete", json::array({"person:1"}));
    expect(f.db->relate("user:a", "knows", "user:b"), "relate", json::array({"user:a", "knows", "user:b"}));
    expect(f.db->insert_relation("knows", data), "insert_relation", json::array({"knows", data}));
    expect(f.db->run("fn::greet", std::nullopt, json::array({"x"})), "run",
           json::array({"fn::greet", nullptr, json::array({"x"})}));
    expect(f.db->graphql(json{{"query", "{ person { id } }"}}), "graphql",
           json::array({json{{"query", "{ person { id } }"}}, json::object()}));
    expect(f.db->call("custom", json::array({1})), "custom", json::array({1}));

    assert(expect(f.db->version(), "version", json::array()) == "surrealdb-2.0.0");
    assert(expect(f.db->info(), "info", json::array())["id"] == "user:root");
    expect(f.db->ping(), "ping", json::array());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Session mutations
// ============================================================================

void test_session_mutations_follow_ack() {
    std::cout << "  test_session_mutations_follow_ack..." << std::flush;

    client_fixture f;
    f.db->connect();
    f.server->silent.insert("let");

    auto call = f.db->let("tenant", json("acme"));
    assert(f.db->session_snapshot().variables.count("tenant") == 0);
    assert(f.last_frame()["params"] == json::array({"tenant", "acme"}));

    f.transport->simulate_message(json{{"id", call.id()}, {"result", nullptr}}.dump());
    call.get();
    assert(f.db->session_snapshot().variables.at("tenant") == "acme");

    // A rejected use() leaves the session as it was
    f.server->failing.insert("use");
    bool rejected = false;
    try {
        f.db->use("other", "other").get();
    } catch (const oneiros::remote_error&) {
        rejected = true;
    }
    assert(rejected);
    assert(f.db->session_snapshot().namespace_name == std::optional<std::string>("test"));
    f.server->failing.clear();

    // Dropping the handle does not lose the acknowledgement
    f.server->silent.insert("unset");
    std::string id;
    {
        auto dropped = f.db->unset("tenant");
        id = dropped.id();
    }
    f.transport->simulate_message(json{{"id", id}, {"result", nullptr}}.dump());
    assert(f.db->session_snapshot().variables.count("tenant") == 0);

    std::cout << " OK" << std::endl;
}

void test_use_keep_and_unset() {
    std::cout << "  test_use_keep_and_unset..." << std::flush;

    client_fixture f;
    f.db->connect();

    f.db->use(oneiros::scope::keep(), "archive").get();
    assert(f.last_frame()["params"] == json::array({"test", "archive"}));
    auto session = f.db->session_snapshot();
    assert(*session.namespace_name == "test" && *session.database_name == "archive");

    f.db->use(std::nullopt, oneiros::scope::keep()).get();
    assert(f.last_frame()["params"] == json::array({nullptr, "archive"}));
    session = f.db->session_snapshot();
    assert(!session.namespace_name);
    assert(*session.database_name == "archive");

    std::cout << " OK" << std::endl;
}

void test_overlapping_use_calls() {
    std::cout << "  test_overlapping_use_calls..." << std::flush;

    client_fixture f;
    f.db->connect();
    f.db->use(std::nullopt, std::nullopt).get();
    f.server->silent.insert("use");

    // The second call resolves "keep" before the first is acknowledged
    auto first = f.db->use("a", "b");
    assert(f.last_frame()["params"] == json::array({"a", "b"}));
    auto second = f.db->use(oneiros::scope::keep(), "c");
    assert(f.last_frame()["params"] == json::array({nullptr, "c"}));

    f.transport->simulate_message(json{{"id", first.id()}, {"result", nullptr}}.dump());
    first.get();
    auto session = f.db->session_snapshot();
    assert(*session.namespace_name == "a" && *session.database_name == "b");

    // The server applied [null, "c"] last; the session must agree
    f.transport->simulate_message(json{{"id", second.id()}, {"result", nullptr}}.dump());
    second.get();
    session = f.db->session_snapshot();
    assert(!session.namespace_name);
    assert(*session.database_name == "c");

    std::cout << " OK" << std::endl;
}

void test_authentication_calls() {
    std::cout << "  test_authentication_calls..." << std::flush;

    client_fixture f(oneiros::client_config("ws://localhost:8000/rpc", "test", "test"));
    f.db->connect();
    assert(f.db->state() == connection_state::connected);

    f.db->authenticate("jwt-token").get();
    assert(f.db->state() == connection_state::authenticated);
    assert(f.db->session_snapshot().auth_token == std::optional<std::string>("jwt-token"));

    f.db->invalidate().get();
    assert(f.db->state() == connection_state::connected);
    assert(!f.db->session_snapshot().auth_token);

    auto token = f.db->signup(json{{"user", "root"}, {"pass", "root"}, {"ns", "test"}}).get();
    assert(token == "token-abc");
    assert(f.db->state() == connection_state::authenticated);

    bool denied = false;
    try {
        f.db->signin(json{{"user", "root"}, {"pass", "nope"}}).get();
    } catch (const oneiros::remote_error&) {
        denied = true;
    }
    assert(denied);
    assert(f.db->session_snapshot().auth_token == std::optional<std::string>("token-abc"));

    std::cout << " OK" << std::endl;
}

void test_reset_is_idempotent() {
    std::cout << "  test_reset_is_idempotent..." << std::flush;

    client_fixture f;
    f.db->connect();
    f.db->let("x", json(1)).get();
    auto stream = f.db->subscribe("person");
    assert(f.db->live_subscriptions() == 1);

    f.db->reset().get();
    auto once = f.db->session_snapshot();
    f.db->reset().get();
    auto twice = f.db->session_snapshot();

    assert(once.state == connection_state::connected && twice.state == connection_state::connected);
    assert(!once.auth_token && !twice.auth_token);
    assert(!once.namespace_name && !twice.namespace_name);
    assert(once.variables.empty() && twice.variables.empty());
    assert(f.db->live_subscriptions() == 0);
    assert(stream.is_closed());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Disconnects and timeouts
// ============================================================================

void test_disconnect_fails_pending() {
    std::cout << "  test_disconnect_fails_pending..." << std::flush;

    client_fixture f;
    f.db->connect();
    f.server->silent.insert("query");

    auto pending = f.db->query("SELECT * FROM person");
    auto stream = f.db->subscribe("person");
    assert(f.db->pending_requests() == 1);

    f.db->disconnect();
    assert(throws_connection_error([&] { pending.get(); }));
    assert(f.db->pending_requests() == 0);
    assert(stream.is_closed());
    assert(!stream.next());
    assert(f.db->state() == connection_state::disconnected);

    std::cout << " OK" << std::endl;
}

void test_remote_close() {
    std::cout << "  test_remote_close..." << std::flush;

    client_fixture f;
    f.db->connect();
    f.server->silent.insert("ping");

    auto pending = f.db->ping();
    f.transport->simulate_close(1006, "server went away");

    assert(throws_connection_error([&] { pending.get(); }));
    assert(f.db->state() == connection_state::disconnected);
    assert(f.observed_states().back() == connection_state::disconnected);
    assert(throws_connection_error([&] { f.db->ping(); }));

    std::cout << " OK" << std::endl;
}

void test_request_timeout() {
    std::cout << "  test_request_timeout..." << std::flush;

    client_fixture f;
    f.db->connect();
    f.server->silent.insert("query");

    auto call = f.db->query("SELECT * FROM person", json::object(), 200ms);
    std::string id = call.id();
    bool timed_out = false;
    try {
        call.get();
    } catch (const oneiros::timeout_error&) {
        timed_out = true;
    }
    assert(timed_out);

    // A late reply is dropped without touching the connection
    f.transport->simulate_message(json{{"id", id}, {"result", json::array()}}.dump());
    assert(f.db->is_connected());

    std::cout << " OK" << std::endl;
}

void test_failed_call_keeps_connection() {
    std::cout << "  test_failed_call_keeps_connection..." << std::flush;

    client_fixture f;
    f.db->connect();
    f.server->failing.insert("ping");

    bool failed = false;
    try {
        f.db->ping().get();
    } catch (const oneiros::remote_error&) {
        failed = true;
    }
    assert(failed);
    assert(f.db->state() == connection_state::authenticated);

    // Malformed and unknown frames are dropped
    f.transport->simulate_message(std::string("not json{"));
    f.transport->simulate_message(json{{"id", "999"}, {"result", 1}}.dump());
    assert(f.db->is_connected());

    std::string reported;
    f.db->set_on_error([&reported](const std::string& error) { reported = error; });
    f.transport->simulate_error("socket hiccup");
    assert(reported == "socket hiccup");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Live queries
// ============================================================================

void test_live_through_client() {
    std::cout << "  test_live_through_client..." << std::flush;

    client_fixture f;
    f.db->connect();

    auto people = f.db->subscribe("person");
    auto adults = f.db->subscribe(oneiros::live_select_statement().from("person").where("age > 18"));
    assert(people.id() == "live-1");
    assert(adults.id() == "live-q1");
    assert(f.db->live_subscriptions() == 2);

    auto notify = [&f](const std::string& id, const std::string& action, json data) {
        f.transport->simulate_message(
            json{{"result", {{"id", id}, {"action", action}, {"result", std::move(data)}}}}.dump());
    };

    notify("live-1", "CREATE", {{"id", "person:2"}, {"age", 12}});
    notify("live-q1", "UPDATE", {{"id", "person:3"}, {"age", 40}});
    notify("live-unknown", "CREATE", json::object());

    auto child = people.next_for(1s);
    assert(child && child->data["age"] == 12);
    auto adult = adults.next_for(1s);
    assert(adult && adult->action == oneiros::live_action::update);
    assert(!people.try_next());

    f.db->kill(adults.id()).get();
    assert(f.last_frame()["method"] == "kill");
    assert(f.last_frame()["params"] == json::array({"live-q1"}));
    assert(f.db->live_subscriptions() == 1);

    people.close();
    assert(f.last_frame()["params"] == json::array({"live-1"}));
    assert(f.db->live_subscriptions() == 0);

    auto raw = f.db->live("order", true).get();
    assert(raw == "live-2");
    assert(f.last_frame()["params"] == json::array({"order", true}));

    std::cout << " OK" << std::endl;
}

void test_encrypted_relation() {
    std::cout << "  test_encrypted_relation..." << std::flush;

    auto config = client_fixture::default_config();
    config.security.enabled = true;
    config.security.key = "client-side-secret";
    client_fixture f(config);
    f.db->connect();

    oneiros::field_descriptors descriptors = {oneiros::field_descriptor::reversible("card")};
    json entity = {{"id", "purchase:1"}, {"card", "4111-1111"}, {"qty", 1}};
    f.db->execute(f.db->relation()
                      .from("user:alice")
                      .to("product:laptop")
                      .via("purchased")
                      .with_entity(entity, descriptors))
        .get();

    assert(entity["card"] == "4111-1111");
    std::string sql = f.last_frame()["params"][0].get<std::string>();
    assert(sql.find("4111-1111") == std::string::npos);
    assert(sql.find("\"qty\":1") != std::string::npos);
    assert(f.db->pipeline().enabled());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Configuration, factory and scheduler
// ============================================================================

void test_config_from_json() {
    std::cout << "  test_config_from_json..." << std::flush;

    auto config = oneiros::client_config::from_json(json{
        {"url", "ws://db:8000/rpc"},
        {"namespace", "app"},
        {"database", "main"},
        {"username", "root"},
        {"password", "root"},
        {"requestTimeoutMs", 1500},
        {"liveBufferWatermark", 8},
        {"security", {{"enabled", true}, {"key", "0123456789abcdef"}}},
    });
    assert(config.url == "ws://db:8000/rpc");
    assert(config.namespace_name == "app" && config.database_name == "main");
    assert(config.has_credentials());
    assert(config.request_timeout == 1500ms);
    assert(config.connect_timeout == 10000ms);
    assert(config.live_buffer_watermark == 8);
    assert(config.security.enabled);

    auto expect_rejected = [](const json& j) {
        bool threw = false;
        try {
            oneiros::client_config::from_json(j);
        } catch (const oneiros::configuration_error&) {
            threw = true;
        }
        assert(threw);
    };
    expect_rejected(json::array());
    expect_rejected(json{{"url", ""}});
    expect_rejected(json{{"url", "ws://x"}, {"requestTimeoutMs", "soon"}});
    expect_rejected(json{{"url", "ws://x"}, {"username", "root"}});
    expect_rejected(json{{"url", "ws://x"}, {"security", {{"enabled", true}, {"key", "short"}}}});

    std::cout << " OK" << std::endl;
}

void test_default_network_factory() {
    std::cout << "  test_default_network_factory..." << std::flush;

    auto factory = std::make_shared<oneiros::mock_network_factory>();
    oneiros::set_network_factory(factory);

    // No namespace or credentials, so connecting sends nothing
    oneiros::client db(oneiros::client_config("ws://localhost:8000/rpc", "", ""));
    auto* transport = factory->last_transport();
    assert(transport != nullptr);
    db.connect();
    assert(db.state() == connection_state::connected);
    assert(transport->url() == "ws://localhost:8000/rpc");
    assert(transport->sent_count() == 0);
    db.disconnect();

    std::cout << " OK" << std::endl;
}

void test_state_changes_on_scheduler() {
    std::cout << "  test_state_changes_on_scheduler..." << std::flush;

    auto sched = std::make_shared<oneiros::std_thread_scheduler>();
    client_fixture f(oneiros::client_config("ws://localhost:8000/rpc", "test", "test"), sched);

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<connection_state> seen;
    std::thread::id handler_thread;
    f.db->set_on_state_change([&](connection_state state) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(state);
        handler_thread = std::this_thread::get_id();
        cv.notify_all();
    });

    f.db->connect();
    f.db->disconnect();

    std::unique_lock<std::mutex> lock(mutex);
    bool all = cv.wait_for(lock, 2s, [&] { return seen.size() == 3; });
    assert(all);
    assert(seen.back() == connection_state::disconnected);
    assert(handler_thread != std::this_thread::get_id());

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing client..." << std::endl;
    test_connect_signs_in_and_selects_scope();
    test_connect_failures();
    test_calls_require_connection();
    test_queries_require_scope();
    test_query_status_unwrap();
    test_execute_statements();
    test_rpc_method_surface();
    test_session_mutations_follow_ack();
    test_use_keep_and_unset();
    test_overlapping_use_calls();
    test_authentication_calls();
    test_reset_is_idempotent();
    test_disconnect_fails_pending();
    test_remote_close();
    test_request_timeout();
    test_failed_call_keeps_connection();
    test_live_through_client();
    test_encrypted_relation();
    test_config_from_json();
    test_default_network_factory();
    test_state_changes_on_scheduler();
}

} // namespace client_tests
