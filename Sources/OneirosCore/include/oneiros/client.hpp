#pragma once

#include "config.hpp"
#include "encryption.hpp"
#include "live.hpp"
#include "network.hpp"
#include "rpc.hpp"
#include "scheduler.hpp"
#include "session.hpp"
#include "statement.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace oneiros {

// ============================================================================
// client - one connection, one session
// ============================================================================
//
// Every RPC method returns an rpc_call resolving to the server's result.
// Calls on a disconnected client throw connection_error; query-class calls
// without a selected namespace and database throw configuration_error.
// Both happen before anything is written.
//
// Session changes (signin, use, let, unset, invalidate, reset) are applied
// when the server acknowledges them, before the call's future is resolved.

class client {
public:
    using on_error_handler = std::function<void(const std::string& error)>;
    using on_state_change_handler = std::function<void(connection_state state)>;

    /// Transport comes from get_network_factory(). nullptr scheduler = immediate_scheduler.
    explicit client(client_config config, std::shared_ptr<scheduler> sched = nullptr);

    client(client_config config, std::unique_ptr<rpc_transport> transport,
           std::shared_ptr<scheduler> sched = nullptr);

    ~client();

    client(const client&) = delete;
    client& operator=(const client&) = delete;
    client(client&&) = delete;
    client& operator=(client&&) = delete;

    // Connection management

    /// Opens the transport and waits up to connect_timeout. With credentials
    /// configured it then signs in and selects namespace/database.
    /// Throws connection_error (or the sign-in failure) and ends disconnected.
    void connect();
    void disconnect();

    bool is_connected() const { return session_.is_connected(); }
    connection_state state() const { return session_.state(); }
    session session_snapshot() const { return session_.snapshot(); }
    const client_config& config() const { return config_; }

    // Authentication and session

    rpc_call signin(const json& credentials);
    rpc_call signup(const json& credentials);
    rpc_call authenticate(const std::string& token);
    rpc_call invalidate();
    rpc_call info();
    rpc_call reset();
    rpc_call ping();
    rpc_call version();
    rpc_call use(const scope& ns, const scope& db);
    rpc_call let(const std::string& name, const json& value);
    rpc_call unset(const std::string& name);

    // Queries

    /// Fails with remote_error naming the first statement whose status is not OK.
    rpc_call query(const std::string& sql, const json& vars = json::object(),
                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Builds the statement (throwing builder errors here) and runs it as a query.
    template <typename Statement>
    rpc_call execute(const Statement& statement, const json& vars = json::object(),
                     std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        return query(statement.build(), vars, timeout);
    }

    rpc_call graphql(const json& request, const json& options = json::object());
    rpc_call run(const std::string& function, const std::optional<std::string>& version = std::nullopt,
                 const json& args = json::array());

    rpc_call select(const std::string& thing);
    rpc_call create(const std::string& thing, const json& data = nullptr);
    rpc_call insert(const std::string& table, const json& data);
    rpc_call update(const std::string& thing, const json& data = nullptr);
    rpc_call upsert(const std::string& thing, const json& data = nullptr);
    rpc_call merge(const std::string& thing, const json& data);
    rpc_call patch(const std::string& thing, const json& patches, bool diff = false);
    rpc_call remove(const std::string& thing);
    rpc_call relate(const std::string& in, const std::string& relation, const std::string& out,
                    const json& data = nullptr);
    rpc_call insert_relation(const std::string& table, const json& data);

    /// Any method by name, gated on the connection only.
    rpc_call call(const std::string& method, json params = json::array(),
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Live queries

    rpc_call live(const std::string& table, bool diff = false);
    rpc_call kill(const std::string& live_id);

    notification_stream subscribe(const std::string& table, bool diff = false,
                                  field_descriptors descriptors = {});
    /// Runs a LIVE SELECT and routes its notifications to the returned stream.
    notification_stream subscribe(const live_select_statement& statement,
                                  field_descriptors descriptors = {});
    rpc_call unsubscribe(const std::string& live_id) { return kill(live_id); }

    // Statement helpers

    /// RELATE builder wired to this client's encryption pipeline.
    relate_statement relation() const { return relate_statement(pipeline_); }
    const encryption_pipeline& pipeline() const { return *pipeline_; }

    // Introspection

    std::size_t pending_requests() const { return correlator_->pending_count(); }
    std::size_t live_subscriptions() const { return router_->size(); }

    // Event handlers (dispatched on the client's scheduler)

    void set_on_error(on_error_handler handler) { on_error_ = std::move(handler); }
    void set_on_state_change(on_state_change_handler handler) { on_state_change_ = std::move(handler); }

private:
    enum class gate { connection, scope };

    rpc_call send(const std::string& method, json params, gate required,
                  request_correlator::completion on_result = nullptr,
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void require(gate required) const;

    void install_transport_handlers();
    void on_transport_open();
    void on_transport_message(const transport_message& msg);
    void on_transport_error(const std::string& error);
    void on_transport_close(int code, const std::string& reason);

    void teardown(const std::string& reason);
    void notify_state(connection_state state);
    void report_error(const std::string& error);

    client_config config_;
    std::shared_ptr<scheduler> scheduler_;
    std::unique_ptr<rpc_transport> transport_;
    std::shared_ptr<const encryption_pipeline> pipeline_;
    session_state session_;
    std::shared_ptr<request_correlator> correlator_;
    std::shared_ptr<live_subscription_router> router_;

    enum class open_outcome { idle, waiting, opened, failed };
    std::mutex connect_mutex_;
    std::condition_variable connect_cv_;
    open_outcome open_outcome_ = open_outcome::idle;
    std::string open_error_;

    on_error_handler on_error_;
    on_state_change_handler on_state_change_;
};

} // namespace oneiros
