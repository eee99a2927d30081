#pragma once

#include <oneiros/network.hpp>

#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace oneiros {

// ============================================================================
// websocket_transport - rpc_transport over websocketpp (plain ws://)
// ============================================================================
//
// The io loop runs on its own thread; every callback fires there, which
// makes that thread the client's demultiplexer.

class websocket_transport : public rpc_transport {
public:
    using client_t = websocketpp::client<websocketpp::config::asio_client>;
    using message_ptr = websocketpp::config::asio_client::message_type::ptr;

    websocket_transport();
    ~websocket_transport() override;

    websocket_transport(const websocket_transport&) = delete;
    websocket_transport& operator=(const websocket_transport&) = delete;

    void connect(const std::string& url,
                 const std::map<std::string, std::string>& headers = {}) override;
    void disconnect() override;
    transport_state state() const override { return state_; }

    /// Throws connection_error when the socket is not open or the write fails.
    void send(const transport_message& message) override;

    void set_on_open(on_open_handler handler) override { on_open_ = std::move(handler); }
    void set_on_message(on_message_handler handler) override { on_message_ = std::move(handler); }
    void set_on_error(on_error_handler handler) override { on_error_ = std::move(handler); }
    void set_on_close(on_close_handler handler) override { on_close_ = std::move(handler); }

private:
    void join_io_thread();

    client_t client_;
    websocketpp::connection_hdl hdl_;
    std::thread io_thread_;
    std::atomic<transport_state> state_{transport_state::closed};

    on_open_handler on_open_;
    on_message_handler on_message_;
    on_error_handler on_error_;
    on_close_handler on_close_;
};

/// Hands out websocket_transport instances; install with set_network_factory().
class websocket_network_factory : public network_factory {
public:
    std::unique_ptr<rpc_transport> create_transport() override {
        return std::make_unique<websocket_transport>();
    }
};

} // namespace oneiros
