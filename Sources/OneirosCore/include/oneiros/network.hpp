#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace oneiros {

// ============================================================================
// RPC Transport Interface
// ============================================================================
//
// Abstract interface for the persistent bidirectional channel the client
// speaks its RPC protocol over. Implementations: WebSocket (OneirosWebSocket),
// mock_transport for tests, or anything with connect/send/receive semantics.

enum class transport_state {
    connecting,
    open,
    closing,
    closed
};

struct transport_message {
    enum class type { text, binary };
    type msg_type = type::text;
    std::vector<uint8_t> data;

    std::string as_string() const {
        return std::string(data.begin(), data.end());
    }

    static transport_message from_string(const std::string& s) {
        transport_message msg;
        msg.msg_type = type::text;
        msg.data = std::vector<uint8_t>(s.begin(), s.end());
        return msg;
    }

    static transport_message from_binary(const std::vector<uint8_t>& d) {
        transport_message msg;
        msg.msg_type = type::binary;
        msg.data = d;
        return msg;
    }
};

class rpc_transport {
public:
    virtual ~rpc_transport() = default;

    // Connection lifecycle. connect() may complete asynchronously; completion
    // is reported through on_open or on_error.
    virtual void connect(const std::string& url,
                         const std::map<std::string, std::string>& headers = {}) = 0;
    virtual void disconnect() = 0;
    virtual transport_state state() const = 0;

    /// Writes one whole frame. Callers serialize writes.
    virtual void send(const transport_message& message) = 0;

    // Event callbacks
    using on_open_handler = std::function<void()>;
    using on_message_handler = std::function<void(const transport_message&)>;
    using on_error_handler = std::function<void(const std::string& error)>;
    using on_close_handler = std::function<void(int code, const std::string& reason)>;

    virtual void set_on_open(on_open_handler handler) = 0;
    virtual void set_on_message(on_message_handler handler) = 0;
    virtual void set_on_error(on_error_handler handler) = 0;
    virtual void set_on_close(on_close_handler handler) = 0;
};

// ============================================================================
// Factory for creating transports
// ============================================================================

class network_factory {
public:
    virtual ~network_factory() = default;

    virtual std::unique_ptr<rpc_transport> create_transport() = 0;
};

// Global factory registration. Defaults to mock_network_factory.
void set_network_factory(std::shared_ptr<network_factory> factory);
std::shared_ptr<network_factory> get_network_factory();

// ============================================================================
// Mock implementations for testing
// ============================================================================

class mock_transport : public rpc_transport {
public:
    /// Produces the reply frame for an outbound frame, or nullopt for no reply.
    using responder = std::function<std::optional<std::string>(const std::string& frame)>;

    void connect(const std::string& url,
                 const std::map<std::string, std::string>& headers = {}) override;
    void disconnect() override;
    transport_state state() const override;
    void send(const transport_message& message) override;

    void set_on_open(on_open_handler handler) override { on_open_ = std::move(handler); }
    void set_on_message(on_message_handler handler) override { on_message_ = std::move(handler); }
    void set_on_error(on_error_handler handler) override { on_error_ = std::move(handler); }
    void set_on_close(on_close_handler handler) override { on_close_ = std::move(handler); }

    // Test helpers
    void simulate_message(const transport_message& msg);
    void simulate_message(const std::string& text) { simulate_message(transport_message::from_string(text)); }
    void simulate_error(const std::string& error);
    void simulate_close(int code, const std::string& reason);

    /// Answer every sent frame synchronously from inside send().
    void set_responder(responder r);

    /// The next connect() fails with the given error instead of opening.
    void fail_next_connect(const std::string& error);

    std::vector<transport_message> get_sent_messages() const;
    std::optional<transport_message> last_sent_message() const;
    std::size_t sent_count() const;
    void clear_sent_messages();

    const std::string& url() const { return url_; }

private:
    mutable std::mutex mutex_;
    std::string url_;
    transport_state state_ = transport_state::closed;
    std::optional<std::string> connect_failure_;
    responder responder_;
    on_open_handler on_open_;
    on_message_handler on_message_;
    on_error_handler on_error_;
    on_close_handler on_close_;
    std::vector<transport_message> sent_messages_;
};

class mock_network_factory : public network_factory {
public:
    std::unique_ptr<rpc_transport> create_transport() override {
        auto transport = std::make_unique<mock_transport>();
        last_transport_ = transport.get();
        return transport;
    }

    // Access last created transport for testing
    mock_transport* last_transport() { return last_transport_; }

private:
    mock_transport* last_transport_ = nullptr;
};

} // namespace oneiros
