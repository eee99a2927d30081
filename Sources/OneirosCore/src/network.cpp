#include "oneiros/network.hpp"
#include "oneiros/errors.hpp"

namespace oneiros {

// Global network factory
static std::mutex g_network_factory_mutex;
static std::shared_ptr<network_factory> g_network_factory;

void set_network_factory(std::shared_ptr<network_factory> factory) {
    std::lock_guard<std::mutex> lock(g_network_factory_mutex);
    g_network_factory = std::move(factory);
}

std::shared_ptr<network_factory> get_network_factory() {
    std::lock_guard<std::mutex> lock(g_network_factory_mutex);
    if (!g_network_factory) {
        g_network_factory = std::make_shared<mock_network_factory>();
    }
    return g_network_factory;
}

// ============================================================================
// mock_transport
// ============================================================================

void mock_transport::connect(const std::string& url,
                             const std::map<std::string, std::string>&) {
    std::optional<std::string> failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        url_ = url;
        failure.swap(connect_failure_);
        state_ = failure ? transport_state::closed : transport_state::open;
    }
    if (failure) {
        if (on_error_) on_error_(*failure);
        return;
    }
    if (on_open_) on_open_();
}

void mock_transport::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == transport_state::closed) return;
        state_ = transport_state::closed;
    }
    if (on_close_) on_close_(1000, "Normal closure");
}

transport_state mock_transport::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void mock_transport::send(const transport_message& message) {
    responder reply_with;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != transport_state::open) {
            throw connection_error("send on a closed transport");
        }
        sent_messages_.push_back(message);
        reply_with = responder_;
    }
    if (reply_with) {
        if (auto reply = reply_with(message.as_string())) {
            simulate_message(*reply);
        }
    }
}

void mock_transport::simulate_message(const transport_message& msg) {
    if (on_message_) on_message_(msg);
}

void mock_transport::simulate_error(const std::string& error) {
    if (on_error_) on_error_(error);
}

void mock_transport::simulate_close(int code, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = transport_state::closed;
    }
    if (on_close_) on_close_(code, reason);
}

void mock_transport::set_responder(responder r) {
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::move(r);
}

void mock_transport::fail_next_connect(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    connect_failure_ = error;
}

std::vector<transport_message> mock_transport::get_sent_messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_messages_;
}

std::optional<transport_message> mock_transport::last_sent_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sent_messages_.empty()) return std::nullopt;
    return sent_messages_.back();
}

std::size_t mock_transport::sent_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_messages_.size();
}

void mock_transport::clear_sent_messages() {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_messages_.clear();
}

} // namespace oneiros
