#include "oneiros/websocket_transport.hpp"
#include <oneiros/errors.hpp>
#include <oneiros/log.hpp>

namespace oneiros {

websocket_transport::websocket_transport() {
    client_.clear_access_channels(websocketpp::log::alevel::all);
    client_.clear_error_channels(websocketpp::log::elevel::all);
    client_.init_asio();

    client_.set_open_handler([this](websocketpp::connection_hdl hdl) {
        hdl_ = hdl;
        state_ = transport_state::open;
        LOG_INFO("ws", "WebSocket open");
        if (on_open_) on_open_();
    });

    client_.set_message_handler([this](websocketpp::connection_hdl, message_ptr msg) {
        if (!on_message_) return;
        if (msg->get_opcode() == websocketpp::frame::opcode::binary) {
            const auto& payload = msg->get_payload();
            on_message_(transport_message::from_binary(std::vector<uint8_t>(payload.begin(), payload.end())));
        } else {
            on_message_(transport_message::from_string(msg->get_payload()));
        }
    });

    client_.set_fail_handler([this](websocketpp::connection_hdl hdl) {
        state_ = transport_state::closed;
        std::string reason = "Connection failed";
        websocketpp::lib::error_code ec;
        if (auto con = client_.get_con_from_hdl(hdl, ec)) {
            reason = con->get_ec().message();
        }
        LOG_ERROR("ws", "WebSocket failure: %s", reason.c_str());
        if (on_error_) on_error_(reason);
    });

    client_.set_close_handler([this](websocketpp::connection_hdl hdl) {
        state_ = transport_state::closed;
        int code = websocketpp::close::status::normal;
        std::string reason = "Connection closed";
        websocketpp::lib::error_code ec;
        if (auto con = client_.get_con_from_hdl(hdl, ec)) {
            code = con->get_remote_close_code();
            if (!con->get_remote_close_reason().empty()) {
                reason = con->get_remote_close_reason();
            }
        }
        LOG_INFO("ws", "WebSocket closed (%d): %s", code, reason.c_str());
        if (on_close_) on_close_(code, reason);
    });
}

websocket_transport::~websocket_transport() {
    disconnect();
    join_io_thread();
}

void websocket_transport::join_io_thread() {
    if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id()) {
        io_thread_.join();
    }
}

void websocket_transport::connect(const std::string& url,
                                  const std::map<std::string, std::string>& headers) {
    join_io_thread();
    if (io_thread_.joinable()) {
        throw connection_error("connect called from the transport's own thread");
    }
    client_.reset();

    websocketpp::lib::error_code ec;
    auto con = client_.get_connection(url, ec);
    if (ec) {
        LOG_ERROR("ws", "Invalid endpoint %s: %s", url.c_str(), ec.message().c_str());
        if (on_error_) on_error_(ec.message());
        return;
    }

    for (const auto& [key, value] : headers) {
        con->append_header(key, value);
    }

    state_ = transport_state::connecting;
    client_.connect(con);

    io_thread_ = std::thread([this]() {
        client_.run();
    });
}

void websocket_transport::disconnect() {
    if (state_ == transport_state::open) {
        state_ = transport_state::closing;
        websocketpp::lib::error_code ec;
        client_.close(hdl_, websocketpp::close::status::normal, "Client disconnect", ec);
        if (ec) {
            LOG_WARN("ws", "Close failed: %s", ec.message().c_str());
        }
    }
    client_.stop();
}

void websocket_transport::send(const transport_message& message) {
    if (state_ != transport_state::open) {
        throw connection_error("WebSocket is not open");
    }

    websocketpp::lib::error_code ec;
    if (message.msg_type == transport_message::type::binary) {
        client_.send(hdl_, message.data.data(), message.data.size(),
                     websocketpp::frame::opcode::binary, ec);
    } else {
        client_.send(hdl_, message.as_string(), websocketpp::frame::opcode::text, ec);
    }
    if (ec) {
        throw connection_error("WebSocket write failed: " + ec.message());
    }
}

} // namespace oneiros
