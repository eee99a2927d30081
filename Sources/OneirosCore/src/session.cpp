#include "oneiros/session.hpp"
#include "oneiros/log.hpp"

namespace oneiros {

const char* to_string(connection_state state) {
    switch (state) {
        case connection_state::disconnected: return "disconnected";
        case connection_state::connecting: return "connecting";
        case connection_state::connected: return "connected";
        case connection_state::authenticated: return "authenticated";
    }
    return "unknown";
}

std::optional<std::string> scope::apply(const std::optional<std::string>& current) const {
    switch (action_) {
        case action::keep: return current;
        case action::unset: return std::nullopt;
        case action::set: return value_;
    }
    return current;
}

session session_state::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

connection_state session_state::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state;
}

bool session_state::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.connected();
}

bool session_state::begin_connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state != connection_state::disconnected) return false;
    session_.state = connection_state::connecting;
    return true;
}

void session_state::connected() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state == connection_state::connecting) {
        session_.state = connection_state::connected;
    }
}

connection_state session_state::disconnected() {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_state previous = session_.state;
    session_ = session{};
    return previous;
}

void session_state::authenticated(std::optional<std::string> token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_.connected()) return;
    session_.auth_token = std::move(token);
    session_.state = connection_state::authenticated;
    LOG_DEBUG("session", "Session authenticated");
}

void session_state::invalidated() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_.connected()) return;
    session_.auth_token.reset();
    session_.state = connection_state::connected;
}

void session_state::use(const scope& ns, const scope& db) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.namespace_name = ns.apply(session_.namespace_name);
    session_.database_name = db.apply(session_.database_name);
}

void session_state::let(const std::string& name, const json& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.variables[name] = value;
}

void session_state::unset(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.variables.erase(name);
}

void session_state::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_.connected()) return;
    session_.auth_token.reset();
    session_.namespace_name.reset();
    session_.database_name.reset();
    session_.variables.clear();
    session_.state = connection_state::connected;
}

} // namespace oneiros
