#pragma once

#include "types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace oneiros {

enum class connection_state {
    disconnected,
    connecting,
    connected,      // unauthenticated
    authenticated
};

const char* to_string(connection_state state);

/// Immutable copy of the session, as handed to readers.
struct session {
    connection_state state = connection_state::disconnected;
    std::optional<std::string> auth_token;
    std::optional<std::string> namespace_name;
    std::optional<std::string> database_name;
    std::map<std::string, json> variables;

    bool connected() const {
        return state == connection_state::connected || state == connection_state::authenticated;
    }
    bool has_scope() const { return namespace_name.has_value() && database_name.has_value(); }
};

// ============================================================================
// scope - argument of use(): keep the current value, unset it, or set it
// ============================================================================

class scope {
public:
    enum class action { keep, unset, set };

    static scope keep() { return scope(action::keep, {}); }
    static scope none() { return scope(action::unset, {}); }

    scope(std::string value) : action_(action::set), value_(std::move(value)) {}
    scope(const char* value) : action_(action::set), value_(value) {}
    scope(std::nullopt_t) : action_(action::unset) {}

    action what() const { return action_; }
    const std::string& value() const { return value_; }

    /// New value of a field currently holding `current`.
    std::optional<std::string> apply(const std::optional<std::string>& current) const;

private:
    scope(action a, std::string value) : action_(a), value_(std::move(value)) {}

    action action_;
    std::string value_;
};

// ============================================================================
// session_state - the mutex-guarded session of one client
// ============================================================================
//
// Every transition happens under one lock, so snapshot() observes either
// the state before or the state after a transition, never a mix.
// Mutations are applied by the client once the server acknowledged them.

class session_state {
public:
    session snapshot() const;
    connection_state state() const;
    bool is_connected() const;

    /// disconnected -> connecting. False if not currently disconnected.
    bool begin_connect();
    /// connecting -> connected.
    void connected();
    /// Any state -> disconnected; forgets token, scope and variables.
    /// Returns the previous state.
    connection_state disconnected();

    /// connected -> authenticated, storing the token if the server sent one.
    void authenticated(std::optional<std::string> token);
    /// authenticated -> connected, dropping the token.
    void invalidated();

    void use(const scope& ns, const scope& db);
    void let(const std::string& name, const json& value);
    void unset(const std::string& name);

    /// Clears token, scope and variables and returns to connected.
    void reset();

private:
    mutable std::mutex mutex_;
    session session_;
};

} // namespace oneiros
