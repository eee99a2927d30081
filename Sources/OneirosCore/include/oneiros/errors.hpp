#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace oneiros {

// ============================================================================
// Error hierarchy
// ============================================================================
//
// Synchronous failures (builder validation, bad strength, calls on a
// disconnected client) are thrown from the call itself. Failures of an
// in-flight request are stored in its rpc_call and rethrown by get().

class oneiros_error : public std::runtime_error {
public:
    explicit oneiros_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Transport-level failure: connect refused, socket closed, send on a closed channel.
class connection_error : public oneiros_error {
public:
    explicit connection_error(const std::string& msg) : oneiros_error(msg) {}
};

/// A request exceeded its deadline; its pending entry has already been removed.
class timeout_error : public oneiros_error {
public:
    explicit timeout_error(const std::string& msg) : oneiros_error(msg) {}
};

/// The server answered with a structured error.
class remote_error : public oneiros_error {
public:
    remote_error(int64_t code, const std::string& message)
        : oneiros_error(message), code_(code), message_(message) {}

    int64_t code() const noexcept { return code_; }
    const std::string& server_message() const noexcept { return message_; }

private:
    int64_t code_;
    std::string message_;
};

class decryption_error : public oneiros_error {
public:
    decryption_error(const std::string& field, const std::string& msg)
        : oneiros_error(field.empty() ? msg : field + ": " + msg), field_(field) {}

    /// Empty when the failure was not tied to a named field.
    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

class configuration_error : public oneiros_error {
public:
    explicit configuration_error(const std::string& msg) : oneiros_error(msg) {}
};

/// A statement was built without one of its mandatory parts.
class missing_target : public configuration_error {
public:
    explicit missing_target(const std::string& msg) : configuration_error(msg) {}
};

} // namespace oneiros
