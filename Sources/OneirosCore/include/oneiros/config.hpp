#pragma once

#include "types.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace oneiros {

// ============================================================================
// security_config - key material for the field encryption pipeline
// ============================================================================

struct security_config {
    /// When false the encryption pipeline is a passthrough.
    bool enabled = false;

    /// Reversible fields are encrypted with SHA-256(key). Minimum 8 characters.
    std::string key;

    static constexpr std::size_t min_key_length = 8;

    /// Throws configuration_error if enabled with a missing or short key.
    void validate() const;
};

// ============================================================================
// encryption_defaults - fallback strengths for one-way hashes
// ============================================================================
//
// A descriptor strength of `unset_strength` is replaced by these values
// when the descriptor is constructed.

struct encryption_defaults {
    static constexpr int unset_strength = -1;

    /// argon2id memory cost in KiB; the strength of an argon2 descriptor.
    int argon2_memory_kib = 65536;
    static constexpr int argon2_min_memory_kib = 8;
    static constexpr int argon2_max_memory_kib = 1 << 22;
    int argon2_iterations = 3;
    int argon2_parallelism = 1;
    int argon2_hash_length = 32;
    int argon2_salt_length = 16;

    int bcrypt_cost = 10;
    static constexpr int bcrypt_min_cost = 4;
    static constexpr int bcrypt_max_cost = 31;

    /// scrypt CPU/memory cost N. Must be a power of two.
    int scrypt_cost = 16384;
    static constexpr int scrypt_min_cost = 2;
    static constexpr int scrypt_max_cost = 1 << 20;
    int scrypt_block_size = 8;
    int scrypt_parallelism = 1;
    int scrypt_key_length = 32;
    int scrypt_salt_length = 16;

    /// Digest iterations for the salted SHA family.
    int sha_iterations = 1;
    static constexpr int sha_min_iterations = 1;
    static constexpr int sha_max_iterations = 1000000;
    int sha_salt_length = 16;
};

// ============================================================================
// client_config
// ============================================================================

struct client_config {
    /// Endpoint of the RPC socket, e.g. "ws://localhost:8000/rpc".
    std::string url;

    std::string namespace_name;
    std::string database_name;

    /// When both are set, connect() signs in and selects namespace/database.
    std::string username;
    std::string password;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds request_timeout{30000};

    /// Per-subscription notification buffer; oldest events are dropped beyond it.
    std::size_t live_buffer_watermark = 1024;

    security_config security;
    encryption_defaults defaults;

    client_config() = default;

    client_config(std::string u, std::string ns, std::string db)
        : url(std::move(u)), namespace_name(std::move(ns)), database_name(std::move(db)) {}

    bool has_credentials() const { return !username.empty() && !password.empty(); }

    /// Throws configuration_error on an unusable combination of settings.
    void validate() const;

    /// Reads url, namespace, database, username, password, connectTimeoutMs,
    /// requestTimeoutMs, liveBufferWatermark and security.{enabled,key}.
    /// Missing keys keep their defaults.
    static client_config from_json(const json& j);
};

} // namespace oneiros
