#pragma once

#include "config.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace oneiros {

/// One-way password hashing families.
enum class hash_kind {
    argon2,
    bcrypt,
    scrypt,
    sha256,
    sha512
};

const char* to_string(hash_kind kind);

// ============================================================================
// crypto_service - reversible encryption and password hashing primitives
// ============================================================================
//
// Reversible values are AES-256-GCM with a random 96-bit IV and a 128-bit
// tag, encoded as base64(iv || ciphertext || tag). The key is SHA-256 of the
// configured key string, so values stay decryptable across restarts.
//
// Hash encodings:
//   argon2  "$argon2id$v=19$m=<KiB>,t=<passes>,p=<lanes>$<salt>$<hash>"  (libargon2)
//   bcrypt  "$2b$<cost>$..."                    (libbcrypt)
//   scrypt  "$scrypt$ln=<log2 N>,r=<r>,p=<p>$<salt>$<hash>"
//   sha256  "$sha256$i=<iterations>$<salt>$<digest>"
//   sha512  "$sha512$i=<iterations>$<salt>$<digest>"

class crypto_service {
public:
    explicit crypto_service(const security_config& config,
                            const encryption_defaults& defaults = {});

    bool enabled() const { return enabled_; }
    const encryption_defaults& defaults() const { return defaults_; }

    /// Throws configuration_error when security is disabled.
    std::string encrypt(const std::string& plaintext) const;

    /// Throws decryption_error on corrupt input, tampering or a wrong key.
    std::string decrypt(const std::string& token) const;

    /// `strength` must already be resolved (see resolve_strength).
    std::string hash(const std::string& plaintext, hash_kind kind, int strength) const;

    /// Constant-time comparison. Malformed stored values verify as false.
    bool verify(const std::string& candidate, const std::string& stored, hash_kind kind) const;

    /// Replaces the unset sentinel with the configured default and range-checks
    /// the result. Throws configuration_error when out of range.
    static int resolve_strength(hash_kind kind, int strength, const encryption_defaults& defaults);

    static bool is_argon2_hash(const std::string& value);
    static bool is_bcrypt_hash(const std::string& value);
    static bool is_scrypt_hash(const std::string& value);

    static std::string base64_encode(const unsigned char* data, std::size_t len);
    static std::optional<std::vector<unsigned char>> base64_decode(const std::string& text);

private:
    std::string hash_argon2(const std::string& plaintext, int memory_kib) const;
    bool verify_argon2(const std::string& candidate, const std::string& stored) const;
    std::string hash_bcrypt(const std::string& plaintext, int cost) const;
    bool verify_bcrypt(const std::string& candidate, const std::string& stored) const;
    std::string hash_scrypt(const std::string& plaintext, int cost) const;
    bool verify_scrypt(const std::string& candidate, const std::string& stored) const;
    std::string hash_sha(const std::string& plaintext, hash_kind kind, int iterations) const;
    bool verify_sha(const std::string& candidate, const std::string& stored, hash_kind kind) const;

    bool enabled_;
    encryption_defaults defaults_;
    std::array<unsigned char, 32> key_{};
};

} // namespace oneiros
