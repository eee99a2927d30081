#include "oneiros/crypto.hpp"
#include "oneiros/errors.hpp"
#include "oneiros/log.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <argon2.h>
#include <libbcrypt/bcrypt.h>

#include <cstring>
#include <memory>
#include <sstream>

namespace oneiros {

namespace {

constexpr std::size_t iv_length = 12;
constexpr std::size_t tag_length = 16;

using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

std::vector<unsigned char> random_bytes(std::size_t n) {
    std::vector<unsigned char> out(n);
    if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
        LOG_ERROR("crypto", "RAND_bytes failed");
        throw oneiros_error("failed to generate random bytes");
    }
    return out;
}

const EVP_MD* digest_for(hash_kind kind) {
    return kind == hash_kind::sha512 ? EVP_sha512() : EVP_sha256();
}

std::vector<unsigned char> digest(const EVP_MD* md, const unsigned char* data, std::size_t len) {
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, out.data(), &out_len, md, nullptr) != 1) {
        throw oneiros_error("digest computation failed");
    }
    out.resize(out_len);
    return out;
}

bool is_power_of_two(int n) {
    return n > 0 && (n & (n - 1)) == 0;
}

int log2_of(int n) {
    int ln = 0;
    while ((1 << ln) < n) ++ln;
    return ln;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(s);
    while (std::getline(in, part, sep)) {
        parts.push_back(part);
    }
    return parts;
}

bool constant_time_equal(const std::vector<unsigned char>& a, const std::vector<unsigned char>& b) {
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// "key=value" -> value as int, or nullopt.
std::optional<int> parse_param(const std::string& part, const char* key) {
    std::string prefix = std::string(key) + "=";
    if (part.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    try {
        std::size_t consumed = 0;
        int value = std::stoi(part.substr(prefix.size()), &consumed);
        if (consumed != part.size() - prefix.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

const char* to_string(hash_kind kind) {
    switch (kind) {
        case hash_kind::argon2: return "argon2";
        case hash_kind::bcrypt: return "bcrypt";
        case hash_kind::scrypt: return "scrypt";
        case hash_kind::sha256: return "sha256";
        case hash_kind::sha512: return "sha512";
    }
    return "unknown";
}

crypto_service::crypto_service(const security_config& config, const encryption_defaults& defaults)
    : enabled_(config.enabled), defaults_(defaults) {
    config.validate();
    if (enabled_) {
        auto key = digest(EVP_sha256(),
                          reinterpret_cast<const unsigned char*>(config.key.data()),
                          config.key.size());
        std::memcpy(key_.data(), key.data(), key_.size());
    }
}

// ============================================================================
// Base64
// ============================================================================

std::string crypto_service::base64_encode(const unsigned char* data, std::size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    if (len == 0) return out;
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(len));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::optional<std::vector<unsigned char>> crypto_service::base64_decode(const std::string& text) {
    if (text.empty()) return std::vector<unsigned char>{};
    if (text.size() % 4 != 0) return std::nullopt;

    std::vector<unsigned char> out(text.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) return std::nullopt;

    // EVP_DecodeBlock counts padding as zero bytes.
    std::size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

// ============================================================================
// AES-256-GCM
// ============================================================================

std::string crypto_service::encrypt(const std::string& plaintext) const {
    if (!enabled_) {
        throw configuration_error("encryption requested while security is disabled");
    }

    auto iv = random_bytes(iv_length);
    std::vector<unsigned char> out(iv_length + plaintext.size() + tag_length);
    std::memcpy(out.data(), iv.data(), iv_length);

    cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    int len = 0;
    int final_len = 0;
    bool ok = ctx != nullptr;
    ok = ok && EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv_length), nullptr) == 1;
    ok = ok && EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv.data()) == 1;
    ok = ok && EVP_EncryptUpdate(ctx.get(), out.data() + iv_length, &len,
                                 reinterpret_cast<const unsigned char*>(plaintext.data()),
                                 static_cast<int>(plaintext.size())) == 1;
    ok = ok && EVP_EncryptFinal_ex(ctx.get(), out.data() + iv_length + len, &final_len) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag_length),
                                   out.data() + iv_length + len + final_len) == 1;
    if (!ok) {
        LOG_ERROR("crypto", "AES-GCM encryption failed");
        throw oneiros_error("encryption failed");
    }

    return base64_encode(out.data(), out.size());
}

std::string crypto_service::decrypt(const std::string& token) const {
    if (!enabled_) {
        throw configuration_error("decryption requested while security is disabled");
    }

    auto raw = base64_decode(token);
    if (!raw) {
        throw decryption_error("", "value is not valid base64");
    }
    if (raw->size() < iv_length + tag_length) {
        throw decryption_error("", "value is too short to be a ciphertext");
    }

    const unsigned char* iv = raw->data();
    const unsigned char* body = raw->data() + iv_length;
    std::size_t body_len = raw->size() - iv_length - tag_length;
    std::vector<unsigned char> tag(raw->end() - tag_length, raw->end());
    std::string plaintext(body_len, '\0');

    cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    int len = 0;
    int final_len = 0;
    bool ok = ctx != nullptr;
    ok = ok && EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv_length), nullptr) == 1;
    ok = ok && EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv) == 1;
    ok = ok && EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()), &len,
                                 body, static_cast<int>(body_len)) == 1;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag_length), tag.data()) == 1;
    ok = ok && EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()) + len, &final_len) > 0;
    if (!ok) {
        throw decryption_error("", "authentication failed (tampered value or wrong key)");
    }

    plaintext.resize(static_cast<std::size_t>(len + final_len));
    return plaintext;
}

// ============================================================================
// Strength
// ============================================================================

int crypto_service::resolve_strength(hash_kind kind, int strength, const encryption_defaults& defaults) {
    switch (kind) {
        case hash_kind::argon2: {
            int memory = strength == encryption_defaults::unset_strength ? defaults.argon2_memory_kib : strength;
            if (memory < encryption_defaults::argon2_min_memory_kib ||
                memory > encryption_defaults::argon2_max_memory_kib) {
                throw configuration_error("argon2 memory " + std::to_string(memory) + " KiB outside " +
                                          std::to_string(encryption_defaults::argon2_min_memory_kib) + ".." +
                                          std::to_string(encryption_defaults::argon2_max_memory_kib));
            }
            return memory;
        }
        case hash_kind::bcrypt: {
            int cost = strength == encryption_defaults::unset_strength ? defaults.bcrypt_cost : strength;
            if (cost < encryption_defaults::bcrypt_min_cost || cost > encryption_defaults::bcrypt_max_cost) {
                throw configuration_error("bcrypt cost " + std::to_string(cost) + " outside " +
                                          std::to_string(encryption_defaults::bcrypt_min_cost) + ".." +
                                          std::to_string(encryption_defaults::bcrypt_max_cost));
            }
            return cost;
        }
        case hash_kind::scrypt: {
            int cost = strength == encryption_defaults::unset_strength ? defaults.scrypt_cost : strength;
            if (cost < encryption_defaults::scrypt_min_cost || cost > encryption_defaults::scrypt_max_cost ||
                !is_power_of_two(cost)) {
                throw configuration_error("scrypt cost " + std::to_string(cost) +
                                          " must be a power of two in " +
                                          std::to_string(encryption_defaults::scrypt_min_cost) + ".." +
                                          std::to_string(encryption_defaults::scrypt_max_cost));
            }
            return cost;
        }
        case hash_kind::sha256:
        case hash_kind::sha512: {
            int iterations = strength == encryption_defaults::unset_strength ? defaults.sha_iterations : strength;
            if (iterations < encryption_defaults::sha_min_iterations ||
                iterations > encryption_defaults::sha_max_iterations) {
                throw configuration_error(std::string(to_string(kind)) + " iterations " +
                                          std::to_string(iterations) + " out of range");
            }
            return iterations;
        }
    }
    throw configuration_error("unknown hash kind");
}

bool crypto_service::is_argon2_hash(const std::string& value) {
    return value.compare(0, 10, "$argon2id$") == 0;
}

bool crypto_service::is_bcrypt_hash(const std::string& value) {
    return value.size() == 60 && value.compare(0, 2, "$2") == 0;
}

bool crypto_service::is_scrypt_hash(const std::string& value) {
    return value.compare(0, 8, "$scrypt$") == 0;
}

// ============================================================================
// Hashing
// ============================================================================

std::string crypto_service::hash(const std::string& plaintext, hash_kind kind, int strength) const {
    int resolved = resolve_strength(kind, strength, defaults_);
    switch (kind) {
        case hash_kind::argon2: return hash_argon2(plaintext, resolved);
        case hash_kind::bcrypt: return hash_bcrypt(plaintext, resolved);
        case hash_kind::scrypt: return hash_scrypt(plaintext, resolved);
        case hash_kind::sha256:
        case hash_kind::sha512: return hash_sha(plaintext, kind, resolved);
    }
    throw configuration_error("unknown hash kind");
}

bool crypto_service::verify(const std::string& candidate, const std::string& stored, hash_kind kind) const {
    switch (kind) {
        case hash_kind::argon2: return verify_argon2(candidate, stored);
        case hash_kind::bcrypt: return verify_bcrypt(candidate, stored);
        case hash_kind::scrypt: return verify_scrypt(candidate, stored);
        case hash_kind::sha256:
        case hash_kind::sha512: return verify_sha(candidate, stored, kind);
    }
    return false;
}

std::string crypto_service::hash_argon2(const std::string& plaintext, int memory_kib) const {
    auto salt = random_bytes(static_cast<std::size_t>(defaults_.argon2_salt_length));

    auto t = static_cast<uint32_t>(defaults_.argon2_iterations);
    auto m = static_cast<uint32_t>(memory_kib);
    auto p = static_cast<uint32_t>(defaults_.argon2_parallelism);
    auto hash_len = static_cast<uint32_t>(defaults_.argon2_hash_length);

    std::string encoded(argon2_encodedlen(t, m, p, static_cast<uint32_t>(salt.size()), hash_len, Argon2_id), '\0');
    int rc = argon2id_hash_encoded(t, m, p, plaintext.data(), plaintext.size(), salt.data(), salt.size(),
                                   hash_len, encoded.data(), encoded.size());
    if (rc != ARGON2_OK) {
        LOG_ERROR("crypto", "argon2id hashing failed (m=%d): %s", memory_kib, argon2_error_message(rc));
        throw oneiros_error("argon2 hashing failed");
    }
    encoded.resize(std::strlen(encoded.c_str()));
    return encoded;
}

bool crypto_service::verify_argon2(const std::string& candidate, const std::string& stored) const {
    if (!is_argon2_hash(stored)) return false;

    // "", "argon2id", "v=19", "m=..,t=..,p=..", salt, hash
    auto parts = split(stored, '$');
    if (parts.size() != 6) return false;
    auto params = split(parts[3], ',');
    if (params.size() != 3) return false;
    auto m = parse_param(params[0], "m");
    if (!m || *m < encryption_defaults::argon2_min_memory_kib || *m > encryption_defaults::argon2_max_memory_kib) {
        return false;
    }

    int rc = argon2id_verify(stored.c_str(), candidate.data(), candidate.size());
    if (rc != ARGON2_OK && rc != ARGON2_VERIFY_MISMATCH) {
        LOG_WARN("crypto", "argon2id_verify failed on a stored hash: %s", argon2_error_message(rc));
    }
    return rc == ARGON2_OK;
}

std::string crypto_service::hash_bcrypt(const std::string& plaintext, int cost) const {
    char salt[BCRYPT_HASHSIZE];
    char hash[BCRYPT_HASHSIZE];

    if (bcrypt_gensalt(cost, salt) != 0) {
        throw oneiros_error("couldn't generate bcrypt salt");
    }
    if (bcrypt_hashpw(plaintext.c_str(), salt, hash) != 0) {
        throw oneiros_error("couldn't compute bcrypt hash");
    }
    return {hash};
}

bool crypto_service::verify_bcrypt(const std::string& candidate, const std::string& stored) const {
    if (!is_bcrypt_hash(stored)) return false;
    int ret = bcrypt_checkpw(candidate.c_str(), stored.c_str());
    if (ret == -1) {
        LOG_WARN("crypto", "bcrypt_checkpw failed on a stored hash");
        return false;
    }
    return ret == 0;
}

std::string crypto_service::hash_scrypt(const std::string& plaintext, int cost) const {
    auto salt = random_bytes(static_cast<std::size_t>(defaults_.scrypt_salt_length));
    std::vector<unsigned char> key(static_cast<std::size_t>(defaults_.scrypt_key_length));

    uint64_t r = static_cast<uint64_t>(defaults_.scrypt_block_size);
    uint64_t p = static_cast<uint64_t>(defaults_.scrypt_parallelism);
    uint64_t max_mem = 128ull * static_cast<uint64_t>(cost) * r * (p + 1) + (1ull << 20);
    if (EVP_PBE_scrypt(plaintext.data(), plaintext.size(), salt.data(), salt.size(),
                       static_cast<uint64_t>(cost), r, p, max_mem, key.data(), key.size()) != 1) {
        LOG_ERROR("crypto", "EVP_PBE_scrypt failed (N=%d)", cost);
        throw oneiros_error("scrypt hashing failed");
    }

    return "$scrypt$ln=" + std::to_string(log2_of(cost)) + ",r=" + std::to_string(r) +
           ",p=" + std::to_string(p) + "$" + base64_encode(salt.data(), salt.size()) +
           "$" + base64_encode(key.data(), key.size());
}

bool crypto_service::verify_scrypt(const std::string& candidate, const std::string& stored) const {
    if (!is_scrypt_hash(stored)) return false;

    // "", "scrypt", "ln=..,r=..,p=..", salt, hash
    auto parts = split(stored, '$');
    if (parts.size() != 5) return false;
    auto params = split(parts[2], ',');
    if (params.size() != 3) return false;

    auto ln = parse_param(params[0], "ln");
    auto r = parse_param(params[1], "r");
    auto p = parse_param(params[2], "p");
    if (!ln || !r || !p || *ln < 1 || *ln > 20 || *r < 1 || *r > 32 || *p < 1 || *p > 16) {
        return false;
    }

    auto salt = base64_decode(parts[3]);
    auto expected = base64_decode(parts[4]);
    if (!salt || !expected || expected->empty()) return false;

    uint64_t n = 1ull << *ln;
    uint64_t max_mem = 128ull * n * static_cast<uint64_t>(*r) * static_cast<uint64_t>(*p + 1) + (1ull << 20);
    std::vector<unsigned char> actual(expected->size());
    if (EVP_PBE_scrypt(candidate.data(), candidate.size(), salt->data(), salt->size(),
                       n, static_cast<uint64_t>(*r), static_cast<uint64_t>(*p), max_mem,
                       actual.data(), actual.size()) != 1) {
        LOG_WARN("crypto", "EVP_PBE_scrypt failed during verification");
        return false;
    }
    return constant_time_equal(actual, *expected);
}

std::string crypto_service::hash_sha(const std::string& plaintext, hash_kind kind, int iterations) const {
    auto salt = random_bytes(static_cast<std::size_t>(defaults_.sha_salt_length));

    std::vector<unsigned char> input(salt);
    input.insert(input.end(), plaintext.begin(), plaintext.end());
    auto md = digest_for(kind);
    auto result = digest(md, input.data(), input.size());
    for (int i = 1; i < iterations; ++i) {
        result = digest(md, result.data(), result.size());
    }

    return std::string("$") + to_string(kind) + "$i=" + std::to_string(iterations) + "$" +
           base64_encode(salt.data(), salt.size()) + "$" + base64_encode(result.data(), result.size());
}

bool crypto_service::verify_sha(const std::string& candidate, const std::string& stored, hash_kind kind) const {
    // "", "sha256", "i=..", salt, digest
    auto parts = split(stored, '$');
    if (parts.size() != 5 || !parts[0].empty() || parts[1] != to_string(kind)) return false;

    auto iterations = parse_param(parts[2], "i");
    if (!iterations || *iterations < encryption_defaults::sha_min_iterations ||
        *iterations > encryption_defaults::sha_max_iterations) {
        return false;
    }

    auto salt = base64_decode(parts[3]);
    auto expected = base64_decode(parts[4]);
    if (!salt || !expected) return false;

    std::vector<unsigned char> input(*salt);
    input.insert(input.end(), candidate.begin(), candidate.end());
    auto md = digest_for(kind);
    auto actual = digest(md, input.data(), input.size());
    for (int i = 1; i < *iterations; ++i) {
        actual = digest(md, actual.data(), actual.size());
    }
    return constant_time_equal(actual, *expected);
}

} // namespace oneiros
