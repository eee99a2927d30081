#pragma once

#include "crypto.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace oneiros {

enum class field_algorithm {
    reversible,
    one_way_hash,
    plain
};

// ============================================================================
// field_descriptor - how one field of an entity shape is protected
// ============================================================================
//
// Built once per entity shape by the caller's metadata layer. Strength is
// resolved against encryption_defaults at construction; an out-of-range
// value throws configuration_error here rather than at first use.
//
// `field_name` may be a dotted path into nested objects ("address.street").

struct field_descriptor {
    std::string field_name;
    field_algorithm algorithm = field_algorithm::plain;
    std::optional<hash_kind> hash;
    int strength = encryption_defaults::unset_strength;
    bool verifiable = true;

    static field_descriptor reversible(std::string name);

    static field_descriptor hashed(std::string name, hash_kind kind,
                                   int strength = encryption_defaults::unset_strength,
                                   bool verifiable = true,
                                   const encryption_defaults& defaults = {});

    static field_descriptor plain(std::string name);
};

using field_descriptors = std::vector<field_descriptor>;

// ============================================================================
// encryption_pipeline - applies descriptors to value bags
// ============================================================================
//
// Only string values are transformed; missing, null and non-string fields
// are left alone. With security disabled every pass is a passthrough.

class encryption_pipeline {
public:
    explicit encryption_pipeline(std::shared_ptr<const crypto_service> crypto);
    explicit encryption_pipeline(const security_config& config, const encryption_defaults& defaults = {});

    bool enabled() const { return crypto_->enabled(); }
    const crypto_service& crypto() const { return *crypto_; }

    /// Encrypts reversible fields and hashes one-way fields in place.
    /// Every one-way value is hashed, whatever it looks like; callers re-saving
    /// a loaded entity drop the stored hash field first.
    void encrypt_fields(value_bag& bag, const field_descriptors& descriptors) const;

    /// Decrypts reversible fields in place. One-way fields are never touched.
    /// Every field is attempted; the failures are returned, one per field,
    /// and the failing fields keep their stored value.
    std::vector<decryption_error> decrypt_fields(value_bag& bag, const field_descriptors& descriptors) const;

    /// Checks `candidate` against a stored one-way value of `field_name`.
    /// False for unknown, non-verifiable or non-hashed fields.
    bool verify(const std::string& field_name, const std::string& candidate,
                const std::string& stored, const field_descriptors& descriptors) const;

    static const field_descriptor* find(const field_descriptors& descriptors, const std::string& field_name);

private:
    std::shared_ptr<const crypto_service> crypto_;
};

} // namespace oneiros
