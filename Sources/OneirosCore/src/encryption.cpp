#include "oneiros/encryption.hpp"
#include "oneiros/log.hpp"

namespace oneiros {

namespace {

// Walks a dotted path; returns the string slot or nullptr.
json* find_string_slot(value_bag& bag, const std::string& path) {
    json* node = &bag;
    std::size_t begin = 0;
    while (true) {
        if (!node->is_object()) return nullptr;
        std::size_t dot = path.find('.', begin);
        std::string key = path.substr(begin, dot == std::string::npos ? std::string::npos : dot - begin);
        auto it = node->find(key);
        if (it == node->end()) return nullptr;
        node = &*it;
        if (dot == std::string::npos) break;
        begin = dot + 1;
    }
    return node->is_string() ? node : nullptr;
}

} // namespace

// ============================================================================
// field_descriptor
// ============================================================================

field_descriptor field_descriptor::reversible(std::string name) {
    field_descriptor d;
    d.field_name = std::move(name);
    d.algorithm = field_algorithm::reversible;
    d.verifiable = false;
    return d;
}

field_descriptor field_descriptor::hashed(std::string name, hash_kind kind, int strength,
                                          bool verifiable, const encryption_defaults& defaults) {
    field_descriptor d;
    d.field_name = std::move(name);
    d.algorithm = field_algorithm::one_way_hash;
    d.hash = kind;
    d.strength = crypto_service::resolve_strength(kind, strength, defaults);
    d.verifiable = verifiable;
    return d;
}

field_descriptor field_descriptor::plain(std::string name) {
    field_descriptor d;
    d.field_name = std::move(name);
    d.algorithm = field_algorithm::plain;
    d.verifiable = false;
    return d;
}

// ============================================================================
// encryption_pipeline
// ============================================================================

encryption_pipeline::encryption_pipeline(std::shared_ptr<const crypto_service> crypto)
    : crypto_(std::move(crypto)) {
    if (!crypto_) {
        throw configuration_error("encryption pipeline needs a crypto service");
    }
}

encryption_pipeline::encryption_pipeline(const security_config& config, const encryption_defaults& defaults)
    : crypto_(std::make_shared<crypto_service>(config, defaults)) {}

const field_descriptor* encryption_pipeline::find(const field_descriptors& descriptors,
                                                  const std::string& field_name) {
    for (const auto& d : descriptors) {
        if (d.field_name == field_name) return &d;
    }
    return nullptr;
}

void encryption_pipeline::encrypt_fields(value_bag& bag, const field_descriptors& descriptors) const {
    if (!crypto_->enabled()) return;

    for (const auto& d : descriptors) {
        json* slot = find_string_slot(bag, d.field_name);
        if (!slot) continue;

        const auto& value = slot->get_ref<const std::string&>();
        switch (d.algorithm) {
            case field_algorithm::reversible:
                *slot = crypto_->encrypt(value);
                break;
            case field_algorithm::one_way_hash:
                *slot = crypto_->hash(value, *d.hash, d.strength);
                break;
            case field_algorithm::plain:
                break;
        }
    }
}

std::vector<decryption_error> encryption_pipeline::decrypt_fields(value_bag& bag,
                                                                  const field_descriptors& descriptors) const {
    std::vector<decryption_error> failures;
    if (!crypto_->enabled()) return failures;

    for (const auto& d : descriptors) {
        if (d.algorithm != field_algorithm::reversible) continue;

        json* slot = find_string_slot(bag, d.field_name);
        if (!slot) continue;

        try {
            *slot = crypto_->decrypt(slot->get_ref<const std::string&>());
        } catch (const decryption_error& e) {
            LOG_ERROR("crypto", "Failed to decrypt field '%s'", d.field_name.c_str());
            failures.emplace_back(d.field_name, e.what());
        }
    }
    return failures;
}

bool encryption_pipeline::verify(const std::string& field_name, const std::string& candidate,
                                 const std::string& stored, const field_descriptors& descriptors) const {
    const field_descriptor* d = find(descriptors, field_name);
    if (!d || d->algorithm != field_algorithm::one_way_hash || !d->verifiable) {
        return false;
    }
    return crypto_->verify(candidate, stored, *d->hash);
}

} // namespace oneiros
