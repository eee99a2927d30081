#include "oneiros/config.hpp"
#include "oneiros/errors.hpp"
#include "oneiros/log.hpp"

namespace oneiros {

void security_config::validate() const {
    if (!enabled) return;
    if (key.size() < min_key_length) {
        LOG_ERROR("crypto", "Encryption key must be at least %zu characters", min_key_length);
        throw configuration_error("encryption key must be at least " +
                                  std::to_string(min_key_length) + " characters");
    }
}

void client_config::validate() const {
    if (url.empty()) {
        throw configuration_error("server url must not be empty");
    }
    if (request_timeout.count() <= 0) {
        throw configuration_error("request timeout must be positive");
    }
    if (connect_timeout.count() <= 0) {
        throw configuration_error("connect timeout must be positive");
    }
    if (live_buffer_watermark == 0) {
        throw configuration_error("live buffer watermark must be at least 1");
    }
    if (username.empty() != password.empty()) {
        throw configuration_error("username and password must be given together");
    }
    security.validate();
}

client_config client_config::from_json(const json& j) {
    if (!j.is_object()) {
        throw configuration_error("client configuration must be a JSON object");
    }

    client_config config;
    try {
        config.url = j.value("url", config.url);
        config.namespace_name = j.value("namespace", config.namespace_name);
        config.database_name = j.value("database", config.database_name);
        config.username = j.value("username", config.username);
        config.password = j.value("password", config.password);

        if (j.contains("connectTimeoutMs")) {
            config.connect_timeout = std::chrono::milliseconds(j["connectTimeoutMs"].get<int64_t>());
        }
        if (j.contains("requestTimeoutMs")) {
            config.request_timeout = std::chrono::milliseconds(j["requestTimeoutMs"].get<int64_t>());
        }
        if (j.contains("liveBufferWatermark")) {
            config.live_buffer_watermark = j["liveBufferWatermark"].get<std::size_t>();
        }
        if (j.contains("security")) {
            const auto& security = j["security"];
            config.security.enabled = security.value("enabled", false);
            config.security.key = security.value("key", std::string());
        }
    } catch (const json::exception& e) {
        throw configuration_error(std::string("invalid client configuration: ") + e.what());
    }

    config.validate();
    return config;
}

} // namespace oneiros
