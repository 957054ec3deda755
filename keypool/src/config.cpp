#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int64_t Config::get_env_int(const char* name, int64_t default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(val, &pos);
        if (pos != std::string(val).size()) {
            throw std::invalid_argument(val);
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    // Blank entries are dropped before pool indices are assigned
    cfg.api_keys = util::split(get_env("API_KEYS"), ',');
    cfg.daily_quota_limit = get_env_int("DAILY_QUOTA_LIMIT", 10000);
    cfg.quota_warning_threshold = get_env_int("QUOTA_WARNING_THRESHOLD", 8000);
    cfg.quota_emergency_threshold = get_env_int("QUOTA_EMERGENCY_THRESHOLD", 9500);
    cfg.key_error_rotate_threshold = static_cast<int>(get_env_int("KEY_ERROR_ROTATE_THRESHOLD", 3));
    cfg.key_identifier_chars = static_cast<int>(get_env_int("KEY_IDENTIFIER_CHARS", 6));

    cfg.api_base_url = get_env("API_BASE_URL", "https://www.googleapis.com/youtube/v3");
    cfg.api_key_param = get_env("API_KEY_PARAM", "key");
    cfg.request_timeout_ms = static_cast<int>(get_env_int("REQUEST_TIMEOUT_MS", 8000));

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_keypool_events = get_env("STREAM_KEYPOOL_EVENTS", "keypool.events");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = static_cast<int>(get_env_int("LISTEN_PORT", 8085));

    cfg.service_name = get_env("SERVICE_NAME", "keypool");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (api_keys.empty()) {
        throw std::runtime_error("API_KEYS is required");
    }
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (quota_warning_threshold <= 0 ||
        quota_warning_threshold > quota_emergency_threshold ||
        quota_emergency_threshold > daily_quota_limit) {
        throw std::runtime_error(
            "Quota thresholds must satisfy 0 < warning <= emergency <= daily limit");
    }
    if (key_error_rotate_threshold < 1) {
        throw std::runtime_error("KEY_ERROR_ROTATE_THRESHOLD must be at least 1");
    }
    if (key_identifier_chars < 1) {
        throw std::runtime_error("KEY_IDENTIFIER_CHARS must be at least 1");
    }
    for (size_t i = 0; i < api_keys.size(); i++) {
        if (api_keys[i].size() <= static_cast<size_t>(key_identifier_chars)) {
            throw std::runtime_error("API key " + std::to_string(i) +
                                     " is not longer than KEY_IDENTIFIER_CHARS");
        }
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  API keys: {}", api_keys.size());
    spdlog::info("  Quota: limit={}, warning={}, emergency={}",
                 daily_quota_limit, quota_warning_threshold, quota_emergency_threshold);
    spdlog::info("  Rotate after {} consecutive errors", key_error_rotate_threshold);
}
