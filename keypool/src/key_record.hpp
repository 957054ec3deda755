#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

// Per-key quota and failure state. Timestamps are UTC epoch milliseconds.
struct KeyRecord {
    int index = 0;
    std::string identifier;
    int64_t quota_used = 0;
    int64_t last_reset_ms = 0;
    std::optional<int64_t> last_used_ms;
    bool is_active = true;
    int error_count = 0;
    std::optional<int64_t> last_error_ms;
};

enum class KeyHealth {
    OK,
    LOW,
    EXHAUSTED
};

// Read-only view handed to reporting surfaces. Never carries the secret.
struct KeyStatus {
    int index;
    std::string identifier;
    int64_t quota_used;
    int64_t quota_remaining;
    bool is_active;
    std::optional<int64_t> last_used_ms;
    int error_count;

    KeyHealth health() const;
    nlohmann::json to_json() const;
};

struct QuotaSummary {
    int64_t total_used;
    int64_t total_available;
    int active_keys;
    int pool_size;
    int active_index;

    nlohmann::json to_json() const;
};

std::string health_string(KeyHealth health);
