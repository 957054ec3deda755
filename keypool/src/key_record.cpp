#include "key_record.hpp"
#include "util.hpp"

namespace {
    constexpr int64_t LOW_REMAINING_UNITS = 1000;
}

KeyHealth KeyStatus::health() const {
    if (is_active && quota_remaining > LOW_REMAINING_UNITS) {
        return KeyHealth::OK;
    }
    if (quota_remaining > 0) {
        return KeyHealth::LOW;
    }
    return KeyHealth::EXHAUSTED;
}

nlohmann::json KeyStatus::to_json() const {
    nlohmann::json j = {
        {"index", index},
        {"identifier", identifier},
        {"quota_used", quota_used},
        {"quota_remaining", quota_remaining},
        {"is_active", is_active},
        {"error_count", error_count},
        {"health", health_string(health())}
    };
    j["last_used"] = last_used_ms ? nlohmann::json(util::to_iso8601(*last_used_ms))
                                  : nlohmann::json(nullptr);
    return j;
}

nlohmann::json QuotaSummary::to_json() const {
    return {
        {"total_used", total_used},
        {"total_available", total_available},
        {"active_keys", active_keys},
        {"pool_size", pool_size},
        {"active_index", active_index}
    };
}

std::string health_string(KeyHealth health) {
    switch (health) {
        case KeyHealth::OK: return "ok";
        case KeyHealth::LOW: return "low";
        case KeyHealth::EXHAUSTED: return "exhausted";
    }
    return "unknown";
}
