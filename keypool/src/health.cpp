#include "health.hpp"
#include <spdlog/spdlog.h>

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresKeyStore> pg,
                         std::shared_ptr<KeyPoolManager> pool)
    : redis_(redis), pg_(pg), pool_(pool) {}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();

    nlohmann::json pool_json;
    int usable = 0;
    if (pg_ok) {
        try {
            auto summary = pool_->quota_summary();
            pool_json = summary.to_json();
            for (const auto& key : pool_->snapshot_status()) {
                if (key.is_active && key.quota_remaining > 0) usable++;
            }
            pool_json["usable_keys"] = usable;
        } catch (const std::exception& e) {
            spdlog::error("Failed to read key pool for health: {}", e.what());
            pg_ok = false;
        }
    }

    nlohmann::json status = {
        {"ok", redis_ok && pg_ok && usable > 0},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"pool", pool_json}
    };

    return status;
}
