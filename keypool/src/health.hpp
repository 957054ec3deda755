#pragma once

#include "redis_bus.hpp"
#include "store_pg.hpp"
#include "key_pool.hpp"
#include <nlohmann/json.hpp>
#include <memory>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisBus> redis,
                std::shared_ptr<PostgresKeyStore> pg,
                std::shared_ptr<KeyPoolManager> pool);

    nlohmann::json get_status();

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresKeyStore> pg_;
    std::shared_ptr<KeyPoolManager> pool_;
};
