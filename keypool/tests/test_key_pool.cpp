#include <catch2/catch_test_macros.hpp>
#include "../src/key_pool.hpp"
#include "../src/quota_clock.hpp"
#include <atomic>
#include <limits>
#include <memory>
#include <thread>
#include <vector>

namespace {
    const int64_t DAY = quota_clock::MS_PER_DAY;
    const int64_t HOUR = 3600LL * 1000;
    const int64_t MARCH_10 = 19792 * DAY;

    const QuotaLimits LIMITS{10000, 8000, 9500};

    struct PoolFixture {
        int64_t now = MARCH_10 + 9 * HOUR;
        std::shared_ptr<MemoryKeyStore> store = std::make_shared<MemoryKeyStore>();
        std::vector<PoolEvent> events;

        std::shared_ptr<KeyPoolManager> make(std::vector<std::string> secrets) {
            auto pool = std::make_shared<KeyPoolManager>(
                secrets, LIMITS, store, RotationPolicy(),
                [this]() { return now; });
            pool->set_event_listener([this](const PoolEvent& e) { events.push_back(e); });
            pool->initialize();
            return pool;
        }

        bool saw(PoolEventType type) const {
            for (const auto& e : events) {
                if (e.type == type) return true;
            }
            return false;
        }
    };
}

TEST_CASE("Pool initialization", "[key_pool]") {
    PoolFixture f;

    SECTION("Creates a record per key with a short identifier") {
        auto pool = f.make({"AIzaSyAAAAAA111111", "AIzaSyBBBBBB222222"});

        auto records = f.store->list_all();
        REQUIRE(records.size() == 2);
        REQUIRE(records[0].identifier == "111111");
        REQUIRE(records[1].identifier == "222222");
        REQUIRE(records[0].quota_used == 0);
        REQUIRE(records[0].last_reset_ms == MARCH_10);
        REQUIRE(pool->active_index() == 0);
    }

    SECTION("Secrets shorter than the identifier length are never shown whole") {
        auto pool = f.make({"abc", "x", "key-bbbbbbbb"});
        auto status = pool->snapshot_status();

        REQUIRE(status[0].identifier == "bc");
        REQUIRE(status[1].identifier.empty());
        REQUIRE(status[2].identifier == "bbbbbb");
        for (const auto& key : status) {
            REQUIRE(key.to_json()["identifier"] != "abc");
        }
    }

    SECTION("Existing records are kept and orphans ignored") {
        KeyRecord existing;
        existing.index = 0;
        existing.identifier = "111111";
        existing.quota_used = 1234;
        existing.last_reset_ms = MARCH_10;
        f.store->upsert(existing);

        KeyRecord orphan;
        orphan.index = 7;
        orphan.identifier = "gone";
        orphan.last_reset_ms = MARCH_10;
        f.store->upsert(orphan);

        auto pool = f.make({"AIzaSyAAAAAA111111"});
        auto status = pool->snapshot_status();

        REQUIRE(status.size() == 1);
        REQUIRE(status[0].quota_used == 1234);
        REQUIRE(status[0].quota_remaining == 10000 - 1234);
    }

    SECTION("Empty pool reports no key configured") {
        auto pool = f.make({});
        REQUIRE_THROWS_AS(pool->current_key(), NoKeyConfigured);
        REQUIRE_FALSE(pool->rotate(true));
        REQUIRE(pool->snapshot_status().empty());
    }
}

TEST_CASE("Charging usage", "[key_pool]") {
    PoolFixture f;
    auto pool = f.make({"key-aaaaaa", "key-bbbbbb", "key-cccccc"});

    SECTION("Charges below the warn line never move the active key") {
        for (int i = 0; i < 79; i++) {
            pool->charge_usage(100);
            REQUIRE(pool->active_index() == 0);
        }
        REQUIRE(pool->current_key().record.quota_used == 7900);
    }

    SECTION("Charge records usage and clears the error streak") {
        pool->record_failure(FailureKind::TransientOther);
        pool->record_failure(FailureKind::TransientOther);
        REQUIRE(pool->current_key().record.error_count == 2);

        pool->charge_usage(5);

        auto key = pool->current_key().record;
        REQUIRE(key.error_count == 0);
        REQUIRE(key.quota_used == 5);
        REQUIRE(key.last_used_ms == f.now);
    }

    SECTION("Reaching the warn line rotates for the next call") {
        pool->charge_usage(8000);

        auto key = pool->current_key();
        REQUIRE(key.record.index == 1);
        REQUIRE(key.secret == "key-bbbbbb");
        REQUIRE(f.saw(PoolEventType::ROTATED));

        // The call just charged stays on the key it used
        REQUIRE(f.store->get(0)->quota_used == 8000);
        REQUIRE(f.store->get(1)->quota_used == 0);
    }

    SECTION("Charging a key that is no longer active does not rotate") {
        pool->rotate(false);
        REQUIRE(pool->active_index() == 1);

        pool->charge_usage_for(0, 9000);

        REQUIRE(pool->active_index() == 1);
        REQUIRE(f.store->get(0)->quota_used == 9000);
    }

    SECTION("Huge charges saturate instead of wrapping") {
        pool->charge_usage_for(1, 5);
        pool->charge_usage_for(1, std::numeric_limits<int64_t>::max());

        REQUIRE(f.store->get(1)->quota_used == std::numeric_limits<int64_t>::max());
        REQUIRE(pool->snapshot_status()[1].quota_remaining == 0);
    }

    SECTION("Negative charges are rejected") {
        REQUIRE_THROWS_AS(pool->charge_usage(-1), std::invalid_argument);
        REQUIRE_THROWS_AS(pool->charge_usage_for(3, 1), std::out_of_range);
    }
}

TEST_CASE("Two key warn and emergency scenario", "[key_pool]") {
    PoolFixture f;
    auto pool = f.make({"key-aaaaaa", "key-bbbbbb"});

    pool->charge_usage(8000);
    REQUIRE(pool->current_key().record.index == 1);

    // Key 0 sits between warn and emergency, so it is still eligible
    pool->charge_usage(9600);
    REQUIRE(pool->current_key().record.index == 0);

    SECTION("Normal rotation will not pick the key over emergency") {
        REQUIRE(pool->rotate(false));
        REQUIRE(pool->active_index() == 0);
    }

    SECTION("Forced rotation may pick the key over emergency") {
        REQUIRE(pool->rotate(true));
        REQUIRE(pool->active_index() == 1);

        REQUIRE(pool->rotate(true));
        REQUIRE(pool->active_index() == 0);
    }
}

TEST_CASE("Rotation with every key disabled", "[key_pool]") {
    PoolFixture f;
    auto pool = f.make({"key-aaaaaa", "key-bbbbbb", "key-cccccc"});

    REQUIRE(pool->record_failure(FailureKind::KeyInvalid));
    REQUIRE(pool->record_failure(FailureKind::KeyInvalid));
    REQUIRE_FALSE(pool->record_failure(FailureKind::KeyInvalid));

    int active = pool->active_index();
    for (int i = 0; i < 4; i++) {
        REQUIRE_FALSE(pool->rotate(false));
        REQUIRE_FALSE(pool->rotate(true));
        REQUIRE(pool->active_index() == active);
    }
    REQUIRE(f.saw(PoolEventType::POOL_EXHAUSTED));
}

TEST_CASE("Recording failures", "[key_pool]") {
    PoolFixture f;
    auto pool = f.make({"key-aaaaaa", "key-bbbbbb", "key-cccccc"});

    SECTION("Quota exceeded pins usage and rotates; reset restores it next day") {
        pool->charge_usage(1200);
        REQUIRE(pool->record_failure(FailureKind::QuotaExceeded));

        REQUIRE(pool->active_index() == 1);
        REQUIRE(f.store->get(0)->quota_used == LIMITS.daily_limit);
        REQUIRE(f.saw(PoolEventType::QUOTA_EXCEEDED));

        f.now += DAY;
        auto status = pool->snapshot_status();
        REQUIRE(status[0].quota_used == 0);
        REQUIRE(status[0].error_count == 0);
        REQUIRE(f.store->get(0)->last_reset_ms == MARCH_10 + DAY);
        REQUIRE(f.saw(PoolEventType::QUOTA_RESET));
    }

    SECTION("Invalid key is disabled and skipped from then on") {
        REQUIRE(pool->record_failure(FailureKind::KeyInvalid));
        REQUIRE(pool->active_index() == 1);
        REQUIRE_FALSE(f.store->get(0)->is_active);

        pool->rotate(false);
        REQUIRE(pool->active_index() == 2);
        pool->rotate(false);
        REQUIRE(pool->active_index() == 1);
    }

    SECTION("Daily reset leaves a disabled key disabled") {
        pool->charge_usage(3000);
        pool->record_failure(FailureKind::KeyInvalid);

        f.now += DAY;
        auto status = pool->snapshot_status();
        REQUIRE(status[0].quota_used == 0);
        REQUIRE(status[0].error_count == 0);
        REQUIRE_FALSE(status[0].is_active);
    }

    SECTION("Transient failures rotate once the streak reaches the threshold") {
        REQUIRE(pool->record_failure(FailureKind::TransientOther));
        REQUIRE(pool->record_failure(FailureKind::TransientOther));
        REQUIRE(pool->active_index() == 0);

        REQUIRE(pool->record_failure(FailureKind::TransientOther));
        REQUIRE(pool->active_index() == 1);
        REQUIRE(f.store->get(0)->error_count == 3);
        REQUIRE(f.store->get(0)->last_error_ms == f.now);
    }

    SECTION("Non-retryable errors leave the record untouched") {
        REQUIRE_FALSE(pool->record_failure(FailureKind::NonRetryable));
        REQUIRE(f.store->get(0)->error_count == 0);
    }

    SECTION("Failure on a key that is no longer active keeps the pool usable") {
        pool->rotate(false);
        REQUIRE(pool->record_failure_for(0, FailureKind::QuotaExceeded));
        REQUIRE(pool->active_index() == 1);
    }
}

TEST_CASE("Manual re-enable and summary", "[key_pool]") {
    PoolFixture f;
    auto pool = f.make({"key-aaaaaa", "key-bbbbbb"});

    pool->charge_usage(500);
    pool->record_failure(FailureKind::KeyInvalid);

    auto summary = pool->quota_summary();
    REQUIRE(summary.total_used == 500);
    REQUIRE(summary.total_available == 20000);
    REQUIRE(summary.active_keys == 1);
    REQUIRE(summary.pool_size == 2);
    REQUIRE(summary.active_index == 1);

    REQUIRE(pool->enable_key(0));
    REQUIRE(f.store->get(0)->is_active);
    REQUIRE(f.saw(PoolEventType::KEY_ENABLED));
    REQUIRE(pool->quota_summary().active_keys == 2);

    REQUIRE_FALSE(pool->enable_key(2));
    REQUIRE_FALSE(pool->enable_key(-1));
}

TEST_CASE("Key status health", "[key_pool]") {
    KeyStatus status{0, "abc123", 8500, 1500, true, std::nullopt, 0};
    REQUIRE(status.health() == KeyHealth::OK);

    status.quota_remaining = 400;
    REQUIRE(status.health() == KeyHealth::LOW);

    status.quota_remaining = 0;
    REQUIRE(status.health() == KeyHealth::EXHAUSTED);

    status.quota_remaining = 5000;
    status.is_active = false;
    REQUIRE(status.health() == KeyHealth::LOW);

    auto j = status.to_json();
    REQUIRE(j["identifier"] == "abc123");
    REQUIRE(j["last_used"].is_null());
}

TEST_CASE("Concurrent charges", "[key_pool]") {
    PoolFixture f;
    auto pool = std::make_shared<KeyPoolManager>(
        std::vector<std::string>{"key-aaaaaa", "key-bbbbbb", "key-cccccc"},
        LIMITS, f.store, RotationPolicy(), [&f]() { return f.now; });

    std::atomic<int> rotations{0};
    pool->set_event_listener([&rotations](const PoolEvent& e) {
        if (e.type == PoolEventType::ROTATED) rotations++;
    });
    pool->initialize();

    // 8 threads x 100 charges x 10 units lands exactly on the warn line
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&pool]() {
            for (int i = 0; i < 100; i++) {
                pool->charge_usage_for(0, 10);
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(f.store->get(0)->quota_used == 8000);
    REQUIRE(rotations.load() == 1);
    REQUIRE(pool->active_index() == 1);
}
