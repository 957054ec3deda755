#include "key_pool.hpp"
#include "quota_clock.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <stdexcept>

std::string PoolEvent::type_string() const {
    switch (type) {
        case PoolEventType::ROTATED: return "rotated";
        case PoolEventType::QUOTA_EXCEEDED: return "quota_exceeded";
        case PoolEventType::KEY_DISABLED: return "key_disabled";
        case PoolEventType::KEY_ENABLED: return "key_enabled";
        case PoolEventType::QUOTA_RESET: return "quota_reset";
        case PoolEventType::POOL_EXHAUSTED: return "pool_exhausted";
    }
    return "unknown";
}

nlohmann::json PoolEvent::to_json() const {
    nlohmann::json j = {
        {"type", type_string()},
        {"index", index},
        {"identifier", identifier},
        {"detail", detail},
        {"ts", util::to_iso8601(ts_ms)}
    };
    if (to_index) {
        j["to_index"] = *to_index;
    }
    return j;
}

KeyPoolManager::KeyPoolManager(std::vector<std::string> secrets,
                               QuotaLimits limits,
                               std::shared_ptr<KeyStore> store,
                               RotationPolicy policy,
                               Clock clock,
                               size_t identifier_chars)
    : secrets_(std::move(secrets))
    , limits_(limits)
    , store_(std::move(store))
    , policy_(policy)
    , clock_(clock ? std::move(clock) : Clock(util::current_timestamp_ms))
    , identifier_chars_(identifier_chars)
{
    if (!store_) {
        throw std::invalid_argument("KeyPoolManager requires a store");
    }
}

void KeyPoolManager::initialize() {
    std::vector<PoolEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now_ms = clock_();

        for (int i = 0; i < pool_size(); i++) {
            auto record = load_locked(i, now_ms, events);
            auto identifier = util::key_identifier(secrets_[i], identifier_chars_);
            if (record.identifier != identifier) {
                spdlog::info("Key {} identifier changed: *{} -> *{}",
                             i, record.identifier, identifier);
                record.identifier = identifier;
                store_->upsert(record);
            }
        }

        int orphaned = 0;
        for (const auto& record : store_->list_all()) {
            if (record.index >= pool_size()) orphaned++;
        }
        if (orphaned > 0) {
            spdlog::debug("Ignoring {} orphaned key records", orphaned);
        }

        active_index_ = 0;
    }

    spdlog::info("Key pool initialized: {} keys, limit={}, warn={}, emergency={}",
                 pool_size(), limits_.daily_limit, limits_.warn_threshold,
                 limits_.emergency_threshold);
    emit(events);
}

void KeyPoolManager::set_event_listener(EventListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

ActiveKey KeyPoolManager::current_key() {
    if (secrets_.empty()) {
        throw NoKeyConfigured();
    }

    std::vector<PoolEvent> events;
    ActiveKey key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        key.record = load_locked(active_index_, clock_(), events);
        key.secret = secrets_[active_index_];
    }
    emit(events);
    return key;
}

void KeyPoolManager::charge_usage(int64_t units) {
    if (secrets_.empty()) {
        throw NoKeyConfigured();
    }
    charge_usage_for(active_index(), units);
}

void KeyPoolManager::charge_usage_for(int index, int64_t units) {
    if (units < 0) {
        throw std::invalid_argument("quota units must be non-negative");
    }
    check_index(index);

    std::vector<PoolEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now_ms = clock_();

        auto record = load_locked(index, now_ms, events);
        if (units > std::numeric_limits<int64_t>::max() - record.quota_used) {
            // The call already happened; pin rather than lose the charge
            spdlog::warn("Key *{}: charge of {} units saturates usage", record.identifier, units);
            record.quota_used = std::numeric_limits<int64_t>::max();
        } else {
            record.quota_used += units;
        }
        record.last_used_ms = now_ms;
        record.error_count = 0;
        store_->upsert(record);

        spdlog::info("Key *{}: used {} units ({}/{})",
                     record.identifier, units, record.quota_used, limits_.daily_limit);

        // A charge against a key that is no longer active does not move the pointer
        if (index == active_index_ &&
            policy_.should_rotate_away(record, limits_.warn_threshold)) {
            spdlog::info("Preemptively rotating key *{} (quota {}, errors {})",
                         record.identifier, record.quota_used, record.error_count);
            if (!rotate_locked(false, now_ms, events)) {
                spdlog::warn("Staying on key *{}: no other key available", record.identifier);
            }
        }
    }
    emit(events);
}

bool KeyPoolManager::rotate(bool force) {
    if (secrets_.empty()) {
        return false;
    }

    std::vector<PoolEvent> events;
    bool rotated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rotated = rotate_locked(force, clock_(), events);
    }
    emit(events);
    return rotated;
}

bool KeyPoolManager::record_failure(FailureKind kind) {
    if (secrets_.empty()) {
        throw NoKeyConfigured();
    }
    return record_failure_for(active_index(), kind);
}

bool KeyPoolManager::record_failure_for(int index, FailureKind kind) {
    check_index(index);
    if (kind == FailureKind::NonRetryable) {
        return false;
    }

    std::vector<PoolEvent> events;
    bool usable = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now_ms = clock_();

        auto record = load_locked(index, now_ms, events);
        record.error_count++;
        record.last_error_ms = now_ms;

        bool rotate_now = false;
        switch (kind) {
            case FailureKind::QuotaExceeded:
                spdlog::warn("Quota exceeded for key *{}", record.identifier);
                record.quota_used = limits_.daily_limit;
                events.push_back({PoolEventType::QUOTA_EXCEEDED, index, std::nullopt,
                                  record.identifier, "pinned to daily limit", now_ms});
                rotate_now = true;
                break;
            case FailureKind::KeyInvalid:
                spdlog::error("Invalid API key *{}, disabling", record.identifier);
                record.is_active = false;
                events.push_back({PoolEventType::KEY_DISABLED, index, std::nullopt,
                                  record.identifier, "rejected as invalid", now_ms});
                rotate_now = true;
                break;
            default:
                spdlog::warn("Key *{} failed ({} consecutive)",
                             record.identifier, record.error_count);
                rotate_now = policy_.should_rotate_away(record, limits_.warn_threshold);
                break;
        }
        store_->upsert(record);

        if (index != active_index_) {
            // Another caller already moved the pool on
            usable = true;
        } else if (rotate_now) {
            usable = rotate_locked(false, now_ms, events);
        }
    }
    emit(events);
    return usable;
}

bool KeyPoolManager::enable_key(int index) {
    if (index < 0 || index >= pool_size()) {
        return false;
    }

    std::vector<PoolEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now_ms = clock_();

        auto record = load_locked(index, now_ms, events);
        record.is_active = true;
        record.error_count = 0;
        store_->upsert(record);

        spdlog::info("Key *{} re-enabled", record.identifier);
        events.push_back({PoolEventType::KEY_ENABLED, index, std::nullopt,
                          record.identifier, "", now_ms});
    }
    emit(events);
    return true;
}

std::vector<KeyStatus> KeyPoolManager::snapshot_status() {
    std::vector<PoolEvent> events;
    std::vector<KeyStatus> status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& record : load_pool_locked(clock_(), events)) {
            status.push_back({
                record.index,
                record.identifier,
                record.quota_used,
                std::max<int64_t>(0, limits_.daily_limit - record.quota_used),
                record.is_active,
                record.last_used_ms,
                record.error_count
            });
        }
    }
    emit(events);
    return status;
}

QuotaSummary KeyPoolManager::quota_summary() {
    QuotaSummary summary{0, 0, 0, pool_size(), active_index()};
    for (const auto& key : snapshot_status()) {
        if (key.quota_used > std::numeric_limits<int64_t>::max() - summary.total_used) {
            summary.total_used = std::numeric_limits<int64_t>::max();
        } else {
            summary.total_used += key.quota_used;
        }
        summary.total_available += limits_.daily_limit;
        if (key.is_active) summary.active_keys++;
    }
    return summary;
}

bool KeyPoolManager::is_usable(const KeyRecord& record) const {
    return record.is_active && record.quota_used < limits_.daily_limit;
}

int KeyPoolManager::active_index() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_index_;
}

KeyRecord KeyPoolManager::load_locked(int index, int64_t now_ms,
                                      std::vector<PoolEvent>& events) {
    auto stored = store_->get(index);
    if (!stored) {
        KeyRecord record;
        record.index = index;
        record.identifier = util::key_identifier(secrets_[index], identifier_chars_);
        record.last_reset_ms = quota_clock::day_start_ms(now_ms);
        store_->upsert(record);
        spdlog::info("Tracking new API key {} (*{})", index, record.identifier);
        return record;
    }

    auto record = *stored;
    if (quota_clock::is_reset_due(record.last_reset_ms, now_ms)) {
        record.quota_used = 0;
        record.error_count = 0;
        record.last_reset_ms = quota_clock::day_start_ms(now_ms);
        store_->upsert(record);
        spdlog::info("Reset quota for API key *{}", record.identifier);
        events.push_back({PoolEventType::QUOTA_RESET, index, std::nullopt,
                          record.identifier, "", now_ms});
    }
    return record;
}

std::vector<KeyRecord> KeyPoolManager::load_pool_locked(int64_t now_ms,
                                                        std::vector<PoolEvent>& events) {
    std::vector<KeyRecord> pool;
    pool.reserve(secrets_.size());
    for (int i = 0; i < pool_size(); i++) {
        pool.push_back(load_locked(i, now_ms, events));
    }
    return pool;
}

bool KeyPoolManager::rotate_locked(bool force, int64_t now_ms,
                                   std::vector<PoolEvent>& events) {
    auto pool = load_pool_locked(now_ms, events);
    auto next = policy_.select_next(pool, active_index_, limits_.emergency_threshold, force);

    if (!next) {
        spdlog::error("No available API keys with remaining quota!");
        events.push_back({PoolEventType::POOL_EXHAUSTED, active_index_, std::nullopt,
                          pool[active_index_].identifier,
                          force ? "forced rotation failed" : "rotation failed", now_ms});
        return false;
    }

    int from = active_index_;
    active_index_ = *next;
    const auto& record = pool[active_index_];
    spdlog::info("Rotated from key {} to {} (quota: {}/{}){}",
                 from, active_index_, record.quota_used, limits_.daily_limit,
                 force ? " [forced]" : "");
    events.push_back({PoolEventType::ROTATED, from, active_index_,
                      record.identifier, force ? "forced" : "", now_ms});
    return true;
}

void KeyPoolManager::check_index(int index) const {
    if (index < 0 || index >= pool_size()) {
        throw std::out_of_range("key index " + std::to_string(index) + " out of range");
    }
}

void KeyPoolManager::emit(const std::vector<PoolEvent>& events) {
    if (events.empty()) return;

    EventListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (!listener) return;

    for (const auto& event : events) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::error("Pool event listener failed: {}", e.what());
        }
    }
}
