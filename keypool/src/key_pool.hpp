#pragma once

#include "key_record.hpp"
#include "key_store.hpp"
#include "rotation_policy.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct QuotaLimits {
    int64_t daily_limit;
    int64_t warn_threshold;
    int64_t emergency_threshold;
};

enum class PoolEventType {
    ROTATED,
    QUOTA_EXCEEDED,
    KEY_DISABLED,
    KEY_ENABLED,
    QUOTA_RESET,
    POOL_EXHAUSTED
};

struct PoolEvent {
    PoolEventType type;
    int index;
    std::optional<int> to_index;
    std::string identifier;
    std::string detail;
    int64_t ts_ms;

    std::string type_string() const;
    nlohmann::json to_json() const;
};

// The key handed to a caller for one remote call.
struct ActiveKey {
    KeyRecord record;
    std::string secret;
};

// Owns the active-key pointer and is the only writer of KeyRecords. Every
// read-modify-write runs inside one critical section covering the active
// index, the record, the rotation decision and the store write.
class KeyPoolManager {
public:
    using Clock = std::function<int64_t()>;
    using EventListener = std::function<void(const PoolEvent&)>;

    KeyPoolManager(std::vector<std::string> secrets,
                   QuotaLimits limits,
                   std::shared_ptr<KeyStore> store,
                   RotationPolicy policy = RotationPolicy(),
                   Clock clock = nullptr,
                   size_t identifier_chars = 6);

    // Creates missing records and applies due resets.
    void initialize();

    void set_event_listener(EventListener listener);

    ActiveKey current_key();

    void charge_usage(int64_t units);
    void charge_usage_for(int index, int64_t units);

    // False when no usable key was found; the active index is then unchanged.
    bool rotate(bool force);

    // Returns true when a usable key is active afterwards and the call may be
    // retried.
    bool record_failure(FailureKind kind);
    bool record_failure_for(int index, FailureKind kind);

    bool enable_key(int index);

    std::vector<KeyStatus> snapshot_status();
    QuotaSummary quota_summary();

    bool is_usable(const KeyRecord& record) const;

    int active_index() const;
    int pool_size() const { return static_cast<int>(secrets_.size()); }
    const QuotaLimits& limits() const { return limits_; }

private:
    std::vector<std::string> secrets_;
    QuotaLimits limits_;
    std::shared_ptr<KeyStore> store_;
    RotationPolicy policy_;
    Clock clock_;
    size_t identifier_chars_;

    mutable std::mutex mutex_;
    int active_index_ = 0;

    std::mutex listener_mutex_;
    EventListener listener_;

    KeyRecord load_locked(int index, int64_t now_ms, std::vector<PoolEvent>& events);
    std::vector<KeyRecord> load_pool_locked(int64_t now_ms, std::vector<PoolEvent>& events);
    bool rotate_locked(bool force, int64_t now_ms, std::vector<PoolEvent>& events);
    void check_index(int index) const;
    void emit(const std::vector<PoolEvent>& events);
};
