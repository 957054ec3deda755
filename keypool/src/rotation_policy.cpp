#include "rotation_policy.hpp"

RotationPolicy::RotationPolicy(int error_threshold)
    : error_threshold_(error_threshold) {}

bool RotationPolicy::should_rotate_away(const KeyRecord& record,
                                        int64_t warn_threshold) const {
    return record.quota_used >= warn_threshold ||
           record.error_count >= error_threshold_;
}

std::optional<int> RotationPolicy::select_next(const std::vector<KeyRecord>& pool,
                                               int start_index,
                                               int64_t emergency_threshold,
                                               bool force) const {
    int size = static_cast<int>(pool.size());
    if (size == 0) {
        return std::nullopt;
    }

    int candidate = ((start_index % size) + size) % size;
    for (int attempts = 0; attempts < size; attempts++) {
        candidate = (candidate + 1) % size;
        const auto& record = pool[candidate];

        if (!record.is_active) {
            continue;
        }
        if (!force && record.quota_used >= emergency_threshold) {
            continue;
        }
        return candidate;
    }

    return std::nullopt;
}
