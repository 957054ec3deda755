#pragma once

#include "key_record.hpp"
#include <optional>
#include <vector>

// Pure decisions over a pool snapshot ordered by index.
class RotationPolicy {
public:
    static constexpr int DEFAULT_ERROR_THRESHOLD = 3;

    explicit RotationPolicy(int error_threshold = DEFAULT_ERROR_THRESHOLD);

    // Preemptive trigger: quota at the warn line or too many consecutive failures.
    bool should_rotate_away(const KeyRecord& record, int64_t warn_threshold) const;

    // Scans from (start_index + 1) mod size, wrapping at most once. Inactive
    // keys are always skipped; keys at or over the emergency threshold are
    // skipped unless force is set. First survivor wins.
    std::optional<int> select_next(const std::vector<KeyRecord>& pool,
                                   int start_index,
                                   int64_t emergency_threshold,
                                   bool force) const;

private:
    int error_threshold_;
};
