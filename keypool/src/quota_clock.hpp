#pragma once

#include <cstdint>

// Daily quota boundaries fall at midnight UTC.
namespace quota_clock {
    constexpr int64_t MS_PER_DAY = 86400LL * 1000;

    int64_t utc_day(int64_t timestamp_ms);
    int64_t day_start_ms(int64_t timestamp_ms);
    int64_t ms_until_next_reset(int64_t now_ms);

    // True iff now falls on a later UTC calendar date than last_reset.
    bool is_reset_due(int64_t last_reset_ms, int64_t now_ms);
}
