#include "quota_clock.hpp"

namespace quota_clock {

int64_t utc_day(int64_t timestamp_ms) {
    // Floor division so pre-epoch timestamps land on the right day
    int64_t day = timestamp_ms / MS_PER_DAY;
    if (timestamp_ms % MS_PER_DAY < 0) {
        --day;
    }
    return day;
}

int64_t day_start_ms(int64_t timestamp_ms) {
    return utc_day(timestamp_ms) * MS_PER_DAY;
}

int64_t ms_until_next_reset(int64_t now_ms) {
    return day_start_ms(now_ms) + MS_PER_DAY - now_ms;
}

bool is_reset_due(int64_t last_reset_ms, int64_t now_ms) {
    return utc_day(now_ms) > utc_day(last_reset_ms);
}

} // namespace quota_clock
