#include "error_classifier.hpp"
#include "api_error.hpp"

FailureKind ApiErrorClassifier::classify(const std::exception& error) const {
    const auto* api = dynamic_cast<const ApiError*>(&error);
    if (!api) {
        // Transport failures and anything else are not the key's fault
        return FailureKind::NonRetryable;
    }

    switch (api->reason()) {
        case ApiErrorReason::QuotaExceeded:
        case ApiErrorReason::DailyLimitExceeded:
            return FailureKind::QuotaExceeded;
        case ApiErrorReason::KeyInvalid:
        case ApiErrorReason::KeyExpired:
            return FailureKind::KeyInvalid;
        case ApiErrorReason::RateLimitExceeded:
        case ApiErrorReason::Backend:
            return FailureKind::TransientOther;
        default:
            break;
    }

    if (api->status() == 429 || api->status() >= 500) {
        return FailureKind::TransientOther;
    }
    return FailureKind::NonRetryable;
}
