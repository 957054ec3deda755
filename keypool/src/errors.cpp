#include "errors.hpp"

std::string failure_kind_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::QuotaExceeded: return "quota_exceeded";
        case FailureKind::KeyInvalid: return "key_invalid";
        case FailureKind::TransientOther: return "transient";
        case FailureKind::NonRetryable: return "non_retryable";
    }
    return "unknown";
}
