#pragma once

#include <stdexcept>
#include <string>

// Reason tags the remote API reports in its error body. Parsed once at the
// transport boundary so nothing downstream matches on message text.
enum class ApiErrorReason {
    QuotaExceeded,
    DailyLimitExceeded,
    RateLimitExceeded,
    KeyInvalid,
    KeyExpired,
    Forbidden,
    BadRequest,
    NotFound,
    Backend,
    Unknown
};

class ApiError : public std::runtime_error {
public:
    ApiError(long status, ApiErrorReason reason, const std::string& message);

    long status() const { return status_; }
    ApiErrorReason reason() const { return reason_; }

private:
    long status_;
    ApiErrorReason reason_;
};

// Connection-level failure: DNS, TLS, timeout. Not tied to any key.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

ApiErrorReason parse_reason(const std::string& reason);
std::string reason_string(ApiErrorReason reason);

// Builds the typed error from a non-2xx response.
ApiError parse_api_error(long status, const std::string& body);
