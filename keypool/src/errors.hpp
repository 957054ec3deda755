#pragma once

#include <stdexcept>
#include <exception>
#include <string>

// Outcome of classifying a failed remote call.
enum class FailureKind {
    QuotaExceeded,    // key is out of quota for today
    KeyInvalid,       // key rejected; disabled until re-enabled by hand
    TransientOther,   // retried, rotates after repeated failures
    NonRetryable      // rotating keys cannot fix it
};

std::string failure_kind_string(FailureKind kind);

class KeyPoolError : public std::runtime_error {
public:
    explicit KeyPoolError(const std::string& what) : std::runtime_error(what) {}
};

class NoKeyConfigured : public KeyPoolError {
public:
    NoKeyConfigured() : KeyPoolError("No API keys configured") {}
};

// No usable key left for this call.
class PoolExhausted : public KeyPoolError {
public:
    PoolExhausted(const std::string& last_error, std::exception_ptr cause)
        : KeyPoolError("All API keys exhausted: " + last_error)
        , last_error_(last_error)
        , cause_(cause) {}

    const std::string& last_error() const { return last_error_; }
    std::exception_ptr cause() const { return cause_; }

private:
    std::string last_error_;
    std::exception_ptr cause_;
};

class NonRetryableError : public KeyPoolError {
public:
    NonRetryableError(const std::string& what, std::exception_ptr cause)
        : KeyPoolError(what)
        , cause_(cause) {}

    std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};
