#pragma once

#include "errors.hpp"
#include <exception>

// Maps whatever the transport raised onto the pool's failure taxonomy.
class ErrorClassifier {
public:
    virtual ~ErrorClassifier() = default;
    virtual FailureKind classify(const std::exception& error) const = 0;
};

class ApiErrorClassifier : public ErrorClassifier {
public:
    FailureKind classify(const std::exception& error) const override;
};
