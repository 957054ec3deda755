#pragma once

#include "key_pool.hpp"
#include "error_classifier.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

// Runs one remote call against the active key with bounded retry and
// rotation. At most pool_size + 1 attempts; quota is charged on success only.
class RequestExecutor {
public:
    RequestExecutor(std::shared_ptr<KeyPoolManager> pool,
                    std::shared_ptr<ErrorClassifier> classifier);

    // call receives the key secret and returns a value or throws. Throws
    // PoolExhausted, NonRetryableError or NoKeyConfigured.
    template <typename Call>
    std::invoke_result_t<Call, const std::string&> execute(Call&& call, int64_t cost);

    int max_attempts() const { return pool_->pool_size() + 1; }

private:
    std::shared_ptr<KeyPoolManager> pool_;
    std::shared_ptr<ErrorClassifier> classifier_;
};

template <typename Call>
std::invoke_result_t<Call, const std::string&>
RequestExecutor::execute(Call&& call, int64_t cost) {
    using Result = std::invoke_result_t<Call, const std::string&>;

    if (cost < 0 || cost > pool_->limits().daily_limit) {
        throw std::invalid_argument("call cost must be between 0 and the daily quota limit");
    }

    const int attempts = max_attempts();
    std::string last_error = "no usable API key";
    std::exception_ptr last_cause;

    for (int attempt = 1; attempt <= attempts; attempt++) {
        auto key = pool_->current_key();

        // Don't spend a call on a key that is already known to be dead
        if (!pool_->is_usable(key.record)) {
            if (!pool_->rotate(false)) {
                break;
            }
            key = pool_->current_key();
        }

        std::optional<Result> result;
        try {
            result.emplace(call(key.secret));
        } catch (const std::exception& e) {
            last_error = e.what();
            last_cause = std::current_exception();

            FailureKind kind = classifier_->classify(e);
            if (kind == FailureKind::NonRetryable) {
                spdlog::error("API request failed, not retrying: {}", e.what());
                throw NonRetryableError(e.what(), last_cause);
            }

            spdlog::warn("API request failed (attempt {}/{}, key *{}, {}): {}",
                         attempt, attempts, key.record.identifier,
                         failure_kind_string(kind), e.what());

            if (!pool_->record_failure_for(key.record.index, kind)) {
                break;
            }
            continue;
        }

        pool_->charge_usage_for(key.record.index, cost);
        return std::move(*result);
    }

    spdlog::error("API request abandoned: {}", last_error);
    throw PoolExhausted(last_error, last_cause);
}
