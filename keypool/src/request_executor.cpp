#include "request_executor.hpp"
#include <stdexcept>

RequestExecutor::RequestExecutor(std::shared_ptr<KeyPoolManager> pool,
                                 std::shared_ptr<ErrorClassifier> classifier)
    : pool_(std::move(pool))
    , classifier_(std::move(classifier))
{
    if (!pool_ || !classifier_) {
        throw std::invalid_argument("RequestExecutor requires a pool and a classifier");
    }
}
