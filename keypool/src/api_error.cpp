#include "api_error.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <vector>

ApiError::ApiError(long status, ApiErrorReason reason, const std::string& message)
    : std::runtime_error(message)
    , status_(status)
    , reason_(reason) {}

ApiErrorReason parse_reason(const std::string& reason) {
    static const std::map<std::string, ApiErrorReason> reasons = {
        {"quotaExceeded", ApiErrorReason::QuotaExceeded},
        {"dailyLimitExceeded", ApiErrorReason::DailyLimitExceeded},
        {"rateLimitExceeded", ApiErrorReason::RateLimitExceeded},
        {"userRateLimitExceeded", ApiErrorReason::RateLimitExceeded},
        {"keyInvalid", ApiErrorReason::KeyInvalid},
        {"API_KEY_INVALID", ApiErrorReason::KeyInvalid},
        {"keyExpired", ApiErrorReason::KeyExpired},
        {"API_KEY_EXPIRED", ApiErrorReason::KeyExpired},
        {"forbidden", ApiErrorReason::Forbidden},
        {"badRequest", ApiErrorReason::BadRequest},
        {"invalidParameter", ApiErrorReason::BadRequest},
        {"notFound", ApiErrorReason::NotFound},
        {"backendError", ApiErrorReason::Backend},
        {"internalError", ApiErrorReason::Backend}
    };

    auto it = reasons.find(reason);
    return it != reasons.end() ? it->second : ApiErrorReason::Unknown;
}

std::string reason_string(ApiErrorReason reason) {
    switch (reason) {
        case ApiErrorReason::QuotaExceeded: return "quotaExceeded";
        case ApiErrorReason::DailyLimitExceeded: return "dailyLimitExceeded";
        case ApiErrorReason::RateLimitExceeded: return "rateLimitExceeded";
        case ApiErrorReason::KeyInvalid: return "keyInvalid";
        case ApiErrorReason::KeyExpired: return "keyExpired";
        case ApiErrorReason::Forbidden: return "forbidden";
        case ApiErrorReason::BadRequest: return "badRequest";
        case ApiErrorReason::NotFound: return "notFound";
        case ApiErrorReason::Backend: return "backendError";
        case ApiErrorReason::Unknown: return "unknown";
    }
    return "unknown";
}

ApiError parse_api_error(long status, const std::string& body) {
    std::string message = "HTTP " + std::to_string(status);
    ApiErrorReason reason = ApiErrorReason::Unknown;

    try {
        auto j = nlohmann::json::parse(body);
        if (j.contains("error") && j["error"].is_object()) {
            const auto& err = j["error"];
            if (err.contains("message") && err["message"].is_string()) {
                message += ": " + err["message"].get<std::string>();
            }

            // The generic tag (badRequest, forbidden) often sits beside the
            // specific one, e.g. details[].reason = API_KEY_INVALID
            std::vector<ApiErrorReason> found;
            for (const char* list : {"errors", "details"}) {
                if (!err.contains(list) || !err[list].is_array()) continue;
                for (const auto& e : err[list]) {
                    if (e.contains("reason") && e["reason"].is_string()) {
                        found.push_back(parse_reason(e["reason"].get<std::string>()));
                    }
                }
            }
            for (auto r : found) {
                if (r != ApiErrorReason::Unknown && r != ApiErrorReason::BadRequest &&
                    r != ApiErrorReason::Forbidden) {
                    reason = r;
                    break;
                }
            }
            if (reason == ApiErrorReason::Unknown) {
                for (auto r : found) {
                    if (r != ApiErrorReason::Unknown) {
                        reason = r;
                        break;
                    }
                }
            }
        }
    } catch (const nlohmann::json::exception&) {
        if (!body.empty()) {
            message += ": " + body.substr(0, 200);
        }
    }

    return ApiError(status, reason, message);
}
