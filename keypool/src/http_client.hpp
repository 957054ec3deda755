#pragma once

#include "api_error.hpp"
#include <string>
#include <map>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// GET-only client for the remote API. The key is passed per call so the
// same client serves every key in the pool. Throws ApiError on a non-2xx
// status and TransportError when no response arrived.
class ApiHttpClient {
public:
    ApiHttpClient(const std::string& base_url,
                  const std::string& key_param,
                  int timeout_ms = 8000);

    nlohmann::json get(const std::string& path,
                       const std::map<std::string, std::string>& params,
                       const std::string& api_key);

private:
    std::string base_url_;
    std::string key_param_;
    int timeout_ms_;

    std::string build_url(CURL* curl, const std::string& path,
                          const std::map<std::string, std::string>& params,
                          const std::string& api_key) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
