#include "http_client.hpp"
#include <spdlog/spdlog.h>
#include <memory>

ApiHttpClient::ApiHttpClient(const std::string& base_url,
                             const std::string& key_param,
                             int timeout_ms)
    : base_url_(base_url)
    , key_param_(key_param)
    , timeout_ms_(timeout_ms) {}

size_t ApiHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::string ApiHttpClient::build_url(CURL* curl, const std::string& path,
                                     const std::map<std::string, std::string>& params,
                                     const std::string& api_key) const {
    std::string url = base_url_;
    if (!path.empty() && path[0] != '/') url += "/";
    url += path;

    auto append = [&](const std::string& key, const std::string& value, bool first) {
        char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
        url += (first ? "?" : "&") + key + "=" + std::string(escaped ? escaped : "");
        curl_free(escaped);
    };

    bool first = url.find('?') == std::string::npos;
    for (const auto& [key, value] : params) {
        append(key, value, first);
        first = false;
    }
    append(key_param_, api_key, first);
    return url;
}

nlohmann::json ApiHttpClient::get(const std::string& path,
                                  const std::map<std::string, std::string>& params,
                                  const std::string& api_key) {
    // One handle per request; the status server calls this from several threads
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw TransportError("Failed to initialize CURL");
    }

    std::string response_string;
    std::string url = build_url(curl.get(), path, params, api_key);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TransportError(std::string("Request to ") + path + " failed: " +
                             curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw parse_api_error(status, response_string);
    }

    try {
        return nlohmann::json::parse(response_string);
    } catch (const std::exception& e) {
        throw TransportError(std::string("Failed to parse response from ") + path +
                             ": " + e.what());
    }
}
