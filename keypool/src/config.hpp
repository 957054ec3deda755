#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

struct Config {
    // Key pool
    std::vector<std::string> api_keys;
    int64_t daily_quota_limit;
    int64_t quota_warning_threshold;
    int64_t quota_emergency_threshold;
    int key_error_rotate_threshold;
    int key_identifier_chars;

    // Remote API
    std::string api_base_url;
    std::string api_key_param;
    int request_timeout_ms;

    // Postgres
    std::string pg_dsn;

    // Redis
    std::string redis_url;
    std::string stream_keypool_events;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int64_t get_env_int(const char* name, int64_t default_val);
};
