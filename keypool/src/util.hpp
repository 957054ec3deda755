#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string to_iso8601(int64_t timestamp_ms);
    std::vector<std::string> split(const std::string& str, char delim);
    int64_t current_timestamp_ms();
    std::string redact_dsn(const std::string& dsn);
    std::string key_identifier(const std::string& secret, size_t chars);
}
