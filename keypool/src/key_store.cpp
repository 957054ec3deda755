#include "key_store.hpp"
#include <stdexcept>

std::optional<KeyRecord> MemoryKeyStore::get(int index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(index);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryKeyStore::upsert(const KeyRecord& record) {
    if (record.quota_used < 0) {
        throw std::invalid_argument("quota_used must be non-negative");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.index] = record;
}

std::vector<KeyRecord> MemoryKeyStore::list_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<KeyRecord> out;
    out.reserve(records_.size());
    for (const auto& [index, record] : records_) {
        out.push_back(record);
    }
    return out;
}
