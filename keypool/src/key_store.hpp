#pragma once

#include "key_record.hpp"
#include <optional>
#include <vector>
#include <map>
#include <mutex>

// Durable table of KeyRecords keyed by pool index. Implementations surface
// write failures to the caller; the last upsert is visible to the next read.
class KeyStore {
public:
    virtual ~KeyStore() = default;

    virtual std::optional<KeyRecord> get(int index) = 0;
    virtual void upsert(const KeyRecord& record) = 0;
    virtual std::vector<KeyRecord> list_all() = 0;
};

class MemoryKeyStore : public KeyStore {
public:
    std::optional<KeyRecord> get(int index) override;
    void upsert(const KeyRecord& record) override;
    std::vector<KeyRecord> list_all() override;

private:
    std::mutex mutex_;
    std::map<int, KeyRecord> records_;
};
