#pragma once

#include "key_store.hpp"
#include <pqxx/pqxx>
#include <string>
#include <vector>

class PostgresKeyStore : public KeyStore {
public:
    explicit PostgresKeyStore(const std::string& dsn);

    void init_schema();

    std::optional<KeyRecord> get(int index) override;
    void upsert(const KeyRecord& record) override;
    std::vector<KeyRecord> list_all() override;

    bool ping();

private:
    std::string dsn_;
    pqxx::connection make_connection();

    static KeyRecord from_row(const pqxx::row& row);
};
