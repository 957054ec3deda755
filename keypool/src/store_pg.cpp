#include "store_pg.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {
    // Timestamps travel as epoch milliseconds
    const char* SELECT_COLUMNS =
        "SELECT key_index, identifier, quota_used, "
        "(EXTRACT(EPOCH FROM last_reset) * 1000)::BIGINT, "
        "(EXTRACT(EPOCH FROM last_used) * 1000)::BIGINT, "
        "is_active, error_count, "
        "(EXTRACT(EPOCH FROM last_error) * 1000)::BIGINT "
        "FROM api_key_usage ";

    std::optional<int64_t> optional_ms(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return field.as<int64_t>();
    }
}

PostgresKeyStore::PostgresKeyStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresKeyStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresKeyStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresKeyStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS api_key_usage (
                key_index INT PRIMARY KEY,
                identifier TEXT NOT NULL,
                quota_used BIGINT NOT NULL DEFAULT 0 CHECK (quota_used >= 0),
                last_reset TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                last_used TIMESTAMPTZ,
                is_active BOOLEAN NOT NULL DEFAULT TRUE,
                error_count INT NOT NULL DEFAULT 0,
                last_error TIMESTAMPTZ
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

KeyRecord PostgresKeyStore::from_row(const pqxx::row& row) {
    KeyRecord record;
    record.index = row[0].as<int>();
    record.identifier = row[1].as<std::string>();
    record.quota_used = row[2].as<int64_t>();
    record.last_reset_ms = row[3].as<int64_t>();
    record.last_used_ms = optional_ms(row[4]);
    record.is_active = row[5].as<bool>();
    record.error_count = row[6].as<int>();
    record.last_error_ms = optional_ms(row[7]);
    return record;
}

std::optional<KeyRecord> PostgresKeyStore::get(int index) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string(SELECT_COLUMNS) + "WHERE key_index = $1", index);
        txn.commit();

        if (result.empty()) {
            return std::nullopt;
        }
        return from_row(result[0]);

    } catch (const std::exception& e) {
        spdlog::error("Failed to load key record {}: {}", index, e.what());
        throw;
    }
}

void PostgresKeyStore::upsert(const KeyRecord& record) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        std::optional<int64_t> last_used = record.last_used_ms;
        std::optional<int64_t> last_error = record.last_error_ms;

        txn.exec_params(
            "INSERT INTO api_key_usage "
            "(key_index, identifier, quota_used, last_reset, last_used, "
            "is_active, error_count, last_error) "
            "VALUES ($1, $2, $3, to_timestamp($4::BIGINT / 1000.0), "
            "to_timestamp($5::BIGINT / 1000.0), $6, $7, "
            "to_timestamp($8::BIGINT / 1000.0)) "
            "ON CONFLICT (key_index) DO UPDATE SET "
            "identifier = $2, quota_used = $3, last_reset = EXCLUDED.last_reset, "
            "last_used = EXCLUDED.last_used, is_active = $6, error_count = $7, "
            "last_error = EXCLUDED.last_error",
            record.index, record.identifier, record.quota_used, record.last_reset_ms,
            last_used, record.is_active, record.error_count, last_error
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to save key record {}: {}", record.index, e.what());
        throw;
    }
}

std::vector<KeyRecord> PostgresKeyStore::list_all() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec(std::string(SELECT_COLUMNS) + "ORDER BY key_index");
        txn.commit();

        std::vector<KeyRecord> records;
        records.reserve(result.size());
        for (const auto& row : result) {
            records.push_back(from_row(row));
        }
        return records;

    } catch (const std::exception& e) {
        spdlog::error("Failed to list key records: {}", e.what());
        throw;
    }
}

bool PostgresKeyStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}
