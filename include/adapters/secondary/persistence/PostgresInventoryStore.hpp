#pragma once

#include "ports/output/IInventoryStore.hpp"
#include "adapters/secondary/persistence/PostgresErrors.hpp"
#include "adapters/secondary/persistence/PostgresTransactionLedger.hpp"
#include "adapters/secondary/persistence/PostgresReservationRepository.hpp"
#include "domain/StockRules.hpp"
#include "settings/DbSettings.hpp"
#include "settings/StorageSettings.hpp"
#include <pqxx/pqxx>
#include <map>
#include <memory>
#include <set>
#include <iostream>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL хранилище остатков
 *
 * Таблица: inventory_stocks
 * - sku_id VARCHAR(64) PRIMARY KEY
 * - total_quantity BIGINT >= 0
 * - reserved_quantity BIGINT, 0 <= reserved <= total (CHECK)
 * - warning_threshold / critical_threshold BIGINT
 * - version BIGINT (+1 на каждую мутацию)
 * - updated_at TIMESTAMPTZ
 *
 * Каждая мутация - одна транзакция: SELECT ... FOR UPDATE с
 * SET LOCAL lock_timeout, проверка, запись в inventory_ledger, UPDATE.
 * available не хранится, считается в StockRecord.
 *
 * settle() в той же транзакции меняет статусы в inventory_reservations:
 * либо фиксируются и статусы, и остатки, либо ничего.
 */
class PostgresInventoryStore : public ports::output::IInventoryStore {
public:
    PostgresInventoryStore(
        std::shared_ptr<settings::DbSettings> dbSettings,
        std::shared_ptr<settings::StorageSettings> storageSettings
    ) : dbSettings_(std::move(dbSettings))
      , storageSettings_(std::move(storageSettings))
    {
        initSchema();
    }

    domain::StockRecord getOrCreate(const std::string& skuId) override {
        return withPostgresErrors("PostgresInventoryStore", "getOrCreate", [&] {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            ensureRow(txn, skuId);
            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) + "FROM inventory_stocks WHERE sku_id = $1",
                skuId
            );
            txn.commit();
            return mapRow(result[0]);
        });
    }

    std::optional<domain::StockRecord> find(const std::string& skuId) override {
        return withPostgresErrors("PostgresInventoryStore", "find", [&] {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) + "FROM inventory_stocks WHERE sku_id = $1",
                skuId
            );
            if (result.empty()) {
                return std::optional<domain::StockRecord>();
            }
            return std::optional<domain::StockRecord>(mapRow(result[0]));
        });
    }

    std::vector<domain::StockRecord> findBatch(const std::vector<std::string>& skuIds) override {
        if (skuIds.empty()) {
            return {};
        }
        return withPostgresErrors("PostgresInventoryStore", "findBatch", [&] {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            std::map<std::string, domain::StockRecord> found;
            for (const auto& skuId : skuIds) {
                auto result = txn.exec_params(
                    std::string(SELECT_COLUMNS) + "FROM inventory_stocks WHERE sku_id = $1",
                    skuId
                );
                if (!result.empty()) {
                    found[skuId] = mapRow(result[0]);
                }
            }

            std::vector<domain::StockRecord> records;
            for (const auto& skuId : skuIds) {
                auto it = found.find(skuId);
                if (it != found.end()) {
                    records.push_back(it->second);
                }
            }
            return records;
        });
    }

    domain::StockRecord mutate(const domain::StockMutation& mutation) override {
        return withPostgresErrors("PostgresInventoryStore", "mutate", [&] {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            setLockTimeout(txn);

            auto updated = applyLocked(txn, lockRow(txn, mutation.skuId), mutation);
            txn.commit();
            return updated;
        });
    }

    std::vector<domain::StockRecord> batchMutate(
        const std::vector<domain::StockMutation>& mutations) override
    {
        if (mutations.empty()) {
            return {};
        }

        std::set<std::string> skuIds;
        for (const auto& m : mutations) {
            if (!skuIds.insert(m.skuId).second) {
                throw domain::InvalidAdjustmentException(
                    "Duplicate SKU in batch mutation: " + m.skuId);
            }
        }

        return withPostgresErrors("PostgresInventoryStore", "batchMutate", [&] {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            setLockTimeout(txn);

            // Строки блокируются по возрастанию sku_id - без взаимных блокировок
            std::map<std::string, domain::StockRecord> locked;
            for (const auto& skuId : skuIds) {
                locked[skuId] = lockRow(txn, skuId);
            }

            // Проверка всех позиций до первой записи
            for (const auto& m : mutations) {
                domain::rules::applyMutation(locked[m.skuId], m);
            }

            std::vector<domain::StockRecord> updated;
            updated.reserve(mutations.size());
            for (const auto& m : mutations) {
                updated.push_back(applyLocked(txn, locked[m.skuId], m));
            }

            txn.commit();
            return updated;
        });
    }

    domain::SettlementResult settle(const domain::ReservationSettlement& settlement) override {
        domain::rules::validateSettlement(settlement);
        if (settlement.reservations.empty()) {
            return {};
        }

        return withPostgresErrors("PostgresInventoryStore", "settle", [&] {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            setLockTimeout(txn);

            // Строки остатков первыми: все переходы из ACTIVE идут через эту
            // блокировку, поэтому deduct, release и sweeper сериализуются по SKU
            std::map<std::string, domain::StockRecord> locked;
            for (const auto& skuId : domain::rules::settlementSkus(settlement)) {
                locked[skuId] = lockRow(txn, skuId);
            }

            domain::SettlementResult result;
            std::vector<domain::Reservation> won;
            for (const auto& r : settlement.reservations) {
                auto switched = PostgresReservationRepository::transitionStatus(
                    txn, r.id, domain::ReservationStatus::ACTIVE, settlement.next);
                if (switched) {
                    won.push_back(*switched);
                    continue;
                }
                auto current = PostgresReservationRepository::selectById(txn, r.id);
                if (!current) {
                    throw domain::ReservationNotFoundException(r.id);
                }
                result.lost.push_back(*current);
            }

            if (won.empty() || (settlement.allOrNothing && !result.lost.empty())) {
                txn.abort();
                return result;
            }

            for (const auto& m : domain::rules::settlementMutations(won, settlement)) {
                result.records.push_back(applyLocked(txn, locked[m.skuId], m));
            }
            txn.commit();

            result.settled = std::move(won);
            return result;
        });
    }

    domain::StockRecord updateThresholds(
        const std::string& skuId,
        int64_t warningThreshold,
        int64_t criticalThreshold) override
    {
        domain::rules::validateThresholds(warningThreshold, criticalThreshold);

        return withPostgresErrors("PostgresInventoryStore", "updateThresholds", [&] {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);
            setLockTimeout(txn);

            ensureRow(txn, skuId);
            auto result = txn.exec_params(
                "UPDATE inventory_stocks "
                "SET warning_threshold = $2, critical_threshold = $3, updated_at = NOW() "
                "WHERE sku_id = $1 "
                "RETURNING sku_id, total_quantity, reserved_quantity, "
                "          warning_threshold, critical_threshold, version, "
                "          (EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_ms",
                skuId,
                warningThreshold,
                criticalThreshold
            );
            txn.commit();

            std::cout << "[PostgresInventoryStore] Thresholds of " << skuId << " set to "
                      << warningThreshold << "/" << criticalThreshold << std::endl;
            return mapRow(result[0]);
        });
    }

    std::vector<domain::StockRecord> findLowStock(
        domain::StockLevel level,
        int limit,
        int64_t offset) override
    {
        return withPostgresErrors("PostgresInventoryStore", "findLowStock", [&] {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            std::string condition;
            switch (level) {
                case domain::StockLevel::WARNING:
                    condition = "(total_quantity - reserved_quantity) <= warning_threshold";
                    break;
                case domain::StockLevel::CRITICAL:
                    condition = "(total_quantity - reserved_quantity) <= critical_threshold";
                    break;
                case domain::StockLevel::OUT:
                    condition = "(total_quantity - reserved_quantity) <= 0";
                    break;
            }

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) + "FROM inventory_stocks WHERE " + condition +
                " ORDER BY (total_quantity - reserved_quantity) ASC, sku_id ASC "
                "LIMIT $1 OFFSET $2",
                limit,
                offset
            );

            std::vector<domain::StockRecord> records;
            records.reserve(result.size());
            for (const auto& row : result) {
                records.push_back(mapRow(row));
            }
            return records;
        });
    }

private:
    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::StorageSettings> storageSettings_;

    static constexpr const char* SELECT_COLUMNS =
        "SELECT sku_id, total_quantity, reserved_quantity, "
        "       warning_threshold, critical_threshold, version, "
        "       (EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_ms ";

    static domain::StockRecord mapRow(const pqxx::row& row) {
        domain::StockRecord record(row["sku_id"].as<std::string>());
        record.totalQuantity = row["total_quantity"].as<int64_t>();
        record.reservedQuantity = row["reserved_quantity"].as<int64_t>();
        record.warningThreshold = row["warning_threshold"].as<int64_t>();
        record.criticalThreshold = row["critical_threshold"].as<int64_t>();
        record.version = row["version"].as<int64_t>();
        record.updatedAt = domain::Timestamp::fromMillis(row["updated_ms"].as<int64_t>());
        return record;
    }

    void setLockTimeout(pqxx::work& txn) {
        txn.exec("SET LOCAL lock_timeout = '" +
                 std::to_string(storageSettings_->getLockTimeout().count()) + "ms'");
    }

    static void ensureRow(pqxx::work& txn, const std::string& skuId) {
        txn.exec_params(
            "INSERT INTO inventory_stocks (sku_id) VALUES ($1) ON CONFLICT (sku_id) DO NOTHING",
            skuId
        );
    }

    static domain::StockRecord lockRow(pqxx::work& txn, const std::string& skuId) {
        ensureRow(txn, skuId);
        auto result = txn.exec_params(
            std::string(SELECT_COLUMNS) + "FROM inventory_stocks WHERE sku_id = $1 FOR UPDATE",
            skuId
        );
        return mapRow(result[0]);
    }

    /**
     * @brief Проверить, записать журнал, обновить строку (строка уже заблокирована)
     */
    static domain::StockRecord applyLocked(
        pqxx::work& txn,
        const domain::StockRecord& current,
        const domain::StockMutation& mutation)
    {
        auto updated = domain::rules::applyMutation(current, mutation);
        PostgresTransactionLedger::insertEntry(
            txn, domain::rules::makeLedgerEntry(current, updated, mutation));

        txn.exec_params(
            "UPDATE inventory_stocks "
            "SET total_quantity = $2, reserved_quantity = $3, version = $4, "
            "    updated_at = to_timestamp($5::bigint / 1000.0) "
            "WHERE sku_id = $1",
            updated.skuId,
            updated.totalQuantity,
            updated.reservedQuantity,
            updated.version,
            updated.updatedAt.toMillis()
        );
        return updated;
    }

    void initSchema() {
        try {
            pqxx::connection conn(dbSettings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS inventory_stocks (
                    sku_id VARCHAR(64) PRIMARY KEY,
                    total_quantity BIGINT NOT NULL DEFAULT 0 CHECK (total_quantity >= 0),
                    reserved_quantity BIGINT NOT NULL DEFAULT 0
                        CHECK (reserved_quantity >= 0 AND reserved_quantity <= total_quantity),
                    warning_threshold BIGINT NOT NULL DEFAULT 10,
                    critical_threshold BIGINT NOT NULL DEFAULT 5,
                    version BIGINT NOT NULL DEFAULT 0,
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.commit();
            std::cout << "[PostgresInventoryStore] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresInventoryStore] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace inventory::adapters::secondary
