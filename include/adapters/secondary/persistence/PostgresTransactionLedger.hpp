#pragma once

#include "ports/output/ITransactionLedger.hpp"
#include "adapters/secondary/persistence/PostgresErrors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <optional>
#include <iostream>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL журнал движения остатков
 *
 * Таблица: inventory_ledger
 * - id BIGSERIAL PRIMARY KEY (порядок записей)
 * - sku_id, kind, reference_id, operator_id, reason
 * - quantity_delta / quantity_before / quantity_after (available)
 * - reserved_delta, total_delta, reserved_after, total_after
 * - created_at TIMESTAMPTZ
 *
 * PostgresInventoryStore пишет сюда через insertEntry() в своей транзакции,
 * поэтому запись журнала и изменение счётчиков фиксируются вместе.
 */
class PostgresTransactionLedger : public ports::output::ITransactionLedger {
public:
    explicit PostgresTransactionLedger(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    /**
     * @brief Вставить запись в открытой транзакции
     * @return Присвоенный id
     */
    static int64_t insertEntry(pqxx::work& txn, const domain::LedgerEntry& entry) {
        auto result = txn.exec_params(
            "INSERT INTO inventory_ledger ("
            "  sku_id, kind, quantity_delta, quantity_before, quantity_after, "
            "  reserved_delta, total_delta, reserved_after, total_after, "
            "  reference_id, operator_id, reason, created_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, "
            "        to_timestamp($13::bigint / 1000.0)) "
            "RETURNING id",
            entry.skuId,
            domain::toString(entry.kind),
            entry.quantityDelta,
            entry.quantityBefore,
            entry.quantityAfter,
            entry.reservedDelta,
            entry.totalDelta,
            entry.reservedAfter,
            entry.totalAfter,
            entry.referenceId,
            entry.operatorId,
            entry.reason,
            entry.createdAt.toMillis()
        );
        return result[0]["id"].as<int64_t>();
    }

    domain::LedgerEntry append(const domain::LedgerEntry& entry) override {
        return withPostgresErrors("PostgresTransactionLedger", "append", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            domain::LedgerEntry stored = entry;
            stored.id = insertEntry(txn, entry);
            txn.commit();
            return stored;
        });
    }

    std::vector<domain::LedgerEntry> appendBatch(
        const std::vector<domain::LedgerEntry>& entries) override
    {
        return withPostgresErrors("PostgresTransactionLedger", "appendBatch", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            std::vector<domain::LedgerEntry> stored;
            stored.reserve(entries.size());
            for (const auto& entry : entries) {
                domain::LedgerEntry e = entry;
                e.id = insertEntry(txn, entry);
                stored.push_back(e);
            }
            txn.commit();
            return stored;
        });
    }

    std::vector<domain::LedgerEntry> findBySku(const std::string& skuId) override {
        return withPostgresErrors("PostgresTransactionLedger", "findBySku", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) +
                "FROM inventory_ledger WHERE sku_id = $1 ORDER BY id ASC",
                skuId
            );

            std::vector<domain::LedgerEntry> entries;
            entries.reserve(result.size());
            for (const auto& row : result) {
                entries.push_back(mapRow(row));
            }
            return entries;
        });
    }

    domain::LedgerPage query(const domain::LedgerQuery& query) override {
        return withPostgresErrors("PostgresTransactionLedger", "query", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            std::optional<std::string> kind;
            if (query.kind) {
                kind = domain::toString(*query.kind);
            }
            std::optional<int64_t> fromMs;
            if (query.from) {
                fromMs = query.from->toMillis();
            }
            std::optional<int64_t> toMs;
            if (query.to) {
                toMs = query.to->toMillis();
            }

            const std::string where =
                "WHERE ($1::text IS NULL OR sku_id = $1) "
                "  AND ($2::text IS NULL OR kind = $2) "
                "  AND ($3::bigint IS NULL OR created_at >= to_timestamp($3::bigint / 1000.0)) "
                "  AND ($4::bigint IS NULL OR created_at <= to_timestamp($4::bigint / 1000.0)) ";

            auto countResult = txn.exec_params(
                "SELECT COUNT(*) AS total FROM inventory_ledger " + where,
                query.skuId, kind, fromMs, toMs
            );

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) + "FROM inventory_ledger " + where +
                "ORDER BY id DESC LIMIT $5 OFFSET $6",
                query.skuId, kind, fromMs, toMs,
                query.pageSize,
                static_cast<int64_t>(query.page - 1) * query.pageSize
            );

            domain::LedgerPage page;
            page.total = countResult[0]["total"].as<int64_t>();
            page.page = query.page;
            page.pageSize = query.pageSize;
            for (const auto& row : result) {
                page.entries.push_back(mapRow(row));
            }
            return page;
        });
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static constexpr const char* SELECT_COLUMNS =
        "SELECT id, sku_id, kind, quantity_delta, quantity_before, quantity_after, "
        "       reserved_delta, total_delta, reserved_after, total_after, "
        "       reference_id, operator_id, reason, "
        "       (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms ";

    static domain::LedgerEntry mapRow(const pqxx::row& row) {
        domain::LedgerEntry entry;
        entry.id = row["id"].as<int64_t>();
        entry.skuId = row["sku_id"].as<std::string>();
        entry.kind = domain::parseLedgerEntryKind(row["kind"].as<std::string>());
        entry.quantityDelta = row["quantity_delta"].as<int64_t>();
        entry.quantityBefore = row["quantity_before"].as<int64_t>();
        entry.quantityAfter = row["quantity_after"].as<int64_t>();
        entry.reservedDelta = row["reserved_delta"].as<int64_t>();
        entry.totalDelta = row["total_delta"].as<int64_t>();
        entry.reservedAfter = row["reserved_after"].as<int64_t>();
        entry.totalAfter = row["total_after"].as<int64_t>();
        entry.referenceId = row["reference_id"].as<std::string>();
        entry.operatorId = row["operator_id"].as<std::string>();
        entry.reason = row["reason"].as<std::string>();
        entry.createdAt = domain::Timestamp::fromMillis(row["created_ms"].as<int64_t>());
        return entry;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS inventory_ledger (
                    id BIGSERIAL PRIMARY KEY,
                    sku_id VARCHAR(64) NOT NULL,
                    kind VARCHAR(16) NOT NULL,
                    quantity_delta BIGINT NOT NULL,
                    quantity_before BIGINT NOT NULL,
                    quantity_after BIGINT NOT NULL,
                    reserved_delta BIGINT NOT NULL,
                    total_delta BIGINT NOT NULL,
                    reserved_after BIGINT NOT NULL,
                    total_after BIGINT NOT NULL,
                    reference_id VARCHAR(128) NOT NULL DEFAULT '',
                    operator_id VARCHAR(64) NOT NULL DEFAULT 'system',
                    reason TEXT NOT NULL DEFAULT '',
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_sku ON inventory_ledger (sku_id, id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_ledger_created ON inventory_ledger (created_at)");

            txn.commit();
            std::cout << "[PostgresTransactionLedger] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransactionLedger] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace inventory::adapters::secondary
