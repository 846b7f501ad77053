#pragma once

#include "ports/output/IReservationRepository.hpp"
#include "adapters/secondary/persistence/PostgresErrors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <optional>
#include <iostream>

namespace inventory::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий резервов
 *
 * Таблица: inventory_reservations
 * - id VARCHAR(64) PRIMARY KEY
 * - sku_id, kind, reference_id
 * - quantity BIGINT > 0
 * - expires_at TIMESTAMPTZ
 * - status VARCHAR(16): ACTIVE | CONSUMED | RELEASED | EXPIRED
 * - created_at, updated_at TIMESTAMPTZ
 *
 * Частичный уникальный индекс (sku_id, kind, reference_id) WHERE status = 'ACTIVE'
 * не даёт создать второй ACTIVE резерв по тому же ключу.
 * CAS статуса - UPDATE ... WHERE id = $1 AND status = $2.
 */
class PostgresReservationRepository : public ports::output::IReservationRepository {
public:
    explicit PostgresReservationRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    bool insert(const domain::Reservation& reservation) override {
        return withPostgresErrors("PostgresReservationRepository", "insert", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            bool inserted = insertRow(txn, reservation);
            txn.commit();
            return inserted;
        });
    }

    bool insertBatch(const std::vector<domain::Reservation>& reservations) override {
        return withPostgresErrors("PostgresReservationRepository", "insertBatch", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            for (const auto& r : reservations) {
                if (!insertRow(txn, r)) {
                    txn.abort();
                    std::cout << "[PostgresReservationRepository] insertBatch conflict on "
                              << r.skuId << "/" << r.referenceId << ", rolled back" << std::endl;
                    return false;
                }
            }
            txn.commit();
            return true;
        });
    }

    std::optional<domain::Reservation> findById(const std::string& id) override {
        return withPostgresErrors("PostgresReservationRepository", "findById", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            return selectById(txn, id);
        });
    }

    std::optional<domain::Reservation> findActive(
        const std::string& skuId,
        domain::ReservationKind kind,
        const std::string& referenceId) override
    {
        return withPostgresErrors("PostgresReservationRepository", "findActive", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) +
                "FROM inventory_reservations "
                "WHERE sku_id = $1 AND kind = $2 AND reference_id = $3 AND status = 'ACTIVE'",
                skuId,
                domain::toString(kind),
                referenceId
            );
            if (result.empty()) {
                return std::optional<domain::Reservation>();
            }
            return std::optional<domain::Reservation>(mapRow(result[0]));
        });
    }

    std::vector<domain::Reservation> findByReference(const std::string& referenceId) override {
        return withPostgresErrors("PostgresReservationRepository", "findByReference", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) +
                "FROM inventory_reservations WHERE reference_id = $1 "
                "ORDER BY sku_id ASC, created_at ASC",
                referenceId
            );

            std::vector<domain::Reservation> reservations;
            reservations.reserve(result.size());
            for (const auto& row : result) {
                reservations.push_back(mapRow(row));
            }
            return reservations;
        });
    }

    bool compareAndSetStatus(
        const std::string& id,
        domain::ReservationStatus expected,
        domain::ReservationStatus next) override
    {
        return withPostgresErrors("PostgresReservationRepository", "compareAndSetStatus", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            bool switched = transitionStatus(txn, id, expected, next).has_value();
            txn.commit();
            return switched;
        });
    }

    bool updateExpiry(const std::string& id, const domain::Timestamp& expiresAt) override {
        return withPostgresErrors("PostgresReservationRepository", "updateExpiry", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "UPDATE inventory_reservations "
                "SET expires_at = to_timestamp($2::bigint / 1000.0), updated_at = NOW() "
                "WHERE id = $1 AND status = 'ACTIVE'",
                id,
                expiresAt.toMillis()
            );
            txn.commit();
            return result.affected_rows() == 1;
        });
    }

    std::vector<domain::Reservation> findExpired(
        const domain::Timestamp& now,
        std::size_t limit) override
    {
        return withPostgresErrors("PostgresReservationRepository", "findExpired", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) +
                "FROM inventory_reservations "
                "WHERE status = 'ACTIVE' AND expires_at < to_timestamp($1::bigint / 1000.0) "
                "ORDER BY expires_at ASC LIMIT $2",
                now.toMillis(),
                static_cast<int64_t>(limit)
            );

            std::vector<domain::Reservation> reservations;
            reservations.reserve(result.size());
            for (const auto& row : result) {
                reservations.push_back(mapRow(row));
            }
            return reservations;
        });
    }

    /**
     * @brief CAS статуса в открытой транзакции
     *
     * Используется PostgresInventoryStore::settle(), чтобы смена статуса
     * и изменение остатков фиксировались одним COMMIT.
     *
     * @return Резерв после смены статуса или nullopt, если статус был не expected
     */
    static std::optional<domain::Reservation> transitionStatus(
        pqxx::work& txn,
        const std::string& id,
        domain::ReservationStatus expected,
        domain::ReservationStatus next)
    {
        auto result = txn.exec_params(
            "UPDATE inventory_reservations SET status = $3, updated_at = NOW() "
            "WHERE id = $1 AND status = $2 "
            "RETURNING id, sku_id, kind, reference_id, quantity, status, "
            "          (EXTRACT(EPOCH FROM expires_at) * 1000)::BIGINT AS expires_ms, "
            "          (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms, "
            "          (EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_ms",
            id,
            domain::toString(expected),
            domain::toString(next)
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return mapRow(result[0]);
    }

    static std::optional<domain::Reservation> selectById(pqxx::work& txn, const std::string& id) {
        auto result = txn.exec_params(
            std::string(SELECT_COLUMNS) + "FROM inventory_reservations WHERE id = $1",
            id
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return mapRow(result[0]);
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static constexpr const char* SELECT_COLUMNS =
        "SELECT id, sku_id, kind, reference_id, quantity, status, "
        "       (EXTRACT(EPOCH FROM expires_at) * 1000)::BIGINT AS expires_ms, "
        "       (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms, "
        "       (EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_ms ";

    static domain::Reservation mapRow(const pqxx::row& row) {
        domain::Reservation r;
        r.id = row["id"].as<std::string>();
        r.skuId = row["sku_id"].as<std::string>();
        r.kind = domain::parseReservationKind(row["kind"].as<std::string>());
        r.referenceId = row["reference_id"].as<std::string>();
        r.quantity = row["quantity"].as<int64_t>();
        r.status = domain::parseReservationStatus(row["status"].as<std::string>());
        r.expiresAt = domain::Timestamp::fromMillis(row["expires_ms"].as<int64_t>());
        r.createdAt = domain::Timestamp::fromMillis(row["created_ms"].as<int64_t>());
        r.updatedAt = domain::Timestamp::fromMillis(row["updated_ms"].as<int64_t>());
        return r;
    }

    /**
     * @return false если ACTIVE резерв с тем же ключом уже существует
     */
    static bool insertRow(pqxx::work& txn, const domain::Reservation& r) {
        auto result = txn.exec_params(
            "INSERT INTO inventory_reservations "
            "(id, sku_id, kind, reference_id, quantity, expires_at, status, created_at, updated_at) "
            "VALUES ($1, $2, $3, $4, $5, to_timestamp($6::bigint / 1000.0), $7, "
            "        to_timestamp($8::bigint / 1000.0), to_timestamp($8::bigint / 1000.0)) "
            "ON CONFLICT (sku_id, kind, reference_id) WHERE status = 'ACTIVE' DO NOTHING "
            "RETURNING id",
            r.id,
            r.skuId,
            domain::toString(r.kind),
            r.referenceId,
            r.quantity,
            r.expiresAt.toMillis(),
            domain::toString(r.status),
            r.createdAt.toMillis()
        );
        return !result.empty();
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS inventory_reservations (
                    id VARCHAR(64) PRIMARY KEY,
                    sku_id VARCHAR(64) NOT NULL,
                    kind VARCHAR(16) NOT NULL,
                    reference_id VARCHAR(128) NOT NULL,
                    quantity BIGINT NOT NULL CHECK (quantity > 0),
                    expires_at TIMESTAMPTZ NOT NULL,
                    status VARCHAR(16) NOT NULL DEFAULT 'ACTIVE',
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");
            txn.exec(R"(
                CREATE UNIQUE INDEX IF NOT EXISTS ux_reservations_active
                ON inventory_reservations (sku_id, kind, reference_id)
                WHERE status = 'ACTIVE'
            )");
            txn.exec(R"(
                CREATE INDEX IF NOT EXISTS idx_reservations_expiry
                ON inventory_reservations (expires_at)
                WHERE status = 'ACTIVE'
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_reservations_reference "
                     "ON inventory_reservations (reference_id)");

            txn.commit();
            std::cout << "[PostgresReservationRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresReservationRepository] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace inventory::adapters::secondary
