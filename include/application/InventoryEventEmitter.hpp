#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "domain/Reservation.hpp"
#include "domain/StockRecord.hpp"
#include "domain/DeductionResult.hpp"
#include "domain/AdjustmentRequest.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace inventory::application {

/**
 * @brief Формирование и публикация событий склада
 *
 * Routing keys:
 * - inventory.reserved / inventory.released / inventory.deducted
 * - inventory.adjusted
 * - reservation.expired
 * - stock.low (level: warning | critical | out)
 *
 * Любая ошибка публикации логируется и не выходит наружу.
 */
class InventoryEventEmitter {
public:
    explicit InventoryEventEmitter(std::shared_ptr<ports::output::IEventPublisher> publisher)
        : publisher_(std::move(publisher))
    {}

    void reserved(const std::vector<domain::Reservation>& reservations) {
        if (reservations.empty()) return;

        nlohmann::json event;
        event["reference_id"] = reservations.front().referenceId;
        event["kind"] = domain::toString(reservations.front().kind);
        event["items"] = itemsJson(reservations);
        event["timestamp"] = domain::Timestamp::now().toString();
        publish("inventory.reserved", event);
    }

    void released(const std::vector<domain::Reservation>& reservations) {
        if (reservations.empty()) return;

        nlohmann::json event;
        event["reference_id"] = reservations.front().referenceId;
        event["items"] = itemsJson(reservations);
        event["timestamp"] = domain::Timestamp::now().toString();
        publish("inventory.released", event);
    }

    void deducted(const domain::DeductionResult& result) {
        if (result.consumed.empty()) return;

        nlohmann::json event;
        event["reference_id"] = result.referenceId;
        event["items"] = itemsJson(result.consumed);
        event["timestamp"] = domain::Timestamp::now().toString();
        publish("inventory.deducted", event);
    }

    void expired(const domain::Reservation& reservation) {
        nlohmann::json event;
        event["reservation_id"] = reservation.id;
        event["sku_id"] = reservation.skuId;
        event["kind"] = domain::toString(reservation.kind);
        event["reference_id"] = reservation.referenceId;
        event["quantity"] = reservation.quantity;
        event["expires_at"] = reservation.expiresAt.toString();
        event["timestamp"] = domain::Timestamp::now().toString();
        publish("reservation.expired", event);
    }

    void adjusted(const domain::AdjustmentRequest& request, const domain::StockRecord& record) {
        nlohmann::json event;
        event["sku_id"] = record.skuId;
        event["type"] = domain::toString(request.type);
        event["quantity"] = request.quantity;
        event["total_quantity"] = record.totalQuantity;
        event["available_quantity"] = record.availableQuantity();
        event["operator_id"] = request.operatorId;
        event["reason"] = request.reason;
        event["timestamp"] = domain::Timestamp::now().toString();
        publish("inventory.adjusted", event);
    }

    /**
     * @brief stock.low, если после мутации available не выше warning
     */
    void stockLevel(const domain::StockRecord& record) {
        if (!record.isLowStock()) return;

        std::string level = record.isOutOfStock() ? "out"
                          : record.isCriticalStock() ? "critical"
                          : "warning";

        nlohmann::json event;
        event["sku_id"] = record.skuId;
        event["level"] = level;
        event["available_quantity"] = record.availableQuantity();
        event["warning_threshold"] = record.warningThreshold;
        event["critical_threshold"] = record.criticalThreshold;
        event["timestamp"] = domain::Timestamp::now().toString();
        publish("stock.low", event);
    }

    void stockLevels(const std::vector<domain::StockRecord>& records) {
        for (const auto& record : records) {
            stockLevel(record);
        }
    }

private:
    std::shared_ptr<ports::output::IEventPublisher> publisher_;

    static nlohmann::json itemsJson(const std::vector<domain::Reservation>& reservations) {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& r : reservations) {
            items.push_back({
                {"reservation_id", r.id},
                {"sku_id", r.skuId},
                {"quantity", r.quantity}
            });
        }
        return items;
    }

    void publish(const std::string& routingKey, const nlohmann::json& event) {
        try {
            publisher_->publish(routingKey, event.dump());
        } catch (const std::exception& e) {
            std::cerr << "[InventoryEventEmitter] Failed to publish " << routingKey
                      << ": " << e.what() << std::endl;
        }
    }
};

} // namespace inventory::application
