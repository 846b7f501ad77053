#pragma once

#include "domain/StockRecord.hpp"
#include "domain/Reservation.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/LedgerQuery.hpp"
#include "domain/ReconciliationReport.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace inventory::adapters::primary {

/**
 * @brief Доменные объекты -> JSON ответа (snake_case)
 */
class JsonMapper {
public:
    static nlohmann::json toJson(const domain::StockRecord& record) {
        nlohmann::json j;
        j["sku_id"] = record.skuId;
        j["total_quantity"] = record.totalQuantity;
        j["reserved_quantity"] = record.reservedQuantity;
        j["available_quantity"] = record.availableQuantity();
        j["warning_threshold"] = record.warningThreshold;
        j["critical_threshold"] = record.criticalThreshold;
        j["is_low_stock"] = record.isLowStock();
        j["is_critical_stock"] = record.isCriticalStock();
        j["is_out_of_stock"] = record.isOutOfStock();
        j["version"] = record.version;
        j["updated_at"] = record.updatedAt.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::Reservation& r) {
        nlohmann::json j;
        j["reservation_id"] = r.id;
        j["sku_id"] = r.skuId;
        j["kind"] = domain::toString(r.kind);
        j["reference_id"] = r.referenceId;
        j["quantity"] = r.quantity;
        j["status"] = domain::toString(r.status);
        j["expires_at"] = r.expiresAt.toString();
        j["created_at"] = r.createdAt.toString();
        j["updated_at"] = r.updatedAt.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::LedgerEntry& e) {
        nlohmann::json j;
        j["id"] = e.id;
        j["sku_id"] = e.skuId;
        j["kind"] = domain::toString(e.kind);
        j["quantity_delta"] = e.quantityDelta;
        j["quantity_before"] = e.quantityBefore;
        j["quantity_after"] = e.quantityAfter;
        j["reserved_delta"] = e.reservedDelta;
        j["total_delta"] = e.totalDelta;
        j["reserved_after"] = e.reservedAfter;
        j["total_after"] = e.totalAfter;
        j["reference_id"] = e.referenceId;
        j["operator_id"] = e.operatorId;
        j["reason"] = e.reason;
        j["created_at"] = e.createdAt.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::LedgerPage& page) {
        nlohmann::json j;
        j["entries"] = toJsonArray(page.entries);
        j["total"] = page.total;
        j["page"] = page.page;
        j["page_size"] = page.pageSize;
        return j;
    }

    static nlohmann::json toJson(const domain::ReconciliationReport& report) {
        nlohmann::json j;
        j["sku_id"] = report.skuId;
        j["entry_count"] = report.entryCount;
        j["ledger_total"] = report.replayedTotal;
        j["ledger_reserved"] = report.replayedReserved;
        j["actual_total"] = report.actualTotal;
        j["actual_reserved"] = report.actualReserved;
        j["consistent"] = report.isConsistent();
        return j;
    }

    template <typename T>
    static nlohmann::json toJsonArray(const std::vector<T>& items) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& item : items) {
            arr.push_back(toJson(item));
        }
        return arr;
    }
};

} // namespace inventory::adapters::primary
