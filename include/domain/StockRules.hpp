#pragma once

#include "StockRecord.hpp"
#include "StockMutation.hpp"
#include "LedgerEntry.hpp"
#include "InventoryException.hpp"
#include "Reservation.hpp"
#include "ReservationSettlement.hpp"
#include "enums/StockLevel.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace inventory::domain::rules {

/**
 * @brief Проверить мутацию и вернуть новое состояние записи
 *
 * Общая логика для всех реализаций IInventoryStore. Вызывается
 * под блокировкой строки; исходная запись не меняется.
 * Версия увеличивается на 1, available пересчитывается из счётчиков.
 */
inline StockRecord applyMutation(const StockRecord& current, const StockMutation& mutation) {
    if (mutation.expectedVersion && *mutation.expectedVersion != current.version) {
        throw ConcurrentModificationException(
            "Version mismatch for " + current.skuId +
            ": expected " + std::to_string(*mutation.expectedVersion) +
            ", actual " + std::to_string(current.version));
    }

    int64_t newTotal = current.totalQuantity + mutation.totalDelta;
    int64_t newReserved = current.reservedQuantity + mutation.reserveDelta;

    if (newTotal < 0) {
        throw InvalidAdjustmentException(
            "Total quantity of " + current.skuId + " would become negative (" +
            std::to_string(newTotal) + ")");
    }
    if (newReserved < 0) {
        throw InvalidAdjustmentException(
            "Reserved quantity of " + current.skuId + " would become negative (" +
            std::to_string(newReserved) + ")");
    }
    if (newReserved > newTotal) {
        if (mutation.reserveDelta > 0) {
            int64_t available = std::max<int64_t>(0, newTotal - current.reservedQuantity);
            throw InsufficientStockException(current.skuId, mutation.reserveDelta, available);
        }
        throw InvalidAdjustmentException(
            "Total quantity of " + current.skuId + " would drop below reserved (" +
            std::to_string(newTotal) + " < " + std::to_string(newReserved) + ")");
    }

    StockRecord next = current;
    next.totalQuantity = newTotal;
    next.reservedQuantity = newReserved;
    next.version = current.version + 1;
    next.updatedAt = Timestamp::now();
    return next;
}

/**
 * @brief Запись журнала для перехода before -> after
 */
inline LedgerEntry makeLedgerEntry(
    const StockRecord& before,
    const StockRecord& after,
    const StockMutation& mutation)
{
    LedgerEntry entry;
    entry.skuId = after.skuId;
    entry.kind = mutation.kind;
    entry.quantityBefore = before.availableQuantity();
    entry.quantityAfter = after.availableQuantity();
    entry.quantityDelta = entry.quantityAfter - entry.quantityBefore;
    entry.reservedDelta = mutation.reserveDelta;
    entry.totalDelta = mutation.totalDelta;
    entry.reservedAfter = after.reservedQuantity;
    entry.totalAfter = after.totalQuantity;
    entry.referenceId = mutation.referenceId;
    entry.operatorId = mutation.operatorId.empty() ? "system" : mutation.operatorId;
    entry.reason = mutation.reason;
    entry.createdAt = after.updatedAt;
    return entry;
}

/**
 * @brief Проверка порогов: 0 <= critical <= warning
 */
inline void validateThresholds(int64_t warningThreshold, int64_t criticalThreshold) {
    if (warningThreshold < 0 || criticalThreshold < 0) {
        throw InvalidAdjustmentException("Thresholds must be non-negative");
    }
    if (criticalThreshold > warningThreshold) {
        throw InvalidAdjustmentException(
            "Critical threshold (" + std::to_string(criticalThreshold) +
            ") must not exceed warning threshold (" + std::to_string(warningThreshold) + ")");
    }
}

/**
 * @brief Попадает ли запись в выборку уровня
 */
inline bool matchesLevel(const StockRecord& record, StockLevel level) {
    switch (level) {
        case StockLevel::WARNING: return record.isLowStock();
        case StockLevel::CRITICAL: return record.isCriticalStock();
        case StockLevel::OUT: return record.isOutOfStock();
        default: return false;
    }
}

/**
 * @brief Мутации, снимающие удержание резервов
 *
 * Резервы одного SKU (корзина и заказ по одному ключу) сворачиваются
 * в одну мутацию: batchMutate не принимает повторов SKU.
 * consume = true - списание (reserved -= q, total -= q),
 * иначе возврат в свободный остаток (reserved -= q).
 * Мутации упорядочены по skuId.
 */
inline std::vector<StockMutation> releaseMutations(
    const std::vector<Reservation>& reservations,
    LedgerEntryKind kind,
    bool consume,
    const std::string& reason)
{
    std::map<std::string, int64_t> bySku;
    for (const auto& r : reservations) {
        bySku[r.skuId] += r.quantity;
    }

    std::vector<StockMutation> mutations;
    for (const auto& [skuId, quantity] : bySku) {
        StockMutation m;
        m.skuId = skuId;
        m.reserveDelta = -quantity;
        m.totalDelta = consume ? -quantity : 0;
        m.kind = kind;
        m.referenceId = reservations.front().referenceId;
        m.reason = reason;
        mutations.push_back(m);
    }
    return mutations;
}

/**
 * @brief Мутации для резервов, выигранных settle()
 */
inline std::vector<StockMutation> settlementMutations(
    const std::vector<Reservation>& settled,
    const ReservationSettlement& settlement)
{
    if (settled.empty()) {
        return {};
    }
    bool consume = settlement.next == ReservationStatus::CONSUMED;
    return releaseMutations(
        settled,
        consume ? LedgerEntryKind::DEDUCT : LedgerEntryKind::RELEASE,
        consume,
        settlement.reason);
}

/**
 * @brief SKU резервов settle() в порядке захвата блокировок
 */
inline std::set<std::string> settlementSkus(const ReservationSettlement& settlement) {
    std::set<std::string> skuIds;
    for (const auto& r : settlement.reservations) {
        skuIds.insert(r.skuId);
    }
    return skuIds;
}

/**
 * @brief Допустимый конечный статус settle()
 */
inline void validateSettlement(const ReservationSettlement& settlement) {
    if (settlement.next == ReservationStatus::ACTIVE) {
        throw std::invalid_argument("settlement target status must be terminal");
    }
    std::set<std::string> ids;
    for (const auto& r : settlement.reservations) {
        if (!ids.insert(r.id).second) {
            throw std::invalid_argument("duplicate reservation in settlement: " + r.id);
        }
    }
}

} // namespace inventory::domain::rules
