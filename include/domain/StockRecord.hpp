#pragma once

#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Авторитетный остаток по одному SKU
 *
 * available не хранится: всегда считается как total - reserved,
 * поэтому разойтись с формулой не может.
 *
 * Инвариант: 0 <= reservedQuantity <= totalQuantity.
 * Его соблюдает каждая мутация в IInventoryStore, фонового "исправителя" нет.
 */
struct StockRecord {
    static constexpr int64_t DEFAULT_WARNING_THRESHOLD = 10;
    static constexpr int64_t DEFAULT_CRITICAL_THRESHOLD = 5;

    std::string skuId;
    int64_t totalQuantity = 0;
    int64_t reservedQuantity = 0;
    int64_t warningThreshold = DEFAULT_WARNING_THRESHOLD;
    int64_t criticalThreshold = DEFAULT_CRITICAL_THRESHOLD;
    int64_t version = 0;
    Timestamp updatedAt;

    StockRecord() = default;

    explicit StockRecord(const std::string& sku)
        : skuId(sku)
    {}

    int64_t availableQuantity() const {
        return totalQuantity - reservedQuantity;
    }

    bool isLowStock() const {
        return availableQuantity() <= warningThreshold;
    }

    bool isCriticalStock() const {
        return availableQuantity() <= criticalThreshold;
    }

    bool isOutOfStock() const {
        return availableQuantity() <= 0;
    }
};

} // namespace inventory::domain
