#pragma once

#include "Timestamp.hpp"
#include "enums/LedgerEntryKind.hpp"
#include <string>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Запись журнала движения остатков (append-only)
 *
 * quantityDelta / quantityBefore / quantityAfter описывают available.
 * reservedDelta / totalDelta и снимки *After нужны для сверки:
 * сумма дельт всех записей SKU по порядку id даёт текущие счётчики.
 */
struct LedgerEntry {
    int64_t id = 0;
    std::string skuId;
    LedgerEntryKind kind = LedgerEntryKind::ADJUST;

    int64_t quantityDelta = 0;
    int64_t quantityBefore = 0;
    int64_t quantityAfter = 0;

    int64_t reservedDelta = 0;
    int64_t totalDelta = 0;
    int64_t reservedAfter = 0;
    int64_t totalAfter = 0;

    std::string referenceId;
    std::string operatorId = "system";
    std::string reason;
    Timestamp createdAt;
};

} // namespace inventory::domain
