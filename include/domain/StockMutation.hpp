#pragma once

#include "enums/LedgerEntryKind.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Запрос на атомарное изменение счётчиков одного SKU
 *
 * Кроме дельт несёт контекст для записи в журнал.
 * expectedVersion задан - оптимистичная проверка версии;
 * не задан - сериализация только блокировкой строки.
 */
struct StockMutation {
    std::string skuId;
    int64_t reserveDelta = 0;
    int64_t totalDelta = 0;
    std::optional<int64_t> expectedVersion;

    LedgerEntryKind kind = LedgerEntryKind::ADJUST;
    std::string referenceId;
    std::string operatorId = "system";
    std::string reason;
};

} // namespace inventory::domain
