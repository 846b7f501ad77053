#pragma once

#include "domain/LedgerEntry.hpp"
#include "domain/LedgerQuery.hpp"
#include <string>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Журнал движения остатков (append-only)
 *
 * Записи никогда не изменяются и не удаляются.
 */
class ITransactionLedger {
public:
    virtual ~ITransactionLedger() = default;

    /**
     * @brief Добавить запись, присвоив ей следующий id
     * @return Запись с заполненным id
     */
    virtual domain::LedgerEntry append(const domain::LedgerEntry& entry) = 0;

    /**
     * @brief Добавить несколько записей одной операцией (всё или ничего)
     */
    virtual std::vector<domain::LedgerEntry> appendBatch(
        const std::vector<domain::LedgerEntry>& entries) = 0;

    /**
     * @brief Все записи SKU в порядке добавления
     */
    virtual std::vector<domain::LedgerEntry> findBySku(const std::string& skuId) = 0;

    /**
     * @brief Выборка с фильтрами и пагинацией, новые записи первыми
     */
    virtual domain::LedgerPage query(const domain::LedgerQuery& query) = 0;
};

} // namespace inventory::ports::output
