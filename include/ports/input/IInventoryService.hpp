#pragma once

#include "domain/StockRecord.hpp"
#include "domain/AdjustmentRequest.hpp"
#include "domain/LedgerQuery.hpp"
#include "domain/ReconciliationReport.hpp"
#include "domain/enums/StockLevel.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace inventory::ports::input {

/**
 * @brief Интерфейс чтения остатков и администрирования
 */
class IInventoryService {
public:
    virtual ~IInventoryService() = default;

    /**
     * @brief Остаток SKU (создаёт пустую запись при первом обращении)
     */
    virtual domain::StockRecord getStock(const std::string& skuId) = 0;

    /**
     * @brief Пакетное чтение, не более 100 уникальных SKU
     */
    virtual std::vector<domain::StockRecord> getStocks(const std::vector<std::string>& skuIds) = 0;

    /**
     * @brief Ручная корректировка total
     */
    virtual domain::StockRecord adjust(const domain::AdjustmentRequest& request) = 0;

    virtual domain::StockRecord updateThresholds(
        const std::string& skuId,
        int64_t warningThreshold,
        int64_t criticalThreshold) = 0;

    virtual std::vector<domain::StockRecord> getLowStock(
        domain::StockLevel level,
        int page,
        int pageSize) = 0;

    virtual domain::LedgerPage getLedger(const domain::LedgerQuery& query) = 0;

    /**
     * @brief Проиграть журнал SKU и сравнить с текущими счётчиками
     */
    virtual domain::ReconciliationReport reconcile(const std::string& skuId) = 0;
};

} // namespace inventory::ports::input
