#pragma once

#include "ports/input/IInventoryService.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "ports/output/ITransactionLedger.hpp"
#include "application/InventoryEventEmitter.hpp"
#include "application/RetryPolicy.hpp"
#include "settings/ReservationSettings.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>

namespace inventory::application {

/**
 * @brief Чтение остатков, ручные корректировки, журнал и сверка
 *
 * Чтение идёт через кэширующий IInventoryStore, корректировки -
 * через mutate() с проверкой версии.
 */
class InventoryService : public ports::input::IInventoryService {
public:
    static constexpr size_t MAX_BATCH_SKUS = 100;
    static constexpr int MAX_PAGE_SIZE = 100;

    InventoryService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<ports::output::ITransactionLedger> ledger,
        std::shared_ptr<settings::ReservationSettings> settings,
        std::shared_ptr<InventoryEventEmitter> events
    ) : store_(std::move(store))
      , ledger_(std::move(ledger))
      , events_(std::move(events))
      , retry_(settings->getMaxRetries(), settings->getRetryBackoff())
    {
        std::cout << "[InventoryService] Created" << std::endl;
    }

    domain::StockRecord getStock(const std::string& skuId) override {
        requireSku(skuId);
        if (auto record = store_->find(skuId)) {
            return *record;
        }
        return store_->getOrCreate(skuId);
    }

    std::vector<domain::StockRecord> getStocks(const std::vector<std::string>& skuIds) override {
        std::vector<std::string> unique;
        std::set<std::string> seen;
        for (const auto& skuId : skuIds) {
            requireSku(skuId);
            if (seen.insert(skuId).second) {
                unique.push_back(skuId);
            }
        }
        if (unique.empty()) {
            throw std::invalid_argument("sku_ids must not be empty");
        }
        if (unique.size() > MAX_BATCH_SKUS) {
            throw std::invalid_argument(
                "too many sku_ids: max " + std::to_string(MAX_BATCH_SKUS));
        }

        std::map<std::string, domain::StockRecord> found;
        for (const auto& record : store_->findBatch(unique)) {
            found[record.skuId] = record;
        }

        // Неизвестный SKU показываем нулевым, не создавая запись
        std::vector<domain::StockRecord> result;
        result.reserve(unique.size());
        for (const auto& skuId : unique) {
            auto it = found.find(skuId);
            result.push_back(it != found.end() ? it->second : domain::StockRecord(skuId));
        }
        return result;
    }

    /**
     * @brief Корректировка total
     *
     * INCREASE (запись RESTOCK) и DECREASE (ADJUST) - дельта, SET - целевое
     * значение. Для SET дельта считается от прочитанной записи, поэтому
     * мутация всегда идёт с expectedVersion: если запись успела измениться,
     * пересчитываем (если версию не задал сам вызывающий).
     */
    domain::StockRecord adjust(const domain::AdjustmentRequest& request) override {
        requireSku(request.skuId);
        if (request.quantity < 0 ||
            (request.type != domain::AdjustmentType::SET && request.quantity == 0)) {
            throw domain::InvalidAdjustmentException(
                "Invalid quantity " + std::to_string(request.quantity) +
                " for " + domain::toString(request.type));
        }

        auto attempt = [&] {
            domain::StockMutation m;
            m.skuId = request.skuId;
            m.expectedVersion = request.expectedVersion;
            m.operatorId = request.operatorId.empty() ? "admin" : request.operatorId;
            m.reason = request.reason;

            switch (request.type) {
                case domain::AdjustmentType::INCREASE:
                    m.totalDelta = request.quantity;
                    m.kind = domain::LedgerEntryKind::RESTOCK;
                    break;
                case domain::AdjustmentType::DECREASE:
                    m.totalDelta = -request.quantity;
                    m.kind = domain::LedgerEntryKind::ADJUST;
                    break;
                case domain::AdjustmentType::SET: {
                    auto current = store_->getOrCreate(request.skuId);
                    if (request.expectedVersion && *request.expectedVersion != current.version) {
                        throw domain::ConcurrentModificationException(
                            "Version mismatch for " + request.skuId +
                            ": expected " + std::to_string(*request.expectedVersion) +
                            ", actual " + std::to_string(current.version));
                    }
                    m.totalDelta = request.quantity - current.totalQuantity;
                    m.expectedVersion = current.version;
                    m.kind = domain::LedgerEntryKind::ADJUST;
                    break;
                }
            }
            return store_->mutate(m);
        };

        // Версия от вызывающего - его решение, повторять нельзя
        auto record = request.expectedVersion
            ? attempt()
            : retry_.execute("adjust " + request.skuId, attempt);

        std::cout << "[InventoryService] " << domain::toString(request.type) << " "
                  << request.skuId << " by " << request.quantity
                  << ": total=" << record.totalQuantity
                  << " available=" << record.availableQuantity() << std::endl;
        events_->adjusted(request, record);
        events_->stockLevel(record);
        return record;
    }

    domain::StockRecord updateThresholds(
        const std::string& skuId,
        int64_t warningThreshold,
        int64_t criticalThreshold) override
    {
        requireSku(skuId);
        auto record = store_->updateThresholds(skuId, warningThreshold, criticalThreshold);
        std::cout << "[InventoryService] Thresholds of " << skuId << ": warning="
                  << warningThreshold << " critical=" << criticalThreshold << std::endl;
        return record;
    }

    std::vector<domain::StockRecord> getLowStock(
        domain::StockLevel level,
        int page,
        int pageSize) override
    {
        validatePage(page, pageSize);
        int64_t offset = static_cast<int64_t>(page - 1) * pageSize;
        return store_->findLowStock(level, pageSize, offset);
    }

    domain::LedgerPage getLedger(const domain::LedgerQuery& query) override {
        validatePage(query.page, query.pageSize);
        if (query.from && query.to && *query.to < *query.from) {
            throw std::invalid_argument("'from' must not be after 'to'");
        }
        return ledger_->query(query);
    }

    /**
     * @brief Проиграть журнал SKU и сравнить со счётчиками
     *
     * Каждая мутация увеличивает version на 1 и пишет ровно одну запись
     * журнала, поэтому снимку с версией V соответствуют первые V записей.
     * Так сверка не ломается от мутаций, идущих параллельно.
     */
    domain::ReconciliationReport reconcile(const std::string& skuId) override {
        requireSku(skuId);

        auto record = store_->getOrCreate(skuId);
        auto entries = ledger_->findBySku(skuId);

        domain::ReconciliationReport report;
        report.skuId = skuId;
        report.actualTotal = record.totalQuantity;
        report.actualReserved = record.reservedQuantity;

        for (const auto& entry : entries) {
            if (report.entryCount >= record.version) {
                break;
            }
            report.replayedTotal += entry.totalDelta;
            report.replayedReserved += entry.reservedDelta;
            ++report.entryCount;
        }

        if (!report.isConsistent() || report.entryCount != record.version) {
            std::cerr << "[InventoryService] Reconciliation mismatch for " << skuId
                      << ": ledger total=" << report.replayedTotal
                      << " reserved=" << report.replayedReserved
                      << " entries=" << report.entryCount
                      << ", counters total=" << report.actualTotal
                      << " reserved=" << report.actualReserved
                      << " version=" << record.version << std::endl;
        }
        return report;
    }

private:
    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<ports::output::ITransactionLedger> ledger_;
    std::shared_ptr<InventoryEventEmitter> events_;
    RetryPolicy retry_;

    static void requireSku(const std::string& skuId) {
        if (skuId.empty()) {
            throw std::invalid_argument("sku_id is required");
        }
    }

    static void validatePage(int page, int pageSize) {
        if (page < 1) {
            throw std::invalid_argument("page must be >= 1");
        }
        if (pageSize < 1 || pageSize > MAX_PAGE_SIZE) {
            throw std::invalid_argument(
                "page_size must be between 1 and " + std::to_string(MAX_PAGE_SIZE));
        }
    }
};

} // namespace inventory::application
