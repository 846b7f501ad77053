#pragma once

#include "domain/StockRecord.hpp"
#include "domain/StockMutation.hpp"
#include "domain/ReservationSettlement.hpp"
#include "domain/enums/StockLevel.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace inventory::ports::output {

/**
 * @brief Авторитетное хранилище остатков по SKU
 *
 * Единственный владелец StockRecord. Любое изменение счётчиков идёт
 * через mutate()/batchMutate(), каждая успешная мутация пишет
 * LedgerEntry в той же атомарной единице.
 *
 * Ошибки (исключения из domain/InventoryException.hpp):
 * - InsufficientStockException: reserveDelta > 0 не помещается в available
 * - InvalidAdjustmentException: total/reserved ушли бы за допустимые границы
 * - ConcurrentModificationException: не совпала версия или истёк таймаут блокировки
 * - StorageUnavailableException: хранилище недоступно
 *
 * @example
 * ```cpp
 * domain::StockMutation m;
 * m.skuId = "S1";
 * m.reserveDelta = 5;
 * m.kind = domain::LedgerEntryKind::RESERVE;
 * m.referenceId = "cart-42";
 * auto record = store->mutate(m);   // reserved += 5
 * ```
 */
class IInventoryStore {
public:
    virtual ~IInventoryStore() = default;

    /**
     * @brief Получить запись или создать пустую (все количества 0)
     */
    virtual domain::StockRecord getOrCreate(const std::string& skuId) = 0;

    /**
     * @brief Найти запись без создания
     */
    virtual std::optional<domain::StockRecord> find(const std::string& skuId) = 0;

    /**
     * @brief Пакетное чтение, отсутствующие SKU пропускаются
     */
    virtual std::vector<domain::StockRecord> findBatch(const std::vector<std::string>& skuIds) = 0;

    /**
     * @brief Атомарно применить дельты к одному SKU
     * @return Запись после изменения (version увеличена на 1)
     */
    virtual domain::StockRecord mutate(const domain::StockMutation& mutation) = 0;

    /**
     * @brief Атомарно применить несколько мутаций (всё или ничего)
     *
     * SKU блокируются в порядке возрастания skuId независимо от порядка
     * во входном списке. Повтор SKU в одном пакете - InvalidAdjustment.
     *
     * @return Записи после изменения в порядке входного списка
     */
    virtual std::vector<domain::StockRecord> batchMutate(
        const std::vector<domain::StockMutation>& mutations) = 0;

    /**
     * @brief Закрыть резервы и снять их удержание в одной атомарной единице
     *
     * Под блокировками SKU (по возрастанию skuId) каждый резерв переводится
     * ACTIVE -> settlement.next, затем для переведённых применяются
     * мутации (по одной на SKU). Любое исключение означает, что не изменилось
     * ничего: резервы остались ACTIVE, счётчики прежние, повтор безопасен.
     *
     * Переходы из ACTIVE в конечный статус делаются только здесь, поэтому
     * статус резерва и счётчики его SKU никогда не расходятся.
     */
    virtual domain::SettlementResult settle(const domain::ReservationSettlement& settlement) = 0;

    /**
     * @brief Обновить пороги предупреждения
     *
     * Требует 0 <= critical <= warning, иначе InvalidAdjustment.
     */
    virtual domain::StockRecord updateThresholds(
        const std::string& skuId,
        int64_t warningThreshold,
        int64_t criticalThreshold) = 0;

    /**
     * @brief SKU, у которых available не выше порога уровня
     *
     * Сортировка по available по возрастанию, затем по skuId.
     */
    virtual std::vector<domain::StockRecord> findLowStock(
        domain::StockLevel level,
        int limit,
        int64_t offset) = 0;
};

} // namespace inventory::ports::output
