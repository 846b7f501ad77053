#pragma once

#include "adapters/secondary/persistence/InMemoryInventoryStore.hpp"
#include "adapters/secondary/persistence/InMemoryReservationRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTransactionLedger.hpp"
#include "application/InventoryEventEmitter.hpp"
#include "settings/ReservationSettings.hpp"
#include "settings/StorageSettings.hpp"
#include "settings/SweeperSettings.hpp"
#include "mocks/MockEventPublisher.hpp"
#include <memory>

namespace inventory::tests {

/**
 * @brief Полный набор in-memory зависимостей для тестов сервисов
 */
struct InMemoryInventoryStack {
    std::shared_ptr<settings::StorageSettings> storageSettings =
        std::make_shared<settings::StorageSettings>();
    std::shared_ptr<settings::ReservationSettings> reservationSettings =
        std::make_shared<settings::ReservationSettings>();
    std::shared_ptr<settings::SweeperSettings> sweeperSettings =
        std::make_shared<settings::SweeperSettings>();

    std::shared_ptr<adapters::secondary::InMemoryTransactionLedger> ledger =
        std::make_shared<adapters::secondary::InMemoryTransactionLedger>();
    std::shared_ptr<adapters::secondary::InMemoryReservationRepository> reservations =
        std::make_shared<adapters::secondary::InMemoryReservationRepository>();
    std::shared_ptr<adapters::secondary::InMemoryInventoryStore> store =
        std::make_shared<adapters::secondary::InMemoryInventoryStore>(
            ledger, reservations, storageSettings);

    std::shared_ptr<MockEventPublisher> publisher = std::make_shared<MockEventPublisher>();
    std::shared_ptr<application::InventoryEventEmitter> events =
        std::make_shared<application::InventoryEventEmitter>(publisher);

    /**
     * @brief Завести остаток через RESTOCK (с записью в журнал)
     */
    domain::StockRecord restock(const std::string& skuId, int64_t quantity) {
        domain::StockMutation m;
        m.skuId = skuId;
        m.totalDelta = quantity;
        m.kind = domain::LedgerEntryKind::RESTOCK;
        m.operatorId = "test";
        m.reason = "initial stock";
        return store->mutate(m);
    }

    int64_t available(const std::string& skuId) {
        return store->getOrCreate(skuId).availableQuantity();
    }
};

} // namespace inventory::tests
