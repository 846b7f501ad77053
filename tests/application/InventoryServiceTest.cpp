/**
 * @file InventoryServiceTest.cpp
 * @brief Unit-тесты для InventoryService
 */

#include <gtest/gtest.h>
#include "application/InventoryService.hpp"
#include "application/ReservationManager.hpp"
#include "mocks/InMemoryInventoryStack.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using namespace inventory;
using namespace inventory::application;
using namespace inventory::tests;

class InventoryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_shared<InventoryService>(
            stack_.store, stack_.ledger, stack_.reservationSettings, stack_.events);
        manager_ = std::make_shared<ReservationManager>(
            stack_.store, stack_.reservations, stack_.reservationSettings, stack_.events);
    }

    domain::AdjustmentRequest adjustment(const std::string& sku,
                                         domain::AdjustmentType type,
                                         int64_t quantity) {
        domain::AdjustmentRequest request;
        request.skuId = sku;
        request.type = type;
        request.quantity = quantity;
        request.reason = "stock count";
        request.operatorId = "admin-1";
        return request;
    }

    InMemoryInventoryStack stack_;
    std::shared_ptr<InventoryService> service_;
    std::shared_ptr<ReservationManager> manager_;
};

// ============================================================================
// Чтение
// ============================================================================

TEST_F(InventoryServiceTest, GetStock_UnknownSku_ReturnsZeroRecord) {
    auto record = service_->getStock("NEW");

    EXPECT_EQ(record.skuId, "NEW");
    EXPECT_EQ(record.totalQuantity, 0);
    EXPECT_TRUE(record.isOutOfStock());
    EXPECT_THROW(service_->getStock(""), std::invalid_argument);
}

TEST_F(InventoryServiceTest, GetStocks_DeduplicatesAndKeepsOrder) {
    stack_.restock("A", 5);
    stack_.restock("B", 7);

    auto records = service_->getStocks({"B", "X", "A", "B"});

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].skuId, "B");
    EXPECT_EQ(records[0].totalQuantity, 7);
    EXPECT_EQ(records[1].skuId, "X");
    EXPECT_EQ(records[1].totalQuantity, 0);
    EXPECT_EQ(records[2].skuId, "A");
    // Неизвестный SKU не создаётся
    EXPECT_FALSE(stack_.store->find("X").has_value());
}

TEST_F(InventoryServiceTest, GetStocks_Limits) {
    EXPECT_THROW(service_->getStocks({}), std::invalid_argument);

    std::vector<std::string> many;
    for (size_t i = 0; i <= InventoryService::MAX_BATCH_SKUS; ++i) {
        many.push_back("SKU-" + std::to_string(i));
    }
    EXPECT_THROW(service_->getStocks(many), std::invalid_argument);

    // Повторы не считаются в лимит
    std::vector<std::string> repeated(150, "SKU-1");
    EXPECT_EQ(service_->getStocks(repeated).size(), 1u);
}

// ============================================================================
// adjust
// ============================================================================

TEST_F(InventoryServiceTest, Adjust_Increase_WritesRestock) {
    auto record = service_->adjust(adjustment("A", domain::AdjustmentType::INCREASE, 20));

    EXPECT_EQ(record.totalQuantity, 20);
    EXPECT_EQ(record.version, 1);

    auto entries = stack_.ledger->findBySku("A");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].kind, domain::LedgerEntryKind::RESTOCK);
    EXPECT_EQ(entries[0].operatorId, "admin-1");
    EXPECT_EQ(entries[0].reason, "stock count");
    EXPECT_EQ(entries[0].quantityDelta, 20);
}

TEST_F(InventoryServiceTest, Adjust_Decrease_WritesAdjust) {
    stack_.restock("A", 20);

    auto record = service_->adjust(adjustment("A", domain::AdjustmentType::DECREASE, 5));

    EXPECT_EQ(record.totalQuantity, 15);
    EXPECT_EQ(stack_.ledger->findBySku("A").back().kind, domain::LedgerEntryKind::ADJUST);
}

TEST_F(InventoryServiceTest, Adjust_DecreaseBelowReserved_ThrowsInvalidAdjustment) {
    stack_.restock("A", 10);
    manager_->reserve("A", 8, domain::ReservationKind::CART, "cart-1", std::nullopt);

    EXPECT_THROW(service_->adjust(adjustment("A", domain::AdjustmentType::DECREASE, 5)),
                 domain::InvalidAdjustmentException);
    EXPECT_EQ(stack_.store->getOrCreate("A").totalQuantity, 10);
}

TEST_F(InventoryServiceTest, Adjust_Set_ComputesDelta) {
    stack_.restock("A", 10);

    auto record = service_->adjust(adjustment("A", domain::AdjustmentType::SET, 4));

    EXPECT_EQ(record.totalQuantity, 4);
    EXPECT_EQ(stack_.ledger->findBySku("A").back().totalDelta, -6);
}

TEST_F(InventoryServiceTest, Adjust_SetBelowReserved_ThrowsInvalidAdjustment) {
    stack_.restock("A", 10);
    manager_->reserve("A", 6, domain::ReservationKind::CART, "cart-1", std::nullopt);

    EXPECT_THROW(service_->adjust(adjustment("A", domain::AdjustmentType::SET, 5)),
                 domain::InvalidAdjustmentException);
}

TEST_F(InventoryServiceTest, Adjust_ExpectedVersion) {
    stack_.restock("A", 10);

    auto stale = adjustment("A", domain::AdjustmentType::INCREASE, 5);
    stale.expectedVersion = 0;
    EXPECT_THROW(service_->adjust(stale), domain::ConcurrentModificationException);

    auto current = adjustment("A", domain::AdjustmentType::INCREASE, 5);
    current.expectedVersion = 1;
    EXPECT_EQ(service_->adjust(current).totalQuantity, 15);

    auto staleSet = adjustment("A", domain::AdjustmentType::SET, 3);
    staleSet.expectedVersion = 1;
    EXPECT_THROW(service_->adjust(staleSet), domain::ConcurrentModificationException);
}

TEST_F(InventoryServiceTest, Adjust_InvalidQuantity_Throws) {
    EXPECT_THROW(service_->adjust(adjustment("A", domain::AdjustmentType::INCREASE, 0)),
                 domain::InvalidAdjustmentException);
    EXPECT_THROW(service_->adjust(adjustment("A", domain::AdjustmentType::DECREASE, -1)),
                 domain::InvalidAdjustmentException);
    EXPECT_NO_THROW(service_->adjust(adjustment("A", domain::AdjustmentType::SET, 0)));
}

TEST_F(InventoryServiceTest, Adjust_PublishesAdjustedAndLowStock) {
    stack_.restock("A", 20);

    service_->adjust(adjustment("A", domain::AdjustmentType::SET, 0));

    auto adjusted = stack_.publisher->getMessages("inventory.adjusted");
    ASSERT_EQ(adjusted.size(), 1u);
    auto json = nlohmann::json::parse(adjusted[0].message);
    EXPECT_EQ(json["sku_id"], "A");
    EXPECT_EQ(json["type"], "SET");
    EXPECT_EQ(json["operator_id"], "admin-1");

    auto low = stack_.publisher->getMessages("stock.low");
    ASSERT_EQ(low.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(low[0].message)["level"], "out");
}

// ============================================================================
// Пороги и low-stock
// ============================================================================

TEST_F(InventoryServiceTest, UpdateThresholds_ChangesLevel) {
    stack_.restock("A", 30);
    EXPECT_FALSE(service_->getStock("A").isLowStock());

    auto record = service_->updateThresholds("A", 50, 20);

    EXPECT_TRUE(record.isLowStock());
    EXPECT_FALSE(record.isCriticalStock());
    EXPECT_THROW(service_->updateThresholds("A", 5, 10), domain::InvalidAdjustmentException);
}

TEST_F(InventoryServiceTest, GetLowStock_Pagination) {
    for (int i = 0; i < 5; ++i) {
        stack_.restock("S" + std::to_string(i), i);
    }
    stack_.restock("PLENTY", 100);

    auto page1 = service_->getLowStock(domain::StockLevel::WARNING, 1, 2);
    auto page3 = service_->getLowStock(domain::StockLevel::WARNING, 3, 2);

    ASSERT_EQ(page1.size(), 2u);
    EXPECT_EQ(page1[0].skuId, "S0");
    EXPECT_EQ(page1[1].skuId, "S1");
    ASSERT_EQ(page3.size(), 1u);
    EXPECT_EQ(page3[0].skuId, "S4");

    EXPECT_THROW(service_->getLowStock(domain::StockLevel::WARNING, 0, 10), std::invalid_argument);
    EXPECT_THROW(service_->getLowStock(domain::StockLevel::WARNING, 1, 101), std::invalid_argument);
}

TEST_F(InventoryServiceTest, GetLowStock_FarPage_EmptyWithoutOverflow) {
    stack_.restock("S0", 0);

    // (page - 1) * pageSize не помещается в int
    auto page = service_->getLowStock(
        domain::StockLevel::WARNING, std::numeric_limits<int>::max(), 100);

    EXPECT_TRUE(page.empty());

    domain::LedgerQuery query;
    query.page = std::numeric_limits<int>::max();
    query.pageSize = 100;
    auto ledger = service_->getLedger(query);
    EXPECT_TRUE(ledger.entries.empty());
}

// ============================================================================
// Журнал и сверка
// ============================================================================

TEST_F(InventoryServiceTest, GetLedger_FiltersBySku) {
    stack_.restock("A", 10);
    stack_.restock("B", 10);
    manager_->reserve("A", 2, domain::ReservationKind::CART, "cart-1", std::nullopt);

    domain::LedgerQuery query;
    query.skuId = "A";
    auto page = service_->getLedger(query);

    EXPECT_EQ(page.total, 2);
    ASSERT_EQ(page.entries.size(), 2u);
    EXPECT_EQ(page.entries[0].kind, domain::LedgerEntryKind::RESERVE);
}

TEST_F(InventoryServiceTest, GetLedger_InvalidQuery_Throws) {
    domain::LedgerQuery badPage;
    badPage.pageSize = 0;
    EXPECT_THROW(service_->getLedger(badPage), std::invalid_argument);

    domain::LedgerQuery badRange;
    badRange.from = domain::Timestamp::fromMillis(2000);
    badRange.to = domain::Timestamp::fromMillis(1000);
    EXPECT_THROW(service_->getLedger(badRange), std::invalid_argument);
}

TEST_F(InventoryServiceTest, Reconcile_AfterMixedOperations_IsConsistent) {
    stack_.restock("A", 50);
    manager_->reserve("A", 5, domain::ReservationKind::CART, "cart-1", std::nullopt);
    manager_->reserve("A", 7, domain::ReservationKind::ORDER, "order-1", std::nullopt);
    manager_->release("cart-1", std::nullopt);
    service_->adjust(adjustment("A", domain::AdjustmentType::DECREASE, 3));
    service_->updateThresholds("A", 20, 10);

    auto report = service_->reconcile("A");

    EXPECT_TRUE(report.isConsistent());
    EXPECT_EQ(report.entryCount, 5);
    EXPECT_EQ(report.actualTotal, 47);
    EXPECT_EQ(report.actualReserved, 7);
    EXPECT_EQ(report.replayedTotal, 47);
    EXPECT_EQ(report.replayedReserved, 7);
}

TEST_F(InventoryServiceTest, Reconcile_UnknownSku_EmptyAndConsistent) {
    auto report = service_->reconcile("NEW");

    EXPECT_TRUE(report.isConsistent());
    EXPECT_EQ(report.entryCount, 0);
}
