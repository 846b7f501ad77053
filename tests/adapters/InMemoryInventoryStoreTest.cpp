/**
 * @file InMemoryInventoryStoreTest.cpp
 * @brief Unit-тесты для InMemoryInventoryStore
 */

#include <gtest/gtest.h>

#include "adapters/secondary/persistence/InMemoryInventoryStore.hpp"
#include "adapters/secondary/persistence/InMemoryReservationRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTransactionLedger.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace inventory;
using namespace inventory::adapters::secondary;

class InMemoryInventoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::StorageSettings>();
        settings_->setLockTimeout(std::chrono::milliseconds(500));
        ledger_ = std::make_shared<InMemoryTransactionLedger>();
        reservations_ = std::make_shared<InMemoryReservationRepository>();
        store_ = std::make_shared<InMemoryInventoryStore>(ledger_, reservations_, settings_);
    }

    /**
     * @brief ACTIVE резерв вместе с удержанием в остатке, как после reserve()
     */
    domain::Reservation hold(const std::string& id, const std::string& sku, int64_t qty,
                             const std::string& ref) {
        store_->mutate(mutation(sku, qty, 0, domain::LedgerEntryKind::RESERVE));

        domain::Reservation r;
        r.id = id;
        r.skuId = sku;
        r.kind = domain::ReservationKind::ORDER;
        r.referenceId = ref;
        r.quantity = qty;
        r.status = domain::ReservationStatus::ACTIVE;
        r.expiresAt = domain::Timestamp::now().plus(std::chrono::minutes(30));
        EXPECT_TRUE(reservations_->insert(r));
        return r;
    }

    domain::ReservationSettlement settlement(std::vector<domain::Reservation> reservations,
                                             domain::ReservationStatus next,
                                             bool allOrNothing = false) {
        domain::ReservationSettlement s;
        s.reservations = std::move(reservations);
        s.next = next;
        s.allOrNothing = allOrNothing;
        s.reason = "test";
        return s;
    }

    domain::StockMutation mutation(const std::string& sku, int64_t reserveDelta, int64_t totalDelta,
                                   domain::LedgerEntryKind kind = domain::LedgerEntryKind::ADJUST) {
        domain::StockMutation m;
        m.skuId = sku;
        m.reserveDelta = reserveDelta;
        m.totalDelta = totalDelta;
        m.kind = kind;
        m.referenceId = "ref-1";
        return m;
    }

    std::shared_ptr<settings::StorageSettings> settings_;
    std::shared_ptr<InMemoryTransactionLedger> ledger_;
    std::shared_ptr<InMemoryReservationRepository> reservations_;
    std::shared_ptr<InMemoryInventoryStore> store_;
};

// ============================================================================
// getOrCreate / find
// ============================================================================

TEST_F(InMemoryInventoryStoreTest, GetOrCreate_NewSku_ReturnsZeroRecord) {
    auto record = store_->getOrCreate("S1");

    EXPECT_EQ(record.skuId, "S1");
    EXPECT_EQ(record.totalQuantity, 0);
    EXPECT_EQ(record.reservedQuantity, 0);
    EXPECT_EQ(record.availableQuantity(), 0);
    EXPECT_EQ(record.version, 0);
    EXPECT_EQ(record.warningThreshold, domain::StockRecord::DEFAULT_WARNING_THRESHOLD);
    EXPECT_EQ(record.criticalThreshold, domain::StockRecord::DEFAULT_CRITICAL_THRESHOLD);
}

TEST_F(InMemoryInventoryStoreTest, Find_UnknownSku_ReturnsNullopt) {
    EXPECT_FALSE(store_->find("missing").has_value());
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(InMemoryInventoryStoreTest, FindBatch_SkipsUnknown) {
    store_->mutate(mutation("S1", 0, 5));
    store_->mutate(mutation("S3", 0, 7));

    auto records = store_->findBatch({"S1", "S2", "S3"});

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].skuId, "S1");
    EXPECT_EQ(records[1].skuId, "S3");
}

// ============================================================================
// mutate
// ============================================================================

TEST_F(InMemoryInventoryStoreTest, Mutate_Reserve_UpdatesCountersAndVersion) {
    store_->mutate(mutation("S1", 0, 10, domain::LedgerEntryKind::RESTOCK));

    auto record = store_->mutate(mutation("S1", 6, 0, domain::LedgerEntryKind::RESERVE));

    EXPECT_EQ(record.totalQuantity, 10);
    EXPECT_EQ(record.reservedQuantity, 6);
    EXPECT_EQ(record.availableQuantity(), 4);
    EXPECT_EQ(record.version, 2);
}

TEST_F(InMemoryInventoryStoreTest, Mutate_WritesLedgerEntry) {
    store_->mutate(mutation("S1", 0, 10, domain::LedgerEntryKind::RESTOCK));
    store_->mutate(mutation("S1", 4, 0, domain::LedgerEntryKind::RESERVE));

    auto entries = ledger_->findBySku("S1");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].kind, domain::LedgerEntryKind::RESERVE);
    EXPECT_EQ(entries[1].quantityBefore, 10);
    EXPECT_EQ(entries[1].quantityAfter, 6);
    EXPECT_EQ(entries[1].quantityDelta, -4);
    EXPECT_EQ(entries[1].reservedDelta, 4);
    EXPECT_EQ(entries[1].totalDelta, 0);
    EXPECT_EQ(entries[1].reservedAfter, 4);
    EXPECT_EQ(entries[1].totalAfter, 10);
    EXPECT_EQ(entries[1].referenceId, "ref-1");
    EXPECT_LT(entries[0].id, entries[1].id);
}

TEST_F(InMemoryInventoryStoreTest, Mutate_ReserveMoreThanAvailable_ThrowsInsufficientStock) {
    store_->mutate(mutation("S1", 0, 3));

    try {
        store_->mutate(mutation("S1", 5, 0, domain::LedgerEntryKind::RESERVE));
        FAIL() << "Expected InsufficientStockException";
    } catch (const domain::InsufficientStockException& e) {
        EXPECT_EQ(e.skuId(), "S1");
        EXPECT_EQ(e.requested(), 5);
        EXPECT_EQ(e.available(), 3);
    }

    // Ничего не изменилось, в журнале только пополнение
    auto record = store_->getOrCreate("S1");
    EXPECT_EQ(record.reservedQuantity, 0);
    EXPECT_EQ(record.version, 1);
    EXPECT_EQ(ledger_->size(), 1u);
}

TEST_F(InMemoryInventoryStoreTest, Mutate_NegativeTotal_ThrowsInvalidAdjustment) {
    EXPECT_THROW(store_->mutate(mutation("S1", 0, -1)), domain::InvalidAdjustmentException);
}

TEST_F(InMemoryInventoryStoreTest, Mutate_NegativeReserved_ThrowsInvalidAdjustment) {
    store_->mutate(mutation("S1", 0, 5));
    EXPECT_THROW(store_->mutate(mutation("S1", -1, 0)), domain::InvalidAdjustmentException);
}

TEST_F(InMemoryInventoryStoreTest, Mutate_TotalBelowReserved_ThrowsInvalidAdjustment) {
    store_->mutate(mutation("S1", 0, 10));
    store_->mutate(mutation("S1", 8, 0));

    EXPECT_THROW(store_->mutate(mutation("S1", 0, -5)), domain::InvalidAdjustmentException);
    EXPECT_EQ(store_->getOrCreate("S1").totalQuantity, 10);
}

TEST_F(InMemoryInventoryStoreTest, Mutate_VersionMismatch_ThrowsConcurrentModification) {
    store_->mutate(mutation("S1", 0, 10));

    auto m = mutation("S1", 0, 5);
    m.expectedVersion = 0;

    EXPECT_THROW(store_->mutate(m), domain::ConcurrentModificationException);

    m.expectedVersion = 1;
    EXPECT_EQ(store_->mutate(m).totalQuantity, 15);
}

TEST_F(InMemoryInventoryStoreTest, Mutate_NeverOversells_UnderContention) {
    store_->mutate(mutation("S1", 0, 50));

    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < 10; ++j) {
                try {
                    store_->mutate(mutation("S1", 1, 0, domain::LedgerEntryKind::RESERVE));
                    ++succeeded;
                } catch (const domain::InsufficientStockException&) {
                    ++rejected;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded, 50);
    EXPECT_EQ(rejected, 110);
    auto record = store_->getOrCreate("S1");
    EXPECT_EQ(record.reservedQuantity, 50);
    EXPECT_EQ(record.availableQuantity(), 0);
}

// ============================================================================
// batchMutate
// ============================================================================

TEST_F(InMemoryInventoryStoreTest, BatchMutate_AllOrNothing) {
    store_->mutate(mutation("A", 0, 5));
    store_->mutate(mutation("B", 0, 1));

    std::vector<domain::StockMutation> batch = {
        mutation("A", 3, 0, domain::LedgerEntryKind::RESERVE),
        mutation("B", 2, 0, domain::LedgerEntryKind::RESERVE)
    };

    try {
        store_->batchMutate(batch);
        FAIL() << "Expected InsufficientStockException";
    } catch (const domain::InsufficientStockException& e) {
        EXPECT_EQ(e.skuId(), "B");
        EXPECT_EQ(e.available(), 1);
    }

    EXPECT_EQ(store_->getOrCreate("A").reservedQuantity, 0);
    EXPECT_EQ(store_->getOrCreate("B").reservedQuantity, 0);
    EXPECT_EQ(ledger_->size(), 2u);
}

TEST_F(InMemoryInventoryStoreTest, BatchMutate_ReturnsRecordsInInputOrder) {
    store_->mutate(mutation("A", 0, 5));
    store_->mutate(mutation("B", 0, 5));

    auto records = store_->batchMutate({
        mutation("B", 2, 0, domain::LedgerEntryKind::RESERVE),
        mutation("A", 1, 0, domain::LedgerEntryKind::RESERVE)
    });

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].skuId, "B");
    EXPECT_EQ(records[0].reservedQuantity, 2);
    EXPECT_EQ(records[1].skuId, "A");
    EXPECT_EQ(records[1].reservedQuantity, 1);
}

TEST_F(InMemoryInventoryStoreTest, BatchMutate_DuplicateSku_ThrowsInvalidAdjustment) {
    EXPECT_THROW(
        store_->batchMutate({mutation("A", 0, 1), mutation("A", 0, 1)}),
        domain::InvalidAdjustmentException);
}

TEST_F(InMemoryInventoryStoreTest, BatchMutate_OppositeOrders_NoDeadlock) {
    store_->mutate(mutation("A", 0, 1000));
    store_->mutate(mutation("B", 0, 1000));

    auto worker = [&](bool reversed) {
        for (int i = 0; i < 100; ++i) {
            std::vector<domain::StockMutation> batch = {
                mutation("A", 1, 0), mutation("B", 1, 0)
            };
            if (reversed) {
                std::swap(batch[0], batch[1]);
            }
            store_->batchMutate(batch);
        }
    };

    std::thread t1(worker, false);
    std::thread t2(worker, true);
    t1.join();
    t2.join();

    EXPECT_EQ(store_->getOrCreate("A").reservedQuantity, 200);
    EXPECT_EQ(store_->getOrCreate("B").reservedQuantity, 200);
}

// ============================================================================
// Пороги и low-stock
// ============================================================================

TEST_F(InMemoryInventoryStoreTest, UpdateThresholds_DoesNotChangeVersion) {
    store_->mutate(mutation("S1", 0, 10));

    auto record = store_->updateThresholds("S1", 20, 3);

    EXPECT_EQ(record.warningThreshold, 20);
    EXPECT_EQ(record.criticalThreshold, 3);
    EXPECT_EQ(record.version, 1);
}

TEST_F(InMemoryInventoryStoreTest, UpdateThresholds_CriticalAboveWarning_Throws) {
    EXPECT_THROW(store_->updateThresholds("S1", 3, 5), domain::InvalidAdjustmentException);
    EXPECT_THROW(store_->updateThresholds("S1", -1, 0), domain::InvalidAdjustmentException);
}

TEST_F(InMemoryInventoryStoreTest, FindLowStock_FiltersAndSortsByAvailable) {
    store_->mutate(mutation("HIGH", 0, 100));
    store_->mutate(mutation("WARN", 0, 8));
    store_->mutate(mutation("CRIT", 0, 4));
    store_->getOrCreate("OUT");

    auto warning = store_->findLowStock(domain::StockLevel::WARNING, 10, 0);
    ASSERT_EQ(warning.size(), 3u);
    EXPECT_EQ(warning[0].skuId, "OUT");
    EXPECT_EQ(warning[1].skuId, "CRIT");
    EXPECT_EQ(warning[2].skuId, "WARN");

    auto critical = store_->findLowStock(domain::StockLevel::CRITICAL, 10, 0);
    EXPECT_EQ(critical.size(), 2u);

    auto out = store_->findLowStock(domain::StockLevel::OUT, 10, 0);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].skuId, "OUT");

    auto secondPage = store_->findLowStock(domain::StockLevel::WARNING, 2, 2);
    ASSERT_EQ(secondPage.size(), 1u);
    EXPECT_EQ(secondPage[0].skuId, "WARN");
}

// ============================================================================
// settle
// ============================================================================

TEST_F(InMemoryInventoryStoreTest, Settle_Consume_ChangesStatusAndCountersTogether) {
    store_->mutate(mutation("A", 0, 10, domain::LedgerEntryKind::RESTOCK));
    store_->mutate(mutation("B", 0, 10, domain::LedgerEntryKind::RESTOCK));
    auto a = hold("rsv-a", "A", 4, "order-1");
    auto b = hold("rsv-b", "B", 2, "order-1");

    auto result = store_->settle(settlement({a, b}, domain::ReservationStatus::CONSUMED));

    ASSERT_EQ(result.settled.size(), 2u);
    EXPECT_TRUE(result.lost.empty());
    ASSERT_EQ(result.records.size(), 2u);

    auto recordA = store_->getOrCreate("A");
    EXPECT_EQ(recordA.totalQuantity, 6);
    EXPECT_EQ(recordA.reservedQuantity, 0);
    EXPECT_EQ(reservations_->findById("rsv-a")->status, domain::ReservationStatus::CONSUMED);
    EXPECT_EQ(reservations_->findById("rsv-b")->status, domain::ReservationStatus::CONSUMED);

    auto entries = ledger_->findBySku("A");
    EXPECT_EQ(entries.back().kind, domain::LedgerEntryKind::DEDUCT);
    EXPECT_EQ(entries.back().totalDelta, -4);
}

TEST_F(InMemoryInventoryStoreTest, Settle_Release_ReturnsHoldAndFreesKey) {
    store_->mutate(mutation("A", 0, 10, domain::LedgerEntryKind::RESTOCK));
    auto a = hold("rsv-a", "A", 4, "cart-1");

    auto result = store_->settle(settlement({a}, domain::ReservationStatus::RELEASED));

    ASSERT_EQ(result.settled.size(), 1u);
    EXPECT_EQ(result.settled[0].status, domain::ReservationStatus::RELEASED);
    EXPECT_EQ(store_->getOrCreate("A").availableQuantity(), 10);
    EXPECT_FALSE(reservations_->findActive("A", domain::ReservationKind::ORDER, "cart-1").has_value());
    EXPECT_EQ(ledger_->findBySku("A").back().kind, domain::LedgerEntryKind::RELEASE);
}

TEST_F(InMemoryInventoryStoreTest, Settle_AlreadyTerminal_ReportedAsLost) {
    store_->mutate(mutation("A", 0, 10, domain::LedgerEntryKind::RESTOCK));
    auto a = hold("rsv-a", "A", 4, "order-1");
    store_->settle(settlement({a}, domain::ReservationStatus::EXPIRED));
    auto before = store_->getOrCreate("A");

    auto result = store_->settle(settlement({a}, domain::ReservationStatus::CONSUMED));

    EXPECT_TRUE(result.settled.empty());
    ASSERT_EQ(result.lost.size(), 1u);
    EXPECT_EQ(result.lost[0].status, domain::ReservationStatus::EXPIRED);
    EXPECT_TRUE(result.records.empty());
    EXPECT_EQ(store_->getOrCreate("A").version, before.version);
}

TEST_F(InMemoryInventoryStoreTest, Settle_AllOrNothing_OneLost_ChangesNothing) {
    store_->mutate(mutation("A", 0, 10, domain::LedgerEntryKind::RESTOCK));
    store_->mutate(mutation("B", 0, 10, domain::LedgerEntryKind::RESTOCK));
    auto a = hold("rsv-a", "A", 4, "order-1");
    auto b = hold("rsv-b", "B", 2, "order-1");
    store_->settle(settlement({b}, domain::ReservationStatus::EXPIRED));
    auto ledgerSize = ledger_->size();

    auto result = store_->settle(settlement({a, b}, domain::ReservationStatus::CONSUMED, true));

    EXPECT_TRUE(result.settled.empty());
    ASSERT_EQ(result.lost.size(), 1u);
    EXPECT_EQ(result.lost[0].id, "rsv-b");
    EXPECT_EQ(reservations_->findById("rsv-a")->status, domain::ReservationStatus::ACTIVE);
    EXPECT_EQ(store_->getOrCreate("A").totalQuantity, 10);
    EXPECT_EQ(store_->getOrCreate("A").reservedQuantity, 4);
    EXPECT_EQ(ledger_->size(), ledgerSize);
}

TEST_F(InMemoryInventoryStoreTest, Settle_InvalidMutation_LeavesReservationActive) {
    store_->mutate(mutation("A", 0, 10, domain::LedgerEntryKind::RESTOCK));
    auto a = hold("rsv-a", "A", 4, "order-1");
    // Второй резерв без удержания в остатке: снять оба нельзя, reserved ушёл бы в минус
    auto ghost = a;
    ghost.id = "rsv-ghost";
    ghost.referenceId = "order-2";
    ASSERT_TRUE(reservations_->insert(ghost));

    EXPECT_THROW(store_->settle(settlement({a, ghost}, domain::ReservationStatus::RELEASED)),
                 domain::InvalidAdjustmentException);

    EXPECT_EQ(reservations_->findById("rsv-a")->status, domain::ReservationStatus::ACTIVE);
    EXPECT_EQ(reservations_->findById("rsv-ghost")->status, domain::ReservationStatus::ACTIVE);
    EXPECT_EQ(store_->getOrCreate("A").reservedQuantity, 4);
}

TEST_F(InMemoryInventoryStoreTest, Settle_ActiveTargetOrDuplicate_Throws) {
    store_->mutate(mutation("A", 0, 10, domain::LedgerEntryKind::RESTOCK));
    auto a = hold("rsv-a", "A", 4, "order-1");

    EXPECT_THROW(store_->settle(settlement({a}, domain::ReservationStatus::ACTIVE)),
                 std::invalid_argument);
    EXPECT_THROW(store_->settle(settlement({a, a}, domain::ReservationStatus::RELEASED)),
                 std::invalid_argument);
    EXPECT_EQ(reservations_->findById("rsv-a")->status, domain::ReservationStatus::ACTIVE);
}

TEST_F(InMemoryInventoryStoreTest, Settle_ConcurrentSameReservation_SettledOnce) {
    store_->mutate(mutation("A", 0, 10, domain::LedgerEntryKind::RESTOCK));
    auto a = hold("rsv-a", "A", 4, "order-1");

    std::atomic<int> wins{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            auto next = (i % 2 == 0) ? domain::ReservationStatus::CONSUMED
                                     : domain::ReservationStatus::EXPIRED;
            if (!store_->settle(settlement({a}, next)).settled.empty()) {
                ++wins;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(wins, 1);
    auto record = store_->getOrCreate("A");
    EXPECT_EQ(record.reservedQuantity, 0);
    auto status = reservations_->findById("rsv-a")->status;
    EXPECT_EQ(record.totalQuantity, status == domain::ReservationStatus::CONSUMED ? 6 : 10);
}
