/**
 * @file InMemoryReservationRepositoryTest.cpp
 * @brief Unit-тесты для InMemoryReservationRepository
 */

#include <gtest/gtest.h>

#include "adapters/secondary/persistence/InMemoryReservationRepository.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace inventory;
using namespace inventory::adapters::secondary;
using domain::ReservationStatus;

class InMemoryReservationRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_ = std::make_shared<InMemoryReservationRepository>();
    }

    domain::Reservation makeReservation(const std::string& id,
                                        const std::string& sku,
                                        const std::string& ref,
                                        domain::Timestamp expiresAt = domain::Timestamp::now().plus(std::chrono::minutes(30))) {
        domain::Reservation r;
        r.id = id;
        r.skuId = sku;
        r.kind = domain::ReservationKind::CART;
        r.referenceId = ref;
        r.quantity = 2;
        r.expiresAt = expiresAt;
        return r;
    }

    std::shared_ptr<InMemoryReservationRepository> repo_;
};

TEST_F(InMemoryReservationRepositoryTest, Insert_DuplicateActiveKey_ReturnsFalse) {
    EXPECT_TRUE(repo_->insert(makeReservation("r1", "S1", "cart-1")));
    EXPECT_FALSE(repo_->insert(makeReservation("r2", "S1", "cart-1")));
    EXPECT_EQ(repo_->size(), 1u);
}

TEST_F(InMemoryReservationRepositoryTest, Insert_SameKeyDifferentKind_Allowed) {
    auto order = makeReservation("r2", "S1", "cart-1");
    order.kind = domain::ReservationKind::ORDER;

    EXPECT_TRUE(repo_->insert(makeReservation("r1", "S1", "cart-1")));
    EXPECT_TRUE(repo_->insert(order));
}

TEST_F(InMemoryReservationRepositoryTest, Insert_AfterRelease_KeyIsFreeAgain) {
    ASSERT_TRUE(repo_->insert(makeReservation("r1", "S1", "cart-1")));
    ASSERT_TRUE(repo_->compareAndSetStatus("r1", ReservationStatus::ACTIVE, ReservationStatus::RELEASED));

    EXPECT_TRUE(repo_->insert(makeReservation("r2", "S1", "cart-1")));
    EXPECT_EQ(repo_->findActive("S1", domain::ReservationKind::CART, "cart-1")->id, "r2");
}

TEST_F(InMemoryReservationRepositoryTest, InsertBatch_ConflictInsertsNothing) {
    ASSERT_TRUE(repo_->insert(makeReservation("r1", "B", "cart-1")));

    bool inserted = repo_->insertBatch({
        makeReservation("r2", "A", "cart-1"),
        makeReservation("r3", "B", "cart-1")
    });

    EXPECT_FALSE(inserted);
    EXPECT_FALSE(repo_->findById("r2").has_value());
    EXPECT_EQ(repo_->size(), 1u);
}

TEST_F(InMemoryReservationRepositoryTest, FindByReference_ReturnsAllStatuses) {
    repo_->insert(makeReservation("r1", "A", "cart-1"));
    repo_->insert(makeReservation("r2", "B", "cart-1"));
    repo_->insert(makeReservation("r3", "A", "cart-2"));
    repo_->compareAndSetStatus("r2", ReservationStatus::ACTIVE, ReservationStatus::CONSUMED);

    auto found = repo_->findByReference("cart-1");

    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].skuId, "A");
    EXPECT_EQ(found[1].status, ReservationStatus::CONSUMED);
}

TEST_F(InMemoryReservationRepositoryTest, CompareAndSet_WrongExpected_ReturnsFalse) {
    repo_->insert(makeReservation("r1", "S1", "cart-1"));

    EXPECT_FALSE(repo_->compareAndSetStatus("r1", ReservationStatus::EXPIRED, ReservationStatus::RELEASED));
    EXPECT_FALSE(repo_->compareAndSetStatus("missing", ReservationStatus::ACTIVE, ReservationStatus::RELEASED));
    EXPECT_EQ(repo_->findById("r1")->status, ReservationStatus::ACTIVE);
}

TEST_F(InMemoryReservationRepositoryTest, CompareAndSet_ConcurrentTransitions_SingleWinner) {
    repo_->insert(makeReservation("r1", "S1", "cart-1"));

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    const ReservationStatus targets[] = {
        ReservationStatus::CONSUMED, ReservationStatus::EXPIRED, ReservationStatus::RELEASED
    };
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&, i]() {
            if (repo_->compareAndSetStatus("r1", ReservationStatus::ACTIVE, targets[i % 3])) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners, 1);
    EXPECT_NE(repo_->findById("r1")->status, ReservationStatus::ACTIVE);
}

TEST_F(InMemoryReservationRepositoryTest, UpdateExpiry_OnlyWhileActive) {
    repo_->insert(makeReservation("r1", "S1", "cart-1"));
    auto later = domain::Timestamp::now().plus(std::chrono::hours(2));

    EXPECT_TRUE(repo_->updateExpiry("r1", later));
    EXPECT_EQ(repo_->findById("r1")->expiresAt, later);

    repo_->compareAndSetStatus("r1", ReservationStatus::ACTIVE, ReservationStatus::RELEASED);
    EXPECT_FALSE(repo_->updateExpiry("r1", later.plus(std::chrono::hours(1))));
    EXPECT_FALSE(repo_->updateExpiry("missing", later));
}

TEST_F(InMemoryReservationRepositoryTest, FindExpired_OldestFirstWithLimit) {
    auto now = domain::Timestamp::now();
    repo_->insert(makeReservation("late", "A", "c1", now.plus(std::chrono::seconds(-10))));
    repo_->insert(makeReservation("early", "B", "c2", now.plus(std::chrono::seconds(-60))));
    repo_->insert(makeReservation("fresh", "C", "c3", now.plus(std::chrono::seconds(60))));
    repo_->insert(makeReservation("gone", "D", "c4", now.plus(std::chrono::seconds(-120))));
    repo_->compareAndSetStatus("gone", ReservationStatus::ACTIVE, ReservationStatus::CONSUMED);

    auto expired = repo_->findExpired(now, 10);
    ASSERT_EQ(expired.size(), 2u);
    EXPECT_EQ(expired[0].id, "early");
    EXPECT_EQ(expired[1].id, "late");

    auto limited = repo_->findExpired(now, 1);
    ASSERT_EQ(limited.size(), 1u);
    EXPECT_EQ(limited[0].id, "early");
}
