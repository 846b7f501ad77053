/**
 * @file StockRulesTest.cpp
 * @brief Unit-тесты правил изменения счётчиков и Timestamp
 */

#include <gtest/gtest.h>
#include "domain/StockRules.hpp"
#include "domain/Timestamp.hpp"

using namespace inventory;
using namespace inventory::domain;

namespace {

StockRecord record(int64_t total, int64_t reserved, int64_t version = 0) {
    StockRecord r("S1");
    r.totalQuantity = total;
    r.reservedQuantity = reserved;
    r.version = version;
    return r;
}

StockMutation mutation(int64_t reserveDelta, int64_t totalDelta) {
    StockMutation m;
    m.skuId = "S1";
    m.reserveDelta = reserveDelta;
    m.totalDelta = totalDelta;
    return m;
}

} // namespace

TEST(StockRulesTest, ApplyMutation_ReserveAll_Allowed) {
    auto next = rules::applyMutation(record(5, 0, 2), mutation(5, 0));

    EXPECT_EQ(next.reservedQuantity, 5);
    EXPECT_EQ(next.availableQuantity(), 0);
    EXPECT_EQ(next.version, 3);
}

TEST(StockRulesTest, ApplyMutation_Deduct_LeavesAvailableUnchanged) {
    auto before = record(10, 4);
    auto after = rules::applyMutation(before, mutation(-4, -4));

    EXPECT_EQ(after.totalQuantity, 6);
    EXPECT_EQ(after.reservedQuantity, 0);
    EXPECT_EQ(after.availableQuantity(), before.availableQuantity());
}

TEST(StockRulesTest, ApplyMutation_ReserveWithShrinkingTotal_ReportsAvailable) {
    try {
        rules::applyMutation(record(10, 6), mutation(3, -2));
        FAIL() << "Expected InsufficientStockException";
    } catch (const InsufficientStockException& e) {
        EXPECT_EQ(e.requested(), 3);
        EXPECT_EQ(e.available(), 2);
    }
}

TEST(StockRulesTest, ApplyMutation_VersionCheckedFirst) {
    auto m = mutation(100, 0);
    m.expectedVersion = 7;

    EXPECT_THROW(rules::applyMutation(record(1, 0, 3), m), ConcurrentModificationException);
}

TEST(StockRulesTest, MakeLedgerEntry_DescribesAvailableChange) {
    auto before = record(10, 2);
    auto m = mutation(3, 0);
    m.kind = LedgerEntryKind::RESERVE;
    m.referenceId = "cart-1";
    auto after = rules::applyMutation(before, m);

    auto entry = rules::makeLedgerEntry(before, after, m);

    EXPECT_EQ(entry.quantityBefore, 8);
    EXPECT_EQ(entry.quantityAfter, 5);
    EXPECT_EQ(entry.quantityDelta, -3);
    EXPECT_EQ(entry.operatorId, "system");
    EXPECT_EQ(entry.createdAt, after.updatedAt);
}

TEST(StockRulesTest, MatchesLevel_Boundaries) {
    auto atWarning = record(10, 0);
    EXPECT_TRUE(rules::matchesLevel(atWarning, StockLevel::WARNING));
    EXPECT_FALSE(rules::matchesLevel(atWarning, StockLevel::CRITICAL));

    auto atCritical = record(5, 0);
    EXPECT_TRUE(rules::matchesLevel(atCritical, StockLevel::CRITICAL));
    EXPECT_FALSE(rules::matchesLevel(atCritical, StockLevel::OUT));

    auto empty = record(3, 3);
    EXPECT_TRUE(rules::matchesLevel(empty, StockLevel::OUT));
}

TEST(StockRulesTest, ValidateThresholds) {
    EXPECT_NO_THROW(rules::validateThresholds(10, 5));
    EXPECT_NO_THROW(rules::validateThresholds(0, 0));
    EXPECT_THROW(rules::validateThresholds(5, 10), InvalidAdjustmentException);
    EXPECT_THROW(rules::validateThresholds(5, -1), InvalidAdjustmentException);
}

TEST(TimestampTest, ParseAndFormat_MillisecondPrecision) {
    auto ts = Timestamp::fromString("2026-01-01T00:00:01.250Z");

    EXPECT_EQ(ts.toMillis(), 1767225601250);
    EXPECT_EQ(ts.toString(), "2026-01-01T00:00:01.250Z");
    EXPECT_EQ(Timestamp::fromString("2026-01-01T00:00:01Z").toMillis(), 1767225601000);
    EXPECT_THROW(Timestamp::fromString("not a date"), std::invalid_argument);
}
