/**
 * @file RetryPolicyTest.cpp
 * @brief Unit-тесты для RetryPolicy
 */

#include <gtest/gtest.h>
#include "application/RetryPolicy.hpp"

#include <stdexcept>

using namespace inventory;
using namespace inventory::application;

TEST(RetryPolicyTest, Execute_SuccessOnFirstAttempt) {
    RetryPolicy policy(3, std::chrono::milliseconds(1));
    int calls = 0;

    int result = policy.execute("op", [&] { ++calls; return 42; });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, Execute_RetriesConcurrentModification) {
    RetryPolicy policy(3, std::chrono::milliseconds(1));
    int calls = 0;

    int result = policy.execute("op", [&] {
        if (++calls < 3) {
            throw domain::ConcurrentModificationException("busy");
        }
        return calls;
    });

    EXPECT_EQ(result, 3);
}

TEST(RetryPolicyTest, Execute_GivesUpAfterMaxAttempts) {
    RetryPolicy policy(2, std::chrono::milliseconds(1));
    int calls = 0;

    EXPECT_THROW(policy.execute("op", [&]() -> int {
        ++calls;
        throw domain::ConcurrentModificationException("busy");
    }), domain::ConcurrentModificationException);

    EXPECT_EQ(calls, 2);
}

TEST(RetryPolicyTest, Execute_OtherErrorsNotRetried) {
    RetryPolicy policy(5, std::chrono::milliseconds(1));
    int calls = 0;

    EXPECT_THROW(policy.execute("op", [&]() -> int {
        ++calls;
        throw domain::InsufficientStockException("S1", 5, 1);
    }), domain::InsufficientStockException);
    EXPECT_EQ(calls, 1);

    EXPECT_THROW(policy.execute("op", [&]() -> int {
        ++calls;
        throw std::invalid_argument("bad");
    }), std::invalid_argument);
    EXPECT_EQ(calls, 2);
}

TEST(RetryPolicyTest, Constructor_AtLeastOneAttempt) {
    RetryPolicy policy(0, std::chrono::milliseconds(1));
    EXPECT_EQ(policy.getMaxAttempts(), 1);
}
