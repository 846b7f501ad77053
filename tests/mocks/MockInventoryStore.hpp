#pragma once

#include "ports/output/IInventoryStore.hpp"
#include <gmock/gmock.h>

namespace inventory::tests {

/**
 * @brief gmock IInventoryStore для тестов декоратора
 */
class MockInventoryStore : public ports::output::IInventoryStore {
public:
    MOCK_METHOD(domain::StockRecord, getOrCreate, (const std::string&), (override));
    MOCK_METHOD(std::optional<domain::StockRecord>, find, (const std::string&), (override));
    MOCK_METHOD(std::vector<domain::StockRecord>, findBatch, (const std::vector<std::string>&), (override));
    MOCK_METHOD(domain::StockRecord, mutate, (const domain::StockMutation&), (override));
    MOCK_METHOD(std::vector<domain::StockRecord>, batchMutate,
                (const std::vector<domain::StockMutation>&), (override));
    MOCK_METHOD(domain::SettlementResult, settle, (const domain::ReservationSettlement&), (override));
    MOCK_METHOD(domain::StockRecord, updateThresholds, (const std::string&, int64_t, int64_t), (override));
    MOCK_METHOD(std::vector<domain::StockRecord>, findLowStock, (domain::StockLevel, int, int64_t), (override));
};

} // namespace inventory::tests
