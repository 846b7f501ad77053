#pragma once

#include <string>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Сверка счётчиков SKU с журналом
 */
struct ReconciliationReport {
    std::string skuId;
    int64_t entryCount = 0;
    int64_t replayedTotal = 0;
    int64_t replayedReserved = 0;
    int64_t actualTotal = 0;
    int64_t actualReserved = 0;

    bool isConsistent() const {
        return replayedTotal == actualTotal && replayedReserved == actualReserved;
    }
};

} // namespace inventory::domain
