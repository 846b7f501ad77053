#pragma once

#include "enums/AdjustmentType.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Ручная корректировка остатка (администратор)
 */
struct AdjustmentRequest {
    std::string skuId;
    AdjustmentType type = AdjustmentType::INCREASE;
    int64_t quantity = 0;
    std::optional<int64_t> expectedVersion;
    std::string reason;
    std::string operatorId;
};

} // namespace inventory::domain
