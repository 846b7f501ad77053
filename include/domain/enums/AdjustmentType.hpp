#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Тип ручной корректировки остатка
 *
 * - INCREASE: поступление, total += quantity
 * - DECREASE: списание, total -= quantity (только из свободного остатка)
 * - SET: инвентаризация, total = quantity (резервы сохраняются)
 */
enum class AdjustmentType {
    INCREASE,
    DECREASE,
    SET
};

inline std::string toString(AdjustmentType type) {
    switch (type) {
        case AdjustmentType::INCREASE: return "INCREASE";
        case AdjustmentType::DECREASE: return "DECREASE";
        case AdjustmentType::SET: return "SET";
        default: return "UNKNOWN";
    }
}

inline AdjustmentType parseAdjustmentType(const std::string& str) {
    if (str == "INCREASE" || str == "increase") return AdjustmentType::INCREASE;
    if (str == "DECREASE" || str == "decrease") return AdjustmentType::DECREASE;
    if (str == "SET" || str == "set") return AdjustmentType::SET;
    throw std::invalid_argument("Unknown adjustment type: " + str);
}

} // namespace inventory::domain
