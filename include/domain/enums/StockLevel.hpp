#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Уровень для выборки "заканчивающихся" SKU
 *
 * WARNING  - available <= warning_threshold
 * CRITICAL - available <= critical_threshold
 * OUT      - available <= 0
 */
enum class StockLevel {
    WARNING,
    CRITICAL,
    OUT
};

inline std::string toString(StockLevel level) {
    switch (level) {
        case StockLevel::WARNING: return "warning";
        case StockLevel::CRITICAL: return "critical";
        case StockLevel::OUT: return "out";
        default: return "unknown";
    }
}

inline StockLevel parseStockLevel(const std::string& str) {
    if (str == "warning" || str == "low") return StockLevel::WARNING;
    if (str == "critical") return StockLevel::CRITICAL;
    if (str == "out") return StockLevel::OUT;
    throw std::invalid_argument("Unknown stock level: " + str);
}

} // namespace inventory::domain
