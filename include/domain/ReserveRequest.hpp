#pragma once

#include "ReservationItem.hpp"
#include "enums/ReservationKind.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace inventory::domain {

/**
 * @brief Запрос на резервирование набора позиций
 *
 * ttl не задан - используется значение по умолчанию для kind
 * (ReservationSettings: CART 30 мин, ORDER 60 мин).
 */
struct ReserveRequest {
    std::vector<ReservationItem> items;
    ReservationKind kind = ReservationKind::CART;
    std::string referenceId;
    std::optional<std::chrono::milliseconds> ttl;
};

} // namespace inventory::domain
