#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Кто держит резерв: корзина или заказ
 */
enum class ReservationKind {
    CART,
    ORDER
};

inline std::string toString(ReservationKind kind) {
    switch (kind) {
        case ReservationKind::CART: return "CART";
        case ReservationKind::ORDER: return "ORDER";
        default: return "UNKNOWN";
    }
}

inline ReservationKind parseReservationKind(const std::string& str) {
    if (str == "CART" || str == "cart") return ReservationKind::CART;
    if (str == "ORDER" || str == "order") return ReservationKind::ORDER;
    throw std::invalid_argument("Unknown reservation kind: " + str);
}

} // namespace inventory::domain
