#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Статус резерва
 *
 * ACTIVE - единственное начальное состояние.
 * CONSUMED, RELEASED, EXPIRED - терминальные, дальнейших переходов нет.
 */
enum class ReservationStatus {
    ACTIVE,
    CONSUMED,
    RELEASED,
    EXPIRED
};

inline std::string toString(ReservationStatus status) {
    switch (status) {
        case ReservationStatus::ACTIVE: return "ACTIVE";
        case ReservationStatus::CONSUMED: return "CONSUMED";
        case ReservationStatus::RELEASED: return "RELEASED";
        case ReservationStatus::EXPIRED: return "EXPIRED";
        default: return "UNKNOWN";
    }
}

inline ReservationStatus parseReservationStatus(const std::string& str) {
    if (str == "ACTIVE") return ReservationStatus::ACTIVE;
    if (str == "CONSUMED") return ReservationStatus::CONSUMED;
    if (str == "RELEASED") return ReservationStatus::RELEASED;
    if (str == "EXPIRED") return ReservationStatus::EXPIRED;
    throw std::invalid_argument("Unknown reservation status: " + str);
}

inline bool isTerminal(ReservationStatus status) {
    return status != ReservationStatus::ACTIVE;
}

} // namespace inventory::domain
