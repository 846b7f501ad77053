#pragma once

#include "Timestamp.hpp"
#include "enums/ReservationKind.hpp"
#include "enums/ReservationStatus.hpp"
#include <string>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Временное удержание количества под корзину или заказ
 *
 * referenceId - ключ идемпотентности от вызывающего (cart_id / order_id).
 * Пока статус ACTIVE, тройка (skuId, kind, referenceId) уникальна.
 * Статус меняется только через CAS в IReservationRepository.
 */
struct Reservation {
    std::string id;
    std::string skuId;
    ReservationKind kind = ReservationKind::CART;
    std::string referenceId;
    int64_t quantity = 0;
    Timestamp expiresAt;
    ReservationStatus status = ReservationStatus::ACTIVE;
    Timestamp createdAt;
    Timestamp updatedAt;

    bool isActive() const {
        return status == ReservationStatus::ACTIVE;
    }

    bool isExpiredAt(const Timestamp& now) const {
        return expiresAt < now;
    }
};

} // namespace inventory::domain
