#pragma once

#include "domain/Reservation.hpp"
#include "domain/ReserveRequest.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inventory::ports::input {

/**
 * @brief Интерфейс управления резервами
 *
 * Вызывается модулями корзины и заказа.
 */
class IReservationService {
public:
    /// Верхняя граница срока резерва и одного продления (30 суток)
    static constexpr std::chrono::seconds MAX_TTL{30 * 24 * 3600};

    virtual ~IReservationService() = default;

    /**
     * @brief Зарезервировать одну позицию
     *
     * Повторный вызов с тем же (skuId, kind, referenceId) возвращает
     * существующий ACTIVE резерв без повторного списания.
     */
    virtual domain::Reservation reserve(
        const std::string& skuId,
        int64_t quantity,
        domain::ReservationKind kind,
        const std::string& referenceId,
        std::optional<std::chrono::milliseconds> ttl) = 0;

    /**
     * @brief Зарезервировать набор позиций (всё или ничего)
     */
    virtual std::vector<domain::Reservation> reserveBatch(const domain::ReserveRequest& request) = 0;

    /**
     * @brief Продлить ACTIVE резерв на additionalTtl
     *
     * additionalTtl в (0, MAX_TTL], иначе std::invalid_argument.
     */
    virtual domain::Reservation extend(
        const std::string& reservationId,
        std::chrono::milliseconds additionalTtl) = 0;

    /**
     * @brief Освободить все ACTIVE резервы по ключу
     * @param kind Ограничить тип (корзина/заказ), если задан
     * @return Резервы, переведённые в RELEASED этим вызовом
     */
    virtual std::vector<domain::Reservation> release(
        const std::string& referenceId,
        std::optional<domain::ReservationKind> kind = std::nullopt) = 0;

    /**
     * @brief Текущее состояние резервов по ключу
     */
    virtual std::vector<domain::Reservation> getReservations(const std::string& referenceId) = 0;
};

} // namespace inventory::ports::input
