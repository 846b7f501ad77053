#pragma once

#include "domain/Reservation.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstddef>

namespace inventory::ports::output {

/**
 * @brief Хранилище резервов
 *
 * Переходы статуса выполняются только compareAndSetStatus():
 * при любом числе конкурентов выигрывает ровно один.
 */
class IReservationRepository {
public:
    virtual ~IReservationRepository() = default;

    /**
     * @brief Вставить ACTIVE резерв
     * @return false если ACTIVE резерв с той же (skuId, kind, referenceId) уже есть
     */
    virtual bool insert(const domain::Reservation& reservation) = 0;

    /**
     * @brief Вставить несколько резервов (всё или ничего)
     * @return false при конфликте хотя бы одного, ничего не вставлено
     */
    virtual bool insertBatch(const std::vector<domain::Reservation>& reservations) = 0;

    virtual std::optional<domain::Reservation> findById(const std::string& id) = 0;

    virtual std::optional<domain::Reservation> findActive(
        const std::string& skuId,
        domain::ReservationKind kind,
        const std::string& referenceId) = 0;

    /**
     * @brief Все резервы по ключу вызывающего (в любом статусе)
     */
    virtual std::vector<domain::Reservation> findByReference(const std::string& referenceId) = 0;

    /**
     * @brief CAS статуса
     * @return true если статус был expected и стал next
     */
    virtual bool compareAndSetStatus(
        const std::string& id,
        domain::ReservationStatus expected,
        domain::ReservationStatus next) = 0;

    /**
     * @brief Сдвинуть срок, только пока резерв ACTIVE
     * @return false если резерв не найден или уже не ACTIVE
     */
    virtual bool updateExpiry(const std::string& id, const domain::Timestamp& expiresAt) = 0;

    /**
     * @brief ACTIVE резервы с expiresAt < now, самые старые первыми
     */
    virtual std::vector<domain::Reservation> findExpired(
        const domain::Timestamp& now,
        std::size_t limit) = 0;
};

} // namespace inventory::ports::output
