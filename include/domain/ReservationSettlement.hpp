#pragma once

#include "Reservation.hpp"
#include "StockRecord.hpp"
#include "enums/ReservationStatus.hpp"
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Закрыть ACTIVE резервы и снять их удержание одной атомарной единицей
 *
 * next = CONSUMED: reserved -= q, total -= q (запись DEDUCT)
 * next = RELEASED / EXPIRED: reserved -= q (запись RELEASE)
 *
 * allOrNothing = true: если хоть один резерв уже не ACTIVE,
 * не меняется ничего (ни статусы, ни счётчики).
 */
struct ReservationSettlement {
    std::vector<Reservation> reservations;
    ReservationStatus next = ReservationStatus::RELEASED;
    bool allOrNothing = false;
    std::string reason;
};

/**
 * @brief Итог settle()
 *
 * settled - резервы, переведённые в next этим вызовом.
 * lost - резервы, которые уже были не ACTIVE; status - текущий в хранилище.
 * records - остатки затронутых SKU после изменения (пусто, если ничего не менялось).
 */
struct SettlementResult {
    std::vector<Reservation> settled;
    std::vector<Reservation> lost;
    std::vector<StockRecord> records;
};

} // namespace inventory::domain
