#pragma once

#include "ports/input/IDeductionService.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IReservationRepository.hpp"
#include "application/InventoryEventEmitter.hpp"
#include "application/RetryPolicy.hpp"
#include "settings/ReservationSettings.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>

namespace inventory::application {

/**
 * @brief Окончательное списание резервов после оплаты
 *
 * Все ACTIVE резервы referenceId закрываются одним IInventoryStore::settle()
 * с allOrNothing: статус CONSUMED и уменьшение reserved/total (запись DEDUCT)
 * фиксируются вместе. Если хоть один резерв заказа успел истечь (раньше
 * вызова или во время него), не списывается ничего и вызывающий получает
 * ReservationExpired.
 *
 * Гонка с ExpirationSweeper решается блокировкой SKU внутри settle():
 * кто первым сменил статус ACTIVE, тот и прав. Ошибка хранилища
 * (таймаут блокировки, недоступная БД) не меняет ничего, повтор
 * deduct() выполнит списание заново.
 *
 * Повторный deduct по уже списанному referenceId - успешный no-op
 * (alreadyDeducted = true).
 */
class DeductionService : public ports::input::IDeductionService {
public:
    DeductionService(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<ports::output::IReservationRepository> reservations,
        std::shared_ptr<settings::ReservationSettings> settings,
        std::shared_ptr<InventoryEventEmitter> events
    ) : store_(std::move(store))
      , reservations_(std::move(reservations))
      , events_(std::move(events))
      , retry_(settings->getMaxRetries(), settings->getRetryBackoff())
    {
        std::cout << "[DeductionService] Created" << std::endl;
    }

    domain::DeductionResult deduct(const std::string& referenceId) override {
        if (referenceId.empty()) {
            throw std::invalid_argument("reference_id is required");
        }

        auto all = reservations_->findByReference(referenceId);
        if (all.empty()) {
            throw domain::ReservationNotFoundException(referenceId);
        }

        domain::ReservationSettlement settlement;
        settlement.next = domain::ReservationStatus::CONSUMED;
        settlement.allOrNothing = true;
        settlement.reason = "payment confirmed";
        for (const auto& r : all) {
            if (r.isActive()) {
                settlement.reservations.push_back(r);
            }
        }

        if (settlement.reservations.empty()) {
            return alreadyDeductedOrExpired(referenceId, all);
        }
        rejectLapsed(referenceId, all, settlement.reservations);

        domain::SettlementResult settled;
        try {
            settled = retry_.execute("deduct " + referenceId, [&] {
                return store_->settle(settlement);
            });
        } catch (const std::exception& e) {
            std::cerr << "[DeductionService] Deduct of " << referenceId
                      << " failed, reservations stay ACTIVE: " << e.what() << std::endl;
            throw;
        }

        if (settled.settled.empty()) {
            // Между чтением и settle() резервы закрыл кто-то другой
            return alreadyDeductedOrExpired(referenceId, reservations_->findByReference(referenceId));
        }

        domain::DeductionResult result;
        result.referenceId = referenceId;
        result.consumed = settled.settled;

        std::cout << "[DeductionService] Deducted " << result.consumed.size()
                  << " reservations of " << referenceId << std::endl;
        events_->deducted(result);
        events_->stockLevels(settled.records);
        return result;
    }

private:
    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<ports::output::IReservationRepository> reservations_;
    std::shared_ptr<InventoryEventEmitter> events_;
    RetryPolicy retry_;

    /**
     * @brief Часть текущих резервов уже истекла - списывать нечего
     *
     * EXPIRED резерв, закрытый до появления самого раннего ACTIVE, относится
     * к прошлому циклу referenceId (заказ перерезервировали) и не мешает.
     */
    static void rejectLapsed(
        const std::string& referenceId,
        const std::vector<domain::Reservation>& all,
        const std::vector<domain::Reservation>& active)
    {
        auto activeSince = active.front().createdAt;
        for (const auto& r : active) {
            if (r.createdAt < activeSince) {
                activeSince = r.createdAt;
            }
        }

        for (const auto& r : all) {
            if (r.status == domain::ReservationStatus::EXPIRED && activeSince <= r.updatedAt) {
                std::cerr << "[DeductionService] Reservation " << r.id << " (" << r.skuId
                          << ") of " << referenceId << " expired, nothing deducted" << std::endl;
                throw domain::ReservationExpiredException(referenceId);
            }
        }
    }

    /**
     * @brief ACTIVE резервов нет: заказ уже списан или его резервы потеряны
     *
     * CONSUMED рядом с EXPIRED/RELEASED возможен только у разных жизненных
     * циклов одного referenceId; списанным считается заказ, где нет ACTIVE
     * и есть хотя бы один CONSUMED.
     */
    domain::DeductionResult alreadyDeductedOrExpired(
        const std::string& referenceId,
        const std::vector<domain::Reservation>& all)
    {
        domain::DeductionResult result;
        result.referenceId = referenceId;
        bool anyActive = false;
        for (const auto& r : all) {
            anyActive = anyActive || r.isActive();
            if (r.status == domain::ReservationStatus::CONSUMED) {
                result.consumed.push_back(r);
            }
        }

        if (anyActive || result.consumed.empty()) {
            for (const auto& r : all) {
                if (r.status == domain::ReservationStatus::EXPIRED ||
                    r.status == domain::ReservationStatus::RELEASED) {
                    std::cerr << "[DeductionService] Reservation " << r.id << " (" << r.skuId
                              << ") of " << referenceId << " is " << domain::toString(r.status)
                              << ", nothing deducted" << std::endl;
                }
            }
            throw domain::ReservationExpiredException(referenceId);
        }

        std::cout << "[DeductionService] " << referenceId << " already deducted" << std::endl;
        result.alreadyDeducted = true;
        return result;
    }
};

} // namespace inventory::application
