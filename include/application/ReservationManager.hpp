#pragma once

#include "ports/input/IReservationService.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IReservationRepository.hpp"
#include "application/InventoryEventEmitter.hpp"
#include "application/ReservationMutations.hpp"
#include "domain/StockRules.hpp"
#include "application/RetryPolicy.hpp"
#include "settings/ReservationSettings.hpp"
#include "utils/IdGenerator.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>

namespace inventory::application {

/**
 * @brief Сервис резервов корзины и заказа
 *
 * reserve / reserveBatch:
 * 1. ACTIVE резерв по (sku, kind, referenceId) уже есть - вернуть его
 * 2. Захватить количество через IInventoryStore (reserved += q)
 * 3. Сохранить ACTIVE резерв с expiresAt = now + ttl
 *
 * Если на шаге 3 конкурент с тем же ключом успел раньше (конфликт
 * уникального индекса), удержание шага 2 возвращается и операция
 * повторяется: на повторе шаг 1 найдёт резерв победителя.
 *
 * Проверка остатка выполняется только хранилищем под блокировкой SKU,
 * поэтому InsufficientStock всегда несёт актуальный available.
 */
class ReservationManager : public ports::input::IReservationService {
public:
    ReservationManager(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<ports::output::IReservationRepository> reservations,
        std::shared_ptr<settings::ReservationSettings> settings,
        std::shared_ptr<InventoryEventEmitter> events
    ) : store_(std::move(store))
      , reservations_(std::move(reservations))
      , settings_(std::move(settings))
      , events_(std::move(events))
      , retry_(settings_->getMaxRetries(), settings_->getRetryBackoff())
    {
        std::cout << "[ReservationManager] Created" << std::endl;
    }

    domain::Reservation reserve(
        const std::string& skuId,
        int64_t quantity,
        domain::ReservationKind kind,
        const std::string& referenceId,
        std::optional<std::chrono::milliseconds> ttl) override
    {
        domain::ReserveRequest request;
        request.items.push_back({skuId, quantity});
        request.kind = kind;
        request.referenceId = referenceId;
        request.ttl = ttl;
        return reserveBatch(request).front();
    }

    std::vector<domain::Reservation> reserveBatch(const domain::ReserveRequest& request) override {
        validate(request);

        auto items = mergeItems(request.items);
        auto ttl = request.ttl.value_or(settings_->getDefaultTtl(request.kind));

        return retry_.execute("reserve " + request.referenceId, [&] {
            return tryReserve(items, request.kind, request.referenceId, ttl);
        });
    }

    domain::Reservation extend(
        const std::string& reservationId,
        std::chrono::milliseconds additionalTtl) override
    {
        if (additionalTtl.count() <= 0) {
            throw std::invalid_argument("additional ttl must be positive");
        }
        if (additionalTtl > MAX_TTL) {
            throw std::invalid_argument("additional ttl must not exceed " +
                                        std::to_string(MAX_TTL.count()) + " seconds");
        }

        auto reservation = reservations_->findById(reservationId);
        if (!reservation) {
            throw domain::ReservationNotFoundException(reservationId);
        }
        if (!reservation->isActive()) {
            throw domain::ReservationNotActiveException(
                reservationId, domain::toString(reservation->status));
        }

        auto expiresAt = reservation->expiresAt.plus(additionalTtl);
        if (!reservations_->updateExpiry(reservationId, expiresAt)) {
            // Между чтением и обновлением резерв ушёл в терминальный статус
            auto current = reservations_->findById(reservationId);
            throw domain::ReservationNotActiveException(
                reservationId,
                current ? domain::toString(current->status) : "UNKNOWN");
        }

        reservation->expiresAt = expiresAt;
        reservation->updatedAt = domain::Timestamp::now();
        std::cout << "[ReservationManager] Extended " << reservationId
                  << " until " << expiresAt.toString() << std::endl;
        return *reservation;
    }

    std::vector<domain::Reservation> release(
        const std::string& referenceId,
        std::optional<domain::ReservationKind> kind) override
    {
        if (referenceId.empty()) {
            throw std::invalid_argument("reference_id is required");
        }

        domain::ReservationSettlement settlement;
        settlement.next = domain::ReservationStatus::RELEASED;
        settlement.reason = "released by caller";
        for (const auto& r : reservations_->findByReference(referenceId)) {
            if (r.isActive() && (!kind || r.kind == *kind)) {
                settlement.reservations.push_back(r);
            }
        }

        if (settlement.reservations.empty()) {
            std::cout << "[ReservationManager] Nothing to release for " << referenceId << std::endl;
            return {};
        }

        // Статус и возврат удержания фиксируются вместе: при ошибке резервы
        // остаются ACTIVE, и повторный release() вернёт их заново
        domain::SettlementResult settled;
        try {
            settled = retry_.execute("release " + referenceId, [&] {
                return store_->settle(settlement);
            });
        } catch (const std::exception& e) {
            std::cerr << "[ReservationManager] Release of " << referenceId
                      << " failed, reservations stay ACTIVE: " << e.what() << std::endl;
            throw;
        }

        if (settled.settled.empty()) {
            std::cout << "[ReservationManager] Reservations of " << referenceId
                      << " were closed concurrently" << std::endl;
            return {};
        }

        std::cout << "[ReservationManager] Released " << settled.settled.size()
                  << " reservations of " << referenceId << std::endl;
        events_->released(settled.settled);
        events_->stockLevels(settled.records);
        return settled.settled;
    }

    std::vector<domain::Reservation> getReservations(const std::string& referenceId) override {
        if (referenceId.empty()) {
            throw std::invalid_argument("reference_id is required");
        }
        return reservations_->findByReference(referenceId);
    }

private:
    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<ports::output::IReservationRepository> reservations_;
    std::shared_ptr<settings::ReservationSettings> settings_;
    std::shared_ptr<InventoryEventEmitter> events_;
    RetryPolicy retry_;

    void validate(const domain::ReserveRequest& request) const {
        if (request.referenceId.empty()) {
            throw std::invalid_argument("reference_id is required");
        }
        if (request.items.empty()) {
            throw std::invalid_argument("at least one item is required");
        }
        if (request.items.size() > static_cast<size_t>(settings_->getMaxBatchItems())) {
            throw std::invalid_argument(
                "too many items: max " + std::to_string(settings_->getMaxBatchItems()));
        }
        for (const auto& item : request.items) {
            if (item.skuId.empty()) {
                throw std::invalid_argument("sku_id is required");
            }
            if (item.quantity <= 0) {
                throw std::invalid_argument("quantity must be positive for " + item.skuId);
            }
        }
        if (request.ttl && request.ttl->count() <= 0) {
            throw std::invalid_argument("ttl must be positive");
        }
        if (request.ttl && *request.ttl > MAX_TTL) {
            throw std::invalid_argument("ttl must not exceed " +
                                        std::to_string(MAX_TTL.count()) + " seconds");
        }
    }

    /**
     * @brief Сложить повторяющиеся SKU, сохранив порядок первого появления
     */
    static std::vector<domain::ReservationItem> mergeItems(
        const std::vector<domain::ReservationItem>& items)
    {
        std::vector<domain::ReservationItem> merged;
        std::map<std::string, size_t> index;
        for (const auto& item : items) {
            auto it = index.find(item.skuId);
            if (it == index.end()) {
                index[item.skuId] = merged.size();
                merged.push_back(item);
            } else {
                merged[it->second].quantity += item.quantity;
            }
        }
        return merged;
    }

    std::vector<domain::Reservation> tryReserve(
        const std::vector<domain::ReservationItem>& items,
        domain::ReservationKind kind,
        const std::string& referenceId,
        std::chrono::milliseconds ttl)
    {
        std::vector<std::optional<domain::Reservation>> result(items.size());
        std::vector<size_t> pending;

        for (size_t i = 0; i < items.size(); ++i) {
            auto existing = reservations_->findActive(items[i].skuId, kind, referenceId);
            if (existing) {
                result[i] = *existing;
            } else {
                pending.push_back(i);
            }
        }

        if (pending.empty()) {
            std::cout << "[ReservationManager] Idempotent hit for " << referenceId << std::endl;
            return collect(result);
        }

        std::vector<domain::StockMutation> mutations;
        for (size_t i : pending) {
            domain::StockMutation m;
            m.skuId = items[i].skuId;
            m.reserveDelta = items[i].quantity;
            m.kind = domain::LedgerEntryKind::RESERVE;
            m.referenceId = referenceId;
            m.reason = domain::toString(kind) + " reservation";
            mutations.push_back(m);
        }

        // InsufficientStock отсюда уходит к вызывающему без повторов
        auto records = applyMutations(*store_, mutations);

        auto now = domain::Timestamp::now();
        std::vector<domain::Reservation> created;
        for (size_t i : pending) {
            domain::Reservation r;
            r.id = utils::IdGenerator::generateWithPrefix("rsv");
            r.skuId = items[i].skuId;
            r.kind = kind;
            r.referenceId = referenceId;
            r.quantity = items[i].quantity;
            r.status = domain::ReservationStatus::ACTIVE;
            r.createdAt = now;
            r.updatedAt = now;
            r.expiresAt = now.plus(ttl);
            created.push_back(r);
        }

        bool inserted = false;
        try {
            inserted = (created.size() == 1)
                ? reservations_->insert(created.front())
                : reservations_->insertBatch(created);
        } catch (const std::exception& e) {
            std::cerr << "[ReservationManager] Failed to persist reservations for "
                      << referenceId << ": " << e.what() << std::endl;
            compensate(created);
            throw;
        }

        if (!inserted) {
            compensate(created);
            throw domain::ConcurrentModificationException(
                "Concurrent reservation for " + referenceId);
        }

        for (size_t k = 0; k < pending.size(); ++k) {
            result[pending[k]] = created[k];
        }

        std::cout << "[ReservationManager] Reserved " << created.size() << " items for "
                  << referenceId << " (" << domain::toString(kind) << ")" << std::endl;
        events_->reserved(created);
        events_->stockLevels(records);
        return collect(result);
    }

    /**
     * @brief Вернуть удержание, если резервы не удалось сохранить
     */
    void compensate(const std::vector<domain::Reservation>& created) {
        auto mutations = domain::rules::releaseMutations(
            created, domain::LedgerEntryKind::RELEASE, false, "reservation rolled back");
        try {
            retry_.execute("rollback " + created.front().referenceId, [&] {
                return applyMutations(*store_, mutations);
            });
        } catch (const std::exception& e) {
            std::cerr << "[ReservationManager] Rollback of hold for "
                      << created.front().referenceId << " failed: " << e.what() << std::endl;
        }
    }

    static std::vector<domain::Reservation> collect(
        const std::vector<std::optional<domain::Reservation>>& slots)
    {
        std::vector<domain::Reservation> result;
        result.reserve(slots.size());
        for (const auto& slot : slots) {
            result.push_back(*slot);
        }
        return result;
    }
};

} // namespace inventory::application
