#pragma once

#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IReservationRepository.hpp"
#include "ports/output/ITransactionLedger.hpp"
#include "domain/StockRules.hpp"
#include "settings/StorageSettings.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>

namespace inventory::adapters::secondary {

/**
 * @brief Хранилище остатков в памяти
 *
 * Аналог SELECT ... FOR UPDATE: у каждого SKU свой std::timed_mutex,
 * ожидание ограничено StorageSettings::getLockTimeout(), по таймауту -
 * ConcurrentModificationException.
 *
 * Запись журнала добавляется до изменения счётчиков, внутри той же
 * критической секции: если журнал не принял запись, счётчики не меняются.
 *
 * settle() меняет статусы резервов в репозитории под блокировками их SKU;
 * если что-то пошло не так после смены статуса, статусы возвращаются в ACTIVE
 * до снятия блокировок, и снаружи промежуточное состояние не видно.
 */
class InMemoryInventoryStore : public ports::output::IInventoryStore {
public:
    InMemoryInventoryStore(
        std::shared_ptr<ports::output::ITransactionLedger> ledger,
        std::shared_ptr<ports::output::IReservationRepository> reservations,
        std::shared_ptr<settings::StorageSettings> settings
    ) : ledger_(std::move(ledger))
      , reservations_(std::move(reservations))
      , settings_(std::move(settings))
    {
        std::cout << "[InMemoryInventoryStore] Created, lock timeout "
                  << settings_->getLockTimeout().count() << "ms" << std::endl;
    }

    domain::StockRecord getOrCreate(const std::string& skuId) override {
        auto slot = getSlot(skuId, true);
        auto lock = lockSlot(*slot);
        return slot->record;
    }

    std::optional<domain::StockRecord> find(const std::string& skuId) override {
        auto slot = getSlot(skuId, false);
        if (!slot) {
            return std::nullopt;
        }
        auto lock = lockSlot(*slot);
        return slot->record;
    }

    std::vector<domain::StockRecord> findBatch(const std::vector<std::string>& skuIds) override {
        std::vector<domain::StockRecord> result;
        for (const auto& skuId : skuIds) {
            if (auto record = find(skuId)) {
                result.push_back(*record);
            }
        }
        return result;
    }

    domain::StockRecord mutate(const domain::StockMutation& mutation) override {
        auto slot = getSlot(mutation.skuId, true);
        auto lock = lockSlot(*slot);

        auto updated = domain::rules::applyMutation(slot->record, mutation);
        ledger_->append(domain::rules::makeLedgerEntry(slot->record, updated, mutation));
        slot->record = updated;
        return updated;
    }

    std::vector<domain::StockRecord> batchMutate(
        const std::vector<domain::StockMutation>& mutations) override
    {
        if (mutations.empty()) {
            return {};
        }

        std::set<std::string> skuIds;
        for (const auto& m : mutations) {
            if (!skuIds.insert(m.skuId).second) {
                throw domain::InvalidAdjustmentException(
                    "Duplicate SKU in batch mutation: " + m.skuId);
            }
        }

        std::map<std::string, std::shared_ptr<Slot>> slots;
        auto locks = lockSlots(skuIds, slots);

        // Сначала проверяем всё (порядок входа - для сообщения об ошибке)
        std::vector<domain::StockRecord> updated;
        std::vector<domain::LedgerEntry> entries;
        updated.reserve(mutations.size());
        entries.reserve(mutations.size());
        for (const auto& m : mutations) {
            const auto& current = slots[m.skuId]->record;
            updated.push_back(domain::rules::applyMutation(current, m));
            entries.push_back(domain::rules::makeLedgerEntry(current, updated.back(), m));
        }

        ledger_->appendBatch(entries);

        for (size_t i = 0; i < mutations.size(); ++i) {
            slots[mutations[i].skuId]->record = updated[i];
        }
        return updated;
    }

    domain::SettlementResult settle(const domain::ReservationSettlement& settlement) override {
        domain::rules::validateSettlement(settlement);

        domain::SettlementResult result;
        if (settlement.reservations.empty()) {
            return result;
        }

        std::map<std::string, std::shared_ptr<Slot>> slots;
        auto locks = lockSlots(domain::rules::settlementSkus(settlement), slots);

        // Под блокировками SKU статус их резервов меняет только settle()
        std::vector<domain::Reservation> won;
        for (const auto& r : settlement.reservations) {
            auto current = reservations_->findById(r.id);
            if (!current) {
                throw domain::ReservationNotFoundException(r.id);
            }
            if (current->isActive()) {
                won.push_back(*current);
            } else {
                result.lost.push_back(*current);
            }
        }
        if (won.empty() || (settlement.allOrNothing && !result.lost.empty())) {
            return result;
        }

        auto mutations = domain::rules::settlementMutations(won, settlement);
        std::vector<domain::StockRecord> updated;
        std::vector<domain::LedgerEntry> entries;
        for (const auto& m : mutations) {
            const auto& current = slots[m.skuId]->record;
            updated.push_back(domain::rules::applyMutation(current, m));
            entries.push_back(domain::rules::makeLedgerEntry(current, updated.back(), m));
        }

        std::vector<domain::Reservation> switched;
        try {
            for (auto& r : won) {
                if (!reservations_->compareAndSetStatus(
                        r.id, domain::ReservationStatus::ACTIVE, settlement.next)) {
                    throw domain::ConcurrentModificationException(
                        "Reservation " + r.id + " changed during settlement");
                }
                r.status = settlement.next;
                r.updatedAt = domain::Timestamp::now();
                switched.push_back(r);
            }
            ledger_->appendBatch(entries);
        } catch (const std::exception& e) {
            std::cerr << "[InMemoryInventoryStore] settle of " << won.front().referenceId
                      << " rolled back: " << e.what() << std::endl;
            for (const auto& r : switched) {
                if (!reservations_->compareAndSetStatus(
                        r.id, settlement.next, domain::ReservationStatus::ACTIVE)) {
                    std::cerr << "[InMemoryInventoryStore] Reservation " << r.id
                              << " could not be restored to ACTIVE" << std::endl;
                }
            }
            throw;
        }

        for (const auto& record : updated) {
            slots[record.skuId]->record = record;
        }
        result.settled = std::move(switched);
        result.records = std::move(updated);
        return result;
    }

    domain::StockRecord updateThresholds(
        const std::string& skuId,
        int64_t warningThreshold,
        int64_t criticalThreshold) override
    {
        domain::rules::validateThresholds(warningThreshold, criticalThreshold);

        auto slot = getSlot(skuId, true);
        auto lock = lockSlot(*slot);

        // Пороги не участвуют в версии: version считает только мутации счётчиков
        slot->record.warningThreshold = warningThreshold;
        slot->record.criticalThreshold = criticalThreshold;
        slot->record.updatedAt = domain::Timestamp::now();
        return slot->record;
    }

    std::vector<domain::StockRecord> findLowStock(
        domain::StockLevel level,
        int limit,
        int64_t offset) override
    {
        std::vector<std::shared_ptr<Slot>> snapshot;
        {
            std::lock_guard<std::mutex> lock(slotsMutex_);
            for (const auto& [skuId, slot] : slots_) {
                snapshot.push_back(slot);
            }
        }

        std::vector<domain::StockRecord> matched;
        for (const auto& slot : snapshot) {
            auto lock = lockSlot(*slot);
            if (domain::rules::matchesLevel(slot->record, level)) {
                matched.push_back(slot->record);
            }
        }

        std::sort(matched.begin(), matched.end(),
            [](const domain::StockRecord& a, const domain::StockRecord& b) {
                if (a.availableQuantity() != b.availableQuantity()) {
                    return a.availableQuantity() < b.availableQuantity();
                }
                return a.skuId < b.skuId;
            });

        std::vector<domain::StockRecord> page;
        for (size_t i = static_cast<size_t>(std::max<int64_t>(offset, 0));
             i < matched.size() && page.size() < static_cast<size_t>(std::max(limit, 0)); ++i) {
            page.push_back(matched[i]);
        }
        return page;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(slotsMutex_);
        return slots_.size();
    }

private:
    struct Slot {
        explicit Slot(const std::string& sku) : skuId(sku), record(sku) {}

        const std::string skuId;
        std::timed_mutex mutex;
        domain::StockRecord record;
    };

    std::shared_ptr<ports::output::ITransactionLedger> ledger_;
    std::shared_ptr<ports::output::IReservationRepository> reservations_;
    std::shared_ptr<settings::StorageSettings> settings_;

    mutable std::mutex slotsMutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;

    std::shared_ptr<Slot> getSlot(const std::string& skuId, bool create) {
        std::lock_guard<std::mutex> lock(slotsMutex_);
        auto it = slots_.find(skuId);
        if (it != slots_.end()) {
            return it->second;
        }
        if (!create) {
            return nullptr;
        }

        auto slot = std::make_shared<Slot>(skuId);
        slots_[skuId] = slot;
        return slot;
    }

    /**
     * @brief Захватить SKU по возрастанию skuId (std::set уже упорядочен)
     */
    std::vector<std::unique_lock<std::timed_mutex>> lockSlots(
        const std::set<std::string>& skuIds,
        std::map<std::string, std::shared_ptr<Slot>>& slots)
    {
        std::vector<std::unique_lock<std::timed_mutex>> locks;
        locks.reserve(skuIds.size());
        for (const auto& skuId : skuIds) {
            auto slot = getSlot(skuId, true);
            locks.push_back(lockSlot(*slot));
            slots[skuId] = slot;
        }
        return locks;
    }

    std::unique_lock<std::timed_mutex> lockSlot(Slot& slot) {
        std::unique_lock<std::timed_mutex> lock(slot.mutex, std::defer_lock);
        if (!lock.try_lock_for(settings_->getLockTimeout())) {
            std::cerr << "[InMemoryInventoryStore] Lock timeout on " << slot.skuId << std::endl;
            throw domain::ConcurrentModificationException("Lock timeout on " + slot.skuId);
        }
        return lock;
    }
};

} // namespace inventory::adapters::secondary
