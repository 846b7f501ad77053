#pragma once

#include "ports/output/IReservationRepository.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <tuple>
#include <unordered_map>

namespace inventory::adapters::secondary {

/**
 * @brief Резервы в памяти
 *
 * activeIndex_ играет роль частичного уникального индекса
 * (sku_id, kind, reference_id) WHERE status = 'ACTIVE'.
 * Все операции под одним mutex, поэтому CAS тривиально атомарен.
 */
class InMemoryReservationRepository : public ports::output::IReservationRepository {
public:
    bool insert(const domain::Reservation& reservation) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (activeIndex_.count(keyOf(reservation)) || reservations_.count(reservation.id)) {
            return false;
        }
        store(reservation);
        return true;
    }

    bool insertBatch(const std::vector<domain::Reservation>& reservations) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::map<Key, bool> seen;
        for (const auto& r : reservations) {
            auto key = keyOf(r);
            if (activeIndex_.count(key) || reservations_.count(r.id) || seen.count(key)) {
                return false;
            }
            seen[key] = true;
        }

        for (const auto& r : reservations) {
            store(r);
        }
        return true;
    }

    std::optional<domain::Reservation> findById(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = reservations_.find(id);
        if (it == reservations_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<domain::Reservation> findActive(
        const std::string& skuId,
        domain::ReservationKind kind,
        const std::string& referenceId) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = activeIndex_.find(Key{skuId, static_cast<int>(kind), referenceId});
        if (it == activeIndex_.end()) {
            return std::nullopt;
        }
        return reservations_.at(it->second);
    }

    std::vector<domain::Reservation> findByReference(const std::string& referenceId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Reservation> result;
        for (const auto& [id, r] : reservations_) {
            if (r.referenceId == referenceId) {
                result.push_back(r);
            }
        }
        std::sort(result.begin(), result.end(),
            [](const domain::Reservation& a, const domain::Reservation& b) {
                if (a.skuId != b.skuId) return a.skuId < b.skuId;
                return a.createdAt < b.createdAt;
            });
        return result;
    }

    bool compareAndSetStatus(
        const std::string& id,
        domain::ReservationStatus expected,
        domain::ReservationStatus next) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = reservations_.find(id);
        if (it == reservations_.end() || it->second.status != expected) {
            return false;
        }

        auto& r = it->second;
        if (r.status == domain::ReservationStatus::ACTIVE &&
            next != domain::ReservationStatus::ACTIVE) {
            activeIndex_.erase(keyOf(r));
        }
        if (r.status != domain::ReservationStatus::ACTIVE &&
            next == domain::ReservationStatus::ACTIVE) {
            // Откат settle(): ключ мог занять новый резерв
            if (activeIndex_.count(keyOf(r))) {
                return false;
            }
            activeIndex_[keyOf(r)] = r.id;
        }
        r.status = next;
        r.updatedAt = domain::Timestamp::now();
        return true;
    }

    bool updateExpiry(const std::string& id, const domain::Timestamp& expiresAt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = reservations_.find(id);
        if (it == reservations_.end() || !it->second.isActive()) {
            return false;
        }
        it->second.expiresAt = expiresAt;
        it->second.updatedAt = domain::Timestamp::now();
        return true;
    }

    std::vector<domain::Reservation> findExpired(
        const domain::Timestamp& now,
        std::size_t limit) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Reservation> result;
        for (const auto& [key, id] : activeIndex_) {
            const auto& r = reservations_.at(id);
            if (r.isExpiredAt(now)) {
                result.push_back(r);
            }
        }

        std::sort(result.begin(), result.end(),
            [](const domain::Reservation& a, const domain::Reservation& b) {
                return a.expiresAt < b.expiresAt;
            });
        if (result.size() > limit) {
            result.resize(limit);
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reservations_.size();
    }

private:
    using Key = std::tuple<std::string, int, std::string>;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::Reservation> reservations_;
    std::map<Key, std::string> activeIndex_;

    static Key keyOf(const domain::Reservation& r) {
        return Key{r.skuId, static_cast<int>(r.kind), r.referenceId};
    }

    void store(const domain::Reservation& r) {
        reservations_[r.id] = r;
        if (r.isActive()) {
            activeIndex_[keyOf(r)] = r.id;
        }
    }
};

} // namespace inventory::adapters::secondary
