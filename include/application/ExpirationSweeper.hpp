#pragma once

#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IReservationRepository.hpp"
#include "application/InventoryEventEmitter.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/SweepReport.hpp"
#include "settings/SweeperSettings.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace inventory::application {

/**
 * @brief Фоновый поток возврата просроченных резервов
 *
 * Каждые SweeperSettings::getInterval():
 * 1. findExpired(now, batchSize) - ACTIVE резервы с expiresAt < now
 * 2. store->settle(): ACTIVE -> EXPIRED и reserved -= quantity
 *    (запись RELEASE, reason "expired") одной атомарной единицей,
 *    с повторами при ConcurrentModification
 * 3. резерв, который deduct/release успели закрыть раньше, - пропуск
 *
 * Ошибка по одному резерву логируется, проход продолжается; резерв
 * остаётся ACTIVE и будет подобран следующим проходом.
 * Несколько экземпляров могут работать одновременно: каждый резерв
 * возвращается ровно один раз.
 */
class ExpirationSweeper {
public:
    ExpirationSweeper(
        std::shared_ptr<ports::output::IInventoryStore> store,
        std::shared_ptr<ports::output::IReservationRepository> reservations,
        std::shared_ptr<settings::SweeperSettings> settings,
        std::shared_ptr<InventoryEventEmitter> events
    ) : store_(std::move(store))
      , reservations_(std::move(reservations))
      , settings_(std::move(settings))
      , events_(std::move(events))
      , retry_(settings_->getMaxRetries(), settings_->getRetryBackoff())
      , running_(false)
      , sweepCount_(0)
      , expiredTotal_(0)
    {}

    ~ExpirationSweeper() {
        stop();
    }

    ExpirationSweeper(const ExpirationSweeper&) = delete;
    ExpirationSweeper& operator=(const ExpirationSweeper&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        thread_ = std::thread([this]() {
            std::cout << "[ExpirationSweeper] Started, interval "
                      << settings_->getInterval().count() << "ms" << std::endl;
            while (running_) {
                sweepOnce();

                std::unique_lock<std::mutex> lock(waitMutex_);
                wakeUp_.wait_for(lock, settings_->getInterval(), [this] { return !running_; });
            }
            std::cout << "[ExpirationSweeper] Stopped" << std::endl;
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(waitMutex_);
            running_ = false;
        }
        wakeUp_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool isRunning() const { return running_; }

    uint64_t getSweepCount() const { return sweepCount_; }

    uint64_t getExpiredTotal() const { return expiredTotal_; }

    /**
     * @brief Один проход вручную (для тестов и администрирования)
     */
    domain::SweepReport sweepOnce(const domain::Timestamp& now = domain::Timestamp::now()) {
        domain::SweepReport report;

        std::vector<domain::Reservation> candidates;
        try {
            candidates = reservations_->findExpired(now, settings_->getBatchSize());
        } catch (const std::exception& e) {
            std::cerr << "[ExpirationSweeper] Failed to load expired reservations: "
                      << e.what() << std::endl;
            ++sweepCount_;
            return report;
        }

        report.scanned = candidates.size();
        for (auto& r : candidates) {
            try {
                auto result = reclaim(r);
                if (result.settled.empty()) {
                    ++report.skipped;
                    continue;
                }
                ++report.expired;
                events_->expired(result.settled.front());
                events_->stockLevels(result.records);
            } catch (const std::exception& e) {
                ++report.failed;
                std::cerr << "[ExpirationSweeper] Reservation " << r.id << " (" << r.skuId
                          << ", " << r.quantity << ") not reclaimed: " << e.what() << std::endl;
            }
        }

        ++sweepCount_;
        expiredTotal_ += report.expired;
        if (report.scanned > 0) {
            std::cout << "[ExpirationSweeper] Sweep: scanned=" << report.scanned
                      << " expired=" << report.expired
                      << " skipped=" << report.skipped
                      << " failed=" << report.failed << std::endl;
        }
        return report;
    }

private:
    std::shared_ptr<ports::output::IInventoryStore> store_;
    std::shared_ptr<ports::output::IReservationRepository> reservations_;
    std::shared_ptr<settings::SweeperSettings> settings_;
    std::shared_ptr<InventoryEventEmitter> events_;
    RetryPolicy retry_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> sweepCount_;
    std::atomic<uint64_t> expiredTotal_;
    std::thread thread_;
    std::mutex waitMutex_;
    std::condition_variable wakeUp_;

    domain::SettlementResult reclaim(const domain::Reservation& r) {
        domain::ReservationSettlement settlement;
        settlement.reservations.push_back(r);
        settlement.next = domain::ReservationStatus::EXPIRED;
        settlement.reason = "expired";

        return retry_.execute("expire " + r.id, [&] {
            return store_->settle(settlement);
        });
    }
};

} // namespace inventory::application
