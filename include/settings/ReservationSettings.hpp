#pragma once

#include "domain/enums/ReservationKind.hpp"
#include <string>
#include <cstdlib>
#include <chrono>

namespace inventory::settings {

/**
 * @brief Настройки резервирования
 *
 * Переменные окружения:
 * - RESERVATION_CART_TTL_SECONDS: срок резерва корзины (1800)
 * - RESERVATION_ORDER_TTL_SECONDS: срок резерва заказа (3600)
 * - RESERVATION_MAX_RETRIES: попыток при ConcurrentModification (3)
 * - RESERVATION_RETRY_BACKOFF_MS: начальная пауза между попытками (10)
 * - RESERVATION_MAX_BATCH_ITEMS: максимум позиций в одном запросе (100)
 */
class ReservationSettings {
public:
    ReservationSettings() {
        cartTtlSeconds_ = std::stoi(getEnvOrDefault("RESERVATION_CART_TTL_SECONDS", "1800"));
        orderTtlSeconds_ = std::stoi(getEnvOrDefault("RESERVATION_ORDER_TTL_SECONDS", "3600"));
        maxRetries_ = std::stoi(getEnvOrDefault("RESERVATION_MAX_RETRIES", "3"));
        retryBackoffMs_ = std::stoi(getEnvOrDefault("RESERVATION_RETRY_BACKOFF_MS", "10"));
        maxBatchItems_ = std::stoi(getEnvOrDefault("RESERVATION_MAX_BATCH_ITEMS", "100"));
    }

    /**
     * @brief Срок по умолчанию для типа резерва
     */
    std::chrono::milliseconds getDefaultTtl(domain::ReservationKind kind) const {
        int seconds = (kind == domain::ReservationKind::ORDER) ? orderTtlSeconds_ : cartTtlSeconds_;
        return std::chrono::seconds(seconds);
    }

    int getMaxRetries() const { return maxRetries_; }

    std::chrono::milliseconds getRetryBackoff() const {
        return std::chrono::milliseconds(retryBackoffMs_);
    }

    int getMaxBatchItems() const { return maxBatchItems_; }

private:
    int cartTtlSeconds_;
    int orderTtlSeconds_;
    int maxRetries_;
    int retryBackoffMs_;
    int maxBatchItems_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace inventory::settings
