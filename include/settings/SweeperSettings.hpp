#pragma once

#include <string>
#include <cstdlib>
#include <chrono>

namespace inventory::settings {

/**
 * @brief Настройки фоновой очистки просроченных резервов
 *
 * Переменные окружения:
 * - SWEEPER_ENABLED: запускать ли поток (true)
 * - SWEEPER_INTERVAL_SECONDS: период прохода (60)
 * - SWEEPER_BATCH_SIZE: резервов за один проход (500)
 * - SWEEPER_MAX_RETRIES: попыток вернуть удержание при ConcurrentModification (5)
 * - SWEEPER_RETRY_BACKOFF_MS: пауза перед первым повтором, дальше удваивается (10)
 *
 * @example K8s ConfigMap:
 * ```yaml
 * data:
 *   SWEEPER_ENABLED: "true"
 *   SWEEPER_INTERVAL_SECONDS: "60"
 *   SWEEPER_BATCH_SIZE: "500"
 * ```
 */
class SweeperSettings {
public:
    SweeperSettings() {
        enabled_ = getEnvOrDefault("SWEEPER_ENABLED", "true") == "true";
        intervalMs_ = std::stoi(getEnvOrDefault("SWEEPER_INTERVAL_SECONDS", "60")) * 1000;
        batchSize_ = static_cast<size_t>(std::stoi(getEnvOrDefault("SWEEPER_BATCH_SIZE", "500")));
        maxRetries_ = std::stoi(getEnvOrDefault("SWEEPER_MAX_RETRIES", "5"));
        retryBackoffMs_ = std::stoi(getEnvOrDefault("SWEEPER_RETRY_BACKOFF_MS", "10"));
    }

    bool isEnabled() const { return enabled_; }

    std::chrono::milliseconds getInterval() const {
        return std::chrono::milliseconds(intervalMs_);
    }

    size_t getBatchSize() const { return batchSize_; }
    int getMaxRetries() const { return maxRetries_; }

    std::chrono::milliseconds getRetryBackoff() const {
        return std::chrono::milliseconds(retryBackoffMs_);
    }

    /**
     * @brief Переопределить период (для тестов)
     */
    void setInterval(std::chrono::milliseconds interval) {
        intervalMs_ = static_cast<int>(interval.count());
    }

private:
    bool enabled_;
    int intervalMs_;
    size_t batchSize_;
    int maxRetries_;
    int retryBackoffMs_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace inventory::settings
