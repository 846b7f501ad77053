#pragma once

#include <cstdlib>
#include <string>
#include <chrono>

namespace inventory::settings {

/**
 * @brief Выбор бэкенда хранения и таймаут блокировки строки
 *
 * Читает из ENV:
 * - INVENTORY_STORAGE (default: "postgres", для локального запуска "memory")
 * - INVENTORY_LOCK_TIMEOUT_MS (default: 2000)
 */
class StorageSettings {
public:
    StorageSettings() {
        if (const char* val = std::getenv("INVENTORY_STORAGE")) {
            backend_ = val;
        }
        if (const char* val = std::getenv("INVENTORY_LOCK_TIMEOUT_MS")) {
            lockTimeoutMs_ = std::stoi(val);
        }
    }

    std::string getBackend() const { return backend_; }
    bool isInMemory() const { return backend_ == "memory"; }

    std::chrono::milliseconds getLockTimeout() const {
        return std::chrono::milliseconds(lockTimeoutMs_);
    }

    void setLockTimeout(std::chrono::milliseconds timeout) {
        lockTimeoutMs_ = static_cast<int>(timeout.count());
    }

private:
    std::string backend_ = "postgres";
    int lockTimeoutMs_ = 2000;
};

} // namespace inventory::settings
