#pragma once

#include <cstdlib>
#include <string>

namespace inventory::settings {

/**
 * @brief Настройки кэша остатков
 *
 * Читает из ENV:
 * - CACHE_STOCK_SIZE (default: 10000)
 * - CACHE_STOCK_TTL_SECONDS (default: 5)
 *
 * TTL короткий: кэш только для отображения, решения по остатку
 * всегда принимает IInventoryStore.
 */
class CacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("CACHE_STOCK_SIZE")) {
            stockCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("CACHE_STOCK_TTL_SECONDS")) {
            stockTtlSeconds_ = std::stoi(val);
        }
    }

    size_t getStockCacheSize() const { return stockCacheSize_; }
    int getStockTtlSeconds() const { return stockTtlSeconds_; }

private:
    size_t stockCacheSize_ = 10000;
    int stockTtlSeconds_ = 5;
};

} // namespace inventory::settings
