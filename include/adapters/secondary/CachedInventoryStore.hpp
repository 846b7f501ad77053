#pragma once

#include "ports/output/IInventoryStore.hpp"
#include "settings/CacheSettings.hpp"
#include "domain/InventoryException.hpp"
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <memory>
#include <iostream>

namespace inventory::adapters::secondary {

/**
 * @brief Декоратор IInventoryStore с LRU кэшированием остатков
 *
 * Кэш: skuId -> StockRecord, короткий TTL.
 *
 * - find / findBatch: read-through
 * - getOrCreate / mutate / batchMutate / settle / updateThresholds: всегда в
 *   хранилище, результат записывается в кэш (write-through)
 * - findLowStock: без кэша
 *
 * Кэш никогда не принимает решений: проверки остатка делает только
 * делегат. При любой ошибке мутации запись кэша удаляется, следующий
 * find() перечитает её из хранилища.
 */
class CachedInventoryStore : public ports::output::IInventoryStore {
public:
    CachedInventoryStore(
        std::shared_ptr<ports::output::IInventoryStore> delegate,
        std::shared_ptr<settings::CacheSettings> cacheSettings
    ) : delegate_(std::move(delegate))
      , cacheSettings_(std::move(cacheSettings))
    {
        initCache();
    }

    domain::StockRecord getOrCreate(const std::string& skuId) override {
        auto record = delegate_->getOrCreate(skuId);
        stockCache_->put(skuId, record);
        return record;
    }

    std::optional<domain::StockRecord> find(const std::string& skuId) override {
        auto cached = stockCache_->get(skuId);
        if (cached) {
            return *cached;
        }

        auto record = delegate_->find(skuId);
        if (record) {
            stockCache_->put(skuId, *record);
        }
        return record;
    }

    std::vector<domain::StockRecord> findBatch(const std::vector<std::string>& skuIds) override {
        std::vector<domain::StockRecord> result;
        std::vector<std::string> missingSkuIds;

        for (const auto& skuId : skuIds) {
            auto cached = stockCache_->get(skuId);
            if (cached) {
                result.push_back(*cached);
            } else {
                missingSkuIds.push_back(skuId);
            }
        }

        if (!missingSkuIds.empty()) {
            auto records = delegate_->findBatch(missingSkuIds);
            for (const auto& record : records) {
                stockCache_->put(record.skuId, record);
                result.push_back(record);
            }
        }

        return result;
    }

    domain::StockRecord mutate(const domain::StockMutation& mutation) override {
        try {
            auto record = delegate_->mutate(mutation);
            stockCache_->put(record.skuId, record);
            return record;
        } catch (const domain::InventoryException&) {
            invalidate(mutation.skuId);
            throw;
        }
    }

    std::vector<domain::StockRecord> batchMutate(
        const std::vector<domain::StockMutation>& mutations) override
    {
        try {
            auto records = delegate_->batchMutate(mutations);
            for (const auto& record : records) {
                stockCache_->put(record.skuId, record);
            }
            return records;
        } catch (const domain::InventoryException&) {
            for (const auto& m : mutations) {
                invalidate(m.skuId);
            }
            throw;
        }
    }

    domain::SettlementResult settle(const domain::ReservationSettlement& settlement) override {
        try {
            auto result = delegate_->settle(settlement);
            for (const auto& record : result.records) {
                stockCache_->put(record.skuId, record);
            }
            return result;
        } catch (const domain::InventoryException&) {
            for (const auto& r : settlement.reservations) {
                invalidate(r.skuId);
            }
            throw;
        }
    }

    domain::StockRecord updateThresholds(
        const std::string& skuId,
        int64_t warningThreshold,
        int64_t criticalThreshold) override
    {
        try {
            auto record = delegate_->updateThresholds(skuId, warningThreshold, criticalThreshold);
            stockCache_->put(skuId, record);
            return record;
        } catch (const domain::InventoryException&) {
            invalidate(skuId);
            throw;
        }
    }

    std::vector<domain::StockRecord> findLowStock(
        domain::StockLevel level,
        int limit,
        int64_t offset) override
    {
        // Выборка по всему складу - всегда из хранилища
        return delegate_->findLowStock(level, limit, offset);
    }

    // ============================================
    // УПРАВЛЕНИЕ КЭШЕМ
    // ============================================

    void invalidate(const std::string& skuId) {
        stockCache_->remove(skuId);
    }

    void clearCache() {
        stockCache_->clear();
    }

    size_t getCacheSize() const {
        return stockCache_->size();
    }

private:
    using StockCache = ThreadSafeCache<std::string, domain::StockRecord>;

    void initCache() {
        size_t stockCacheSize = cacheSettings_->getStockCacheSize();
        int stockTtlSeconds = cacheSettings_->getStockTtlSeconds();

        auto stockBase = std::make_unique<Cache<std::string, domain::StockRecord>>(
            stockCacheSize,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(stockTtlSeconds))
        );
        stockCache_ = std::make_unique<StockCache>(std::move(stockBase));

        std::cout << "[CachedInventoryStore] Created with stockCache="
                  << stockCacheSize << "/" << stockTtlSeconds << "s" << std::endl;
    }

    std::shared_ptr<ports::output::IInventoryStore> delegate_;
    std::shared_ptr<settings::CacheSettings> cacheSettings_;
    std::unique_ptr<StockCache> stockCache_;
};

} // namespace inventory::adapters::secondary
