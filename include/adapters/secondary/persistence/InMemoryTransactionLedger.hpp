#pragma once

#include "ports/output/ITransactionLedger.hpp"
#include <algorithm>
#include <mutex>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief Журнал в памяти (локальный запуск и тесты)
 *
 * id выдаются последовательно с 1, порядок хранения = порядок id.
 */
class InMemoryTransactionLedger : public ports::output::ITransactionLedger {
public:
    domain::LedgerEntry append(const domain::LedgerEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return appendLocked(entry);
    }

    std::vector<domain::LedgerEntry> appendBatch(
        const std::vector<domain::LedgerEntry>& entries) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.reserve(entries_.size() + entries.size());

        std::vector<domain::LedgerEntry> stored;
        stored.reserve(entries.size());
        for (const auto& entry : entries) {
            stored.push_back(appendLocked(entry));
        }
        return stored;
    }

    std::vector<domain::LedgerEntry> findBySku(const std::string& skuId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::LedgerEntry> result;
        for (const auto& entry : entries_) {
            if (entry.skuId == skuId) {
                result.push_back(entry);
            }
        }
        return result;
    }

    domain::LedgerPage query(const domain::LedgerQuery& query) override {
        std::lock_guard<std::mutex> lock(mutex_);

        domain::LedgerPage page;
        page.page = query.page;
        page.pageSize = query.pageSize;

        int64_t skip = static_cast<int64_t>(query.page - 1) * query.pageSize;

        // Новые первыми
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (!matches(*it, query)) {
                continue;
            }
            if (page.total >= skip &&
                page.entries.size() < static_cast<size_t>(query.pageSize)) {
                page.entries.push_back(*it);
            }
            ++page.total;
        }
        return page;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::LedgerEntry> entries_;
    int64_t nextId_ = 1;

    domain::LedgerEntry appendLocked(const domain::LedgerEntry& entry) {
        domain::LedgerEntry stored = entry;
        stored.id = nextId_++;
        entries_.push_back(stored);
        return stored;
    }

    static bool matches(const domain::LedgerEntry& entry, const domain::LedgerQuery& query) {
        if (query.skuId && entry.skuId != *query.skuId) return false;
        if (query.kind && entry.kind != *query.kind) return false;
        if (query.from && entry.createdAt < *query.from) return false;
        if (query.to && *query.to < entry.createdAt) return false;
        return true;
    }
};

} // namespace inventory::adapters::secondary
