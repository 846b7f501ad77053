#pragma once

#include "LedgerEntry.hpp"
#include "Timestamp.hpp"
#include "enums/LedgerEntryKind.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Фильтр выборки журнала
 *
 * page начинается с 1, pageSize от 1 до 100.
 */
struct LedgerQuery {
    std::optional<std::string> skuId;
    std::optional<LedgerEntryKind> kind;
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;
    int page = 1;
    int pageSize = 10;
};

struct LedgerPage {
    std::vector<LedgerEntry> entries;
    int64_t total = 0;
    int page = 1;
    int pageSize = 10;
};

} // namespace inventory::domain
