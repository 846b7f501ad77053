#pragma once

#include <cstddef>

namespace inventory::domain {

/**
 * @brief Статистика одного прохода ExpirationSweeper
 *
 * skipped - CAS проигран (резерв уже CONSUMED/RELEASED), это нормальный исход гонки.
 * failed  - CAS выигран, но вернуть удержание не удалось (залогировано).
 */
struct SweepReport {
    std::size_t scanned = 0;
    std::size_t expired = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
};

} // namespace inventory::domain
