#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Тип записи в журнале движения остатков
 *
 * RESTOCK - ручное поступление товара (частный случай ADJUST).
 */
enum class LedgerEntryKind {
    RESERVE,
    RELEASE,
    DEDUCT,
    ADJUST,
    RESTOCK
};

inline std::string toString(LedgerEntryKind kind) {
    switch (kind) {
        case LedgerEntryKind::RESERVE: return "RESERVE";
        case LedgerEntryKind::RELEASE: return "RELEASE";
        case LedgerEntryKind::DEDUCT: return "DEDUCT";
        case LedgerEntryKind::ADJUST: return "ADJUST";
        case LedgerEntryKind::RESTOCK: return "RESTOCK";
        default: return "UNKNOWN";
    }
}

inline LedgerEntryKind parseLedgerEntryKind(const std::string& str) {
    if (str == "RESERVE") return LedgerEntryKind::RESERVE;
    if (str == "RELEASE") return LedgerEntryKind::RELEASE;
    if (str == "DEDUCT") return LedgerEntryKind::DEDUCT;
    if (str == "ADJUST") return LedgerEntryKind::ADJUST;
    if (str == "RESTOCK") return LedgerEntryKind::RESTOCK;
    throw std::invalid_argument("Unknown ledger entry kind: " + str);
}

} // namespace inventory::domain
