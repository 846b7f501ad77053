#pragma once

#include "Reservation.hpp"
#include <string>
#include <vector>

namespace inventory::domain {

/**
 * @brief Итог списания по referenceId
 *
 * alreadyDeducted - повторный вызов: всё уже было CONSUMED.
 */
struct DeductionResult {
    std::string referenceId;
    std::vector<Reservation> consumed;
    bool alreadyDeducted = false;
};

} // namespace inventory::domain
