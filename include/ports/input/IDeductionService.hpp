#pragma once

#include "domain/DeductionResult.hpp"
#include <string>

namespace inventory::ports::input {

/**
 * @brief Интерфейс окончательного списания
 *
 * Вызывается модулем заказа после подтверждения оплаты.
 */
class IDeductionService {
public:
    virtual ~IDeductionService() = default;

    virtual domain::DeductionResult deduct(const std::string& referenceId) = 0;
};

} // namespace inventory::ports::input
