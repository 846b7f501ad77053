#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

/**
 * @file InventoryException.hpp
 * @brief Исключения движка резервирования
 */

namespace inventory::domain {

enum class ErrorCode {
    INSUFFICIENT_STOCK,
    RESERVATION_NOT_FOUND,
    RESERVATION_NOT_ACTIVE,
    RESERVATION_EXPIRED,
    CONCURRENT_MODIFICATION,
    INVALID_ADJUSTMENT,
    STORAGE_UNAVAILABLE
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INSUFFICIENT_STOCK: return "INSUFFICIENT_STOCK";
        case ErrorCode::RESERVATION_NOT_FOUND: return "RESERVATION_NOT_FOUND";
        case ErrorCode::RESERVATION_NOT_ACTIVE: return "RESERVATION_NOT_ACTIVE";
        case ErrorCode::RESERVATION_EXPIRED: return "RESERVATION_EXPIRED";
        case ErrorCode::CONCURRENT_MODIFICATION: return "CONCURRENT_MODIFICATION";
        case ErrorCode::INVALID_ADJUSTMENT: return "INVALID_ADJUSTMENT";
        case ErrorCode::STORAGE_UNAVAILABLE: return "STORAGE_UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Базовое исключение, код определяет реакцию вызывающего
 */
class InventoryException : public std::runtime_error {
public:
    InventoryException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

    /**
     * @brief Имеет ли смысл повторить запрос без изменений
     */
    bool isRetryable() const {
        return code_ == ErrorCode::CONCURRENT_MODIFICATION;
    }

private:
    ErrorCode code_;
};

/**
 * @brief Запрошено больше, чем свободно
 *
 * Всегда несёт актуальный available, чтобы UI мог показать "осталось N".
 */
class InsufficientStockException : public InventoryException {
public:
    InsufficientStockException(const std::string& skuId, int64_t requested, int64_t available)
        : InventoryException(ErrorCode::INSUFFICIENT_STOCK,
              "Insufficient stock for " + skuId + ": requested " + std::to_string(requested) +
              ", available " + std::to_string(available))
        , skuId_(skuId), requested_(requested), available_(available) {}

    const std::string& skuId() const { return skuId_; }
    int64_t requested() const { return requested_; }
    int64_t available() const { return available_; }

private:
    std::string skuId_;
    int64_t requested_;
    int64_t available_;
};

class ReservationNotFoundException : public InventoryException {
public:
    explicit ReservationNotFoundException(const std::string& id)
        : InventoryException(ErrorCode::RESERVATION_NOT_FOUND, "Reservation not found: " + id) {}
};

class ReservationNotActiveException : public InventoryException {
public:
    ReservationNotActiveException(const std::string& id, const std::string& status)
        : InventoryException(ErrorCode::RESERVATION_NOT_ACTIVE,
              "Reservation " + id + " is not active (" + status + ")") {}
};

/**
 * @brief Резерв истёк или освобождён: товар мог уйти другому покупателю
 */
class ReservationExpiredException : public InventoryException {
public:
    explicit ReservationExpiredException(const std::string& referenceId)
        : InventoryException(ErrorCode::RESERVATION_EXPIRED,
              "Reservation for " + referenceId + " expired or was released") {}
};

class ConcurrentModificationException : public InventoryException {
public:
    explicit ConcurrentModificationException(const std::string& message)
        : InventoryException(ErrorCode::CONCURRENT_MODIFICATION, message) {}
};

class InvalidAdjustmentException : public InventoryException {
public:
    explicit InvalidAdjustmentException(const std::string& message)
        : InventoryException(ErrorCode::INVALID_ADJUSTMENT, message) {}
};

class StorageUnavailableException : public InventoryException {
public:
    explicit StorageUnavailableException(const std::string& message)
        : InventoryException(ErrorCode::STORAGE_UNAVAILABLE, message) {}
};

} // namespace inventory::domain
