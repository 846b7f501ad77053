#pragma once

#include "domain/InventoryException.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <string>

namespace inventory::adapters::secondary {

/**
 * @brief Перевод исключений libpqxx в доменные
 *
 * - 55P03 lock_not_available, 40001 serialization_failure,
 *   40P01 deadlock_detected, 57014 query_canceled -> ConcurrentModification
 * - 23xxx нарушение ограничения -> InvalidAdjustment
 * - потеря соединения и прочие ошибки -> StorageUnavailable
 *
 * Доменные исключения пробрасываются без изменений.
 */
template <typename Fn>
auto withPostgresErrors(const char* component, const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const domain::InventoryException&) {
        throw;
    } catch (const pqxx::broken_connection& e) {
        std::cerr << "[" << component << "] " << operation << " connection lost: " << e.what() << std::endl;
        throw domain::StorageUnavailableException(std::string(operation) + ": " + e.what());
    } catch (const pqxx::sql_error& e) {
        const std::string state = e.sqlstate();
        std::cerr << "[" << component << "] " << operation << " sql error "
                  << state << ": " << e.what() << std::endl;

        if (state == "55P03" || state == "40001" || state == "40P01" || state == "57014") {
            throw domain::ConcurrentModificationException(
                std::string(operation) + ": row is busy (" + state + ")");
        }
        if (state.rfind("23", 0) == 0) {
            throw domain::InvalidAdjustmentException(
                std::string(operation) + ": constraint violation (" + state + ")");
        }
        throw domain::StorageUnavailableException(std::string(operation) + ": " + e.what());
    } catch (const pqxx::failure& e) {
        std::cerr << "[" << component << "] " << operation << " error: " << e.what() << std::endl;
        throw domain::StorageUnavailableException(std::string(operation) + ": " + e.what());
    }
}

} // namespace inventory::adapters::secondary
