#pragma once

#include <IResponse.hpp>
#include "domain/InventoryException.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

namespace inventory::adapters::primary {

/**
 * @brief Исключение -> HTTP ответ {"error": "...", "code": "..."}
 *
 * | Исключение                  | HTTP |
 * |-----------------------------|------|
 * | InsufficientStock           | 409 (+ sku_id, requested, available) |
 * | ReservationNotFound         | 404  |
 * | ReservationNotActive        | 409  |
 * | ReservationExpired          | 410  |
 * | ConcurrentModification      | 503 (можно повторить) |
 * | InvalidAdjustment           | 422  |
 * | StorageUnavailable          | 503  |
 * | JSON / std::invalid_argument| 400  |
 * | прочее                      | 500  |
 */
class ErrorMapper {
public:
    static void sendError(IResponse& res, int status, const std::string& message,
                          const std::string& code = "BAD_REQUEST")
    {
        nlohmann::json error;
        error["error"] = message;
        error["code"] = code;
        res.setResult(status, "application/json", error.dump());
    }

    static void sendException(IResponse& res, const std::exception& e, const char* component) {
        if (auto* insufficient = dynamic_cast<const domain::InsufficientStockException*>(&e)) {
            nlohmann::json error;
            error["error"] = insufficient->what();
            error["code"] = domain::toString(insufficient->code());
            error["sku_id"] = insufficient->skuId();
            error["requested"] = insufficient->requested();
            error["available"] = insufficient->available();
            res.setResult(409, "application/json", error.dump());
            return;
        }

        if (auto* inventory = dynamic_cast<const domain::InventoryException*>(&e)) {
            int status = statusFor(inventory->code());
            if (status >= 500) {
                std::cerr << "[" << component << "] " << inventory->what() << std::endl;
            }
            sendError(res, status, inventory->what(), domain::toString(inventory->code()));
            return;
        }

        if (dynamic_cast<const nlohmann::json::exception*>(&e)) {
            sendError(res, 400, "Invalid JSON");
            return;
        }

        if (dynamic_cast<const std::invalid_argument*>(&e)) {
            sendError(res, 400, e.what());
            return;
        }

        std::cerr << "[" << component << "] Error: " << e.what() << std::endl;
        sendError(res, 500, "Internal server error", "INTERNAL");
    }

    static int statusFor(domain::ErrorCode code) {
        switch (code) {
            case domain::ErrorCode::INSUFFICIENT_STOCK: return 409;
            case domain::ErrorCode::RESERVATION_NOT_FOUND: return 404;
            case domain::ErrorCode::RESERVATION_NOT_ACTIVE: return 409;
            case domain::ErrorCode::RESERVATION_EXPIRED: return 410;
            case domain::ErrorCode::CONCURRENT_MODIFICATION: return 503;
            case domain::ErrorCode::INVALID_ADJUSTMENT: return 422;
            case domain::ErrorCode::STORAGE_UNAVAILABLE: return 503;
            default: return 500;
        }
    }
};

} // namespace inventory::adapters::primary
