#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ErrorMapper.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/IInventoryService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace inventory::adapters::primary {

/**
 * @brief POST /api/v1/adjustments - ручная корректировка остатка
 *
 * Body:
 * ```json
 * {
 *   "sku_id": "S1",
 *   "type": "INCREASE" | "DECREASE" | "SET",
 *   "quantity": 100,
 *   "expected_version": 7,      // опционально
 *   "reason": "поставка",
 *   "operator_id": "admin-1"
 * }
 * ```
 * Несовпадение expected_version - 503 CONCURRENT_MODIFICATION.
 */
class AdjustStockHandler : public IHttpHandler {
public:
    explicit AdjustStockHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
        : inventoryService_(std::move(inventoryService))
    {
        std::cout << "[AdjustStockHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            ErrorMapper::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());

            domain::AdjustmentRequest request;
            request.skuId = body.value("sku_id", "");
            request.type = domain::parseAdjustmentType(body.value("type", "INCREASE"));
            request.quantity = body.value("quantity", int64_t{0});
            request.reason = body.value("reason", "");
            request.operatorId = body.value("operator_id", "");
            if (body.contains("expected_version") && !body["expected_version"].is_null()) {
                request.expectedVersion = body["expected_version"].get<int64_t>();
            }

            if (request.skuId.empty()) {
                ErrorMapper::sendError(res, 400, "sku_id is required");
                return;
            }
            if (request.reason.empty()) {
                ErrorMapper::sendError(res, 400, "reason is required");
                return;
            }

            auto record = inventoryService_->adjust(request);
            res.setResult(200, "application/json", JsonMapper::toJson(record).dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "AdjustStockHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IInventoryService> inventoryService_;
};

} // namespace inventory::adapters::primary
