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
 * @brief PUT /api/v1/stocks/{sku_id} - пороги предупреждения
 *
 * Body: {"warning_threshold": 10, "critical_threshold": 5}
 * Требуется 0 <= critical <= warning, иначе 422.
 */
class UpdateThresholdsHandler : public IHttpHandler {
public:
    explicit UpdateThresholdsHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
        : inventoryService_(std::move(inventoryService))
    {
        std::cout << "[UpdateThresholdsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "PUT") {
            ErrorMapper::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
            return;
        }

        try {
            std::string skuId = req.getPathParam(0).value_or("");
            if (skuId.empty()) {
                ErrorMapper::sendError(res, 400, "SKU ID is required");
                return;
            }

            auto body = nlohmann::json::parse(req.getBody());
            if (!body.contains("warning_threshold") || !body.contains("critical_threshold")) {
                ErrorMapper::sendError(res, 400, "warning_threshold and critical_threshold are required");
                return;
            }

            auto record = inventoryService_->updateThresholds(
                skuId,
                body["warning_threshold"].get<int64_t>(),
                body["critical_threshold"].get<int64_t>());
            res.setResult(200, "application/json", JsonMapper::toJson(record).dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "UpdateThresholdsHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IInventoryService> inventoryService_;
};

} // namespace inventory::adapters::primary
