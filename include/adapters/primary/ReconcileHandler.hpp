#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ErrorMapper.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/IInventoryService.hpp"
#include <memory>
#include <iostream>

namespace inventory::adapters::primary {

/**
 * @brief GET /api/v1/reconciliation/{sku_id} - сверка счётчиков с журналом
 */
class ReconcileHandler : public IHttpHandler {
public:
    explicit ReconcileHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
        : inventoryService_(std::move(inventoryService))
    {
        std::cout << "[ReconcileHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            ErrorMapper::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
            return;
        }

        try {
            std::string skuId = req.getPathParam(0).value_or("");
            if (skuId.empty()) {
                ErrorMapper::sendError(res, 400, "SKU ID is required");
                return;
            }

            auto report = inventoryService_->reconcile(skuId);
            res.setResult(200, "application/json", JsonMapper::toJson(report).dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "ReconcileHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IInventoryService> inventoryService_;
};

} // namespace inventory::adapters::primary
