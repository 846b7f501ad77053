#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ErrorMapper.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/IInventoryService.hpp"
#include <memory>
#include <iostream>

namespace inventory::adapters::primary {

/**
 * @brief GET /api/v1/stocks/{sku_id} - остаток SKU
 *
 * Роутер регистрирует с паттерном "/api/v1/stocks/*".
 * Читает через кэш; неизвестный SKU создаётся с нулевым остатком.
 */
class GetStockHandler : public IHttpHandler {
public:
    explicit GetStockHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
        : inventoryService_(std::move(inventoryService))
    {
        std::cout << "[GetStockHandler] Created" << std::endl;
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

            auto record = inventoryService_->getStock(skuId);
            res.setResult(200, "application/json", JsonMapper::toJson(record).dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "GetStockHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IInventoryService> inventoryService_;
};

} // namespace inventory::adapters::primary
