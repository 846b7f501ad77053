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
 * @brief POST /api/v1/stocks/batch - остатки нескольких SKU
 *
 * Body: {"sku_ids": ["S1", "S2"]}, от 1 до 100 SKU, повторы отбрасываются.
 */
class GetStocksBatchHandler : public IHttpHandler {
public:
    explicit GetStocksBatchHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
        : inventoryService_(std::move(inventoryService))
    {
        std::cout << "[GetStocksBatchHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            ErrorMapper::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());
            if (!body.contains("sku_ids") || !body["sku_ids"].is_array()) {
                ErrorMapper::sendError(res, 400, "sku_ids array is required");
                return;
            }

            auto skuIds = body["sku_ids"].get<std::vector<std::string>>();
            auto records = inventoryService_->getStocks(skuIds);

            nlohmann::json response;
            response["stocks"] = JsonMapper::toJsonArray(records);
            response["count"] = records.size();
            res.setResult(200, "application/json", response.dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "GetStocksBatchHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IInventoryService> inventoryService_;
};

} // namespace inventory::adapters::primary
