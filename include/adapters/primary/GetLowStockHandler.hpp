#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ErrorMapper.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "adapters/primary/QueryParams.hpp"
#include "ports/input/IInventoryService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace inventory::adapters::primary {

/**
 * @brief GET /api/v1/low-stock?level=warning|critical|out&page=1&page_size=20
 */
class GetLowStockHandler : public IHttpHandler {
public:
    explicit GetLowStockHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
        : inventoryService_(std::move(inventoryService))
    {
        std::cout << "[GetLowStockHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            ErrorMapper::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
            return;
        }

        try {
            auto level = domain::parseStockLevel(
                stringQueryParam(req, "level").value_or("warning"));
            int page = intQueryParam(req, "page", 1);
            int pageSize = intQueryParam(req, "page_size", 20);

            auto records = inventoryService_->getLowStock(level, page, pageSize);

            nlohmann::json response;
            response["level"] = domain::toString(level);
            response["stocks"] = JsonMapper::toJsonArray(records);
            response["page"] = page;
            response["page_size"] = pageSize;
            res.setResult(200, "application/json", response.dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "GetLowStockHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IInventoryService> inventoryService_;
};

} // namespace inventory::adapters::primary
