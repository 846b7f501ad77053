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
 * @brief GET /api/v1/ledger - журнал движения остатков
 *
 * Query: sku_id, kind (RESERVE|RELEASE|DEDUCT|ADJUST|RESTOCK),
 * from, to (ISO 8601 UTC), page (>= 1), page_size (1..100).
 * Новые записи первыми.
 */
class GetLedgerHandler : public IHttpHandler {
public:
    explicit GetLedgerHandler(std::shared_ptr<ports::input::IInventoryService> inventoryService)
        : inventoryService_(std::move(inventoryService))
    {
        std::cout << "[GetLedgerHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            ErrorMapper::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
            return;
        }

        try {
            domain::LedgerQuery query;
            query.skuId = stringQueryParam(req, "sku_id");
            if (auto kind = stringQueryParam(req, "kind")) {
                query.kind = domain::parseLedgerEntryKind(*kind);
            }
            if (auto from = stringQueryParam(req, "from")) {
                query.from = domain::Timestamp::fromString(*from);
            }
            if (auto to = stringQueryParam(req, "to")) {
                query.to = domain::Timestamp::fromString(*to);
            }
            query.page = intQueryParam(req, "page", 1);
            query.pageSize = intQueryParam(req, "page_size", 10);

            auto page = inventoryService_->getLedger(query);
            res.setResult(200, "application/json", JsonMapper::toJson(page).dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "GetLedgerHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IInventoryService> inventoryService_;
};

} // namespace inventory::adapters::primary
