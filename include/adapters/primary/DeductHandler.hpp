#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ErrorMapper.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/IDeductionService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace inventory::adapters::primary {

/**
 * @brief POST /api/v1/deductions - списать резервы после оплаты
 *
 * Body: {"reference_id": "order-7"}
 * 404 - резервов нет, 410 - резерв истёк (товар мог уйти другому).
 */
class DeductHandler : public IHttpHandler {
public:
    explicit DeductHandler(std::shared_ptr<ports::input::IDeductionService> deductionService)
        : deductionService_(std::move(deductionService))
    {
        std::cout << "[DeductHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            ErrorMapper::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());
            std::string referenceId = body.value("reference_id", "");
            if (referenceId.empty()) {
                ErrorMapper::sendError(res, 400, "reference_id is required");
                return;
            }

            auto result = deductionService_->deduct(referenceId);

            nlohmann::json response;
            response["reference_id"] = result.referenceId;
            response["already_deducted"] = result.alreadyDeducted;
            response["consumed"] = JsonMapper::toJsonArray(result.consumed);
            res.setResult(200, "application/json", response.dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "DeductHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IDeductionService> deductionService_;
};

} // namespace inventory::adapters::primary
