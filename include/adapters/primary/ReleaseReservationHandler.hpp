#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ErrorMapper.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "adapters/primary/QueryParams.hpp"
#include "ports/input/IReservationService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace inventory::adapters::primary {

/**
 * @brief DELETE /api/v1/reservations/{reference_id}[?kind=CART|ORDER]
 *
 * Освобождает все ACTIVE резервы ключа. Повтор - 200 с пустым released.
 */
class ReleaseReservationHandler : public IHttpHandler {
public:
    explicit ReleaseReservationHandler(std::shared_ptr<ports::input::IReservationService> reservationService)
        : reservationService_(std::move(reservationService))
    {
        std::cout << "[ReleaseReservationHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "DELETE") {
            ErrorMapper::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
            return;
        }

        try {
            std::string referenceId = req.getPathParam(0).value_or("");
            if (referenceId.empty()) {
                ErrorMapper::sendError(res, 400, "Reference ID is required");
                return;
            }

            std::optional<domain::ReservationKind> kind;
            if (auto raw = stringQueryParam(req, "kind")) {
                kind = domain::parseReservationKind(*raw);
            }

            auto released = reservationService_->release(referenceId, kind);

            nlohmann::json response;
            response["reference_id"] = referenceId;
            response["released"] = JsonMapper::toJsonArray(released);
            res.setResult(200, "application/json", response.dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "ReleaseReservationHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IReservationService> reservationService_;
};

} // namespace inventory::adapters::primary
