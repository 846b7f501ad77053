#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ErrorMapper.hpp"
#include "adapters/primary/JsonMapper.hpp"
#include "ports/input/IReservationService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace inventory::adapters::primary {

/**
 * @brief GET /api/v1/reservations/{reference_id} - состояние резервов
 *
 * Вызывающий, не дождавшийся ответа на reserve/deduct, перечитывает
 * статус здесь вместо слепого повтора.
 */
class GetReservationsHandler : public IHttpHandler {
public:
    explicit GetReservationsHandler(std::shared_ptr<ports::input::IReservationService> reservationService)
        : reservationService_(std::move(reservationService))
    {
        std::cout << "[GetReservationsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            ErrorMapper::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
            return;
        }

        try {
            std::string referenceId = req.getPathParam(0).value_or("");
            if (referenceId.empty()) {
                ErrorMapper::sendError(res, 400, "Reference ID is required");
                return;
            }

            auto reservations = reservationService_->getReservations(referenceId);
            if (reservations.empty()) {
                ErrorMapper::sendError(res, 404, "No reservations for " + referenceId,
                                       "RESERVATION_NOT_FOUND");
                return;
            }

            nlohmann::json response;
            response["reference_id"] = referenceId;
            response["reservations"] = JsonMapper::toJsonArray(reservations);
            res.setResult(200, "application/json", response.dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "GetReservationsHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IReservationService> reservationService_;
};

} // namespace inventory::adapters::primary
