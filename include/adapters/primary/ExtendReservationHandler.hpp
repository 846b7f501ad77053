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
 * @brief PATCH /api/v1/reservations/{reservation_id} - продлить резерв
 *
 * Body: {"additional_ttl_seconds": 600}, не больше 30 суток за раз.
 * 404 - резерв не найден, 409 - резерв уже не ACTIVE.
 */
class ExtendReservationHandler : public IHttpHandler {
public:
    explicit ExtendReservationHandler(std::shared_ptr<ports::input::IReservationService> reservationService)
        : reservationService_(std::move(reservationService))
    {
        std::cout << "[ExtendReservationHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "PATCH") {
            ErrorMapper::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
            return;
        }

        try {
            std::string reservationId = req.getPathParam(0).value_or("");
            if (reservationId.empty()) {
                ErrorMapper::sendError(res, 400, "Reservation ID is required");
                return;
            }

            auto body = nlohmann::json::parse(req.getBody());
            if (!body.contains("additional_ttl_seconds")) {
                ErrorMapper::sendError(res, 400, "additional_ttl_seconds must be positive");
                return;
            }
            auto seconds = secondsField(
                body, "additional_ttl_seconds", ports::input::IReservationService::MAX_TTL);

            auto reservation = reservationService_->extend(reservationId, seconds);
            res.setResult(200, "application/json", JsonMapper::toJson(reservation).dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "ExtendReservationHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IReservationService> reservationService_;
};

} // namespace inventory::adapters::primary
