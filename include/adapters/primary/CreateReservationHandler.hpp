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
 * @brief POST /api/v1/reservations - зарезервировать позиции
 *
 * Body:
 * ```json
 * {
 *   "reference_id": "cart-42",
 *   "kind": "CART",
 *   "ttl_seconds": 1800,
 *   "items": [{"sku_id": "S1", "quantity": 5}]
 * }
 * ```
 * ttl_seconds: целое в (0, 2592000], по умолчанию из настроек.
 * Всё или ничего. Повтор с тем же reference_id возвращает те же резервы.
 * Нехватка - 409 с sku_id, requested и available.
 */
class CreateReservationHandler : public IHttpHandler {
public:
    explicit CreateReservationHandler(std::shared_ptr<ports::input::IReservationService> reservationService)
        : reservationService_(std::move(reservationService))
    {
        std::cout << "[CreateReservationHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            ErrorMapper::sendError(res, 405, "Method not allowed", "METHOD_NOT_ALLOWED");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());

            domain::ReserveRequest request;
            request.referenceId = body.value("reference_id", "");
            request.kind = domain::parseReservationKind(body.value("kind", "CART"));
            if (body.contains("ttl_seconds") && !body["ttl_seconds"].is_null()) {
                request.ttl = secondsField(
                    body, "ttl_seconds", ports::input::IReservationService::MAX_TTL);
            }

            if (request.referenceId.empty()) {
                ErrorMapper::sendError(res, 400, "reference_id is required");
                return;
            }
            if (!body.contains("items") || !body["items"].is_array() || body["items"].empty()) {
                ErrorMapper::sendError(res, 400, "items must be a non-empty array");
                return;
            }

            for (const auto& item : body["items"]) {
                domain::ReservationItem ri;
                ri.skuId = item.value("sku_id", "");
                ri.quantity = item.value("quantity", int64_t{0});
                request.items.push_back(ri);
            }

            auto reservations = reservationService_->reserveBatch(request);

            nlohmann::json response;
            response["reference_id"] = request.referenceId;
            response["reservations"] = JsonMapper::toJsonArray(reservations);
            res.setResult(201, "application/json", response.dump());

        } catch (const std::exception& e) {
            ErrorMapper::sendException(res, e, "CreateReservationHandler");
        }
    }

private:
    std::shared_ptr<ports::input::IReservationService> reservationService_;
};

} // namespace inventory::adapters::primary
