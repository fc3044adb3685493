#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IIdentityIssuer.hpp"
#include "ErrorResponse.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace identity::adapters::primary {

/**
 * @brief Анонимная регистрация устройства
 *
 * POST /api/v1/identity/accounts
 * {
 *   "device_fingerprint": "6F1C2A4B-..."
 * }
 *
 * Response (201 - создан, 200 - уже существовал):
 * {
 *   "account_id": "0b6c...-...",
 *   "created": true
 * }
 */
class CreateOrGetAccountHandler : public IHttpHandler {
public:
    explicit CreateOrGetAccountHandler(
        std::shared_ptr<ports::input::IIdentityIssuer> issuer
    ) : issuer_(std::move(issuer)) {}

    void handle(IRequest& req, IResponse& res) override {
        std::string fingerprint;
        try {
            auto body = nlohmann::json::parse(req.getBody());
            if (!body.is_object() || !body.contains("device_fingerprint") || !body["device_fingerprint"].is_string()) {
                sendError(res, domain::AuthErrorCode::INVALID_ARGUMENT, "device_fingerprint is required");
                return;
            }
            fingerprint = body["device_fingerprint"].get<std::string>();
        } catch (const nlohmann::json::exception&) {
            sendError(res, domain::AuthErrorCode::INVALID_ARGUMENT, "Invalid JSON");
            return;
        }

        auto result = issuer_->createOrGetAccount(fingerprint);
        if (!result.success) {
            sendError(res, result.error, result.message);
            return;
        }

        nlohmann::json response;
        response["account_id"] = result.accountId;
        response["created"] = result.created;

        res.setResult(result.created ? 201 : 200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::IIdentityIssuer> issuer_;
};

} // namespace identity::adapters::primary
