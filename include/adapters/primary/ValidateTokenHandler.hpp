#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITokenService.hpp"
#include "ErrorResponse.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace identity::adapters::primary {

/**
 * @brief Валидация токена (внутренний API для других сервисов)
 *
 * POST /api/v1/auth/validate
 * {
 *   "token": "eyJ..."
 * }
 *
 * Response:
 * {
 *   "valid": true,
 *   "account_id": "0b6c..."
 * }
 */
class ValidateTokenHandler : public IHttpHandler {
public:
    explicit ValidateTokenHandler(
        std::shared_ptr<ports::input::ITokenService> tokenService
    ) : tokenService_(std::move(tokenService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());
            std::string token = body.is_object() ? body.value("token", "") : "";

            if (token.empty()) {
                sendError(res, domain::AuthErrorCode::INVALID_ARGUMENT, "token is required");
                return;
            }

            auto result = tokenService_->validate(token);

            nlohmann::json response;
            response["valid"] = result.valid;
            if (result.valid) {
                response["account_id"] = result.accountId;
            } else {
                response["error"] = domain::toString(result.error);
                response["message"] = result.message;
            }

            res.setResult(200, "application/json", response.dump());

        } catch (const nlohmann::json::exception&) {
            sendError(res, domain::AuthErrorCode::INVALID_ARGUMENT, "Invalid JSON");
        }
    }

private:
    std::shared_ptr<ports::input::ITokenService> tokenService_;
};

} // namespace identity::adapters::primary
