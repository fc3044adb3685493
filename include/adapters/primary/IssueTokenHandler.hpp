#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IIdentityIssuer.hpp"
#include "ports/input/ITokenService.hpp"
#include "ErrorResponse.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace identity::adapters::primary {

/**
 * @brief Handler для получения access_token
 *
 * POST /api/v1/auth/token
 * Body: {"device_fingerprint": "6F1C2A4B-..."}
 * Response: {"access_token": "eyJ...", "token_type": "Bearer", "expires_in": 1800, "account_id": "..."}
 *
 * Flow:
 * 1. create-or-get аккаунта по fingerprint
 * 2. выдача токена для найденного accountId
 *
 * accountId из тела запроса не принимается.
 */
class IssueTokenHandler : public IHttpHandler {
public:
    IssueTokenHandler(
        std::shared_ptr<ports::input::IIdentityIssuer> issuer,
        std::shared_ptr<ports::input::ITokenService> tokenService
    ) : issuer_(std::move(issuer))
      , tokenService_(std::move(tokenService)) {}

    void handle(IRequest& req, IResponse& res) override {
        // 1. Парсим body
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

        // 2. Аккаунт устройства
        auto account = issuer_->createOrGetAccount(fingerprint);
        if (!account.success) {
            sendError(res, account.error, account.message);
            return;
        }

        // 3. Токен
        auto issued = tokenService_->issue(account.accountId);
        if (!issued.success) {
            std::cerr << "[IssueTokenHandler] issue() failed: " << issued.message << std::endl;
            sendError(res, issued.error, issued.message);
            return;
        }

        nlohmann::json response;
        response["access_token"] = issued.token.token;
        response["token_type"] = "Bearer";
        response["expires_in"] = issued.token.expiresInSeconds();
        response["account_id"] = issued.token.accountId;

        res.setHeader("Cache-Control", "no-store");
        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::IIdentityIssuer> issuer_;
    std::shared_ptr<ports::input::ITokenService> tokenService_;
};

} // namespace identity::adapters::primary
