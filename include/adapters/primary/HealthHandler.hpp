#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/ISigningKeyStore.hpp"
#include "domain/StorageExceptions.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace identity::adapters::primary {

/**
 * @brief GET /health
 *
 * Сервис готов, пока есть ключ для подписи токенов: без него
 * IssueToken отвечает UNAVAILABLE, и под должен уйти из балансировки (503).
 * БД здесь не опрашивается, чтобы health не зависел от statement_timeout.
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<ports::output::ISigningKeyStore> keyStore)
        : keyStore_(std::move(keyStore)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["service"] = "identity-service";
        response["version"] = "1.0.0";

        try {
            auto key = keyStore_->currentKey();
            response["status"] = "healthy";
            response["signing_key"] = {{"ready", true}, {"kid", key.keyId}};
            res.setResult(200, "application/json", response.dump());
        } catch (const domain::SigningKeyUnavailableException& e) {
            std::cerr << "[HealthHandler] Signing key unavailable: " << e.what() << std::endl;
            response["status"] = "unhealthy";
            response["signing_key"] = {{"ready", false}};
            res.setResult(503, "application/json", response.dump());
        }
    }

private:
    std::shared_ptr<ports::output::ISigningKeyStore> keyStore_;
};

} // namespace identity::adapters::primary
