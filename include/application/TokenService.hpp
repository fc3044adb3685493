#pragma once

#include "ports/input/ITokenService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IJwtProvider.hpp"
#include "ports/output/IClock.hpp"
#include "settings/TokenSettings.hpp"
#include "domain/StorageExceptions.hpp"
#include "IdGenerator.hpp"
#include <memory>
#include <iostream>

namespace identity::application {

/**
 * @brief Выдача и проверка bearer token'ов
 *
 * Токен stateless: validate() проверяет только подпись и claims,
 * не обращаясь к хранилищу. Срок действия - полуинтервал [iat, exp),
 * расширенный на clock skew из настроек.
 */
class TokenService : public ports::input::ITokenService {
public:
    TokenService(
        std::shared_ptr<settings::TokenSettings> settings,
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IJwtProvider> jwtProvider,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : settings_(std::move(settings))
      , accountRepo_(std::move(accountRepo))
      , jwtProvider_(std::move(jwtProvider))
      , clock_(std::move(clock))
      , metrics_(std::move(metrics))
    {
        std::cout << "[TokenService] Created, issuer=" << settings_->getIssuer()
                  << " audience=" << settings_->getAudience()
                  << " ttl=" << settings_->getTtlSeconds() << "s" << std::endl;
    }

    ports::input::IssueTokenResult issue(const std::string& accountId) override {
        ports::input::IssueTokenResult result;

        if (accountId.empty()) {
            result.error = domain::AuthErrorCode::INVALID_ARGUMENT;
            result.message = "account_id is required";
            return result;
        }

        try {
            if (!accountRepo_->findById(accountId)) {
                result.error = domain::AuthErrorCode::INVALID_ARGUMENT;
                result.message = "Unknown account";
                return result;
            }

            // Секунды: exp/iat в токене без дробной части
            auto now = std::chrono::time_point_cast<std::chrono::seconds>(clock_->now());

            domain::TokenClaims claims;
            claims.subject = accountId;
            claims.issuer = settings_->getIssuer();
            claims.audience = settings_->getAudience();
            claims.tokenId = IdGenerator::uuidV4();
            claims.issuedAt = now;
            claims.expiresAt = now + settings_->getTtl();

            result.token.token = jwtProvider_->encode(claims);
            result.token.accountId = accountId;
            result.token.issuedAt = claims.issuedAt;
            result.token.expiresAt = claims.expiresAt;
            result.success = true;
            result.message = "Token issued";

            metrics_->increment("tokens_issued_total");
            return result;

        } catch (const domain::StorageTimeoutException& e) {
            std::cerr << "[TokenService] issue() storage timeout: " << e.what() << std::endl;
            result.error = domain::AuthErrorCode::DEADLINE_EXCEEDED;
            result.message = "Account storage timed out";
        } catch (const domain::StorageUnavailableException& e) {
            std::cerr << "[TokenService] issue() storage unavailable: " << e.what() << std::endl;
            result.error = domain::AuthErrorCode::UNAVAILABLE;
            result.message = "Account storage unavailable";
        } catch (const domain::SigningKeyUnavailableException& e) {
            std::cerr << "[TokenService] issue() signing key unavailable: " << e.what() << std::endl;
            result.error = domain::AuthErrorCode::UNAVAILABLE;
            result.message = "Signing key unavailable";
        }
        return result;
    }

    ports::input::ValidateResult validate(const std::string& token) override {
        if (token.empty()) {
            return rejected("Token is required");
        }

        auto decoded = jwtProvider_->decode(token);
        if (decoded.status != ports::output::JwtDecodeStatus::OK) {
            return rejected(ports::output::toString(decoded.status));
        }

        const auto& claims = decoded.claims;

        if (claims.issuer != settings_->getIssuer()) {
            return rejected("Invalid token issuer");
        }
        if (claims.audience != settings_->getAudience()) {
            return rejected("Invalid token audience");
        }
        if (claims.subject.empty()) {
            return rejected("Token has no subject");
        }

        auto now = clock_->now();
        auto skew = settings_->getClockSkew();

        if (now >= claims.expiresAt + skew) {
            return rejected("Token expired");
        }
        if (claims.issuedAt > now + skew) {
            return rejected("Token issued in the future");
        }

        return {true, claims.subject, domain::AuthErrorCode::OK, "Valid"};
    }

private:
    std::shared_ptr<settings::TokenSettings> settings_;
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IJwtProvider> jwtProvider_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    static ports::input::ValidateResult rejected(const std::string& message) {
        return {false, "", domain::AuthErrorCode::UNAUTHENTICATED, message};
    }
};

} // namespace identity::application
