#pragma once

#include "ports/input/IAuthInterceptor.hpp"
#include "ports/input/ITokenService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "settings/InterceptorSettings.hpp"
#include <memory>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace identity::application {

/**
 * @brief Аутентификация входящего вызова
 *
 * Received -> Extracting -> Validating -> {Authorized, Rejected}
 *
 * - authorization есть: только Bearer, dev-заголовок игнорируется;
 * - authorization нет: dev-заголовок принимается только если
 *   InterceptorSettings::isDevHeaderAllowed();
 * - ошибки TokenService сводятся к UNAUTHENTICATED, кроме
 *   UNAVAILABLE и DEADLINE_EXCEEDED. Повторов нет.
 */
class AuthInterceptor : public ports::input::IAuthInterceptor {
public:
    AuthInterceptor(
        std::shared_ptr<ports::input::ITokenService> tokenService,
        std::shared_ptr<settings::InterceptorSettings> settings,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : tokenService_(std::move(tokenService))
      , settings_(std::move(settings))
      , metrics_(std::move(metrics))
    {
        std::cout << "[AuthInterceptor] Created, mode=" << domain::toString(settings_->getMode())
                  << " devHeader=" << (settings_->isDevHeaderAllowed() ? "on" : "off") << std::endl;
    }

    ports::input::InterceptResult intercept(const ports::input::InboundCredentials& credentials) override {
        using ports::input::InterceptState;

        ports::input::InterceptResult result;
        result.trace.push_back(InterceptState::RECEIVED);

        transition(result, InterceptState::EXTRACTING);

        if (credentials.authorization) {
            auto token = extractBearerToken(*credentials.authorization);
            if (!token) {
                return reject(result, domain::AuthErrorCode::UNAUTHENTICATED,
                              "Authorization header must use the Bearer scheme");
            }

            transition(result, InterceptState::VALIDATING);

            auto validation = tokenService_->validate(*token);
            if (!validation.valid) {
                return reject(result, toBoundaryError(validation.error), validation.message);
            }

            return authorize(result, domain::CallContext(validation.accountId, domain::AuthMethod::BEARER_TOKEN));
        }

        if (credentials.devAccountId) {
            if (!settings_->isDevHeaderAllowed()) {
                return reject(result, domain::AuthErrorCode::UNAUTHENTICATED, "Bearer token required");
            }
            if (credentials.devAccountId->empty()) {
                return reject(result, domain::AuthErrorCode::UNAUTHENTICATED, "Empty development account header");
            }

            std::cerr << "[AuthInterceptor] WARNING: call authorized by insecure header for "
                      << *credentials.devAccountId << std::endl;
            return authorize(result, domain::CallContext(*credentials.devAccountId, domain::AuthMethod::DEV_ACCOUNT_HEADER));
        }

        return reject(result, domain::AuthErrorCode::UNAUTHENTICATED, "Bearer token required");
    }

private:
    std::shared_ptr<ports::input::ITokenService> tokenService_;
    std::shared_ptr<settings::InterceptorSettings> settings_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    static void transition(ports::input::InterceptResult& result, ports::input::InterceptState next) {
        result.state = next;
        result.trace.push_back(next);
    }

    ports::input::InterceptResult& authorize(ports::input::InterceptResult& result, domain::CallContext context) {
        transition(result, ports::input::InterceptState::AUTHORIZED);
        result.context = std::move(context);
        result.error = domain::AuthErrorCode::OK;
        result.message = "Authorized";
        metrics_->increment("auth_requests_total", {{"result", "authorized"}});
        return result;
    }

    ports::input::InterceptResult& reject(
        ports::input::InterceptResult& result,
        domain::AuthErrorCode code,
        const std::string& message
    ) {
        transition(result, ports::input::InterceptState::REJECTED);
        result.context.reset();
        result.error = code;
        result.message = message;
        metrics_->increment("auth_requests_total", {{"result", metricLabel(code)}});
        return result;
    }

    static domain::AuthErrorCode toBoundaryError(domain::AuthErrorCode code) {
        if (code == domain::AuthErrorCode::UNAVAILABLE || code == domain::AuthErrorCode::DEADLINE_EXCEEDED) {
            return code;
        }
        return domain::AuthErrorCode::UNAUTHENTICATED;
    }

    static std::string metricLabel(domain::AuthErrorCode code) {
        switch (code) {
            case domain::AuthErrorCode::UNAVAILABLE:       return "unavailable";
            case domain::AuthErrorCode::DEADLINE_EXCEEDED: return "deadline_exceeded";
            default: return "unauthenticated";
        }
    }

    /**
     * @brief "Bearer <token>", схема без учёта регистра
     */
    static std::optional<std::string> extractBearerToken(const std::string& header) {
        static const std::string scheme = "bearer ";
        if (header.size() <= scheme.size()) {
            return std::nullopt;
        }

        std::string prefix = header.substr(0, scheme.size());
        std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (prefix != scheme) {
            return std::nullopt;
        }

        std::string token = header.substr(scheme.size());
        auto first = token.find_first_not_of(' ');
        auto last = token.find_last_not_of(' ');
        if (first == std::string::npos) {
            return std::nullopt;
        }
        return token.substr(first, last - first + 1);
    }
};

} // namespace identity::application
