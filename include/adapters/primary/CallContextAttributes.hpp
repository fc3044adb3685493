#pragma once

#include <IRequest.hpp>
#include "domain/CallContext.hpp"
#include <optional>
#include <stdexcept>

namespace identity::adapters::primary {

/**
 * @brief Передача CallContext от middleware к handler через attributes запроса
 *
 * Attributes заполняются только на стороне сервера; заголовки и тело
 * запроса сюда не попадают.
 */
class CallContextAttributes {
public:
    static constexpr const char* ACCOUNT_ID = "accountId";
    static constexpr const char* AUTH_METHOD = "authMethod";

    static void attach(IRequest& req, const domain::CallContext& context) {
        req.setAttribute(ACCOUNT_ID, context.accountId);
        req.setAttribute(AUTH_METHOD, domain::toString(context.authMethod));
    }

    /**
     * @return nullopt если запрос не прошёл AuthInterceptorMiddleware
     */
    static std::optional<domain::CallContext> resolve(IRequest& req) {
        auto accountId = req.getAttribute(ACCOUNT_ID);
        auto method = req.getAttribute(AUTH_METHOD);
        if (!accountId || accountId->empty() || !method) {
            return std::nullopt;
        }

        try {
            return domain::CallContext(*accountId, domain::parseAuthMethod(*method));
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }
};

} // namespace identity::adapters::primary
