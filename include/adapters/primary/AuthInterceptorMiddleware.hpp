#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthInterceptor.hpp"
#include "settings/InterceptorSettings.hpp"
#include "CallContextAttributes.hpp"
#include "ErrorResponse.hpp"
#include <memory>
#include <iostream>

namespace identity::adapters::primary
{

    /**
     * @brief Middleware аутентификации перед всеми RPC с пользовательскими данными
     *
     * Читает authorization и x-dev-account-id-insecure, прогоняет их через
     * IAuthInterceptor. При успехе кладёт CallContext в attributes и
     * выставляет статус 0 (цепочка продолжается), иначе отвечает ошибкой
     * и handler не вызывается.
     */
    class AuthInterceptorMiddleware : public IHttpHandler
    {
    public:
        explicit AuthInterceptorMiddleware(
            std::shared_ptr<ports::input::IAuthInterceptor> interceptor) : interceptor_(std::move(interceptor))
        {
            std::cout << "[AuthInterceptorMiddleware] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            ports::input::InboundCredentials credentials;
            credentials.authorization = req.getHeader("authorization");
            credentials.devAccountId = req.getHeader(settings::InterceptorSettings::DEV_ACCOUNT_HEADER);

            auto result = interceptor_->intercept(credentials);
            if (!result.authorized() || !result.context)
            {
                std::cout << "[AuthInterceptorMiddleware] Rejected " << req.getMethod() << " " << req.getPath()
                          << ": " << domain::toString(result.error) << " (" << result.message << ")" << std::endl;
                sendError(res, result.error, result.message);
                return;
            }

            CallContextAttributes::attach(req, *result.context);
            res.setStatus(0); // для middleware
        }

    private:
        std::shared_ptr<ports::input::IAuthInterceptor> interceptor_;
    };

} // namespace identity::adapters::primary
