#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/TokenSettings.hpp"
#include "settings/InterceptorSettings.hpp"
#include "settings/MetricsSettings.hpp"

// Ports
#include "ports/input/IIdentityIssuer.hpp"
#include "ports/input/ITokenService.hpp"
#include "ports/input/IAuthInterceptor.hpp"
#include "ports/input/ISleepSessionService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ISleepSessionRepository.hpp"
#include "ports/output/IJwtProvider.hpp"
#include "ports/output/ISigningKeyStore.hpp"
#include "ports/output/IClock.hpp"

// Application
#include "application/IdentityIssuer.hpp"
#include "application/TokenService.hpp"
#include "application/AuthInterceptor.hpp"
#include "application/SleepSessionService.hpp"
#include "application/MetricsService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresAccountRepository.hpp"
#include "adapters/secondary/PostgresSleepSessionRepository.hpp"
#include "adapters/secondary/HmacJwtAdapter.hpp"
#include "adapters/secondary/EnvSigningKeyStore.hpp"
#include "adapters/secondary/SystemClock.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/CreateOrGetAccountHandler.hpp"
#include "adapters/primary/IssueTokenHandler.hpp"
#include "adapters/primary/ValidateTokenHandler.hpp"
#include "adapters/primary/SleepSessionHandler.hpp"
#include "adapters/primary/AuthInterceptorMiddleware.hpp"
#include "adapters/primary/ChainHandler.hpp"

#include <memory>
#include <iostream>

namespace di = boost::di;

namespace identity {

/**
 * @brief Identity Service Application
 *
 * Анонимная идентичность устройств, bearer token'ы и аутентификация
 * всех RPC с пользовательскими данными.
 */
class IdentityApp : public BoostBeastApplication {
public:
    IdentityApp() {
        std::cout << "[IdentityApp] Initializing..." << std::endl;
    }

    ~IdentityApp() override = default;

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[IdentityApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[IdentityApp] Configuring Boost.DI injection..." << std::endl;

        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings
            // ================================================================
            di::bind<settings::DbSettings>().in(di::singleton),
            di::bind<settings::TokenSettings>().in(di::singleton),
            di::bind<settings::InterceptorSettings>().in(di::singleton),
            di::bind<settings::MetricsSettings>().in(di::singleton),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================
            di::bind<ports::output::IClock>()
                .to<adapters::secondary::SystemClock>()
                .in(di::singleton),

            di::bind<ports::output::ISigningKeyStore>()
                .to<adapters::secondary::EnvSigningKeyStore>()
                .in(di::singleton),

            di::bind<ports::output::IJwtProvider>()
                .to<adapters::secondary::HmacJwtAdapter>()
                .in(di::singleton),

            di::bind<ports::output::IAccountRepository>()
                .to<adapters::secondary::PostgresAccountRepository>()
                .in(di::singleton),

            di::bind<ports::output::ISleepSessionRepository>()
                .to<adapters::secondary::PostgresSleepSessionRepository>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application Services (Input Ports implementations)
            // ================================================================
            di::bind<ports::input::IMetricsService>()
                .to<application::MetricsService>()
                .in(di::singleton),

            di::bind<ports::input::IIdentityIssuer>()
                .to<application::IdentityIssuer>()
                .in(di::singleton),

            di::bind<ports::input::ITokenService>()
                .to<application::TokenService>()
                .in(di::singleton),

            di::bind<ports::input::IAuthInterceptor>()
                .to<application::AuthInterceptor>()
                .in(di::singleton),

            di::bind<ports::input::ISleepSessionService>()
                .to<application::SleepSessionService>()
                .in(di::singleton)
        );

        // Режим окружения до регистрации endpoint'ов: недопустимая
        // конфигурация (ConfigurationError) останавливает старт здесь
        {
            auto interceptorSettings = injector.create<std::shared_ptr<settings::InterceptorSettings>>();
            std::cout << "[IdentityApp] Deployment mode: " << domain::toString(interceptorSettings->getMode())
                      << ", dev account header: "
                      << (interceptorSettings->isDevHeaderAllowed() ? "ENABLED (insecure)" : "disabled")
                      << std::endl;
        }

        // ====================================================================
        // Layer 4: Primary Adapters (HTTP Handlers)
        // ====================================================================

        std::cout << "[IdentityApp] Registering HTTP Handlers via DI..." << std::endl;

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
            registerEndpoint("GET", "/health", handler);
            std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>();
            registerEndpoint("GET", "/metrics", handler);
            std::cout << "  ✓ MetricsHandler: GET /metrics" << std::endl;
        }

        // Identity & Token (без аутентификации)
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::CreateOrGetAccountHandler>>();
            registerEndpoint("POST", "/api/v1/identity/accounts", handler);
            std::cout << "  ✓ CreateOrGetAccountHandler: POST /api/v1/identity/accounts" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::IssueTokenHandler>>();
            registerEndpoint("POST", "/api/v1/auth/token", handler);
            std::cout << "  ✓ IssueTokenHandler: POST /api/v1/auth/token" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::ValidateTokenHandler>>();
            registerEndpoint("POST", "/api/v1/auth/validate", handler);
            std::cout << "  ✓ ValidateTokenHandler: POST /api/v1/auth/validate" << std::endl;
        }

        // Пользовательские данные: только через AuthInterceptorMiddleware
        {
            auto middleware = injector.create<std::shared_ptr<adapters::primary::AuthInterceptorMiddleware>>();
            auto sleepHandler = injector.create<std::shared_ptr<adapters::primary::SleepSessionHandler>>();
            auto chain = std::make_shared<adapters::primary::ChainHandler>(middleware, sleepHandler);

            registerEndpoint("GET", "/api/v1/sleep/sessions", chain);
            registerEndpoint("POST", "/api/v1/sleep/sessions", chain);
            std::cout << "  ✓ SleepSessionHandler: GET|POST /api/v1/sleep/sessions (authenticated)" << std::endl;
        }

        std::cout << "[IdentityApp] Configuration complete! 7 endpoints registered." << std::endl;
    }
};

} // namespace identity
