#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/BridgeSettings.hpp"

// Ports
#include "ports/input/IAuthService.hpp"
#include "ports/input/IHandoffTokenService.hpp"
#include "ports/output/IUserDirectory.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "ports/output/IHandoffTokenRepository.hpp"
#include "ports/output/ITokenGenerator.hpp"
#include "ports/output/IClock.hpp"

// Application
#include "application/DomainRouter.hpp"
#include "application/HandoffTokenService.hpp"
#include "application/AuthService.hpp"
#include "application/LoginSessionGuard.hpp"
#include "application/TenantSessionGuard.hpp"
#include "application/TokenSweeper.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryUserDirectory.hpp"
#include "adapters/secondary/InMemorySessionRepository.hpp"
#include "adapters/secondary/InMemoryHandoffTokenRepository.hpp"
#include "adapters/secondary/OpenSslTokenGenerator.hpp"
#include "adapters/secondary/SystemClock.hpp"

// Primary Adapters
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/SessionContextResolver.hpp"
#include "adapters/primary/SessionGuardMiddleware.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/LoginHandler.hpp"
#include "adapters/primary/LogoutHandler.hpp"
#include "adapters/primary/InitSessionHandler.hpp"
#include "adapters/primary/VerifyTokenHandler.hpp"
#include "adapters/primary/ValidateSessionHandler.hpp"
#include "adapters/primary/PingHandler.hpp"
#include "adapters/primary/DashboardHandler.hpp"
#include "adapters/primary/ProfileHandler.hpp"

#include <memory>
#include <iostream>

namespace di = boost::di;

namespace bridge {

/**
 * @brief Bridge Service Application
 *
 * Сессии домена логина и доменов тенантов, передача аутентификации
 * между ними через одноразовые токены.
 */
class BridgeApp : public BoostBeastApplication {
public:
    BridgeApp() {
        std::cout << "[BridgeApp] Initializing..." << std::endl;
    }

    ~BridgeApp() override {
        if (tokenSweeper_) {
            tokenSweeper_->stop();
        }
        std::cout << "[BridgeApp] Shutting down..." << std::endl;
    }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[BridgeApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[BridgeApp] Configuring Boost.DI injection..." << std::endl;

        auto injector = di::make_injector(

            // Settings
            di::bind<settings::BridgeSettings>().in(di::singleton),

            // Secondary Adapters
            di::bind<ports::output::IClock>()
                .to<adapters::secondary::SystemClock>()
                .in(di::singleton),

            di::bind<ports::output::ITokenGenerator>()
                .to<adapters::secondary::OpenSslTokenGenerator>()
                .in(di::singleton),

            di::bind<ports::output::IUserDirectory>()
                .to<adapters::secondary::InMemoryUserDirectory>()
                .in(di::singleton),

            di::bind<ports::output::ISessionRepository>()
                .to<adapters::secondary::InMemorySessionRepository>()
                .in(di::singleton),

            di::bind<ports::output::IHandoffTokenRepository>()
                .to<adapters::secondary::InMemoryHandoffTokenRepository>()
                .in(di::singleton),

            // Application
            di::bind<application::DomainRouter>().in(di::singleton),
            di::bind<application::LoginSessionGuard>().in(di::singleton),
            di::bind<application::TenantSessionGuard>().in(di::singleton),
            di::bind<application::TokenSweeper>().in(di::singleton),

            di::bind<ports::input::IHandoffTokenService>()
                .to<application::HandoffTokenService>()
                .in(di::singleton),

            di::bind<ports::input::IAuthService>()
                .to<application::AuthService>()
                .in(di::singleton),

            di::bind<adapters::primary::SessionContextResolver>().in(di::singleton)
        );

        // ====================================================================
        // Middleware
        // ====================================================================

        auto bridgeSettings = injector.create<std::shared_ptr<settings::BridgeSettings>>();
        auto resolver = injector.create<std::shared_ptr<adapters::primary::SessionContextResolver>>();
        auto authService = injector.create<std::shared_ptr<ports::input::IAuthService>>();
        auto loginGuard = injector.create<std::shared_ptr<application::LoginSessionGuard>>();
        auto tenantGuard = injector.create<std::shared_ptr<application::TenantSessionGuard>>();

        auto loginMiddleware = std::make_shared<adapters::primary::SessionGuardMiddleware>(
            bridgeSettings, resolver, loginGuard);
        auto initSessionMiddleware = std::make_shared<adapters::primary::SessionGuardMiddleware>(
            bridgeSettings, resolver, loginGuard, true);
        auto tenantMiddleware = std::make_shared<adapters::primary::SessionGuardMiddleware>(
            bridgeSettings, resolver, tenantGuard);

        // ====================================================================
        // HTTP Handlers
        // ====================================================================

        std::cout << "[BridgeApp] Registering HTTP Handlers..." << std::endl;

        registerEndpoint("GET", "/health",
            injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());

        // Auth
        registerEndpoint("POST", "/api/auth/login",
            injector.create<std::shared_ptr<adapters::primary::LoginHandler>>());
        registerEndpoint("POST", "/api/auth/logout",
            injector.create<std::shared_ptr<adapters::primary::LogoutHandler>>());
        registerEndpoint("GET", "/api/auth/validate-session",
            injector.create<std::shared_ptr<adapters::primary::ValidateSessionHandler>>());
        registerEndpoint("GET", "/api/auth/init-session/*",
            std::make_shared<adapters::primary::ChainHandler>(
                initSessionMiddleware,
                injector.create<std::shared_ptr<adapters::primary::InitSessionHandler>>()));

        // Tenant
        auto verifyHandler = injector.create<std::shared_ptr<adapters::primary::VerifyTokenHandler>>();
        registerEndpoint("GET", "/verify/*", verifyHandler);
        registerEndpoint("GET", "/api/tenant/verify-token/*", verifyHandler);

        registerEndpoint("GET", "/api/tenant/ping",
            std::make_shared<adapters::primary::ChainHandler>(
                tenantMiddleware,
                injector.create<std::shared_ptr<adapters::primary::PingHandler>>()));
        registerEndpoint("GET", "/api/tenant/dashboard",
            std::make_shared<adapters::primary::ChainHandler>(
                tenantMiddleware,
                std::make_shared<adapters::primary::DashboardHandler>()));

        // Users
        registerEndpoint("GET", "/api/users/login/me",
            std::make_shared<adapters::primary::ChainHandler>(
                loginMiddleware,
                std::make_shared<adapters::primary::ProfileHandler>(
                    authService, adapters::primary::ProfileHandler::View::LOGIN)));
        registerEndpoint("GET", "/api/users/tenant/me",
            std::make_shared<adapters::primary::ChainHandler>(
                tenantMiddleware,
                std::make_shared<adapters::primary::ProfileHandler>(
                    authService, adapters::primary::ProfileHandler::View::TENANT)));

        std::cout << "[BridgeApp] 11 routes registered" << std::endl;

        // Очистка токенов стартует после регистрации всех handlers
        tokenSweeper_ = injector.create<std::shared_ptr<application::TokenSweeper>>();
        tokenSweeper_->start();

        std::cout << "[BridgeApp] Ready" << std::endl;
    }

private:
    std::shared_ptr<application::TokenSweeper> tokenSweeper_;
};

} // namespace bridge
