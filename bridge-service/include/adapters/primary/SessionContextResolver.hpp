#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/SessionCookies.hpp"
#include "application/DomainRouter.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "settings/BridgeSettings.hpp"
#include "domain/SessionContext.hpp"
#include <memory>

namespace bridge::adapters::primary {

/**
 * @brief Сборка SessionContext из HTTP-запроса
 *
 * Host → scope (через DomainRouter), cookie scope'а → сессия из репозитория.
 * Нет cookie или запись не найдена/истекла → session == nullopt.
 * Ошибка хранилища (SessionPersistenceError) пробрасывается вызывающему.
 */
class SessionContextResolver {
public:
    SessionContextResolver(
        std::shared_ptr<settings::BridgeSettings> settings,
        std::shared_ptr<application::DomainRouter> domainRouter,
        std::shared_ptr<ports::output::ISessionRepository> sessionRepo
    ) : settings_(std::move(settings))
      , domainRouter_(std::move(domainRouter))
      , sessionRepo_(std::move(sessionRepo))
    {}

    domain::SessionContext resolve(IRequest& req) {
        domain::SessionContext ctx;

        std::string hostHeader = req.getHeader("Host").value_or("");
        ctx.host = application::DomainRouter::hostnameOf(hostHeader);
        ctx.port = application::DomainRouter::portOf(hostHeader);
        ctx.scheme = req.getHeader("X-Forwarded-Proto").value_or(settings_->getDefaultScheme());
        ctx.scope = domainRouter_->resolveScope(ctx.host);

        if (!ctx.scope) {
            return ctx;
        }

        auto cookies = SessionCookies::parse(req.getHeader("Cookie").value_or(""));
        auto it = cookies.find(ctx.scope->cookieName);
        if (it == cookies.end() || it->second.empty()) {
            return ctx;
        }

        ctx.session = sessionRepo_->findById(*ctx.scope, it->second);
        return ctx;
    }

private:
    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<application::DomainRouter> domainRouter_;
    std::shared_ptr<ports::output::ISessionRepository> sessionRepo_;
};

} // namespace bridge::adapters::primary
