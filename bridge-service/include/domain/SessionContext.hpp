#pragma once

#include "Session.hpp"
#include "CookieScope.hpp"
#include <string>
#include <optional>

namespace bridge::domain {

/**
 * @brief Контекст запроса, передаваемый по цепочке guard → engine
 *
 * Каждый этап получает контекст по const& и возвращает новый
 * (в составе своего результата), а не мутирует общий объект.
 */
struct SessionContext {
    std::string host;                       ///< Hostname без порта
    std::string port;                       ///< Порт из Host (может быть пустым)
    std::string scheme = "http";
    std::optional<CookieScope> scope;       ///< nullopt - хост не распознан
    std::optional<Session> session;         ///< nullopt - объекта сессии нет
    std::optional<std::string> routeTenantId;  ///< Параметр маршрута init-session

    bool isAuthenticated() const { return session && session->isBound(); }
};

/**
 * @brief Пользователь, пропущенный guard'ом
 *
 * tenantId пуст для общих маршрутов на домене логина.
 */
struct AuthorizedPrincipal {
    std::string principalId;
    std::string tenantId;
};

} // namespace bridge::domain
