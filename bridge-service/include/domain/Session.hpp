#pragma once

#include "CookieScope.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <variant>

namespace bridge::domain {

/**
 * @brief Сессия на домене логина
 *
 * tenants - снимок на момент логина.
 */
struct LoginSession {
    std::string principalId;
    std::string email;
    std::string name;
    std::vector<std::string> tenants;
    std::chrono::system_clock::time_point lastActivity;
};

/**
 * @brief Сессия на домене тенанта
 *
 * Создаётся только погашением HandoffToken.
 * lastActivity может отсутствовать - тогда простой считается нулевым.
 */
struct TenantSession {
    std::string principalId;
    std::string tenantId;
    std::string email;
    std::optional<std::chrono::system_clock::time_point> lastActivity;
};

/**
 * @brief Запись сессии в пространстве cookie
 *
 * Сессия может существовать без привязанного пользователя (binding пуст).
 * maxAge cookie задаёт expiresAt, по истечении запись считается отсутствующей.
 */
struct Session {
    using Binding = std::variant<std::monostate, LoginSession, TenantSession>;

    std::string sessionId;      ///< Значение cookie
    CookieScope scope;
    Binding binding;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point expiresAt;

    Session() = default;

    Session(const std::string& sessionId,
            const CookieScope& scope,
            std::chrono::system_clock::time_point now,
            std::chrono::milliseconds maxAge)
        : sessionId(sessionId)
        , scope(scope)
        , createdAt(now)
        , expiresAt(now + maxAge)
    {}

    bool isBound() const { return !std::holds_alternative<std::monostate>(binding); }

    const LoginSession* login() const { return std::get_if<LoginSession>(&binding); }
    LoginSession* login() { return std::get_if<LoginSession>(&binding); }

    const TenantSession* tenant() const { return std::get_if<TenantSession>(&binding); }
    TenantSession* tenant() { return std::get_if<TenantSession>(&binding); }

    /**
     * @brief ID привязанного пользователя (пусто, если сессия не привязана)
     */
    std::string principalId() const {
        if (auto* l = login()) return l->principalId;
        if (auto* t = tenant()) return t->principalId;
        return "";
    }

    /**
     * @brief Последняя активность привязки (nullopt - неизвестна)
     */
    std::optional<std::chrono::system_clock::time_point> lastActivity() const {
        if (auto* l = login()) return l->lastActivity;
        if (auto* t = tenant()) return t->lastActivity;
        return std::nullopt;
    }

    void touch(std::chrono::system_clock::time_point now) {
        if (auto* l = login()) l->lastActivity = now;
        if (auto* t = tenant()) t->lastActivity = now;
    }

    bool isExpiredAt(std::chrono::system_clock::time_point now) const {
        return now > expiresAt;
    }
};

} // namespace bridge::domain
