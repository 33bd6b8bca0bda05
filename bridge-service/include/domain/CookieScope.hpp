#pragma once

#include <string>

namespace bridge::domain {

/**
 * @brief Тип пространства сессий
 */
enum class ScopeKind {
    LOGIN,      ///< Общий домен логина
    TENANT      ///< Поддомен конкретного тенанта
};

/**
 * @brief Пара (имя cookie, домен cookie), изолирующая одно пространство сессий
 *
 * Для тенанта дополнительно хранится tenantLabel - левая метка хоста.
 */
struct CookieScope {
    ScopeKind kind = ScopeKind::LOGIN;
    std::string cookieName;     ///< "login.sid", "acme_lvh_me.sid"
    std::string cookieDomain;   ///< "login.lvh.me", "acme.lvh.me"
    std::string tenantLabel;    ///< "acme" (пусто для LOGIN)

    bool isLogin() const { return kind == ScopeKind::LOGIN; }
    bool isTenant() const { return kind == ScopeKind::TENANT; }

    bool operator==(const CookieScope& other) const {
        return kind == other.kind
            && cookieName == other.cookieName
            && cookieDomain == other.cookieDomain;
    }
};

} // namespace bridge::domain
