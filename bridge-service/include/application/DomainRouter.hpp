#pragma once

#include "domain/CookieScope.hpp"
#include "settings/BridgeSettings.hpp"
#include <string>
#include <optional>
#include <memory>
#include <algorithm>
#include <cctype>

namespace bridge::application {

/**
 * @brief Выбор пространства сессий по хосту запроса
 *
 * login.<base>      → scope логина (cookie "login.sid")
 * <tenant>.<base>   → scope тенанта (cookie "<tenant>_<base с '_'>.sid")
 * остальное         → nullopt
 *
 * Также отвечает за привязку хоста к тенанту: строгое сравнение
 * левой метки или (в режиме совместимости) вхождение подстроки.
 */
class DomainRouter {
public:
    explicit DomainRouter(std::shared_ptr<settings::BridgeSettings> settings)
        : settings_(std::move(settings)) {}

    std::optional<domain::CookieScope> resolveScope(const std::string& host) const {
        std::string hostname = normalize(host);
        if (hostname.empty()) {
            return std::nullopt;
        }

        if (hostname == normalize(settings_->getLoginHost())) {
            domain::CookieScope scope;
            scope.kind = domain::ScopeKind::LOGIN;
            scope.cookieName = "login.sid";
            scope.cookieDomain = hostname;
            return scope;
        }

        auto label = tenantLabelOf(hostname);
        if (!label) {
            return std::nullopt;
        }

        domain::CookieScope scope;
        scope.kind = domain::ScopeKind::TENANT;
        scope.cookieName = cookieNameFor(hostname);
        scope.cookieDomain = hostname;
        scope.tenantLabel = *label;
        return scope;
    }

    bool isLoginHost(const std::string& host) const {
        return normalize(host) == normalize(settings_->getLoginHost());
    }

    /**
     * @brief Принадлежит ли хост домену логина
     *
     * Строгий режим: точное совпадение с каноническим хостом.
     * Режим совместимости: хост содержит базовый домен.
     */
    bool isLoginDomainHost(const std::string& host) const {
        std::string hostname = normalize(host);
        if (settings_->isStrictTenantMatch()) {
            return hostname == normalize(settings_->getLoginHost());
        }
        return hostname.find(normalize(settings_->getBaseDomain())) != std::string::npos;
    }

    /**
     * @brief Соответствует ли хост тенанту
     *
     * Строгий режим: левая метка == tenantId и остаток == базовый домен.
     * Режим совместимости: поддомен содержит tenantId как подстроку.
     */
    bool hostMatchesTenant(const std::string& host, const std::string& tenantId) const {
        if (tenantId.empty()) {
            return false;
        }

        std::string hostname = normalize(host);
        std::string tenant = normalize(tenantId);

        if (settings_->isStrictTenantMatch()) {
            auto label = tenantLabelOf(hostname);
            return label && *label == tenant;
        }

        auto dot = hostname.find('.');
        std::string subdomain = (dot == std::string::npos) ? hostname : hostname.substr(0, dot);
        return subdomain.find(tenant) != std::string::npos;
    }

    std::string tenantHost(const std::string& tenantId) const {
        return normalize(tenantId) + "." + normalize(settings_->getBaseDomain());
    }

    /**
     * @brief "acme.lvh.me:5173" → "acme.lvh.me"
     */
    static std::string hostnameOf(const std::string& hostHeader) {
        auto colon = hostHeader.find(':');
        return normalize(colon == std::string::npos ? hostHeader : hostHeader.substr(0, colon));
    }

    /**
     * @brief "acme.lvh.me:5173" → "5173" (пусто, если порта нет)
     */
    static std::string portOf(const std::string& hostHeader) {
        auto colon = hostHeader.find(':');
        return colon == std::string::npos ? "" : hostHeader.substr(colon + 1);
    }

    /**
     * @brief "acme.lvh.me" → "acme_lvh_me.sid"
     */
    static std::string cookieNameFor(const std::string& hostname) {
        std::string name = hostname;
        std::replace(name.begin(), name.end(), '.', '_');
        return name + ".sid";
    }

private:
    std::shared_ptr<settings::BridgeSettings> settings_;

    /**
     * @brief Левая метка, если хост имеет вид <label>.<base> и это не хост логина
     */
    std::optional<std::string> tenantLabelOf(const std::string& hostname) const {
        std::string suffix = "." + normalize(settings_->getBaseDomain());
        if (hostname.size() <= suffix.size()) {
            return std::nullopt;
        }
        if (hostname.compare(hostname.size() - suffix.size(), suffix.size(), suffix) != 0) {
            return std::nullopt;
        }
        if (hostname == normalize(settings_->getLoginHost())) {
            return std::nullopt;
        }

        std::string label = hostname.substr(0, hostname.size() - suffix.size());
        if (label.empty()) {
            return std::nullopt;
        }
        for (char c : label) {
            bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-';
            if (!ok) {
                return std::nullopt;    // в т.ч. вложенные поддомены
            }
        }
        return label;
    }

    static std::string normalize(const std::string& value) {
        std::string result = value;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }
};

} // namespace bridge::application
