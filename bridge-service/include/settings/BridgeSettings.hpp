#pragma once

#include <string>
#include <cstdlib>
#include <chrono>

namespace bridge::settings {

/**
 * @brief Настройки Bridge Service
 *
 * Читает из ENV:
 * - BRIDGE_BASE_DOMAIN (default: "lvh.me")
 * - BRIDGE_LOGIN_HOST (default: "login.lvh.me")
 * - BRIDGE_LOGIN_URL (default: "http://login.lvh.me:3000/login")
 * - BRIDGE_DEFAULT_PORT (default: "5173")
 * - BRIDGE_DEFAULT_SCHEME (default: "http")
 * - BRIDGE_HANDOFF_TOKEN_TTL_MS (default: 30000)
 * - BRIDGE_TENANT_IDLE_TIMEOUT_MS (default: 1200000)
 * - BRIDGE_SESSION_MAX_AGE_MS (default: 3600000)
 * - BRIDGE_SWEEP_INTERVAL_MS (default: 900000)
 * - BRIDGE_STRICT_TENANT_MATCH (default: true)
 * - BRIDGE_COOKIE_SECURE (default: false)
 */
class BridgeSettings {
public:
    BridgeSettings() {
        if (const char* val = std::getenv("BRIDGE_BASE_DOMAIN")) {
            baseDomain_ = val;
        }
        if (const char* val = std::getenv("BRIDGE_LOGIN_HOST")) {
            loginHost_ = val;
        }
        if (const char* val = std::getenv("BRIDGE_LOGIN_URL")) {
            loginUrl_ = val;
        }
        if (const char* val = std::getenv("BRIDGE_DEFAULT_PORT")) {
            defaultPort_ = val;
        }
        if (const char* val = std::getenv("BRIDGE_DEFAULT_SCHEME")) {
            defaultScheme_ = val;
        }
        if (const char* val = std::getenv("BRIDGE_HANDOFF_TOKEN_TTL_MS")) {
            handoffTokenTtl_ = std::chrono::milliseconds(std::stoll(val));
        }
        if (const char* val = std::getenv("BRIDGE_TENANT_IDLE_TIMEOUT_MS")) {
            tenantIdleTimeout_ = std::chrono::milliseconds(std::stoll(val));
        }
        if (const char* val = std::getenv("BRIDGE_SESSION_MAX_AGE_MS")) {
            sessionMaxAge_ = std::chrono::milliseconds(std::stoll(val));
        }
        if (const char* val = std::getenv("BRIDGE_SWEEP_INTERVAL_MS")) {
            sweepInterval_ = std::chrono::milliseconds(std::stoll(val));
        }
        if (const char* val = std::getenv("BRIDGE_STRICT_TENANT_MATCH")) {
            strictTenantMatch_ = parseBool(val);
        }
        if (const char* val = std::getenv("BRIDGE_COOKIE_SECURE")) {
            cookieSecure_ = parseBool(val);
        }
    }

    std::string getBaseDomain() const { return baseDomain_; }
    std::string getLoginHost() const { return loginHost_; }
    std::string getLoginUrl() const { return loginUrl_; }
    std::string getDefaultPort() const { return defaultPort_; }
    std::string getDefaultScheme() const { return defaultScheme_; }
    std::chrono::milliseconds getHandoffTokenTtl() const { return handoffTokenTtl_; }
    std::chrono::milliseconds getTenantIdleTimeout() const { return tenantIdleTimeout_; }
    std::chrono::milliseconds getSessionMaxAge() const { return sessionMaxAge_; }
    std::chrono::milliseconds getSweepInterval() const { return sweepInterval_; }
    bool isStrictTenantMatch() const { return strictTenantMatch_; }
    bool isCookieSecure() const { return cookieSecure_; }

    // Для тестов
    void setStrictTenantMatch(bool strict) { strictTenantMatch_ = strict; }
    void setHandoffTokenTtl(std::chrono::milliseconds ttl) { handoffTokenTtl_ = ttl; }
    void setTenantIdleTimeout(std::chrono::milliseconds timeout) { tenantIdleTimeout_ = timeout; }
    void setSweepInterval(std::chrono::milliseconds interval) { sweepInterval_ = interval; }

private:
    std::string baseDomain_ = "lvh.me";
    std::string loginHost_ = "login.lvh.me";
    std::string loginUrl_ = "http://login.lvh.me:3000/login";
    std::string defaultPort_ = "5173";
    std::string defaultScheme_ = "http";
    std::chrono::milliseconds handoffTokenTtl_{30000};
    std::chrono::milliseconds tenantIdleTimeout_{1200000};
    std::chrono::milliseconds sessionMaxAge_{3600000};
    std::chrono::milliseconds sweepInterval_{900000};
    bool strictTenantMatch_ = true;
    bool cookieSecure_ = false;

    static bool parseBool(const std::string& value) {
        return value == "1" || value == "true" || value == "TRUE" || value == "yes";
    }
};

} // namespace bridge::settings
