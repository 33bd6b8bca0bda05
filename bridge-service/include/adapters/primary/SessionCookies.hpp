#pragma once

#include "domain/CookieScope.hpp"
#include <map>
#include <string>
#include <chrono>

namespace bridge::adapters::primary {

/**
 * @brief Разбор заголовка Cookie и сборка Set-Cookie
 */
class SessionCookies {
public:
    /**
     * @brief "a=1; b=2" → {a: 1, b: 2}
     *
     * При повторе имени берётся первое значение.
     */
    static std::map<std::string, std::string> parse(const std::string& header) {
        std::map<std::string, std::string> cookies;
        size_t pos = 0;
        while (pos < header.size()) {
            size_t end = header.find(';', pos);
            if (end == std::string::npos) end = header.size();

            std::string pair = trim(header.substr(pos, end - pos));
            auto eq = pair.find('=');
            if (eq != std::string::npos && eq > 0) {
                std::string name = trim(pair.substr(0, eq));
                std::string value = trim(pair.substr(eq + 1));
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }
                cookies.emplace(name, value);
            }
            pos = end + 1;
        }
        return cookies;
    }

    static std::string issue(
        const domain::CookieScope& scope,
        const std::string& sessionId,
        std::chrono::milliseconds maxAge,
        bool secure
    ) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(maxAge).count();
        return build(scope, sessionId, seconds, secure);
    }

    static std::string clear(const domain::CookieScope& scope, bool secure) {
        return build(scope, "", 0, secure);
    }

private:
    static std::string build(
        const domain::CookieScope& scope,
        const std::string& value,
        long long maxAgeSeconds,
        bool secure
    ) {
        std::string cookie = scope.cookieName + "=" + value
            + "; Path=/"
            + "; Domain=" + scope.cookieDomain
            + "; Max-Age=" + std::to_string(maxAgeSeconds)
            + "; HttpOnly; SameSite=Lax";
        if (secure) {
            cookie += "; Secure";
        }
        return cookie;
    }

    static std::string trim(const std::string& s) {
        auto begin = s.find_first_not_of(" \t");
        if (begin == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t");
        return s.substr(begin, end - begin + 1);
    }
};

} // namespace bridge::adapters::primary
