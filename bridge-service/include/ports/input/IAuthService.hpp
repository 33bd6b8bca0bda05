#pragma once

#include "domain/Principal.hpp"
#include "domain/Session.hpp"
#include "domain/SessionContext.hpp"
#include "domain/enums/AuthError.hpp"
#include <string>
#include <optional>

namespace bridge::ports::input {

/**
 * @brief Результат логина
 *
 * session - зафиксированная сессия домена логина (для выставления cookie).
 */
struct LoginResult {
    bool success = false;
    domain::Principal principal;
    std::optional<domain::Session> session;
    domain::AuthError error = domain::AuthError::NONE;
    std::string message;
};

/**
 * @brief Результат выхода
 *
 * tenantId - тенант уничтоженной сессии (если это была сессия тенанта).
 */
struct LogoutResult {
    bool success = false;
    bool destroyed = false;
    std::optional<std::string> tenantId;
    domain::AuthError error = domain::AuthError::NONE;
    std::string message;
};

/**
 * @brief Результат выпуска токена передачи
 */
struct HandoffResult {
    bool success = false;
    std::string token;
    std::string redirectUrl;    ///< {scheme}://{tenant}.{base}:{port}/verify/{token}
    domain::AuthError error = domain::AuthError::NONE;
    std::string message;
};

/**
 * @brief Результат погашения токена передачи
 */
struct RedeemResult {
    bool success = false;
    std::optional<domain::Session> session;     ///< Сессия тенанта, уже зафиксированная
    domain::AuthError error = domain::AuthError::NONE;
    std::string message;
};

/**
 * @brief Результат проверки сессии
 */
struct ValidateResult {
    bool valid = false;
    std::string principalId;
    std::string message;
};

/**
 * @brief Auth Engine: логин, выход, выпуск и погашение токенов передачи
 */
class IAuthService {
public:
    virtual ~IAuthService() = default;

    /**
     * @brief Логин на домене логина
     *
     * Создаёт или перезаписывает LoginSession в scope запроса.
     */
    virtual LoginResult login(
        const domain::SessionContext& ctx,
        const std::string& email,
        const std::string& secret
    ) = 0;

    /**
     * @brief Уничтожить активную сессию запроса (логина или тенанта)
     */
    virtual LogoutResult logout(const domain::SessionContext& ctx) = 0;

    /**
     * @brief Выпустить токен передачи на домен тенанта
     */
    virtual HandoffResult initiateHandoff(
        const domain::SessionContext& ctx,
        const std::string& tenantId
    ) = 0;

    /**
     * @brief Погасить токен и создать сессию тенанта
     */
    virtual RedeemResult redeemHandoff(
        const domain::SessionContext& ctx,
        const std::string& token
    ) = 0;

    /**
     * @brief Есть ли у запроса привязанная сессия
     */
    virtual ValidateResult validateSession(const domain::SessionContext& ctx) = 0;

    /**
     * @brief Профиль пользователя по ID
     */
    virtual std::optional<domain::Principal> currentPrincipal(const std::string& principalId) = 0;
};

} // namespace bridge::ports::input
