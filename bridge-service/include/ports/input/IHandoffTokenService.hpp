#pragma once

#include "domain/enums/AuthError.hpp"
#include <string>

namespace bridge::ports::input {

/**
 * @brief Результат погашения токена
 */
struct TokenRedeemResult {
    bool success = false;
    std::string principalId;
    std::string tenantId;
    domain::AuthError error = domain::AuthError::NONE;
    std::string message;
};

/**
 * @brief Token Store: жизненный цикл одноразовых токенов
 */
class IHandoffTokenService {
public:
    virtual ~IHandoffTokenService() = default;

    /**
     * @brief Выпустить токен для пары (principal, tenant)
     * @return Непрозрачная строка токена
     */
    virtual std::string issue(const std::string& principalId, const std::string& tenantId) = 0;

    /**
     * @brief Погасить токен на хосте requestHost
     *
     * TOKEN_INVALID - токена нет; TOKEN_EXPIRED - истёк (запись удаляется);
     * TENANT_MISMATCH - хост не соответствует тенанту (запись остаётся).
     * При успехе запись удаляется.
     */
    virtual TokenRedeemResult redeem(const std::string& token, const std::string& requestHost) = 0;

    /**
     * @brief Удалить все истёкшие записи
     * @return Количество удалённых
     */
    virtual size_t sweep() = 0;
};

} // namespace bridge::ports::input
