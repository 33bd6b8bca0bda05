#pragma once

#include <string>
#include <chrono>

namespace bridge::domain {

/**
 * @brief Одноразовый токен передачи аутентификации на домен тенанта
 *
 * Живёт 30 секунд (по умолчанию), удаляется при первом погашении
 * или при обнаружении истечения.
 */
struct HandoffToken {
    std::string token;          ///< 64 hex-символа (32 случайных байта)
    std::string principalId;
    std::string tenantId;
    std::chrono::system_clock::time_point expiresAt;

    HandoffToken() = default;

    HandoffToken(const std::string& token,
                 const std::string& principalId,
                 const std::string& tenantId,
                 std::chrono::system_clock::time_point expiresAt)
        : token(token)
        , principalId(principalId)
        , tenantId(tenantId)
        , expiresAt(expiresAt)
    {}

    bool isExpiredAt(std::chrono::system_clock::time_point now) const {
        return now > expiresAt;
    }
};

} // namespace bridge::domain
