#pragma once

#include <string>

namespace bridge::domain {

/**
 * @brief Виды ошибок аутентификации и авторизации
 *
 * Семейство Unauthorized: NO_SESSION, NOT_AUTHENTICATED, INVALID_HOST,
 * SESSION_EXPIRED, TENANT_MISMATCH.
 */
enum class AuthError {
    NONE,
    INVALID_CREDENTIALS,
    NO_SESSION,
    NOT_AUTHENTICATED,
    INVALID_HOST,
    SESSION_EXPIRED,
    TENANT_MISMATCH,
    TENANT_NOT_GRANTED,         ///< Forbidden
    TOKEN_INVALID,
    TOKEN_EXPIRED,
    SESSION_PERSISTENCE_FAILED
};

inline std::string toString(AuthError error) {
    switch (error) {
        case AuthError::NONE:                       return "NONE";
        case AuthError::INVALID_CREDENTIALS:        return "INVALID_CREDENTIALS";
        case AuthError::NO_SESSION:                 return "NO_SESSION";
        case AuthError::NOT_AUTHENTICATED:          return "NOT_AUTHENTICATED";
        case AuthError::INVALID_HOST:               return "INVALID_HOST";
        case AuthError::SESSION_EXPIRED:            return "SESSION_EXPIRED";
        case AuthError::TENANT_MISMATCH:            return "TENANT_MISMATCH";
        case AuthError::TENANT_NOT_GRANTED:         return "TENANT_NOT_GRANTED";
        case AuthError::TOKEN_INVALID:              return "TOKEN_INVALID";
        case AuthError::TOKEN_EXPIRED:              return "TOKEN_EXPIRED";
        case AuthError::SESSION_PERSISTENCE_FAILED: return "SESSION_PERSISTENCE_FAILED";
        default: return "UNKNOWN";
    }
}

inline bool isUnauthorized(AuthError error) {
    switch (error) {
        case AuthError::NO_SESSION:
        case AuthError::NOT_AUTHENTICATED:
        case AuthError::INVALID_HOST:
        case AuthError::SESSION_EXPIRED:
        case AuthError::TENANT_MISMATCH:
            return true;
        default:
            return false;
    }
}

/**
 * @brief HTTP статус для ошибки
 *
 * 5xx только для отказа хранилища сессий, остальное - 4xx.
 */
inline int httpStatusFor(AuthError error) {
    switch (error) {
        case AuthError::NONE:                       return 200;
        case AuthError::TENANT_NOT_GRANTED:         return 403;
        case AuthError::SESSION_PERSISTENCE_FAILED: return 500;
        default:                                    return 401;
    }
}

} // namespace bridge::domain
