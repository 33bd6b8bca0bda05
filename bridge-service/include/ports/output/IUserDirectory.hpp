#pragma once

#include "domain/User.hpp"
#include <string>
#include <optional>

namespace bridge::ports::output {

/**
 * @brief Каталог пользователей (Credential Validator)
 *
 * Output Port: хранение учётных данных вне этого сервиса.
 */
class IUserDirectory {
public:
    virtual ~IUserDirectory() = default;

    /**
     * @brief Найти пользователя по email
     * @param email Логин
     * @return User или nullopt
     */
    virtual std::optional<domain::User> findByEmail(const std::string& email) = 0;

    /**
     * @brief Найти пользователя по ID в рамках тенанта
     *
     * Возвращает nullopt, если пользователь не имеет доступа к tenantId.
     */
    virtual std::optional<domain::User> findById(
        const std::string& userId,
        const std::string& tenantId
    ) = 0;

    /**
     * @brief Найти пользователя по ID без учёта тенанта
     */
    virtual std::optional<domain::User> findById(const std::string& userId) = 0;
};

} // namespace bridge::ports::output
