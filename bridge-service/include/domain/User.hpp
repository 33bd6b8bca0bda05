#pragma once

#include <string>
#include <vector>
#include <algorithm>

namespace bridge::domain {

/**
 * @brief Запись пользователя из каталога (Credential Validator)
 *
 * Содержит секрет, поэтому никогда не покидает слой application:
 * наружу отдаётся только Principal.
 */
struct User {
    std::string userId;                 ///< Стабильный идентификатор
    std::string email;                  ///< Логин
    std::string name;                   ///< Отображаемое имя
    std::string password;               ///< Секрет для сверки при логине
    std::vector<std::string> tenants;   ///< Тенанты, к которым есть доступ

    User() = default;

    User(const std::string& userId,
         const std::string& email,
         const std::string& name,
         const std::string& password,
         std::vector<std::string> tenants)
        : userId(userId)
        , email(email)
        , name(name)
        , password(password)
        , tenants(std::move(tenants))
    {}

    bool hasTenant(const std::string& tenantId) const {
        return std::find(tenants.begin(), tenants.end(), tenantId) != tenants.end();
    }
};

} // namespace bridge::domain
