#pragma once

#include "User.hpp"
#include <string>
#include <vector>
#include <algorithm>

namespace bridge::domain {

/**
 * @brief Аутентифицированная личность (без секрета)
 */
struct Principal {
    std::string id;
    std::string email;
    std::string name;
    std::vector<std::string> tenants;

    Principal() = default;

    Principal(const std::string& id,
              const std::string& email,
              const std::string& name,
              std::vector<std::string> tenants)
        : id(id)
        , email(email)
        , name(name)
        , tenants(std::move(tenants))
    {}

    /**
     * @brief Санитизированная копия записи каталога
     */
    static Principal fromUser(const User& user) {
        return Principal(user.userId, user.email, user.name, user.tenants);
    }

    bool hasTenant(const std::string& tenantId) const {
        return std::find(tenants.begin(), tenants.end(), tenantId) != tenants.end();
    }
};

} // namespace bridge::domain
