#pragma once

#include "ports/output/IUserDirectory.hpp"
#include <unordered_map>
#include <mutex>
#include <iostream>

namespace bridge::adapters::secondary {

/**
 * @brief Каталог пользователей в памяти
 *
 * По умолчанию содержит демонстрационного пользователя
 * john@example.com с доступом к тенантам acme и globex.
 */
class InMemoryUserDirectory : public ports::output::IUserDirectory {
public:
    InMemoryUserDirectory() {
        add(domain::User("1", "john@example.com", "John Doe", "password123", {"acme", "globex"}));
        std::cout << "[InMemoryUserDirectory] Seeded " << users_.size() << " user(s)" << std::endl;
    }

    void add(const domain::User& user) {
        std::lock_guard<std::mutex> lock(mutex_);
        users_[user.userId] = user;
    }

    std::optional<domain::User> findByEmail(const std::string& email) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, user] : users_) {
            if (user.email == email) return user;
        }
        return std::nullopt;
    }

    std::optional<domain::User> findById(
        const std::string& userId,
        const std::string& tenantId
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(userId);
        if (it == users_.end() || !it->second.hasTenant(tenantId)) return std::nullopt;
        return it->second;
    }

    std::optional<domain::User> findById(const std::string& userId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(userId);
        if (it == users_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, domain::User> users_;
};

} // namespace bridge::adapters::secondary
