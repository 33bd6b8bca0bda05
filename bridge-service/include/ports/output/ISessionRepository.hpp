#pragma once

#include "domain/Session.hpp"
#include "domain/CookieScope.hpp"
#include <string>
#include <optional>
#include <stdexcept>

namespace bridge::ports::output {

/**
 * @brief Сессию не удалось зафиксировать в хранилище
 */
class SessionPersistenceError : public std::runtime_error {
public:
    explicit SessionPersistenceError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Интерфейс хранилища сессий
 *
 * Пространства разных CookieScope независимы: одинаковый sessionId
 * в двух scope - две разные записи.
 *
 * save() и deleteById() возвращают управление только после фиксации записи
 * и бросают SessionPersistenceError при отказе.
 *
 * update() перезаписывает только существующую запись: удалённая
 * параллельно сессия не воскресает, возвращается false.
 */
class ISessionRepository {
public:
    virtual ~ISessionRepository() = default;

    virtual void save(const domain::Session& session) = 0;
    virtual bool update(const domain::Session& session) = 0;
    virtual std::optional<domain::Session> findById(
        const domain::CookieScope& scope,
        const std::string& sessionId
    ) = 0;
    virtual bool deleteById(const domain::CookieScope& scope, const std::string& sessionId) = 0;
    virtual size_t deleteExpired(std::chrono::system_clock::time_point now) = 0;
};

} // namespace bridge::ports::output
